#ifndef LIBTFS_STORAGEEXCEPTION_H_
#define LIBTFS_STORAGEEXCEPTION_H_

#include <string>

#include "treefs/BaseException.hpp"

namespace TreeFS {
namespace Storage {

/** Base Exception for all storage issues */
class StorageException : public BaseException { public:
    /** @param message error message */
    explicit StorageException(const std::string& message) :
        BaseException("Storage Error: "+message) {}; };

/** Exception indicating an I/O failure in the backing storage */
class IOException : public StorageException { public:
    /** @param message error message */
    explicit IOException(const std::string& message) :
        StorageException("I/O: "+message) {}; };

/** Exception indicating the requested entry does not exist */
class NotFoundException : public IOException { public:
    /** @param path storage path not found */
    explicit NotFoundException(const std::string& path) :
        IOException("Not Found: "+path) {}; };

/** Exception indicating stored data could not be parsed */
class FormatException : public IOException { public:
    /** @param message parser error message */
    explicit FormatException(const std::string& message) :
        IOException("Bad Format: "+message) {}; };

/** Exception indicating an optional capability is not supported */
class UnsupportedException : public StorageException { public:
    /** @param what name of the unsupported capability */
    explicit UnsupportedException(const std::string& what) :
        StorageException("Unsupported: "+what) {}; };

/** Exception indicating the storage is read-only */
class ReadOnlyException : public StorageException { public:
    ReadOnlyException() : StorageException("Read Only Storage") {}; };

} // namespace Storage
} // namespace TreeFS

#endif // LIBTFS_STORAGEEXCEPTION_H_
