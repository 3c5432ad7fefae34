#ifndef LIBTFS_FILE_H_
#define LIBTFS_FILE_H_

#include <string>

#include "Node.hpp"

namespace TreeFS {
namespace Filesystem {

/** A handle to a file location (see Node) */
class File : public Node
{
public:

    /**
     * Creates an empty file and any missing parent folders (no-op if it exists)
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors (e.g. a folder is in the way)
     */
    void Create() const;

    /**
     * Deletes the file, no-op unless a file exists here
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors
     */
    void Delete() const;

    /**
     * Returns the whole content of the file
     * @throws Storage::NotFoundException if the file does not exist
     * @throws Storage::IOException on storage errors
     */
    std::string Read() const;

    /**
     * Replaces the whole content of the file, creating it and its parents if needed
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors
     */
    void Write(const std::string& data) const;

    /** Copies this file to target, replacing anything there (see Copier::CopyFile) */
    void CopyTo(const File& target) const;

    /** Moves this file to target, replacing anything there (see Copier::MoveFile) */
    void MoveTo(const File& target) const;

private:

    friend class Node;
    friend class Folder;

    /**
     * @param storage reference to the backing storage
     * @param path absolute normalized path
     */
    File(Storage::BaseStorage& storage, const std::string& path);
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_FILE_H_
