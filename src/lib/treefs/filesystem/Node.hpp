#ifndef LIBTFS_NODE_H_
#define LIBTFS_NODE_H_

#include <cstdint>
#include <optional>
#include <string>

#include "treefs/BaseException.hpp"
#include "treefs/storage/BaseStorage.hpp"

namespace TreeFS {
namespace Filesystem {

class File;
class Folder;

/**
 * A handle to a file or folder location within a storage
 *
 * Handles are cheap values identified by their storage and absolute path.
 * They do not imply that anything exists at their location, and the parent
 * relation is derived from the path, so nothing is kept alive by a child.
 * The storage must outlive all handles referencing it.
 */
class Node
{
public:

    /** Base Exception for all filesystem issues */
    class Exception : public BaseException { public:
        /** @param message Filesystem error string */
        explicit Exception(const std::string& message) :
            BaseException("Filesystem Error: "+message) {}; };

    /** Exception indicating a path or name is empty or malformed */
    class InvalidPathException : public Exception { public:
        /** @param path the invalid path or name */
        explicit InvalidPathException(const std::string& path) :
            Exception("Invalid Path: \""+path+"\"") {}; };

    /** Exception indicating the node is the root and has no parent */
    class NullParentException : public Exception { public:
        NullParentException() : Exception("Null Parent") {}; };

    /** Exception indicating the node is not of the requested type */
    class WrongTypeException : public Exception { public:
        /** @param path path of the node */
        explicit WrongTypeException(const std::string& path) :
            Exception("Wrong Node Type: "+path) {}; };

    /** Exception indicating a copy/move target overlaps its source */
    class SelfContainmentException : public Exception { public:
        /** @param source source path @param target target path */
        SelfContainmentException(const std::string& source, const std::string& target) :
            Exception("Target "+target+" overlaps source "+source) {}; };

    /** Concrete node types */
    enum class Type : uint8_t { FILE, FOLDER };

    /** Returns the node type */
    Type GetType() const { return mType; }

    /** Returns true if this node is a file handle */
    bool isFile() const { return mType == Type::FILE; }

    /** Returns true if this node is a folder handle */
    bool isFolder() const { return mType == Type::FOLDER; }

    /** Returns the node's name (empty for the root) */
    const std::string& GetName() const { return mName; }

    /** Returns the node's absolute path in its storage */
    const std::string& GetPath() const { return mPath; }

    /** Returns the storage this node belongs to */
    Storage::BaseStorage& GetStorage() const { return *mStorage; }

    /** Returns true if both nodes belong to the same storage */
    bool isSameStorage(const Node& node) const { return mStorage == node.mStorage; }

    /** Returns true if this node has a parent (is not the root) */
    bool HasParent() const { return !mName.empty(); }

    /** Returns the parent folder or nullopt if the root */
    std::optional<Folder> TryGetParent() const;

    /**
     * Returns the parent folder
     * @throws NullParentException if this is the root
     */
    Folder GetParent() const;

    /**
     * Returns true iff the given folder is reached by walking up this node's parents
     * A node is not its own descendant
     */
    bool isDescendantOf(const Node& folder) const;

    /**
     * Returns true if an entry of this node's type exists in storage
     * @throws Storage::IOException on storage errors
     */
    bool Exists() const;

    /**
     * Deletes whatever entry exists at this location (recursively if a folder)
     * No-op if nothing exists
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors
     */
    void Delete() const;

    /**
     * Returns this node as a File handle
     * @throws WrongTypeException if not a file
     */
    File AsFile() const;

    /**
     * Returns this node as a Folder handle
     * @throws WrongTypeException if not a folder
     */
    Folder AsFolder() const;

    /**
     * Sets the creation time of the entry
     * @throws Storage::UnsupportedException if the storage does not support this
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors
     */
    void SetCreationTime(const Storage::BaseStorage::Clock::time_point& time) const;

    /**
     * Makes sure the storage allows modification
     * @throws Storage::ReadOnlyException if the storage is read-only
     */
    void CheckWritable() const;

    /** Nodes are equal if they are the same path in the same storage */
    bool operator==(const Node& node) const;
    bool operator!=(const Node& node) const { return !(*this == node); }

    /**
     * Validates a single path segment name (not empty, no /, not . or ..)
     * @throws InvalidPathException if the name is invalid
     */
    static void ValidateName(const std::string& name);

protected:

    friend class Folder; // constructs children

    /**
     * @param storage reference to the backing storage
     * @param path absolute normalized path
     * @param type the node type
     */
    Node(Storage::BaseStorage& storage, const std::string& path, Type type);

    /** Pointer to the backing storage (not owned) */
    Storage::BaseStorage* mStorage;

    /** Absolute path of this node */
    std::string mPath;

    /** Name of this node (last path segment) */
    std::string mName;

    /** The node type */
    Type mType;
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_NODE_H_
