#ifndef LIBTFS_FOLDER_H_
#define LIBTFS_FOLDER_H_

#include <string>

#include "Node.hpp"
#include "File.hpp"
#include "LazySequence.hpp"

namespace TreeFS {
namespace Filesystem {

/** A handle to a folder location (see Node) */
class Folder : public Node
{
public:

    /** Returns the root folder of the given storage */
    static Folder GetRoot(Storage::BaseStorage& storage);

    using Children = LazySequence<Node>;
    using Files = LazySequence<File>;
    using Folders = LazySequence<Folder>;

    /**
     * Returns a lazy sequence of this folder's direct children
     * Calling this does no I/O. The listing is opened when the first element is
     * pulled, and storage failures (e.g. the folder does not exist) are thrown
     * as Storage::IOException from the pull, not from here.
     * Children are returned in the order the storage lists them.
     */
    Children GetChildren() const;

    /** Returns a lazy sequence of only the child files (see GetChildren) */
    Files GetFiles() const;

    /** Returns a lazy sequence of only the child folders (see GetChildren) */
    Folders GetFolders() const;

    /**
     * Returns the handle of the child file with the given name (no I/O)
     * @throws InvalidPathException if the name is not a valid single segment
     */
    File GetFile(const std::string& name) const;

    /**
     * Returns the handle of the child folder with the given name (no I/O)
     * @throws InvalidPathException if the name is not a valid single segment
     */
    Folder GetFolder(const std::string& name) const;

    /** Resolves a relative path to a file handle (see PathResolver::ResolveFile) */
    File ResolveFile(const std::string& path) const;

    /** Resolves a relative path to a folder handle (see PathResolver::ResolveFolder) */
    Folder ResolveFolder(const std::string& path) const;

    /**
     * Creates the folder and any missing parents (no-op if it exists)
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors (e.g. a file is in the way)
     */
    void Create() const;

    /**
     * Recursively deletes the folder and its contents, no-op unless a folder exists here
     * Deleting the root removes its contents only.
     * @throws Storage::ReadOnlyException if the storage is read-only
     * @throws Storage::IOException on storage errors
     */
    void Delete() const;

    /** Recursively copies this folder to target, replacing anything there (see Copier::CopyFolder) */
    void CopyTo(const Folder& target) const;

    /** Moves this folder to target, replacing anything there (see Copier::MoveFolder) */
    void MoveTo(const Folder& target) const;

    /** Returns true iff this folder is a proper ancestor of node (not of itself) */
    bool IsAncestorOf(const Node& node) const;

private:

    friend class Node;

    /**
     * @param storage reference to the backing storage
     * @param path absolute normalized path
     */
    Folder(Storage::BaseStorage& storage, const std::string& path);
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_FOLDER_H_
