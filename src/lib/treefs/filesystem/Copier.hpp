#ifndef LIBTFS_COPIER_H_
#define LIBTFS_COPIER_H_

namespace TreeFS {
namespace Filesystem {

class Node;
class File;
class Folder;

/**
 * Recursive copy and move of files and folders, possibly across storages
 *
 * Any existing entry (of either type) at the target is deleted first, so the
 * result exactly replaces it. Missing parents of the target are created.
 * A target that overlaps its source is rejected before anything is changed.
 * A failure partway through leaves whatever was already copied in place.
 */
class Copier
{
public:

    Copier() = delete; // static only

    /**
     * Replicates source and all its contents at target
     * @throws Node::SelfContainmentException if target is source or inside it
     * @throws Storage::NotFoundException if source does not exist
     * @throws Storage::ReadOnlyException if the target storage is read-only
     * @throws Storage::IOException on storage errors
     */
    static void CopyFolder(const Folder& source, const Folder& target);

    /**
     * Replicates the source file's content at target
     * @throws Node::SelfContainmentException if target is source
     * @throws Storage::NotFoundException if source does not exist
     * @throws Storage::ReadOnlyException if the target storage is read-only
     * @throws Storage::IOException on storage errors
     */
    static void CopyFile(const File& source, const File& target);

    /**
     * Relocates source and all its contents to target
     * Uses an atomic storage rename if possible, else copies then deletes the source.
     * @throws Node::SelfContainmentException if target is source or inside it
     * @throws Storage::NotFoundException if source does not exist
     * @throws Storage::ReadOnlyException if either storage is read-only
     * @throws Storage::IOException on storage errors
     */
    static void MoveFolder(const Folder& source, const Folder& target);

    /**
     * Relocates the source file to target (see MoveFolder)
     * @throws Node::SelfContainmentException if target is source
     * @throws Storage::NotFoundException if source does not exist
     * @throws Storage::ReadOnlyException if either storage is read-only
     * @throws Storage::IOException on storage errors
     */
    static void MoveFile(const File& source, const File& target);

private:

    /**
     * Checks that source and target do not overlap
     * @throws Node::SelfContainmentException if target is source, inside source, or contains source
     */
    static void CheckOverlap(const Node& source, const Node& target);

    /** @throws Storage::NotFoundException if source does not exist */
    static void CheckExists(const Node& source);

    /** Deletes anything at target and creates its missing parents */
    static void PrepareTarget(const Node& target);

    /** Copies source recursively to target whose parent exists but target doesn't */
    static void CopyTree(const Folder& source, const Folder& target);

    /** Copies the content of source to target whose parent exists */
    static void CopyContent(const File& source, const File& target);

    /** Renames source to target if both are in the same storage and it allows it */
    static bool TryRename(const Node& source, const Node& target);
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_COPIER_H_
