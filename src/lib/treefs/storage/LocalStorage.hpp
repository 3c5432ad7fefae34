#ifndef LIBTFS_LOCALSTORAGE_H_
#define LIBTFS_LOCALSTORAGE_H_

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "BaseStorage.hpp"
#include "treefs/Debug.hpp"

namespace TreeFS {
namespace Storage {

/** 
 * A storage backed by a directory on the local disk
 * Supports atomic rename, does not support setting creation times.
 * Host symlinks are never followed out of the root: a symlink is listed as a
 * file, deleting or renaming it affects only the link, copying it copies the
 * link, writing replaces it, and paths may not go through one.
 */
class LocalStorage : public BaseStorage
{
public:

    /** 
     * @param root host directory that becomes the storage root (created if missing)
     * @param options storage options
     * @throws IOException if the root cannot be created
     */
    explicit LocalStorage(const std::filesystem::path& root, const StorageOptions& options = {});

    ~LocalStorage() override = default;
    DELETE_COPY(LocalStorage)
    DELETE_MOVE(LocalStorage)

    const char* GetTypeName() const override { return "local"; }

    /** Returns the host directory mapped to the storage root */
    const std::filesystem::path& GetRoot() const { return mRoot; }

    EntryType GetEntryType(const std::string& path) override;

    std::unique_ptr<EntryReader> ListFolder(const std::string& path) override;

    void CreateFolder(const std::string& path) override;

    void CreateFile(const std::string& path) override;

    void DeleteFile(const std::string& path) override;

    void DeleteFolder(const std::string& path) override;

    void CopyFile(const std::string& src, const std::string& dst) override;

    std::string ReadFile(const std::string& path) override;

    void WriteFile(const std::string& path, const std::string& data) override;

    bool TryRename(const std::string& src, const std::string& dst) override;

private:

    class Reader;

    /** 
     * Maps a storage path to a host path under mRoot
     * @throws IOException if the path has . or .. segments or goes through a symlink
     */
    std::filesystem::path HostPath(const std::string& path) const;

    /** Returns true if hostPath itself is a symlink (not following it) */
    static bool IsSymlink(const std::filesystem::path& hostPath);

    /** 
     * Removes hostPath if it is a symlink
     * @throws IOException if removing fails
     */
    static void RemoveSymlink(const std::filesystem::path& hostPath, const std::string& path);

    /** 
     * Throws the exception matching the given error code
     * @param what the operation and path that failed
     * @throws NotFoundException if the error is a missing entry
     * @throws IOException otherwise
     */
    [[noreturn]] static void ThrowError(const std::string& what, const std::error_code& ec);

    /** Host directory mapped to "/" */
    const std::filesystem::path mRoot;

    mutable Debug mDebug;
};

} // namespace Storage
} // namespace TreeFS

#endif // LIBTFS_LOCALSTORAGE_H_
