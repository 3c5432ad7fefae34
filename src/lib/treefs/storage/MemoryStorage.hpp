#ifndef LIBTFS_MEMORYSTORAGE_H_
#define LIBTFS_MEMORYSTORAGE_H_

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "nlohmann/json_fwd.hpp"

#include "BaseStorage.hpp"
#include "treefs/Debug.hpp"

namespace TreeFS {
namespace Storage {

/** 
 * A storage that keeps the whole tree in memory (useful for testing)
 * Supports atomic rename and creation times
 * THREAD SAFE (INTERNAL LOCKS) - each primitive is atomic, sequences of them are not
 */
class MemoryStorage : public BaseStorage
{
public:

    /** Construct an empty storage (only the root folder exists) */
    explicit MemoryStorage(const StorageOptions& options = {});

    /** 
     * Construct a storage initialized with the given tree
     * @param tree JSON tree - objects are folders, strings are file contents
     * @throws FormatException if the JSON tree is malformed
     */
    MemoryStorage(const nlohmann::json& tree, const StorageOptions& options = {});

    ~MemoryStorage() override;
    DELETE_COPY(MemoryStorage)
    DELETE_MOVE(MemoryStorage)

    const char* GetTypeName() const override { return "memory"; }

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

    void SetCreationTime(const std::string& path, const Clock::time_point& time) override;

    /** 
     * Returns the creation time set for the given entry, if any
     * @throws NotFoundException if the entry does not exist
     */
    std::optional<Clock::time_point> GetCreationTime(const std::string& path) const;

    /** 
     * Replaces the contents of the given folder with the given tree
     * @param tree JSON tree - objects are folders, strings are file contents
     * @param path the folder to load into (must exist)
     * @throws FormatException if the JSON tree is malformed
     * @throws NotFoundException if path is not a folder
     */
    void LoadJSON(const nlohmann::json& tree, const std::string& path = "/");

    /** 
     * Returns the given entry as a JSON tree in the LoadJSON format
     * @throws NotFoundException if the entry does not exist
     */
    nlohmann::json DumpJSON(const std::string& path = "/") const;

private:

    /** An in-memory file or folder */
    struct MemoryNode
    {
        explicit MemoryNode(EntryType t) : type(t) { }

        EntryType type;
        /** File content (files only) */
        std::string data;
        /** Sorted children by name (folders only) */
        std::map<std::string, std::unique_ptr<MemoryNode>> children;
        /** Creation time if one was set */
        std::optional<Clock::time_point> created;
    };

    class Reader;

    /** Returns the node at the given path or nullptr if not found - MUST hold mMutex */
    MemoryNode* TryFind(const std::string& path) const;

    /** 
     * Returns the node at the given path - MUST hold mMutex
     * @throws NotFoundException if not found or not of the given type
     */
    MemoryNode& Find(const std::string& path, EntryType type) const;

    /** 
     * Returns the parent folder of the given path - MUST hold mMutex
     * @param[out] name set to the last path segment
     * @throws NotFoundException if the parent is not a folder
     * @throws IOException if path is the root
     */
    MemoryNode& FindParent(const std::string& path, std::string& name) const;

    /** 
     * Recursively fills the given folder with the JSON tree
     * @throws FormatException if the JSON tree is malformed
     */
    static void LoadNode(MemoryNode& folder, const nlohmann::json& tree);

    /** Recursively converts the given node to JSON */
    static nlohmann::json DumpNode(const MemoryNode& node);

    /** The root folder */
    std::unique_ptr<MemoryNode> mRoot;

    /** Mutex protecting the whole tree */
    mutable std::mutex mMutex;

    mutable Debug mDebug;
};

} // namespace Storage
} // namespace TreeFS

#endif // LIBTFS_MEMORYSTORAGE_H_
