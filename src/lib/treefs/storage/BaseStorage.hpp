#ifndef LIBTFS_BASESTORAGE_H_
#define LIBTFS_BASESTORAGE_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "StorageException.hpp"
#include "StorageOptions.hpp"
#include "treefs/common.hpp"

namespace TreeFS {
namespace Storage {

/** 
 * Abstract backing storage providing the raw primitives the filesystem core is built on
 * All paths are absolute and normalized ("/" is the root, "/a/b" has no trailing slash)
 * The storage object must outlive all filesystem handles that reference it
 */
class BaseStorage
{
public:

    virtual ~BaseStorage() = default;
    DELETE_COPY(BaseStorage)
    DELETE_MOVE(BaseStorage)

    /** Kind of entry found at a storage path */
    enum class EntryType : uint8_t { NONE, FILE, FOLDER };

    /** A direct child of a folder */
    struct Entry
    {
        /** Name of the child (last path segment) */
        std::string name;
        /** Whether the child is a file or folder */
        EntryType type { EntryType::NONE };
    };

    /** 
     * Pull-based listing of a folder's direct children
     * Each Next() may perform I/O, so failures surface while reading, not when listing
     */
    class EntryReader
    {
    public:
        virtual ~EntryReader() = default;

        /** 
         * Reads the next entry
         * @param[out] entry entry to fill if one is available
         * @return false if there are no more entries
         * @throws IOException if the storage fails while reading
         */
        virtual bool Next(Entry& entry) = 0;
    };

    /** Clock used for timestamps */
    using Clock = std::chrono::system_clock;

    /** Returns the options this storage was configured with */
    const StorageOptions& GetOptions() const { return mOptions; }

    /** Returns a short name for this storage type used in debug */
    virtual const char* GetTypeName() const = 0;

    /** Returns the type of entry at path or NONE if it does not exist */
    virtual EntryType GetEntryType(const std::string& path) = 0;

    /** 
     * Returns a lazy reader over the direct children of the given folder
     * Must not throw for I/O issues - those are thrown from EntryReader::Next()
     */
    virtual std::unique_ptr<EntryReader> ListFolder(const std::string& path) = 0;

    /** 
     * Creates a single folder whose parent exists (no-op if already a folder)
     * @throws IOException on storage errors
     */
    virtual void CreateFolder(const std::string& path) = 0;

    /** 
     * Creates an empty file whose parent exists (no-op if already a file)
     * @throws IOException on storage errors
     */
    virtual void CreateFile(const std::string& path) = 0;

    /** 
     * Removes a single file
     * @throws NotFoundException if not a file
     * @throws IOException on storage errors
     */
    virtual void DeleteFile(const std::string& path) = 0;

    /** 
     * Removes a single empty folder
     * @throws NotFoundException if not a folder
     * @throws IOException if not empty or on storage errors
     */
    virtual void DeleteFolder(const std::string& path) = 0;

    /** 
     * Duplicates the content of file src at dst, replacing any file at dst
     * @throws NotFoundException if src is not a file
     * @throws IOException on storage errors
     */
    virtual void CopyFile(const std::string& src, const std::string& dst) = 0;

    /** 
     * Returns the whole content of the given file
     * @throws NotFoundException if not a file
     * @throws IOException on storage errors
     */
    virtual std::string ReadFile(const std::string& path) = 0;

    /** 
     * Replaces the whole content of the given file, creating it if needed
     * @throws IOException on storage errors
     */
    virtual void WriteFile(const std::string& path, const std::string& data) = 0;

    /** 
     * Atomically renames src to dst, which must not exist (but whose parent does)
     * @return false if renaming is not supported by this storage
     * @throws IOException on storage errors
     */
    virtual bool TryRename(const std::string& src, const std::string& dst) { (void)src; (void)dst; return false; }

    /** 
     * Sets the creation time of the entry at path
     * @throws UnsupportedException if the storage does not record creation times
     * @throws IOException on storage errors
     */
    virtual void SetCreationTime(const std::string& path, const Clock::time_point& time)
    {
        (void)path; (void)time;
        throw UnsupportedException(std::string(GetTypeName())+" creation time");
    }

protected:

    /** @param options storage options to copy */
    explicit BaseStorage(const StorageOptions& options) : mOptions(options) { }

private:

    const StorageOptions mOptions;
};

} // namespace Storage
} // namespace TreeFS

#endif // LIBTFS_BASESTORAGE_H_
