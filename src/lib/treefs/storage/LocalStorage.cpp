
#include <fstream>
#include <sstream>

#include "LocalStorage.hpp"
#include "treefs/StringUtil.hpp"

namespace fs = std::filesystem;

namespace TreeFS {
namespace Storage {

/** Lists a host directory, opening it on the first Next() */
class LocalStorage::Reader : public BaseStorage::EntryReader
{
public:
    Reader(fs::path hostPath, std::string path) :
        mHostPath(std::move(hostPath)), mPath(std::move(path)) { }

    bool Next(Entry& entry) override
    {
        std::error_code ec;
        if (!mStarted)
        {
            mStarted = true;
            if (IsSymlink(mHostPath))
                throw IOException("not a folder: "+mPath);
            mIterator = fs::directory_iterator(mHostPath, ec);
        }
        else mIterator.increment(ec);

        if (ec) ThrowError("list "+mPath, ec);
        if (mIterator == fs::directory_iterator()) return false;

        entry.name = mIterator->path().filename().string();

        const fs::file_status status { mIterator->symlink_status(ec) };
        if (ec) ThrowError("stat "+StringUtil::joinPath(mPath, entry.name), ec);

        entry.type = fs::is_directory(status) ? EntryType::FOLDER : EntryType::FILE;
        return true;
    }

private:
    const fs::path mHostPath;
    const std::string mPath;

    bool mStarted { false };
    fs::directory_iterator mIterator;
};

/*****************************************************/
LocalStorage::LocalStorage(const fs::path& root, const StorageOptions& options) :
    BaseStorage(options), mRoot(root), mDebug(__func__,this)
{
    MDBG_INFO("(root:" << mRoot << ")");

    std::error_code ec;
    fs::create_directories(mRoot, ec);
    if (ec) ThrowError("create root "+mRoot.string(), ec);

    if (!fs::is_directory(mRoot, ec))
        throw IOException("root is not a directory: "+mRoot.string());
}

/*****************************************************/
void LocalStorage::ThrowError(const std::string& what, const std::error_code& ec)
{
    if (ec == std::errc::no_such_file_or_directory)
        throw NotFoundException(what);
    else throw IOException(what+": "+ec.message());
}

/*****************************************************/
bool LocalStorage::IsSymlink(const fs::path& hostPath)
{
    std::error_code ec; // missing is not a symlink
    return fs::is_symlink(fs::symlink_status(hostPath, ec));
}

/*****************************************************/
fs::path LocalStorage::HostPath(const std::string& path) const
{
    fs::path retval { mRoot };
    bool inRoot { true };

    for (const std::string& name : StringUtil::explode(path,"/"))
    {
        if (name.empty()) continue;
        if (name == "." || name == "..")
            throw IOException("invalid path: "+path);

        // only the last segment may be a symlink
        if (!inRoot && IsSymlink(retval))
            throw IOException("path through symlink: "+path);

        retval /= name; inRoot = false;
    }

    return retval;
}

/*****************************************************/
void LocalStorage::RemoveSymlink(const fs::path& hostPath, const std::string& path)
{
    if (!IsSymlink(hostPath)) return;

    std::error_code ec;
    fs::remove(hostPath, ec);
    if (ec) ThrowError("unlink "+path, ec);
}

/*****************************************************/
BaseStorage::EntryType LocalStorage::GetEntryType(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    std::error_code ec;
    const fs::file_status status { fs::symlink_status(HostPath(path), ec) };

    if (status.type() == fs::file_type::not_found) return EntryType::NONE;
    if (ec) ThrowError("stat "+path, ec);

    // symlinks are never followed, they are files that only delete/rename/copy as links
    return fs::is_directory(status) ? EntryType::FOLDER : EntryType::FILE;
}

/*****************************************************/
std::unique_ptr<BaseStorage::EntryReader> LocalStorage::ListFolder(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    return std::make_unique<Reader>(HostPath(path), path);
}

/*****************************************************/
void LocalStorage::CreateFolder(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const EntryType type { GetEntryType(path) };
    if (type == EntryType::FOLDER) return;
    if (type == EntryType::FILE) throw IOException("file exists: "+path);

    std::error_code ec;
    fs::create_directory(HostPath(path), ec);
    if (ec) ThrowError("mkdir "+path, ec);
}

/*****************************************************/
void LocalStorage::CreateFile(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    const EntryType type { GetEntryType(path) };
    if (type == EntryType::FILE) return;
    if (type == EntryType::FOLDER) throw IOException("folder exists: "+path);

    std::ofstream file(HostPath(path), std::ios::out | std::ios::binary);
    if (!file) throw IOException("create "+path);
}

/*****************************************************/
void LocalStorage::DeleteFile(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    if (GetEntryType(path) != EntryType::FILE)
        throw NotFoundException(path);

    std::error_code ec;
    fs::remove(HostPath(path), ec);
    if (ec) ThrowError("delete "+path, ec);
}

/*****************************************************/
void LocalStorage::DeleteFolder(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    if (GetEntryType(path) != EntryType::FOLDER)
        throw NotFoundException(path);

    std::error_code ec; // fails if not empty
    fs::remove(HostPath(path), ec);
    if (ec) ThrowError("rmdir "+path, ec);
}

/*****************************************************/
void LocalStorage::CopyFile(const std::string& src, const std::string& dst)
{
    MDBG_STORAGE("(src:" << src << " dst:" << dst << ")");

    if (GetEntryType(src) != EntryType::FILE)
        throw NotFoundException(src);
    if (GetEntryType(dst) == EntryType::FOLDER)
        throw IOException("folder exists: "+dst);

    const fs::path srcPath { HostPath(src) };
    const fs::path dstPath { HostPath(dst) };
    RemoveSymlink(dstPath, dst);

    std::error_code ec;
    if (IsSymlink(srcPath))
        fs::copy_symlink(srcPath, dstPath, ec);
    else fs::copy_file(srcPath, dstPath, fs::copy_options::overwrite_existing, ec);
    if (ec) ThrowError("copy "+src+" to "+dst, ec);
}

/*****************************************************/
std::string LocalStorage::ReadFile(const std::string& path)
{
    MDBG_STORAGE("(path:" << path << ")");

    if (GetEntryType(path) != EntryType::FILE)
        throw NotFoundException(path);

    const fs::path hostPath { HostPath(path) };
    std::error_code ec; // a symlink is read through if it points to a file
    if (!fs::is_regular_file(hostPath, ec))
        throw IOException("not a regular file: "+path);

    std::ifstream file(hostPath, std::ios::in | std::ios::binary);
    if (!file) throw IOException("open "+path);

    std::ostringstream data; data << file.rdbuf();
    if (file.bad()) throw IOException("read "+path);
    return data.str();
}

/*****************************************************/
void LocalStorage::WriteFile(const std::string& path, const std::string& data)
{
    MDBG_STORAGE("(path:" << path << " size:" << data.size() << ")");

    if (GetEntryType(path) == EntryType::FOLDER)
        throw IOException("folder exists: "+path);

    // replaces a symlink rather than writing through it
    const fs::path hostPath { HostPath(path) };
    RemoveSymlink(hostPath, path);

    std::ofstream file(hostPath, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) throw IOException("open "+path);

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush(); if (!file) throw IOException("write "+path);
}

/*****************************************************/
bool LocalStorage::TryRename(const std::string& src, const std::string& dst)
{
    MDBG_STORAGE("(src:" << src << " dst:" << dst << ")");

    if (GetEntryType(dst) != EntryType::NONE)
        throw IOException("target exists: "+dst);

    std::error_code ec;
    fs::rename(HostPath(src), HostPath(dst), ec);
    if (ec) ThrowError("rename "+src+" to "+dst, ec);
    return true;
}

} // namespace Storage
} // namespace TreeFS
