
#include "File.hpp"
#include "Folder.hpp"
#include "Copier.hpp"
#include "treefs/Debug.hpp"

namespace TreeFS {
namespace Filesystem {

static Debug sDebug("File",nullptr); // NOLINT(cert-err58-cpp)

/*****************************************************/
File::File(Storage::BaseStorage& storage, const std::string& path) :
    Node(storage, path, Type::FILE) { }

/*****************************************************/
void File::Create() const
{
    SDBG_INFO("(path:" << mPath << ")");

    if (Exists()) return;
    CheckWritable();

    GetParent().Create();
    mStorage->CreateFile(mPath);
}

/*****************************************************/
void File::Delete() const
{
    SDBG_INFO("(path:" << mPath << ")");

    if (!Exists()) return;
    CheckWritable();

    mStorage->DeleteFile(mPath);
}

/*****************************************************/
std::string File::Read() const
{
    SDBG_INFO("(path:" << mPath << ")");

    return mStorage->ReadFile(mPath);
}

/*****************************************************/
void File::Write(const std::string& data) const
{
    SDBG_INFO("(path:" << mPath << " size:" << data.size() << ")");

    CheckWritable();

    GetParent().Create();
    mStorage->WriteFile(mPath, data);
}

/*****************************************************/
void File::CopyTo(const File& target) const
{
    Copier::CopyFile(*this, target);
}

/*****************************************************/
void File::MoveTo(const File& target) const
{
    Copier::MoveFile(*this, target);
}

} // namespace Filesystem
} // namespace TreeFS
