
#include <list>
#include <memory>

#include "Folder.hpp"
#include "Copier.hpp"
#include "PathResolver.hpp"
#include "treefs/Debug.hpp"
#include "treefs/StringUtil.hpp"

namespace TreeFS {
namespace Filesystem {

static Debug sDebug("Folder",nullptr); // NOLINT(cert-err58-cpp)

/*****************************************************/
Folder::Folder(Storage::BaseStorage& storage, const std::string& path) :
    Node(storage, path, Type::FOLDER) { }

/*****************************************************/
Folder Folder::GetRoot(Storage::BaseStorage& storage)
{
    return Folder(storage, "/");
}

/*****************************************************/
Folder::Children Folder::GetChildren() const
{
    SDBG_INFO("(path:" << mPath << ")");

    // the reader is opened lazily so that listing failures surface on the first pull
    const Folder folder { *this };
    const std::shared_ptr<std::unique_ptr<Storage::BaseStorage::EntryReader>> reader {
        std::make_shared<std::unique_ptr<Storage::BaseStorage::EntryReader>>() };

    return Children([folder,reader]()->std::optional<Node>
    {
        if (!*reader) *reader = folder.mStorage->ListFolder(folder.mPath);

        Storage::BaseStorage::Entry entry;
        if (!(*reader)->Next(entry)) return std::nullopt;

        const std::string path { StringUtil::joinPath(folder.mPath, entry.name) };
        return Node(*folder.mStorage, path, (entry.type == Storage::BaseStorage::EntryType::FOLDER)
            ? Type::FOLDER : Type::FILE);
    });
}

/*****************************************************/
Folder::Files Folder::GetFiles() const
{
    return GetChildren()
        .Filter([](const Node& node){ return node.isFile(); })
        .Map<File>([](const Node& node){ return node.AsFile(); });
}

/*****************************************************/
Folder::Folders Folder::GetFolders() const
{
    return GetChildren()
        .Filter([](const Node& node){ return node.isFolder(); })
        .Map<Folder>([](const Node& node){ return node.AsFolder(); });
}

/*****************************************************/
File Folder::GetFile(const std::string& name) const
{
    ValidateName(name);
    return File(*mStorage, StringUtil::joinPath(mPath, name));
}

/*****************************************************/
Folder Folder::GetFolder(const std::string& name) const
{
    ValidateName(name);
    return Folder(*mStorage, StringUtil::joinPath(mPath, name));
}

/*****************************************************/
File Folder::ResolveFile(const std::string& path) const
{
    return PathResolver::ResolveFile(*this, path);
}

/*****************************************************/
Folder Folder::ResolveFolder(const std::string& path) const
{
    return PathResolver::ResolveFolder(*this, path);
}

/*****************************************************/
void Folder::Create() const
{
    SDBG_INFO("(path:" << mPath << ")");

    if (Exists()) return;
    CheckWritable();

    if (HasParent()) GetParent().Create();
    mStorage->CreateFolder(mPath);
}

/*****************************************************/
void Folder::Delete() const
{
    SDBG_INFO("(path:" << mPath << ")");

    if (!Exists()) return;
    CheckWritable();

    // finish listing before modifying the folder
    const std::list<Node> children { GetChildren().ToList() };
    for (const Node& child : children) child.Delete();

    if (HasParent()) mStorage->DeleteFolder(mPath);
}

/*****************************************************/
void Folder::CopyTo(const Folder& target) const
{
    Copier::CopyFolder(*this, target);
}

/*****************************************************/
void Folder::MoveTo(const Folder& target) const
{
    Copier::MoveFolder(*this, target);
}

/*****************************************************/
bool Folder::IsAncestorOf(const Node& node) const
{
    return node.isDescendantOf(*this);
}

} // namespace Filesystem
} // namespace TreeFS
