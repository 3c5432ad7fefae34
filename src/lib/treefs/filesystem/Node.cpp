
#include "Node.hpp"
#include "File.hpp"
#include "Folder.hpp"
#include "treefs/Debug.hpp"
#include "treefs/StringUtil.hpp"

namespace TreeFS {
namespace Filesystem {

static Debug sDebug("Node",nullptr); // NOLINT(cert-err58-cpp)

/*****************************************************/
Node::Node(Storage::BaseStorage& storage, const std::string& path, Type type) :
    mStorage(&storage), mPath(path), mType(type)
{
    if (mPath != "/") mName = StringUtil::splitPath(mPath).second;
}

/*****************************************************/
void Node::ValidateName(const std::string& name)
{
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos)
    {
        SDBG_ERROR("... invalid name:" << name);
        throw InvalidPathException(name);
    }
}

/*****************************************************/
std::optional<Folder> Node::TryGetParent() const
{
    if (!HasParent()) return std::nullopt;

    std::string parent { StringUtil::splitPath(mPath).first };
    if (parent.empty()) parent = "/";
    return Folder(*mStorage, parent);
}

/*****************************************************/
Folder Node::GetParent() const
{
    std::optional<Folder> parent { TryGetParent() };
    if (!parent) throw NullParentException();
    return *parent;
}

/*****************************************************/
bool Node::isDescendantOf(const Node& folder) const
{
    for (std::optional<Folder> parent { TryGetParent() }; parent; parent = parent->TryGetParent())
    {
        if (*parent == folder) return true;
    }
    return false;
}

/*****************************************************/
bool Node::Exists() const
{
    const Storage::BaseStorage::EntryType type { mStorage->GetEntryType(mPath) };

    return isFolder() ? (type == Storage::BaseStorage::EntryType::FOLDER)
                      : (type == Storage::BaseStorage::EntryType::FILE);
}

/*****************************************************/
void Node::Delete() const
{
    switch (mStorage->GetEntryType(mPath))
    {
        case Storage::BaseStorage::EntryType::FILE:
            File(*mStorage, mPath).Delete(); break;
        case Storage::BaseStorage::EntryType::FOLDER:
            Folder(*mStorage, mPath).Delete(); break;
        case Storage::BaseStorage::EntryType::NONE: break;
    }
}

/*****************************************************/
File Node::AsFile() const
{
    if (!isFile()) throw WrongTypeException(mPath);
    return File(*mStorage, mPath);
}

/*****************************************************/
Folder Node::AsFolder() const
{
    if (!isFolder()) throw WrongTypeException(mPath);
    return Folder(*mStorage, mPath);
}

/*****************************************************/
void Node::SetCreationTime(const Storage::BaseStorage::Clock::time_point& time) const
{
    SDBG_INFO("(path:" << mPath << ")");

    CheckWritable();
    mStorage->SetCreationTime(mPath, time);
}

/*****************************************************/
void Node::CheckWritable() const
{
    if (mStorage->GetOptions().readOnly)
        throw Storage::ReadOnlyException();
}

/*****************************************************/
bool Node::operator==(const Node& node) const
{
    return mStorage == node.mStorage && mPath == node.mPath;
}

} // namespace Filesystem
} // namespace TreeFS
