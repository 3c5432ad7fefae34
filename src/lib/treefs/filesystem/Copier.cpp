
#include "Copier.hpp"
#include "File.hpp"
#include "Folder.hpp"
#include "treefs/Debug.hpp"

namespace TreeFS {
namespace Filesystem {

static Debug sDebug("Copier",nullptr); // NOLINT(cert-err58-cpp)

/*****************************************************/
void Copier::CheckOverlap(const Node& source, const Node& target)
{
    // a target containing the source would delete it in PrepareTarget
    if (source == target || target.isDescendantOf(source) || source.isDescendantOf(target))
    {
        SDBG_ERROR("... source:" << source.GetPath() << " target:" << target.GetPath());
        throw Node::SelfContainmentException(source.GetPath(), target.GetPath());
    }
}

/*****************************************************/
void Copier::CheckExists(const Node& source)
{
    if (!source.Exists())
        throw Storage::NotFoundException(source.GetPath());
}

/*****************************************************/
void Copier::PrepareTarget(const Node& target)
{
    target.CheckWritable();

    target.Delete();
    if (target.HasParent())
        target.GetParent().Create();
}

/*****************************************************/
void Copier::CopyTree(const Folder& source, const Folder& target)
{
    SDBG_INFO("(source:" << source.GetPath() << " target:" << target.GetPath() << ")");

    target.Create();

    for (const Node& child : source.GetChildren())
    {
        if (child.isFolder())
            CopyTree(child.AsFolder(), target.GetFolder(child.GetName()));
        else CopyContent(child.AsFile(), target.GetFile(child.GetName()));
    }
}

/*****************************************************/
void Copier::CopyContent(const File& source, const File& target)
{
    SDBG_INFO("(source:" << source.GetPath() << " target:" << target.GetPath() << ")");

    if (source.isSameStorage(target))
        target.GetStorage().CopyFile(source.GetPath(), target.GetPath());
    else target.GetStorage().WriteFile(target.GetPath(), source.Read());
}

/*****************************************************/
bool Copier::TryRename(const Node& source, const Node& target)
{
    if (!source.isSameStorage(target) || !source.GetStorage().GetOptions().useRename)
        return false;

    return source.GetStorage().TryRename(source.GetPath(), target.GetPath());
}

/*****************************************************/
void Copier::CopyFolder(const Folder& source, const Folder& target)
{
    SDBG_INFO("(source:" << source.GetPath() << " target:" << target.GetPath() << ")");

    CheckOverlap(source, target);
    CheckExists(source);

    PrepareTarget(target);
    CopyTree(source, target);
}

/*****************************************************/
void Copier::CopyFile(const File& source, const File& target)
{
    SDBG_INFO("(source:" << source.GetPath() << " target:" << target.GetPath() << ")");

    CheckOverlap(source, target);
    CheckExists(source);

    PrepareTarget(target);
    CopyContent(source, target);
}

/*****************************************************/
void Copier::MoveFolder(const Folder& source, const Folder& target)
{
    SDBG_INFO("(source:" << source.GetPath() << " target:" << target.GetPath() << ")");

    CheckOverlap(source, target);
    CheckExists(source);
    source.CheckWritable();

    PrepareTarget(target);
    if (TryRename(source, target)) return;

    SDBG_INFO("... copying");
    CopyTree(source, target);
    source.Delete();
}

/*****************************************************/
void Copier::MoveFile(const File& source, const File& target)
{
    SDBG_INFO("(source:" << source.GetPath() << " target:" << target.GetPath() << ")");

    CheckOverlap(source, target);
    CheckExists(source);
    source.CheckWritable();

    PrepareTarget(target);
    if (TryRename(source, target)) return;

    SDBG_INFO("... copying");
    CopyContent(source, target);
    source.Delete();
}

} // namespace Filesystem
} // namespace TreeFS
