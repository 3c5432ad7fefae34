
#include <utility>

#include "PathResolver.hpp"
#include "File.hpp"
#include "Folder.hpp"
#include "treefs/Debug.hpp"

namespace TreeFS {
namespace Filesystem {

static Debug sDebug("PathResolver",nullptr); // NOLINT(cert-err58-cpp)

/*****************************************************/
StringUtil::StringList PathResolver::SplitPath(const std::string& path)
{
    StringUtil::StringList retval;

    for (std::string& segment : StringUtil::explode(path,"/"))
    {
        if (segment.empty() || segment == ".") continue;
        retval.push_back(std::move(segment));
    }

    return retval;
}

/*****************************************************/
Folder PathResolver::ResolveFolder(const Folder& start, const std::string& path)
{
    SDBG_INFO("(start:" << start.GetPath() << " path:" << path << ")");

    Folder folder { start };
    for (const std::string& segment : SplitPath(path))
        folder = folder.GetFolder(segment);
    return folder;
}

/*****************************************************/
File PathResolver::ResolveFile(const Folder& start, const std::string& path)
{
    SDBG_INFO("(start:" << start.GetPath() << " path:" << path << ")");

    StringUtil::StringList segments { SplitPath(path) };
    if (segments.empty()) throw Node::InvalidPathException(path);

    const std::string name { segments.back() };
    segments.pop_back();

    Folder folder { start };
    for (const std::string& segment : segments)
        folder = folder.GetFolder(segment);
    return folder.GetFile(name);
}

} // namespace Filesystem
} // namespace TreeFS
