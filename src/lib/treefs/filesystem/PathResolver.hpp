#ifndef LIBTFS_PATHRESOLVER_H_
#define LIBTFS_PATHRESOLVER_H_

#include <string>

#include "treefs/StringUtil.hpp"

namespace TreeFS {
namespace Filesystem {

class File;
class Folder;

/**
 * Resolves slash-separated relative paths against a starting folder
 * Resolving is purely lexical and does no I/O, so the result may not exist.
 * Empty segments and "." are skipped. Any other segment (including "..")
 * is looked up as a child name, which rejects "..".
 */
class PathResolver
{
public:

    PathResolver() = delete; // static only

    /** Splits a path into its meaningful segments (drops empty and "." segments) */
    [[nodiscard]] static StringUtil::StringList SplitPath(const std::string& path);

    /**
     * Resolves path as a file under start
     * @throws Node::InvalidPathException if the path has no segments or a segment is invalid
     */
    [[nodiscard]] static File ResolveFile(const Folder& start, const std::string& path);

    /**
     * Resolves path as a folder under start (start itself if the path has no segments)
     * @throws Node::InvalidPathException if a segment is invalid
     */
    [[nodiscard]] static Folder ResolveFolder(const Folder& start, const std::string& path);
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_PATHRESOLVER_H_
