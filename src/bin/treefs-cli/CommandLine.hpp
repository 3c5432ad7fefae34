#ifndef TFSCLI_COMMANDLINE_H_
#define TFSCLI_COMMANDLINE_H_

#include <ostream>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "treefs/StringUtil.hpp"

namespace TreeFS {
    namespace Storage { class BaseStorage; }
    namespace Filesystem { class Node; class Folder; }
}

namespace TreeFSCli {

class Options;

/** Gets options and a filesystem command from the command line */
class CommandLine
{
public:

    /** Retrieve the standard help text string */
    static std::string HelpText();

    /**
     * Parses command line arguments from main (skips argv[0]!)
     * @throws BadUsageException if invalid arguments or an unknown command
     * @throws BadFlagException if a invalid flag is used
     * @throws BadOptionException if an invalid option is used
     */
    explicit CommandLine(Options& options, size_t argc, const char* const* argv);

    /** Returns true if the command can modify the storage */
    bool isModifying() const;

    /**
     * Runs the command against the given storage
     * @param storage the storage to operate on
     * @param output stream to print results to
     * @throws TreeFS::Storage::StorageException on storage errors
     * @throws TreeFS::Filesystem::Node::Exception on filesystem errors
     */
    void Run(TreeFS::Storage::BaseStorage& storage, std::ostream& output);

private:

    /**
     * Returns the node at the given path, a folder if one exists there, else a file
     * @throws TreeFS::Storage::NotFoundException if nothing exists at path
     */
    static TreeFS::Filesystem::Node GetNode(const TreeFS::Filesystem::Folder& root, const std::string& path);

    /** Returns the folder's subtree as JSON (object = folder, string = file content) */
    static nlohmann::json DumpTree(const TreeFS::Filesystem::Folder& folder);

    /** Prints the children of the node at path (or the node itself if a file) */
    void RunList(const TreeFS::Filesystem::Folder& root, const std::string& path, std::ostream& output);

    /** Copies or moves the node at src to dst */
    static void RunTransfer(const TreeFS::Filesystem::Folder& root,
        const std::string& src, const std::string& dst, bool move);

    /** Returns the command argument at the given index or the default if not given */
    std::string GetArg(size_t idx, const std::string& def = "") const;

    Options& mOptions;

    std::string mCommand;
    TreeFS::StringUtil::StringList mArgs;
};

} // namespace TreeFSCli

#endif // TFSCLI_COMMANDLINE_H_
