
#include <list>
#include <map>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "CommandLine.hpp"
#include "Options.hpp"

#include "treefs/BaseOptions.hpp"
using TreeFS::BaseOptions;
#include "treefs/StringUtil.hpp"
using TreeFS::StringUtil;
#include "treefs/filesystem/File.hpp"
using TreeFS::Filesystem::File;
#include "treefs/filesystem/Folder.hpp"
using TreeFS::Filesystem::Folder;
#include "treefs/filesystem/Node.hpp"
using TreeFS::Filesystem::Node;
#include "treefs/storage/BaseStorage.hpp"
using TreeFS::Storage::BaseStorage;
#include "treefs/storage/StorageException.hpp"
using TreeFS::Storage::NotFoundException;

namespace TreeFSCli {

namespace {

/** Min and max argument counts for each command */
using ArgCounts = std::pair<size_t, size_t>;
const std::map<std::string, ArgCounts> sCommands { // NOLINT(cert-err58-cpp)
    { "ls", {0,1} }, { "tree", {0,1} }, { "mkdir", {1,1} }, { "touch", {1,1} },
    { "cat", {1,1} }, { "write", {2,2} }, { "cp", {2,2} }, { "mv", {2,2} }, { "rm", {1,1} }
};

const char* TypeString(Node::Type type)
{
    return (type == Node::Type::FOLDER) ? "folder" : "file";
}

} // namespace

/*****************************************************/
std::string CommandLine::HelpText()
{
    std::ostringstream output;

    using std::endl;

    output
        << "Usage Syntax: " << endl
        << "treefs-cli " << Options::CoreHelpText() << endl
        << "treefs-cli " << Options::MainHelpText() << " -- command [args+]" << endl << endl

        << "NOTE that -- always comes before the command!" << endl
        << "NOTE --memory loads the tree from a JSON file and saves it back after modifying commands." << endl << endl

        << "commands: ls [path] | tree [path] | mkdir path | touch path | cat path" << endl
        << "          write path data | cp src dst | mv src dst | rm path" << endl
        << "         paths are relative to the storage root, cp/mv/rm replace and delete recursively" << endl << endl

        << Options::DetailHelpText() << endl;

    return output.str();
}

/*****************************************************/
CommandLine::CommandLine(Options& options, size_t argc, const char* const* argv) : mOptions(options)
{
    const size_t shift { mOptions.ParseArgs(argc, argv, true) };
    argc -= shift; argv += shift; mOptions.Validate();

    if (argc < 1) throw BaseOptions::BadUsageException("missing command");

    mCommand = argv[0];
    for (size_t i = 1; i < argc; i++)
        mArgs.emplace_back(argv[i]);

    const decltype(sCommands)::const_iterator it { sCommands.find(mCommand) };
    if (it == sCommands.cend())
    {
        std::list<std::string> names;
        for (const decltype(sCommands)::value_type& command : sCommands)
            names.push_back(command.first);
        throw BaseOptions::BadUsageException("unknown command "+mCommand+
            ", expected one of: "+StringUtil::implode(", ",names));
    }

    if (mArgs.size() < it->second.first || mArgs.size() > it->second.second)
        throw BaseOptions::BadUsageException("wrong argument count for "+mCommand);
}

/*****************************************************/
bool CommandLine::isModifying() const
{
    return mCommand != "ls" && mCommand != "tree" && mCommand != "cat";
}

/*****************************************************/
std::string CommandLine::GetArg(size_t idx, const std::string& def) const
{
    return (mArgs.size() > idx) ? mArgs[idx] : def;
}

/*****************************************************/
Node CommandLine::GetNode(const Folder& root, const std::string& path)
{
    const Folder folder { root.ResolveFolder(path) };
    if (folder.Exists()) return folder;

    const File file { root.ResolveFile(path) };
    if (file.Exists()) return file;

    throw NotFoundException(path);
}

/*****************************************************/
nlohmann::json CommandLine::DumpTree(const Folder& folder)
{
    nlohmann::json retval(nlohmann::json::value_t::object);

    for (const Node& child : folder.GetChildren())
    {
        if (child.isFolder())
            retval[child.GetName()] = DumpTree(child.AsFolder());
        else retval[child.GetName()] = child.AsFile().Read();
    }

    return retval;
}

/*****************************************************/
void CommandLine::RunList(const Folder& root, const std::string& path, std::ostream& output)
{
    const Node node { GetNode(root, path) };

    nlohmann::json list(nlohmann::json::value_t::array);
    const auto addNode = [&](const Node& child)
    {
        if (mOptions.isJsonOut())
            list.push_back(nlohmann::json{ {"name", child.GetName()}, {"type", TypeString(child.GetType())} });
        else output << child.GetName() << (child.isFolder() ? "/" : "") << std::endl;
    };

    if (node.isFolder())
    {
        for (const Node& child : node.AsFolder().GetChildren())
            addNode(child);
    }
    else addNode(node);

    if (mOptions.isJsonOut())
        output << list.dump(4) << std::endl;
}

/*****************************************************/
void CommandLine::RunTransfer(const Folder& root, const std::string& src, const std::string& dst, bool move)
{
    const Node source { GetNode(root, src) };

    if (source.isFolder())
    {
        const Folder target { root.ResolveFolder(dst) };
        if (move) source.AsFolder().MoveTo(target);
        else source.AsFolder().CopyTo(target);
    }
    else
    {
        const File target { root.ResolveFile(dst) };
        if (move) source.AsFile().MoveTo(target);
        else source.AsFile().CopyTo(target);
    }
}

/*****************************************************/
void CommandLine::Run(BaseStorage& storage, std::ostream& output)
{
    const Folder root { Folder::GetRoot(storage) };

    if (mCommand == "ls")
        RunList(root, GetArg(0), output);
    else if (mCommand == "tree")
    {
        const Node node { GetNode(root, GetArg(0)) };
        const nlohmann::json tree(node.isFolder() ?
            DumpTree(node.AsFolder()) : nlohmann::json(node.AsFile().Read()));
        output << tree.dump(4) << std::endl;
    }
    else if (mCommand == "mkdir")
        root.ResolveFolder(GetArg(0)).Create();
    else if (mCommand == "touch")
        root.ResolveFile(GetArg(0)).Create();
    else if (mCommand == "cat")
        output << root.ResolveFile(GetArg(0)).Read();
    else if (mCommand == "write")
        root.ResolveFile(GetArg(0)).Write(GetArg(1));
    else if (mCommand == "cp")
        RunTransfer(root, GetArg(0), GetArg(1), false);
    else if (mCommand == "mv")
        RunTransfer(root, GetArg(0), GetArg(1), true);
    else if (mCommand == "rm")
    {
        const Node node { GetNode(root, GetArg(0)) };
        node.Delete();
    }
}

} // namespace TreeFSCli
