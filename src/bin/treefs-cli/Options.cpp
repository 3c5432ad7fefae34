
#include <sstream>

#include "Options.hpp"

#include "treefs/BaseOptions.hpp"
using TreeFS::BaseOptions;
#include "treefs/storage/StorageOptions.hpp"
using TreeFS::Storage::StorageOptions;

namespace TreeFSCli {

/*****************************************************/
std::string Options::CoreHelpText()
{
    return CoreBaseHelpText();
}

/*****************************************************/
std::string Options::MainHelpText()
{
    return "(--root path | -m|--memory file.json)";
}

/*****************************************************/
std::string Options::DetailHelpText()
{
    std::ostringstream output;

    using std::endl;

    output
        << "Other Options:   [--json]" << endl
        << StorageOptions::HelpText() << endl << endl

        << DetailBaseHelpText("cli");

    return output.str();
}

/*****************************************************/
Options::Options(StorageOptions& storageOptions) :
    mStorageOptions(storageOptions) { }

/*****************************************************/
bool Options::AddFlag(const std::string& flag)
{
    if (BaseOptions::AddFlag(flag)) { }

    else if (flag == "json") mJsonOut = true;

    else if (mStorageOptions.AddFlag(flag)) { }
    else return false; // not used

    return true;
}

/*****************************************************/
bool Options::AddOption(const std::string& option, const std::string& value)
{
    if (BaseOptions::AddOption(option, value)) { }

    /** Storage backend selection */
    else if (option == "root") mRootPath = value;
    else if (option == "m" || option == "memory") mMemoryPath = value;

    else if (mStorageOptions.AddOption(option, value)) { }
    else return false; // not used

    return true;
}

/*****************************************************/
void Options::Validate()
{
    if (mRootPath.empty() && mMemoryPath.empty())
        throw MissingOptionException("root");

    if (!mRootPath.empty() && !mMemoryPath.empty())
        throw BadUsageException("--root and --memory are exclusive");
}

} // namespace TreeFSCli
