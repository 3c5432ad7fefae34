
#include <sstream>

#include "StorageOptions.hpp"
#include "treefs/StringUtil.hpp"

namespace TreeFS {
namespace Storage {

/*****************************************************/
std::string StorageOptions::HelpText()
{
    std::ostringstream output;

    const StorageOptions optDefault;

    output << "Storage Options: [-r|--read-only] [--rename bool(" << BOOLSTR(optDefault.useRename) << ")]";

    return output.str();
}

/*****************************************************/
bool StorageOptions::AddFlag(const std::string& flag)
{
    if (flag == "r" || flag == "read-only")
        readOnly = true;
    else return false; // not used

    return true;
}

/*****************************************************/
bool StorageOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "read-only")
        readOnly = StringUtil::stringToBool(value);
    else if (option == "rename")
        useRename = StringUtil::stringToBool(value);
    else return false; // not used

    return true;
}

} // namespace Storage
} // namespace TreeFS
