#include <cstdlib>
#include <fstream>
#include <sstream>

#include "BaseOptions.hpp"
#include "Debug.hpp"
#include "StringUtil.hpp"

namespace fs = std::filesystem;

namespace TreeFS {

/*****************************************************/
std::string BaseOptions::CoreBaseHelpText()
{
    return "(-h|--help | -V|--version)";
}

/*****************************************************/
std::string BaseOptions::DetailBaseHelpText(const std::string& name)
{
    std::ostringstream output;
    using std::endl;

    output << "Config File:     [-c|--config path]" << endl
           << "Debugging:       [-d|--debug errors|storage|info|details] [--debug-filter mod1,mod2+] [--debug-log path]" << endl << endl

           << "Any flag or option can also be given in treefs.conf";
    if (!name.empty()) output << " or treefs-" << name << ".conf";
    output << " as one option=value per line," << endl
           << "searched for in $TREEFS_CONFIG_DIR or /etc/treefs, ~/.config/treefs and the working directory.";

    return output.str();
}

/*****************************************************/
size_t BaseOptions::ParseArgs(size_t argc, const char* const* argv, bool stopmm)
{
    Flags flags; Options options;

    size_t idx { 1 };
    while (idx < argc)
    {
        const std::string arg { argv[idx++] };
        if (arg.size() < 2 || arg[0] != '-')
            throw BadUsageException("expected key at arg "+std::to_string(idx-1));

        if (arg == "--")
        {
            if (stopmm) break;
            throw BadUsageException("empty key at arg "+std::to_string(idx-1));
        }

        const bool isLong { arg[1] == '-' };
        const std::string key { arg.substr(isLong ? 2 : 1) };

        if (key.find('=') != std::string::npos)
            options.emplace(StringUtil::split(key, "=")); // -x=3, --x=3
        else if (!isLong && key.size() > 1)
            options.emplace(key.substr(0,1), key.substr(1)); // -x3
        else if (idx < argc && argv[idx][0] != '-')
            options.emplace(key, argv[idx++]); // -x 3, --x 3
        else flags.push_back(key); // -x, --x
    }

    AddAll(flags, options);
    return idx;
}

/*****************************************************/
void BaseOptions::ParseFile(const fs::path& path)
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) throw ConfigFileException(path.string());

    Flags flags; Options options;

    for (std::string line; std::getline(file, line); )
    {
        // also handles \r from Windows line endings
        line = StringUtil::trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.find('=') == std::string::npos)
        {
            flags.push_back(line);
            continue;
        }

        const StringUtil::StringPair pair { StringUtil::split(line, "=") };
        options.emplace(StringUtil::trim(pair.first), StringUtil::trim(pair.second));
    }

    if (file.bad()) throw ConfigFileException(path.string());
    AddAll(flags, options);
}

/*****************************************************/
std::list<fs::path> BaseOptions::GetConfigDirs()
{
    const char* const envDir { std::getenv("TREEFS_CONFIG_DIR") };
    if (envDir != nullptr && *envDir != '\0')
        return { fs::path(envDir) };

    std::list<fs::path> dirs { "/etc/treefs", "/usr/local/etc/treefs" };

    const char* const xdg { std::getenv("XDG_CONFIG_HOME") };
    const char* const home { std::getenv("HOME") };
    if (xdg != nullptr && *xdg != '\0')
        dirs.push_back(fs::path(xdg) / "treefs");
    else if (home != nullptr && *home != '\0')
        dirs.push_back(fs::path(home) / ".config" / "treefs");

    dirs.emplace_back(".");
    return dirs;
}

/*****************************************************/
void BaseOptions::ParseConfig(const std::string& prefix)
{
    for (const fs::path& dir : GetConfigDirs())
    {
        const fs::path path { dir / (prefix+".conf") };

        std::error_code ec;
        if (fs::is_regular_file(path, ec)) ParseFile(path);
    }
}

/*****************************************************/
void BaseOptions::AddAll(const Flags& flags, const Options& options)
{
    for (const Flags::value_type& flag : flags)
        if (!AddFlag(flag)) throw BadFlagException(flag);

    for (const Options::value_type& option : options)
        if (!AddOption(option.first, option.second)) throw BadOptionException(option.first);
}

/*****************************************************/
bool BaseOptions::AddFlag(const std::string& flag)
{
    if (flag == "h" || flag == "help")
        throw ShowHelpException();
    if (flag == "V" || flag == "version")
        throw ShowVersionException();
    return false;
}

/*****************************************************/
bool BaseOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "c" || option == "config")
    {
        std::error_code ec;
        if (!fs::is_regular_file(value, ec))
            throw BadValueException(option);
        ParseFile(value);
    }
    else if (option == "d" || option == "debug")
    {
        Debug::Level level { Debug::Level::ERRORS };
        if (!Debug::ParseLevel(value, level))
            throw BadValueException(option);
        Debug::SetLevel(level);
    }
    else if (option == "debug-filter")
        Debug::SetFilters(value);
    else if (option == "debug-log")
        Debug::AddLogFile(value);
    else return false;

    return true;
}

} // namespace TreeFS
