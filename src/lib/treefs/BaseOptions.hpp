#ifndef LIBTFS_BASEOPTIONS_H_
#define LIBTFS_BASEOPTIONS_H_

#include <filesystem>
#include <list>
#include <map>
#include <string>

#include "BaseException.hpp"

namespace TreeFS {

/**
 * Base for program options gathered from the command line and config files
 * Derived classes handle their own flags and options, falling back to these
 * base handlers for help, version, config and debugging
 */
class BaseOptions
{
public:

    virtual ~BaseOptions() = default;

    /** Base for all errors in user-supplied options */
    class Exception : public BaseException {
        using BaseException::BaseException; };

    /** Thrown when -h or --help is given */
    class ShowHelpException : public Exception {
        public: ShowHelpException() : Exception("") {} };

    /** Thrown when -V or --version is given */
    class ShowVersionException : public Exception {
        public: ShowVersionException() : Exception("") {} };

    /** The arguments do not follow the expected syntax */
    class BadUsageException : public Exception {
        public: explicit BadUsageException(const std::string& details) :
            Exception("Invalid Usage: "+details) {} };

    /** No handler accepted the flag */
    class BadFlagException : public Exception {
        public: explicit BadFlagException(const std::string& flag) :
            Exception("Unknown Flag: "+flag) {} };

    /** No handler accepted the option */
    class BadOptionException : public Exception {
        public: explicit BadOptionException(const std::string& option) :
            Exception("Unknown Option: "+option) {} };

    /** The option's value is not valid for it */
    class BadValueException : public Exception {
        public: explicit BadValueException(const std::string& option) :
            Exception("Bad Option Value: "+option) {} };

    /** A required option was not given */
    class MissingOptionException : public Exception {
        public: explicit MissingOptionException(const std::string& option) :
            Exception("Missing Option: "+option) {} };

    /** The config file exists but could not be read */
    class ConfigFileException : public Exception {
        public: explicit ConfigFileException(const std::string& path) :
            Exception("Unreadable Config: "+path) {} };

    using Flags = std::list<std::string>;
    using Options = std::multimap<std::string, std::string>;

    /**
     * Parses main()'s arguments, skipping argv[0]
     * Accepts -x, -x3, -x 3, -x=3 and the same with --
     * @param stopmm if true, "--" ends the options and the rest are left to the caller
     * @return the index of the first unparsed argument
     * @throws Exception if invalid arguments
     */
    size_t ParseArgs(size_t argc, const char* const* argv, bool stopmm = false);

    /** 
     * Parses a config file with one flag or option=value per line
     * Whitespace around keys and values is ignored, lines starting with # or ; are comments
     * @throws ConfigFileException if the file cannot be read
     * @throws Exception if invalid arguments
     */
    void ParseFile(const std::filesystem::path& path);

    /**
     * Parses every config file with the given name found in GetConfigDirs()
     * @param prefix the name of the config file to find (without .conf)
     * @throws Exception if invalid arguments
     */
    void ParseConfig(const std::string& prefix);

    /** 
     * Returns the directories searched for config files, in order of increasing priority
     * Only $TREEFS_CONFIG_DIR if set, else the system dirs, the user config dir and "."
     */
    static std::list<std::filesystem::path> GetConfigDirs();

    /**
     * Handles a flag, returning false if it is not known
     * @throws ShowHelpException for help
     * @throws ShowVersionException for version
     */
    virtual bool AddFlag(const std::string& flag);

    /**
     * Handles an option, returning false if it is not known
     * @throws BadValueException if the value is invalid
     */
    virtual bool AddOption(const std::string& option, const std::string& value);

    /**
     * Checks the combination of options after parsing
     * @throws MissingOptionException if a required option is missing
     */
    virtual void Validate() = 0;

protected:

    /** Returns the usage of the base flags */
    static std::string CoreBaseHelpText();

    /**
     * Returns the usage of the base options and config files
     * @param name program suffix of its treefs-name.conf (or blank)
     */
    static std::string DetailBaseHelpText(const std::string& name = "");

private:

    /** Applies parsed flags and options, throwing for any unused */
    void AddAll(const Flags& flags, const Options& options);
};

} // namespace TreeFS

#endif // LIBTFS_BASEOPTIONS_H_
