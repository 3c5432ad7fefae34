#ifndef LIBTFS_STRINGUTIL_H_
#define LIBTFS_STRINGUTIL_H_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#define BOOLSTR(x) ((x) ? "true" : "false")

namespace TreeFS {

/** Static string helpers for paths, options and config values */
class StringUtil
{
public:

    StringUtil() = delete;

    /** Returns size random characters from [0-9a-z_], safe for host file names */
    [[nodiscard]] static std::string Random(size_t size);

    /** Joins the strings of arr with glue between each */
    template<typename T>
    [[nodiscard]] static std::string implode(const std::string& glue, const T& arr)
    {
        std::string retval;
        for (typename T::const_iterator it { arr.begin() }; it != arr.end(); ++it)
        {
            if (it != arr.begin()) retval += glue;
            retval += *it;
        }
        return retval;
    }

    using StringList = std::vector<std::string>;

    /**
     * Splits str at every delim, keeping empty pieces
     * An empty str gives no pieces, an empty delim gives str itself
     */
    [[nodiscard]] static StringList explode(const std::string& str, const std::string& delim);

    using StringPair = std::pair<std::string, std::string>;

    /**
     * Splits str in two at the first delim (or last if reverse)
     * Without a delim, str is returned as the first piece (or second if reverse)
     */
    [[nodiscard]] static StringPair split(
        const std::string& str, const std::string& delim, bool reverse = false);

    /** Returns {parent, name} of a / separated path, ignoring trailing slashes */
    [[nodiscard]] static StringPair splitPath(const std::string& str);

    /** Returns the / separated path of name within parent (no doubled / under "/") */
    [[nodiscard]] static std::string joinPath(const std::string& parent, const std::string& name);

    [[nodiscard]] static bool startsWith(const std::string& str, const std::string& start);

    /** Strips leading and trailing whitespace */
    [[nodiscard]] static std::string trim(const std::string& str);

    /** Returns false for empty, 0, false, off and no (after trimming), else true */
    [[nodiscard]] static bool stringToBool(const std::string& str);
};

} // namespace TreeFS

#endif // LIBTFS_STRINGUTIL_H_
