#ifndef LIBTFS_STORAGEOPTIONS_H_
#define LIBTFS_STORAGEOPTIONS_H_

#include <string>

namespace TreeFS {
namespace Storage {

/** Options common to all storage backends */
struct StorageOptions
{
    /** Retrieve the standard help text string */
    static std::string HelpText();

    /** Adds the given argument, returning true iff it was used */
    bool AddFlag(const std::string& flag);

    /** Adds the given option/value, returning true iff it was used */
    bool AddOption(const std::string& option, const std::string& value);

    /** If true, all mutating operations fail with ReadOnlyException */
    bool readOnly { false };

    /** 
     * If true, moves within one storage try an atomic rename before
     * falling back to copy+delete (which is not atomic)
     */
    bool useRename { true };
};

} // namespace Storage
} // namespace TreeFS

#endif // LIBTFS_STORAGEOPTIONS_H_
