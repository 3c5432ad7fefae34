#ifndef LIBTFS_TEMPPATH_H_
#define LIBTFS_TEMPPATH_H_

#include <filesystem>
#include <string>
#include <system_error>

#include "StringUtil.hpp"
#include "common.hpp"

namespace TreeFS {

/** Auto-deleting (recursively) temporary host path */
class TempPath
{
public:

    /** Create a temp path with the given suffix - does NOT create anything! */
    explicit TempPath(const std::string& suffix) :
        mPath(std::filesystem::temp_directory_path().string()+"/tfs_"
            +StringUtil::Random(16)+"_"+suffix) { }

    virtual ~TempPath()
    {
        std::error_code ec; // ignore errors in destructor
        std::filesystem::remove_all(mPath, ec);
    }
    DELETE_COPY(TempPath)
    DELETE_MOVE(TempPath)

    /** returns the temporary path generated */
    [[nodiscard]] const std::string& Get() const { return mPath; }

private:
    // path to the created file or folder
    const std::string mPath;
};

} // namespace TreeFS

#endif // LIBTFS_TEMPPATH_H_
