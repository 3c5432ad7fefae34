#ifndef TFSCLI_OPTIONS_H_
#define TFSCLI_OPTIONS_H_

#include <string>

#include "treefs/BaseOptions.hpp"

namespace TreeFS {
    namespace Storage { struct StorageOptions; }
}

namespace TreeFSCli {

/** Manages command line options and config */
class Options : public TreeFS::BaseOptions
{
public:

    /** Retrieve the base usage help text string */
    static std::string CoreHelpText();

    /** Retrieve the main command help text string */
    static std::string MainHelpText();

    /** Retrieve the detailed options help text string */
    static std::string DetailHelpText();

    /** @param[out] storageOptions storage options ref to fill */
    explicit Options(TreeFS::Storage::StorageOptions& storageOptions);

    virtual bool AddFlag(const std::string& flag) override;

    virtual bool AddOption(const std::string& option, const std::string& value) override;

    virtual void Validate() override;

    /** Returns the host directory to use as local storage (or empty) */
    std::string GetRootPath() const { return mRootPath; }

    /** Returns the JSON file to load as memory storage (or empty) */
    std::string GetMemoryPath() const { return mMemoryPath; }

    /** Returns true if JSON output is requested */
    bool isJsonOut() const { return mJsonOut; }

private:

    TreeFS::Storage::StorageOptions& mStorageOptions;

    std::string mRootPath;
    std::string mMemoryPath;
    bool mJsonOut { false };
};

} // namespace TreeFSCli

#endif // TFSCLI_OPTIONS_H_
