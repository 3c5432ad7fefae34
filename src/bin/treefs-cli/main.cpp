#include <fstream>
#include <iostream>
#include <memory>
#include <utility>

#include <nlohmann/json.hpp>

#include "CommandLine.hpp"
using TreeFSCli::CommandLine;
#include "Options.hpp"
using TreeFSCli::Options;

#include "treefs/Debug.hpp"
using TreeFS::Debug;
#include "treefs/filesystem/Node.hpp"
using TreeFS::Filesystem::Node;
#include "treefs/storage/BaseStorage.hpp"
using TreeFS::Storage::BaseStorage;
#include "treefs/storage/LocalStorage.hpp"
using TreeFS::Storage::LocalStorage;
#include "treefs/storage/MemoryStorage.hpp"
using TreeFS::Storage::MemoryStorage;
#include "treefs/storage/StorageException.hpp"
using TreeFS::Storage::IOException;
using TreeFS::Storage::StorageException;
#include "treefs/storage/StorageOptions.hpp"
using TreeFS::Storage::StorageOptions;

enum class ExitCode
{
    SUCCESS,
    BAD_USAGE,
    STORAGE,
    FILESYSTEM
};

int main(int argc, char** argv)
{
    Debug::AddStream(std::cerr);
    Debug debug("main",nullptr);

    StorageOptions storageOptions;

    Options options(storageOptions);
    std::unique_ptr<CommandLine> commandLine;

    try
    {
        options.ParseConfig("treefs");
        options.ParseConfig("treefs-cli");

        commandLine = std::make_unique<CommandLine>(
            options, static_cast<size_t>(argc), argv);
    }
    catch (const Options::ShowHelpException& ex)
    {
        std::cout << CommandLine::HelpText() << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Options::ShowVersionException& ex)
    {
        std::cout << "version: " << TREEFS_VERSION << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Options::Exception& ex)
    {
        std::cout << ex.what() << std::endl << std::endl;
        std::cout << CommandLine::HelpText() << std::endl;
        return static_cast<int>(ExitCode::BAD_USAGE);
    }

    DDBG_INFO("()");

    try
    {
        std::unique_ptr<BaseStorage> storage;
        MemoryStorage* memory { nullptr };

        if (!options.GetMemoryPath().empty())
        {
            std::ifstream file(options.GetMemoryPath(), std::ios::in | std::ios::binary);
            if (!file) throw IOException("open "+options.GetMemoryPath());

            const nlohmann::json tree(nlohmann::json::parse(file));
            std::unique_ptr<MemoryStorage> memStorage {
                std::make_unique<MemoryStorage>(tree, storageOptions) };
            memory = memStorage.get();
            storage = std::move(memStorage);
        }
        else storage = std::make_unique<LocalStorage>(options.GetRootPath(), storageOptions);

        commandLine->Run(*storage, std::cout);

        if (memory != nullptr && commandLine->isModifying() && !storageOptions.readOnly)
        {
            DDBG_INFO(": saving " << options.GetMemoryPath());

            std::ofstream file(options.GetMemoryPath(), std::ios::out | std::ios::binary | std::ios::trunc);
            file << memory->DumpJSON().dump(4) << std::endl;
            if (!file) throw IOException("write "+options.GetMemoryPath());
        }

        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const nlohmann::json::exception& ex)
    {
        DDBG_ERROR(": JSON Error: " << ex.what());
        return static_cast<int>(ExitCode::STORAGE);
    }
    catch (const StorageException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::STORAGE);
    }
    catch (const Node::Exception& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::FILESYSTEM);
    }
}
