#ifndef LIBTFS_TESTOBJECTS_H_
#define LIBTFS_TESTOBJECTS_H_

#include <memory>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "treefs/storage/BaseStorage.hpp"
#include "treefs/storage/MemoryStorage.hpp"

namespace TreeFS {
namespace Filesystem {

using Storage::BaseStorage;
using Storage::MemoryStorage;
using Storage::StorageOptions;
using EntryType = BaseStorage::EntryType;

class MockEntryReader : public BaseStorage::EntryReader { public:
    MAKE_MOCK1(Next, bool(BaseStorage::Entry&), override);
};

/** Hands out a reader owned by the test so it outlives the expectations on it */
class ForwardingReader : public BaseStorage::EntryReader { public:
    explicit ForwardingReader(BaseStorage::EntryReader& reader) : mReader(reader) { }
    bool Next(BaseStorage::Entry& entry) override { return mReader.Next(entry); }
private:
    BaseStorage::EntryReader& mReader;
};

class MockListStorage : public MemoryStorage { public:
    using MemoryStorage::MemoryStorage;
    MAKE_MOCK1(ListFolder, std::unique_ptr<BaseStorage::EntryReader>(const std::string&), override);
};

class MockRenameStorage : public MemoryStorage { public:
    using MemoryStorage::MemoryStorage;
    MAKE_MOCK2(TryRename, bool(const std::string&, const std::string&), override);
};

} // namespace Filesystem
} // namespace TreeFS

#endif // LIBTFS_TESTOBJECTS_H_
