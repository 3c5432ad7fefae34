#include <chrono>
#include <memory>

#include <nlohmann/json.hpp>

#include "catch2/catch_test_macros.hpp"

#include "treefs/storage/MemoryStorage.hpp"

namespace TreeFS {
namespace Storage {

using json = nlohmann::json;
using EntryType = BaseStorage::EntryType;

/*****************************************************/
TEST_CASE("JSON", "[MemoryStorage]")
{
    const json tree {{"dir",{{"a","1"},{"empty",json::object()}}},{"file",""}};
    MemoryStorage storage(tree);

    REQUIRE(storage.DumpJSON() == tree);
    REQUIRE(storage.DumpJSON("/dir/a") == json("1"));
    REQUIRE_THROWS_AS(storage.DumpJSON("/missing"), NotFoundException);

    REQUIRE(storage.GetEntryType("/") == EntryType::FOLDER);
    REQUIRE(storage.GetEntryType("/dir/empty") == EntryType::FOLDER);
    REQUIRE(storage.GetEntryType("/file") == EntryType::FILE);
    REQUIRE(storage.GetEntryType("/file/x") == EntryType::NONE);

    storage.LoadJSON(json{{"b","2"}}, "/dir");
    REQUIRE(storage.DumpJSON("/dir") == json{{"b","2"}});
    REQUIRE_THROWS_AS(storage.LoadJSON(json::object(), "/file"), NotFoundException);
}

/*****************************************************/
TEST_CASE("BadJSON", "[MemoryStorage]")
{
    REQUIRE_THROWS_AS(MemoryStorage(json("file")), FormatException);
    REQUIRE_THROWS_AS(MemoryStorage(json{{"a",5}}), FormatException);
    REQUIRE_THROWS_AS(MemoryStorage(json{{"a/b","x"}}), FormatException);
    REQUIRE_THROWS_AS(MemoryStorage(json{{"..","x"}}), FormatException);
    REQUIRE_THROWS_AS(MemoryStorage(json{{"",json::object()}}), FormatException);

    // a bad tree does not replace anything
    MemoryStorage storage(json{{"a","1"}});
    REQUIRE_THROWS_AS(storage.LoadJSON(json{{"b",true}}), FormatException);
    REQUIRE(storage.DumpJSON() == json{{"a","1"}});
}

/*****************************************************/
TEST_CASE("Primitives", "[MemoryStorage]")
{
    MemoryStorage storage;

    storage.CreateFolder("/dir");
    storage.CreateFolder("/dir"); // no-op
    storage.CreateFile("/dir/file");
    storage.CreateFile("/dir/file"); // no-op
    REQUIRE_THROWS_AS(storage.CreateFolder("/dir/file"), IOException);
    REQUIRE_THROWS_AS(storage.CreateFile("/dir"), IOException);
    REQUIRE_THROWS_AS(storage.CreateFolder("/missing/dir"), NotFoundException);

    storage.WriteFile("/dir/file", "data");
    REQUIRE(storage.ReadFile("/dir/file") == "data");
    REQUIRE_THROWS_AS(storage.ReadFile("/dir"), NotFoundException);
    REQUIRE_THROWS_AS(storage.WriteFile("/dir", "x"), IOException);

    storage.CopyFile("/dir/file", "/copy");
    REQUIRE(storage.ReadFile("/copy") == "data");
    REQUIRE_THROWS_AS(storage.CopyFile("/missing", "/copy2"), NotFoundException);

    REQUIRE_THROWS_AS(storage.DeleteFolder("/dir"), IOException); // not empty
    REQUIRE_THROWS_AS(storage.DeleteFile("/dir"), NotFoundException);
    REQUIRE_THROWS_AS(storage.DeleteFolder("/"), IOException);
    storage.DeleteFile("/dir/file");
    storage.DeleteFolder("/dir");
    REQUIRE_THROWS_AS(storage.DeleteFile("/dir/file"), NotFoundException);

    REQUIRE(storage.DumpJSON() == json{{"copy","data"}});
}

/*****************************************************/
TEST_CASE("TryRename", "[MemoryStorage]")
{
    MemoryStorage storage(json{{"a",{{"x","1"}}},{"b","2"}});

    REQUIRE(storage.TryRename("/a", "/c"));
    REQUIRE(storage.DumpJSON() == json{{"c",{{"x","1"}}},{"b","2"}});

    REQUIRE_THROWS_AS(storage.TryRename("/b", "/c"), IOException); // exists
    REQUIRE_THROWS_AS(storage.TryRename("/c", "/c/d"), IOException); // into itself
    REQUIRE_THROWS_AS(storage.TryRename("/missing", "/d"), NotFoundException);

    REQUIRE(storage.TryRename("/b", "/c/b"));
    REQUIRE(storage.DumpJSON() == json{{"c",{{"x","1"},{"b","2"}}}});
}

/*****************************************************/
TEST_CASE("CreationTime", "[MemoryStorage]")
{
    MemoryStorage storage(json{{"a","1"}});
    REQUIRE(!storage.GetCreationTime("/a"));

    const BaseStorage::Clock::time_point time { std::chrono::seconds(1000) };
    storage.SetCreationTime("/a", time);
    REQUIRE(storage.GetCreationTime("/a") == time);

    REQUIRE_THROWS_AS(storage.SetCreationTime("/b", time), NotFoundException);
    REQUIRE_THROWS_AS(storage.GetCreationTime("/b"), NotFoundException);
}

/*****************************************************/
TEST_CASE("ListFolder", "[MemoryStorage]")
{
    MemoryStorage storage(json{{"dir",{{"a","1"},{"b",json::object()},{"c","3"}}}});

    const std::unique_ptr<BaseStorage::EntryReader> reader { storage.ListFolder("/dir") };
    BaseStorage::Entry entry;

    REQUIRE(reader->Next(entry));
    REQUIRE(entry.name == "a");
    REQUIRE(entry.type == EntryType::FILE);

    // changes while listing do not invalidate the reader
    storage.DeleteFolder("/dir/b");
    storage.CreateFile("/dir/bb");

    REQUIRE(reader->Next(entry));
    REQUIRE(entry.name == "bb");
    REQUIRE(reader->Next(entry));
    REQUIRE(entry.name == "c");
    REQUIRE(!reader->Next(entry));

    // failures only surface while reading
    const std::unique_ptr<BaseStorage::EntryReader> missing { storage.ListFolder("/missing") };
    REQUIRE_THROWS_AS(missing->Next(entry), NotFoundException);

    const std::unique_ptr<BaseStorage::EntryReader> vanished { storage.ListFolder("/dir") };
    REQUIRE(vanished->Next(entry));
    storage.LoadJSON(json::object());
    REQUIRE_THROWS_AS(vanished->Next(entry), NotFoundException);
}

} // namespace Storage
} // namespace TreeFS
