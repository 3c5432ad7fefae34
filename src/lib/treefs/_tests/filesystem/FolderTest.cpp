#include <algorithm>
#include <list>
#include <memory>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "testObjects.hpp"
#include "treefs/filesystem/File.hpp"
#include "treefs/filesystem/Folder.hpp"

namespace TreeFS {
namespace Filesystem {

using trompeloeil::_;

namespace {

/** Returns the set of names of the given nodes */
template<typename T>
std::set<std::string> GetNames(const std::list<T>& nodes)
{
    std::set<std::string> retval;
    for (const T& node : nodes) retval.insert(node.GetName());
    return retval;
}

} // namespace

/*****************************************************/
TEST_CASE("Children", "[Folder]")
{
    MemoryStorage storage(nlohmann::json{{"fileA","a"},{"folderB",{{"inner","x"}}},{"fileC","c"}});
    const Folder root { Folder::GetRoot(storage) };

    const std::list<Node> children { root.GetChildren().ToList() };
    REQUIRE(GetNames(children) == std::set<std::string>{"fileA","folderB","fileC"}); // direct only

    for (const Node& child : children)
    {
        REQUIRE(child.GetParent() == root);
        REQUIRE(child.isFolder() == (child.GetName() == "folderB"));
    }

    REQUIRE(GetNames(root.GetFiles().ToList()) == std::set<std::string>{"fileA","fileC"});
    REQUIRE(GetNames(root.GetFolders().ToList()) == std::set<std::string>{"folderB"});

    // filtered sequences keep the listing order
    std::list<std::string> fileOrder;
    for (const Node& child : children)
        if (child.isFile()) fileOrder.push_back(child.GetName());

    std::list<std::string> files;
    for (const File& file : root.GetFiles()) files.push_back(file.GetName());
    REQUIRE(files == fileOrder);

    REQUIRE(root.GetFolder("folderB").GetFolders().ToList().empty());
}

/*****************************************************/
TEST_CASE("ChildrenRequery", "[Folder]")
{
    MemoryStorage storage(nlohmann::json{{"a","1"}});
    const Folder root { Folder::GetRoot(storage) };

    REQUIRE(root.GetChildren().ToList().size() == 1);
    root.GetFile("b").Write("2");
    REQUIRE(root.GetChildren().ToList().size() == 2);

    Folder::Children children { root.GetChildren() };
    const std::optional<Node> first { children.Next() };
    REQUIRE(first);
    REQUIRE(first->GetName() == "a");

    // an independent listing starts from the beginning
    REQUIRE(root.GetChildren().Next()->GetName() == "a");
    REQUIRE(children.Next()->GetName() == "b");
    REQUIRE(!children.Next());
    REQUIRE(!children.Next());
}

/*****************************************************/
TEST_CASE("ChildrenMissing", "[Folder]")
{
    MemoryStorage storage(nlohmann::json{{"file","x"}});
    const Folder root { Folder::GetRoot(storage) };

    // no failure until the sequence is consumed
    Folder::Children children { root.GetFolder("missing").GetChildren() };
    REQUIRE_THROWS_AS(children.Next(), Storage::NotFoundException);

    Folder::Files files { root.GetFolder("file").GetFiles() };
    REQUIRE_THROWS_AS(files.ToList(), Storage::IOException);
}

/*****************************************************/
TEST_CASE("ChildrenDeferredFailure", "[Folder]")
{
    MockListStorage storage;
    const Folder root { Folder::GetRoot(storage) };

    std::unique_ptr<MockEntryReader> reader { std::make_unique<MockEntryReader>() };
    MockEntryReader& readerRef { *reader };

    // nothing is listed until the first pull
    Folder::Children children { root.GetChildren() };

    trompeloeil::sequence seq;
    REQUIRE_CALL(storage, ListFolder("/")).IN_SEQUENCE(seq)
        .LR_RETURN(std::move(reader));
    REQUIRE_CALL(readerRef, Next(_)).IN_SEQUENCE(seq)
        .SIDE_EFFECT(_1 = BaseStorage::Entry{"fileA", EntryType::FILE}).RETURN(true);
    REQUIRE_CALL(readerRef, Next(_)).IN_SEQUENCE(seq)
        .SIDE_EFFECT(_1 = BaseStorage::Entry{"folderB", EntryType::FOLDER}).RETURN(true);
    REQUIRE_CALL(readerRef, Next(_)).IN_SEQUENCE(seq)
        .THROW(Storage::IOException("disk failure"));

    std::list<std::string> names;
    REQUIRE_THROWS_AS([&]()
    {
        for (const Node& child : children)
            names.push_back(child.GetName());
    }(), Storage::IOException);

    REQUIRE(names == std::list<std::string>{"fileA","folderB"});
}

/*****************************************************/
TEST_CASE("ChildrenFilteredFailure", "[Folder]")
{
    MockListStorage storage;
    const Folder root { Folder::GetRoot(storage) };

    std::unique_ptr<MockEntryReader> reader { std::make_unique<MockEntryReader>() };
    MockEntryReader& readerRef { *reader };

    Folder::Folders folders { root.GetFolders() };

    trompeloeil::sequence seq;
    REQUIRE_CALL(storage, ListFolder("/")).IN_SEQUENCE(seq)
        .LR_RETURN(std::move(reader));
    REQUIRE_CALL(readerRef, Next(_)).IN_SEQUENCE(seq)
        .SIDE_EFFECT(_1 = BaseStorage::Entry{"folderA", EntryType::FOLDER}).RETURN(true);
    REQUIRE_CALL(readerRef, Next(_)).IN_SEQUENCE(seq)
        .SIDE_EFFECT(_1 = BaseStorage::Entry{"fileB", EntryType::FILE}).RETURN(true);
    REQUIRE_CALL(readerRef, Next(_)).IN_SEQUENCE(seq)
        .THROW(Storage::IOException("disk failure"));

    const std::optional<Folder> first { folders.Next() };
    REQUIRE(first);
    REQUIRE(first->GetPath() == "/folderA");

    REQUIRE_THROWS_AS(folders.Next(), Storage::IOException);
}

/*****************************************************/
TEST_CASE("Create", "[Folder]")
{
    MemoryStorage storage(nlohmann::json{{"file","x"}});
    const Folder root { Folder::GetRoot(storage) };

    const Folder folder { root.ResolveFolder("a/b/c") };
    REQUIRE(!folder.Exists());

    folder.Create();
    REQUIRE(folder.Exists());
    REQUIRE(root.ResolveFolder("a/b").Exists());

    folder.Create(); // no-op
    root.Create(); // no-op

    REQUIRE_THROWS_AS(root.GetFolder("file").Create(), Storage::IOException);
    REQUIRE_THROWS_AS(root.ResolveFolder("file/sub").Create(), Storage::IOException);
}

/*****************************************************/
TEST_CASE("Delete", "[Folder]")
{
    MemoryStorage storage(nlohmann::json{{"a",{{"b",{{"c",{{"f1","1"}}},{"f2","2"}}},{"f3","3"}}},{"keep","4"}});
    const Folder root { Folder::GetRoot(storage) };

    const Folder a { root.GetFolder("a") };
    a.Delete();
    REQUIRE(!a.Exists());
    REQUIRE(storage.DumpJSON() == nlohmann::json{{"keep","4"}});

    a.Delete(); // no-op
    root.GetFolder("keep").Delete(); // not a folder, no-op
    REQUIRE(root.GetFile("keep").Exists());

    // the root itself remains
    root.Delete();
    REQUIRE(root.Exists());
    REQUIRE(storage.DumpJSON() == nlohmann::json::object());
}

/*****************************************************/
TEST_CASE("IsAncestorOf", "[Folder]")
{
    MemoryStorage storage;
    MemoryStorage storage2;
    const Folder root { Folder::GetRoot(storage) };

    const Folder a { root.GetFolder("a") };
    REQUIRE(!root.IsAncestorOf(root));
    REQUIRE(!a.IsAncestorOf(a));

    REQUIRE(root.IsAncestorOf(a));
    REQUIRE(a.IsAncestorOf(a.ResolveFolder("b/c/d")));
    REQUIRE(a.IsAncestorOf(a.ResolveFile("b/c/d")));
    REQUIRE(root.IsAncestorOf(a.ResolveFile("b/c/d")));

    REQUIRE(!a.IsAncestorOf(root));
    REQUIRE(!a.IsAncestorOf(root.GetFolder("b")));
    REQUIRE(!a.IsAncestorOf(root.GetFolder("ab")));
    REQUIRE(!a.ResolveFolder("b/c").IsAncestorOf(a));

    // same paths in another storage are unrelated
    REQUIRE(!Folder::GetRoot(storage2).IsAncestorOf(a));
}

} // namespace Filesystem
} // namespace TreeFS
