#include <memory>

#include <nlohmann/json.hpp>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "testObjects.hpp"

#include "treefs/filesystem/Copier.hpp"
#include "treefs/filesystem/File.hpp"
#include "treefs/filesystem/Folder.hpp"
#include "treefs/storage/MemoryStorage.hpp"

namespace TreeFS {
namespace Filesystem {

using Storage::MemoryStorage;
using Storage::StorageOptions;
using json = nlohmann::json;
using trompeloeil::_;

/*****************************************************/
TEST_CASE("CopyFolder", "[Copier]")
{
    MemoryStorage storage(json{{"A",{{"x","hello"},{"sub",{{"y","world"}}}}}});
    const Folder root { Folder::GetRoot(storage) };

    // copies the folder itself and creates missing parents
    root.GetFolder("A").CopyTo(root.ResolveFolder("B/C"));

    const json tree {{"x","hello"},{"sub",{{"y","world"}}}};
    REQUIRE(storage.DumpJSON("/B/C") == tree);
    REQUIRE(storage.DumpJSON("/A") == tree); // unchanged

    // empty folders are copied too
    root.GetFolder("empty").Create();
    Copier::CopyFolder(root.GetFolder("empty"), root.GetFolder("empty2"));
    REQUIRE(root.GetFolder("empty2").Exists());
}

/*****************************************************/
TEST_CASE("CopyOverwrite", "[Copier]")
{
    MemoryStorage storage(json{{"A",{{"x","new"}}},{"B",{{"y","unrelated"},{"x","old"}}},{"F","file"}});
    const Folder root { Folder::GetRoot(storage) };

    // the target is replaced, not merged
    root.GetFolder("A").CopyTo(root.GetFolder("B"));
    REQUIRE(storage.DumpJSON("/B") == json{{"x","new"}});

    // a file at the target is replaced by the folder
    root.GetFolder("A").CopyTo(root.GetFolder("F"));
    REQUIRE(storage.DumpJSON("/F") == json{{"x","new"}});

    // a folder at the target is replaced by the file
    root.ResolveFile("A/x").CopyTo(root.GetFile("B"));
    REQUIRE(storage.DumpJSON("/B") == json("new"));

    // an existing file is overwritten
    root.GetFile("B").Write("newer");
    root.GetFile("B").CopyTo(root.ResolveFile("A/x"));
    REQUIRE(root.ResolveFile("A/x").Read() == "newer");
}

/*****************************************************/
TEST_CASE("CopySelfContainment", "[Copier]")
{
    MemoryStorage storage(json{{"A",{{"x","1"},{"sub",{{"y","2"}}}}}});
    const Folder root { Folder::GetRoot(storage) };
    const json before(storage.DumpJSON());

    const Folder A { root.GetFolder("A") };
    REQUIRE_THROWS_AS(A.CopyTo(A), Node::SelfContainmentException);
    REQUIRE_THROWS_AS(A.CopyTo(A.GetFolder("sub")), Node::SelfContainmentException);
    REQUIRE_THROWS_AS(A.CopyTo(A.ResolveFolder("new/deep")), Node::SelfContainmentException);

    // replacing an ancestor would delete the source
    REQUIRE_THROWS_AS(A.GetFolder("sub").CopyTo(A), Node::SelfContainmentException);
    REQUIRE_THROWS_AS(A.CopyTo(root), Node::SelfContainmentException);

    const File x { A.GetFile("x") };
    REQUIRE_THROWS_AS(x.CopyTo(x), Node::SelfContainmentException);
    REQUIRE_THROWS_AS(x.CopyTo(root.GetFile("A")), Node::SelfContainmentException);

    REQUIRE(storage.DumpJSON() == before);
}

/*****************************************************/
TEST_CASE("CopyMissing", "[Copier]")
{
    MemoryStorage storage(json{{"B",{{"y","1"}}}});
    const Folder root { Folder::GetRoot(storage) };
    const json before(storage.DumpJSON());

    REQUIRE_THROWS_AS(root.GetFolder("A").CopyTo(root.GetFolder("B")), Storage::NotFoundException);
    REQUIRE_THROWS_AS(root.GetFile("A").CopyTo(root.ResolveFile("B/y")), Storage::NotFoundException);

    // the wrong type counts as missing
    REQUIRE_THROWS_AS(root.GetFile("B").CopyTo(root.GetFile("C")), Storage::NotFoundException);

    REQUIRE(storage.DumpJSON() == before);
}

/*****************************************************/
TEST_CASE("CopyCrossStorage", "[Copier]")
{
    MemoryStorage source(json{{"A",{{"x","hello"},{"sub",{{"y","world"}}}}}});
    MemoryStorage target(json{{"T",{{"old","gone"}}}});

    const Folder A { Folder::GetRoot(source).GetFolder("A") };
    const Folder T { Folder::GetRoot(target).GetFolder("T") };

    // same paths in different storages do not overlap
    A.CopyTo(Folder::GetRoot(target).GetFolder("A"));
    REQUIRE(target.DumpJSON("/A") == source.DumpJSON("/A"));

    A.CopyTo(T);
    REQUIRE(target.DumpJSON("/T") == json{{"x","hello"},{"sub",{{"y","world"}}}});

    A.GetFile("x").CopyTo(T.ResolveFile("deep/x2"));
    REQUIRE(T.ResolveFile("deep/x2").Read() == "hello");

    // the root of another storage can be replaced
    A.CopyTo(Folder::GetRoot(target));
    REQUIRE(target.DumpJSON() == source.DumpJSON("/A"));
}

/*****************************************************/
TEST_CASE("CopyReadOnly", "[Copier]")
{
    MemoryStorage source(json{{"A",{{"x","hello"}}}});

    StorageOptions options; options.readOnly = true;
    MemoryStorage target(json{{"B",{{"y","1"}}}}, options);

    const Folder A { Folder::GetRoot(source).GetFolder("A") };
    REQUIRE_THROWS_AS(A.CopyTo(Folder::GetRoot(target).GetFolder("B")), Storage::ReadOnlyException);
    REQUIRE_THROWS_AS(A.CopyTo(Folder::GetRoot(target).GetFolder("C")), Storage::ReadOnlyException);
    REQUIRE(target.DumpJSON() == json{{"B",{{"y","1"}}}});

    // a read-only source can be copied from
    Folder::GetRoot(target).GetFolder("B").CopyTo(A.GetFolder("B"));
    REQUIRE(source.DumpJSON("/A/B") == json{{"y","1"}});
}

/*****************************************************/
TEST_CASE("CopyPartialFailure", "[Copier]")
{
    MockListStorage storage(json{{"src",{{"a","1"},{"b","2"}}},{"dst",{{"old","0"}}}});
    const Folder root { Folder::GetRoot(storage) };

    MockEntryReader reader;

    trompeloeil::sequence seq;
    REQUIRE_CALL(storage, ListFolder("/dst")).IN_SEQUENCE(seq) // deleting the old target
        .RETURN(std::make_unique<ForwardingReader>(reader));
    REQUIRE_CALL(reader, Next(_)).IN_SEQUENCE(seq)
        .SIDE_EFFECT(_1 = BaseStorage::Entry{"old", EntryType::FILE}).RETURN(true);
    REQUIRE_CALL(reader, Next(_)).IN_SEQUENCE(seq).RETURN(false);

    REQUIRE_CALL(storage, ListFolder("/src")).IN_SEQUENCE(seq)
        .RETURN(std::make_unique<ForwardingReader>(reader));
    REQUIRE_CALL(reader, Next(_)).IN_SEQUENCE(seq)
        .SIDE_EFFECT(_1 = BaseStorage::Entry{"a", EntryType::FILE}).RETURN(true);
    REQUIRE_CALL(reader, Next(_)).IN_SEQUENCE(seq)
        .THROW(Storage::IOException("disk failure"));

    REQUIRE_THROWS_AS(root.GetFolder("src").CopyTo(root.GetFolder("dst")), Storage::IOException);

    // what was copied before the failure stays, nothing is rolled back
    REQUIRE(storage.DumpJSON("/dst") == json{{"a","1"}});
    REQUIRE(storage.DumpJSON("/src") == json{{"a","1"},{"b","2"}});
}

} // namespace Filesystem
} // namespace TreeFS
