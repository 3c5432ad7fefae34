
#include <list>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"

#include "treefs/StringUtil.hpp"

namespace TreeFS {

/*****************************************************/
TEST_CASE("Random", "[StringUtil]")
{
    REQUIRE(StringUtil::Random(0).empty());
    REQUIRE(StringUtil::Random(16).size() == 16);

    // used in host paths
    const std::string rand { StringUtil::Random(2048) };
    REQUIRE(rand.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz_") == std::string::npos);
    REQUIRE(StringUtil::Random(32) != StringUtil::Random(32));
}

/*****************************************************/
TEST_CASE("implode", "[StringUtil]")
{
    REQUIRE(StringUtil::implode(", ", std::list<std::string>{}).empty());
    REQUIRE(StringUtil::implode(", ", std::list<std::string>{"ls"}) == "ls");
    REQUIRE(StringUtil::implode(", ", std::list<std::string>{"cp","mv","rm"}) == "cp, mv, rm");
    REQUIRE(StringUtil::implode("", std::vector<std::string>{"a","","b"}) == "ab");
}

/*****************************************************/
TEST_CASE("explode", "[StringUtil]")
{
    using Strings = StringUtil::StringList;

    REQUIRE(StringUtil::explode("","/").empty());
    REQUIRE(StringUtil::explode("docs","") == Strings{"docs"});
    REQUIRE(StringUtil::explode("docs","/") == Strings{"docs"});

    REQUIRE(StringUtil::explode("/docs/a.txt","/") == Strings{"","docs","a.txt"});
    REQUIRE(StringUtil::explode("a//b/","/") == Strings{"a","","b",""});
    REQUIRE(StringUtil::explode("Copier,,Folder",",") == Strings{"Copier","","Folder"});
    REQUIRE(StringUtil::explode("x::y::",":: ") == Strings{"x::y::"});
    REQUIRE(StringUtil::explode("x::y::","::") == Strings{"x","y",""});
}

/*****************************************************/
TEST_CASE("split", "[StringUtil]")
{
    using StringPair = StringUtil::StringPair;

    REQUIRE(StringUtil::split("", "=") == StringPair{"",""});
    REQUIRE(StringUtil::split("root", "") == StringPair{"root",""});
    REQUIRE(StringUtil::split("root", "", true) == StringPair{"","root"});

    REQUIRE(StringUtil::split("read-only", "=") == StringPair{"read-only",""});
    REQUIRE(StringUtil::split("root=/tmp/a=b", "=") == StringPair{"root","/tmp/a=b"});
    REQUIRE(StringUtil::split("root=", "=") == StringPair{"root",""});

    REQUIRE(StringUtil::split("a/b/c", "/", true) == StringPair{"a/b","c"});
    REQUIRE(StringUtil::split("c", "/", true) == StringPair{"","c"});
}

/*****************************************************/
TEST_CASE("splitPath", "[StringUtil]")
{
    using StringPair = StringUtil::StringPair;

    REQUIRE(StringUtil::splitPath("/") == StringPair{"",""});
    REQUIRE(StringUtil::splitPath("/docs") == StringPair{"","docs"});
    REQUIRE(StringUtil::splitPath("/docs/") == StringPair{"","docs"});
    REQUIRE(StringUtil::splitPath("/docs/a.txt") == StringPair{"/docs","a.txt"});
    REQUIRE(StringUtil::splitPath("/docs/sub/") == StringPair{"/docs","sub"});
    REQUIRE(StringUtil::splitPath("docs/sub") == StringPair{"docs","sub"});
}

/*****************************************************/
TEST_CASE("joinPath", "[StringUtil]")
{
    REQUIRE(StringUtil::joinPath("/", "docs") == "/docs");
    REQUIRE(StringUtil::joinPath("/docs", "a.txt") == "/docs/a.txt");
    REQUIRE(StringUtil::joinPath("/docs/", "a.txt") == "/docs/a.txt");
    REQUIRE(StringUtil::joinPath("", "docs") == "/docs");

    // inverse of splitPath
    REQUIRE(StringUtil::splitPath(StringUtil::joinPath("/docs/sub", "b")) == StringUtil::StringPair{"/docs/sub","b"});
}

/*****************************************************/
TEST_CASE("startsWith", "[StringUtil]")
{
    REQUIRE(StringUtil::startsWith("/a/b/", ""));
    REQUIRE(StringUtil::startsWith("/a/b/", "/a/"));
    REQUIRE(StringUtil::startsWith("/a/b/", "/a/b/"));

    REQUIRE(!StringUtil::startsWith("/ab/", "/a/"));
    REQUIRE(!StringUtil::startsWith("/a/", "/a/b/"));
    REQUIRE(!StringUtil::startsWith("", "/"));
}

/*****************************************************/
TEST_CASE("trim", "[StringUtil]")
{
    REQUIRE(StringUtil::trim("").empty());
    REQUIRE(StringUtil::trim(" \t\r\n").empty());
    REQUIRE(StringUtil::trim(" root = x\r") == "root = x");
    REQUIRE(StringUtil::trim("a b") == "a b");
}

/*****************************************************/
TEST_CASE("stringToBool", "[StringUtil]")
{
    for (const char* val : {"", "0", "false", " off", "no\r"})
        REQUIRE(!StringUtil::stringToBool(val));

    for (const char* val : {"1", "true", "on ", "yes", "anything"})
        REQUIRE(StringUtil::stringToBool(val));
}

} // namespace TreeFS
