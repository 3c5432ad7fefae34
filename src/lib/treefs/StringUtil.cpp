#include <algorithm>
#include <array>
#include <cctype>
#include <random>

#include "StringUtil.hpp"

namespace TreeFS {

/*****************************************************/
std::string StringUtil::Random(const size_t size)
{
    static constexpr std::array<char,38> chars { "0123456789abcdefghijklmnopqrstuvwxyz_" }; // 37+NUL
    std::default_random_engine rng(std::random_device{}());

    // chars has a NUL term, and dist includes max
    std::uniform_int_distribution<size_t> dist(0, chars.size()-2);

    std::string retval; retval.resize(size);
    for (char& c : retval) c = chars[dist(rng)];
    return retval;
}

/*****************************************************/
StringUtil::StringList StringUtil::explode(const std::string& str, const std::string& delim)
{
    StringList retval;

    if (str.empty()) return retval;
    if (delim.empty()) return { str };

    size_t start { 0 }; 
    for (size_t end; (end = str.find(delim, start)) != std::string::npos; start = end + delim.size())
        retval.push_back(str.substr(start, end-start));

    retval.push_back(str.substr(start));
    return retval;
}

/*****************************************************/
StringUtil::StringPair StringUtil::split(const std::string& str, const std::string& delim, const bool reverse)
{
    const size_t pos { (delim.empty()) ? std::string::npos : 
        (reverse ? str.rfind(delim) : str.find(delim)) };

    if (pos == std::string::npos)
    {
        if (reverse) return { "", str };
        else return { str, "" };
    }

    return { str.substr(0, pos), str.substr(pos + delim.size()) };
}

/*****************************************************/
StringUtil::StringPair StringUtil::splitPath(const std::string& str)
{
    std::string path { str }; // copy
    while (!path.empty() && path.back() == '/')
        path.pop_back(); // remove trailing /

    return split(path, "/", true);
}

/*****************************************************/
std::string StringUtil::joinPath(const std::string& parent, const std::string& name)
{
    if (!parent.empty() && parent.back() == '/')
        return parent+name;
    return parent+"/"+name;
}

/*****************************************************/
bool StringUtil::startsWith(const std::string& str, const std::string& start)
{
    if (start.size() > str.size()) return false;

    return std::equal(start.begin(), start.end(), str.begin());
}

/*****************************************************/
std::string StringUtil::trim(const std::string& str)
{
    const size_t size { str.size() };

    size_t start = 0; while (start < size && std::isspace(static_cast<unsigned char>(str[start]))) ++start;
    size_t end = size; while (end > start && std::isspace(static_cast<unsigned char>(str[end-1]))) --end;

    return str.substr(start, end-start);
}

/*****************************************************/
bool StringUtil::stringToBool(const std::string& str)
{
    const std::string val { trim(str) };
    return (!val.empty() && val != "0" && val != "false" && val != "off" && val != "no");
}

} // namespace TreeFS
