
#include <algorithm>
#include <array>
#include <sstream>
#include <thread>

#include "Debug.hpp"
#include "StringUtil.hpp"

namespace TreeFS {

using std::chrono::steady_clock;

std::mutex Debug::sMutex;
std::vector<Debug::Sink> Debug::sSinks;
std::list<std::ofstream> Debug::sFiles;
Debug::Level Debug::sMaxLevel { Debug::Level::ERRORS };
const steady_clock::time_point Debug::sStart { steady_clock::now() };

namespace {
const std::array<const char*, static_cast<size_t>(Debug::Level::LAST)+1> sLevelNames {
    "errors", "storage", "info", "details" };
} // namespace

/*****************************************************/
bool Debug::ParseLevel(const std::string& str, Level& level)
{
    for (size_t i = 0; i < sLevelNames.size(); i++)
    {
        if (str == sLevelNames[i] || str == std::to_string(i))
        {
            level = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

/*****************************************************/
void Debug::UpdateMaxLevel()
{
    sMaxLevel = Level::ERRORS;
    for (const Sink& sink : sSinks)
        sMaxLevel = std::max(sMaxLevel, sink.level);
}

/*****************************************************/
void Debug::SetLevel(Level level)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (Sink& sink : sSinks) sink.level = level;
    UpdateMaxLevel();
}

/*****************************************************/
void Debug::SetFilters(const std::string& filters)
{
    decltype(Sink::filters) names;
    for (const std::string& name : StringUtil::explode(filters,","))
    {
        const std::string trimmed { StringUtil::trim(name) };
        if (!trimmed.empty()) names.insert(trimmed);
    }

    const std::lock_guard<decltype(sMutex)> lock(sMutex);
    for (Sink& sink : sSinks) sink.filters = names;
}

/*****************************************************/
void Debug::AddStream(std::ostream& stream)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sSinks.emplace_back(stream);
    UpdateMaxLevel();
}

/*****************************************************/
void Debug::AddLogFile(const std::string& path)
{
    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    sFiles.emplace_back(path, std::ofstream::out | std::ofstream::app);

    Sink sink { sFiles.back() };
    if (!sSinks.empty())
    {
        sink.level = sSinks.front().level;
        sink.filters = sSinks.front().filters;
    }
    sSinks.push_back(std::move(sink));
    UpdateMaxLevel();
}

/*****************************************************/
void Debug::Print(const StreamFunc& strfunc, Level level) const
{
    std::ostringstream line;
    line << mPrefix << ": "; strfunc(line);

    std::ostringstream details;
    details << "tid:" << std::this_thread::get_id() << " time:"
        << std::chrono::duration<double>(steady_clock::now() - sStart).count() << " ";
    if (mAddr == nullptr) details << "static ";
    else details << "obj:" << mAddr << " ";

    const std::lock_guard<decltype(sMutex)> lock(sMutex);

    for (const Sink& sink : sSinks)
    {
        if (level > sink.level) continue;
        if (level > Level::ERRORS && !sink.filters.empty() &&
            sink.filters.find(mPrefix) == sink.filters.cend()) continue;

        if (sink.level >= Level::DETAILS) *sink.stream << details.str();
        *sink.stream << line.str() << std::endl;
    }
}

} // namespace TreeFS
