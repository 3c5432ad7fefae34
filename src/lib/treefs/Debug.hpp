#ifndef LIBTFS_DEBUG_H_
#define LIBTFS_DEBUG_H_

#include <chrono>
#include <fstream>
#include <functional>
#include <list>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace TreeFS {

/**
 * Global thread-safe debug printing
 * Each module owns a Debug instance (static for namespaces, member for
 * objects) and prints through the xDBG_ macros below. Output goes to every
 * registered sink whose level and module filter allow it.
 */
class Debug
{
public:

    /** Debug verbosity */
    enum class Level
    {
        /** Only show Error()s */         ERRORS,
        /** Also show storage accesses */ STORAGE,
        /** Filesystem operations */      INFO,
        /** Add thread/time/object */     DETAILS,
        LAST = DETAILS
    };

    /**
     * Parses a level from its number or name (errors, storage, info, details)
     * @return false if the string is not a valid level
     */
    static bool ParseLevel(const std::string& str, Level& level);

    /** Returns the highest level of all configured sinks */
    static Level GetLevel(){ return sMaxLevel; }

    /** Sets the level for all sinks - THREAD SAFE */
    static void SetLevel(Level level);

    /** Sets the comma-separated module names to show (below ERRORS) - THREAD SAFE */
    static void SetFilters(const std::string& filters);

    /** Adds a sink writing to the given stream reference - THREAD SAFE */
    static void AddStream(std::ostream& stream);

    /**
     * Adds a sink appending to the given file - THREAD SAFE
     * The level and filters are copied from the first existing sink
     */
    static void AddLogFile(const std::string& path);

    /**
     * @param prefix module name to use for all prints
     * @param addr address to print with details (null if static)
     */
    explicit Debug(std::string prefix, const void* addr = nullptr) noexcept :
        mAddr(addr), mPrefix(std::move(prefix)) { }

    /** Function writing debug text to a given output stream */
    using StreamFunc = std::function<void (std::ostream&)>;

    /** Prints strfunc if any sink shows ERRORS */
    inline void Error(const StreamFunc& strfunc) const
    {
        if (sMaxLevel >= Level::ERRORS) Print(strfunc,Level::ERRORS);
    }

    /** Prints strfunc if any sink shows STORAGE */
    inline void Storage(const StreamFunc& strfunc) const
    {
        if (sMaxLevel >= Level::STORAGE) Print(strfunc,Level::STORAGE);
    }

    /** Prints strfunc if any sink shows INFO */
    inline void Info(const StreamFunc& strfunc) const
    {
        if (sMaxLevel >= Level::INFO) Print(strfunc,Level::INFO);
    }

    /** Sends the calling function's name followed by strcode (error) */
    #define DBG_ERROR(debug, strcode) { const char* const myfname { __func__ }; \
        (debug).Error([&](std::ostream& str){ str << myfname << strcode; }); }

    /** Sends the calling function's name followed by strcode (storage) */
    #define DBG_STORAGE(debug, strcode) { const char* const myfname { __func__ }; \
        (debug).Storage([&](std::ostream& str){ str << myfname << strcode; }); }

    /** Sends the calling function's name followed by strcode (info) */
    #define DBG_INFO(debug, strcode) { const char* const myfname { __func__ }; \
        (debug).Info([&](std::ostream& str){ str << myfname << strcode; }); }

    // D = local "debug", M = member "mDebug", S = static "sDebug"
    #define DDBG_ERROR(strcode) DBG_ERROR(debug, strcode)
    #define MDBG_ERROR(strcode) DBG_ERROR(mDebug, strcode)
    #define SDBG_ERROR(strcode) DBG_ERROR(sDebug, strcode)

    #define MDBG_STORAGE(strcode) DBG_STORAGE(mDebug, strcode)
    #define SDBG_STORAGE(strcode) DBG_STORAGE(sDebug, strcode)

    #define DDBG_INFO(strcode) DBG_INFO(debug, strcode)
    #define MDBG_INFO(strcode) DBG_INFO(mDebug, strcode)
    #define SDBG_INFO(strcode) DBG_INFO(sDebug, strcode)

private:

    /**
     * Formats the line once then writes it to all matching sinks - THREAD SAFE
     * @param level level of the caller, ERRORS ignores module filters
     */
    void Print(const StreamFunc& strfunc, Level level) const;

    const void* const mAddr;
    const std::string mPrefix;

    /** A destination for debug output */
    struct Sink
    {
        explicit Sink(std::ostream& s) : stream(&s) { }

        std::ostream* stream;
        Level level { Level::ERRORS };
        /** module names to show, empty for all */
        std::unordered_set<std::string> filters;
    };

    /** Recomputes sMaxLevel from all sinks (lock held) */
    static void UpdateMaxLevel();

    static std::mutex sMutex;
    static std::vector<Sink> sSinks;
    /** File streams owned by file sinks */
    static std::list<std::ofstream> sFiles;

    /** The highest level of any sink, checked without locking */
    static Level sMaxLevel;

    /** Program start, for DETAILS timestamps */
    static const std::chrono::steady_clock::time_point sStart;
};

} // namespace TreeFS

#endif // LIBTFS_DEBUG_H_
