#pragma once

#include "progress_sink.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace disksight::scan
{

enum class EntryKind
{
    File,
    Directory
};

struct ScanConfig
{
    std::filesystem::path root = ".";
    bool recurseDetailed = true;
    bool humanReadable = true;
    bool showHidden = true;
    std::string nameFilter;
    bool parallel = true;
    bool sortBySize = true;
    bool sortDescending = true;
    bool fullPath = false;
    bool collectCreatedTime = false;
    bool reportErrors = true;
    std::size_t workerThreads = 0;
    std::size_t maxDepth = 0;
    bool detectCycles = true;
};

struct Entry
{
    EntryKind kind = EntryKind::File;
    std::string permissionFlags;
    std::uintmax_t sizeRaw = 0;
    std::string sizeDisplay;
    std::string path;
    std::string name;
    std::optional<std::chrono::system_clock::time_point> createdTime;

    char typeChar() const noexcept { return kind == EntryKind::Directory ? 'd' : '-'; }
};

struct ListResult
{
    std::vector<std::string> names;
    std::vector<Entry> entries;
    bool cancelled = false;
};

struct ScanResult
{
    std::vector<Entry> entries;
    std::vector<std::string> names;
    double elapsedSeconds = 0.0;
    bool cancelled = false;
};

using ErrorCallback = std::function<void(const std::filesystem::path &, const std::error_code &)>;

// Callbacks threaded through a scan. Any of them may be empty. When
// ScanConfig::parallel is set they are invoked from several threads.
struct ScanHooks
{
    ProgressSink *progress = nullptr;
    ErrorCallback errorCallback;
    std::function<bool()> cancelRequested;
};

// Thrown out of aggregateSize() and findMatches() when cancelRequested() fires.
// listDirectory() and scan() report it through the cancelled flag instead.
class ScanCancelled : public std::runtime_error
{
public:
    ScanCancelled()
        : std::runtime_error("scan cancelled")
    {
    }
};

// "r" followed by "wx" when the entry carries no write permission at all,
// otherwise a space in the first position.
std::string permissionFlags(bool readOnly);

// Canonical absolute form of path without a "\\?\" prefix, or path itself when
// it cannot be canonicalized.
std::string displayPath(const std::filesystem::path &path);

std::string formatTimePoint(const std::chrono::system_clock::time_point &tp);

} // namespace disksight::scan
