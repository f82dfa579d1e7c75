#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "scan_context.hpp"

#include "size_formatter.hpp"

#include <cerrno>
#include <ctime>
#include <exception>
#include <fcntl.h>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <thread>

namespace disksight::scan
{
namespace
{
namespace fs = std::filesystem;

constexpr std::string_view kVerbatimPrefix = R"(\\?\)";
}

std::string permissionFlags(bool readOnly)
{
    std::string flags = readOnly ? "r" : " ";
    flags += "wx";
    return flags;
}

std::string displayPath(const fs::path &path)
{
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec)
        return path.string();
    std::string text = canonical.string();
    if (text.compare(0, kVerbatimPrefix.size(), kVerbatimPrefix) == 0)
        text.erase(0, kVerbatimPrefix.size());
    return text;
}

std::string formatTimePoint(const std::chrono::system_clock::time_point &tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!localtime_r(&tt, &tm))
        return "-";
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return out.str();
}

namespace detail
{

bool AncestorChain::contains(const FileIdentity &candidate) const noexcept
{
    for (const AncestorChain *node = this; node; node = node->parent)
    {
        if (node->identity == candidate)
            return true;
    }
    return false;
}

std::optional<EntryMetadata> readMetadata(const fs::path &path, std::error_code &ec)
{
    struct stat sb{};
    if (::stat(path.c_str(), &sb) != 0)
    {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
    ec.clear();

    EntryMetadata metadata;
    metadata.isDirectory = S_ISDIR(sb.st_mode);
    metadata.readOnly = (sb.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0;
    metadata.size = sb.st_size < 0 ? 0 : static_cast<std::uintmax_t>(sb.st_size);
    metadata.identity = {static_cast<std::uintmax_t>(sb.st_dev), static_cast<std::uintmax_t>(sb.st_ino)};
    return metadata;
}

std::optional<std::chrono::system_clock::time_point> readCreatedTime(const fs::path &path)
{
#if defined(__linux__) && defined(STATX_BTIME)
    struct statx stx{};
    if (statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BTIME, &stx) == 0 &&
        (stx.stx_mask & STATX_BTIME))
    {
        return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(stx.stx_btime.tv_sec)) +
               std::chrono::duration_cast<std::chrono::system_clock::duration>(
                   std::chrono::nanoseconds(stx.stx_btime.tv_nsec));
    }
    return std::nullopt;
#elif defined(__APPLE__)
    struct stat sb{};
    if (::stat(path.c_str(), &sb) != 0)
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(sb.st_birthtimespec.tv_sec);
#else
    (void)path;
    return std::nullopt;
#endif
}

void deliverProgress(ProgressSink *sink, const ProgressEvent &event)
{
    if (!sink)
        return;
    try
    {
        sink->notify(event);
    }
    catch (const std::exception &)
    {
        // Notifications are best effort; the scan never depends on them.
    }
    catch (...)
    {
        // Same for sinks that throw something other than std::exception.
    }
}

WorkerBudget::WorkerBudget(std::size_t slots) noexcept
    : available(slots)
{
}

bool WorkerBudget::tryAcquire() noexcept
{
    std::size_t current = available.load(std::memory_order_relaxed);
    while (current > 0)
    {
        if (available.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

void WorkerBudget::release() noexcept
{
    available.fetch_add(1, std::memory_order_acq_rel);
}

namespace
{

// The calling thread always works too, so it is not counted as a spare slot.
std::size_t spareWorkers(const ScanConfig &config)
{
    if (!config.parallel)
        return 0;
    std::size_t threads = config.workerThreads;
    if (threads == 0)
        threads = std::thread::hardware_concurrency();
    if (threads == 0)
        threads = 4;
    return threads - 1;
}

} // namespace

ScanContext::ScanContext(const ScanConfig &config, const ScanHooks &hooks)
    : scanConfig(config)
    , hooks(hooks)
    , workers(spareWorkers(config))
{
}

void ScanContext::reportError(const fs::path &path, const std::error_code &ec) const
{
    if (!scanConfig.reportErrors || !hooks.errorCallback)
        return;
    hooks.errorCallback(path, ec);
}

void ScanContext::progress(const fs::path &directory, const fs::path &entry, std::string_view status) const
{
    if (hooks.progress)
        deliverProgress(hooks.progress, ProgressEvent{directory, entry, std::string(status)});
}

void ScanContext::checkCancelled() const
{
    if (hooks.cancelRequested && hooks.cancelRequested())
        throw ScanCancelled();
}

bool ScanContext::isListed(const std::string &name) const noexcept
{
    return scanConfig.showHidden || name.empty() || name.front() != '.';
}

bool ScanContext::mayDescend(std::size_t depth) const noexcept
{
    return scanConfig.maxDepth == 0 || depth <= scanConfig.maxDepth;
}

bool ScanContext::closesCycle(const fs::path &path, const FileIdentity &identity,
                              const AncestorChain *ancestors) const
{
    if (!scanConfig.detectCycles || !ancestors || !ancestors->contains(identity))
        return false;
    reportError(path, std::make_error_code(std::errc::too_many_symbolic_link_levels));
    return true;
}

Entry ScanContext::makeEntry(const fs::path &path, const std::string &name, const EntryMetadata &metadata,
                             std::uintmax_t size) const
{
    Entry entry;
    entry.kind = metadata.isDirectory ? EntryKind::Directory : EntryKind::File;
    entry.permissionFlags = permissionFlags(metadata.readOnly);
    entry.sizeRaw = size;
    entry.sizeDisplay = formatSize(size, scanConfig.humanReadable);
    entry.path = displayPath(path);
    entry.name = name;
    if (scanConfig.collectCreatedTime)
        entry.createdTime = readCreatedTime(path);
    return entry;
}

} // namespace detail
} // namespace disksight::scan
