#pragma once

#include "disk_scan_core.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace disksight::scan::detail
{

struct FileIdentity
{
    std::uintmax_t device = 0;
    std::uintmax_t inode = 0;

    bool operator==(const FileIdentity &) const noexcept = default;
};

// The directories between the scan root and the directory being visited. Each
// recursion level owns its node on the stack, so parallel branches never share
// mutable state.
struct AncestorChain
{
    FileIdentity identity;
    const AncestorChain *parent = nullptr;

    bool contains(const FileIdentity &candidate) const noexcept;
};

struct EntryMetadata
{
    bool isDirectory = false;
    bool readOnly = false;
    std::uintmax_t size = 0;
    FileIdentity identity;
};

// stat() following symbolic links.
std::optional<EntryMetadata> readMetadata(const std::filesystem::path &path, std::error_code &ec);

// Birth time where the platform records one.
std::optional<std::chrono::system_clock::time_point> readCreatedTime(const std::filesystem::path &path);

// Hands event to sink unless sink is null. A sink that throws loses the event.
void deliverProgress(ProgressSink *sink, const ProgressEvent &event);

class WorkerBudget
{
public:
    explicit WorkerBudget(std::size_t slots) noexcept;

    bool tryAcquire() noexcept;
    void release() noexcept;

private:
    std::atomic<std::size_t> available;
};

class BudgetSlot
{
public:
    explicit BudgetSlot(WorkerBudget &budget) noexcept
        : budget(budget)
    {
    }
    ~BudgetSlot() { budget.release(); }

    BudgetSlot(const BudgetSlot &) = delete;
    BudgetSlot &operator=(const BudgetSlot &) = delete;

private:
    WorkerBudget &budget;
};

class ScanContext
{
public:
    ScanContext(const ScanConfig &config, const ScanHooks &hooks);

    ScanContext(const ScanContext &) = delete;
    ScanContext &operator=(const ScanContext &) = delete;

    const ScanConfig &config() const noexcept { return scanConfig; }
    WorkerBudget &budget() noexcept { return workers; }

    void reportError(const std::filesystem::path &path, const std::error_code &ec) const;
    void progress(const std::filesystem::path &directory, const std::filesystem::path &entry,
                  std::string_view status) const;
    void checkCancelled() const;

    bool isListed(const std::string &name) const noexcept;
    bool mayDescend(std::size_t depth) const noexcept;

    // Reports and returns true when identity already appears in ancestors.
    bool closesCycle(const std::filesystem::path &path, const FileIdentity &identity,
                     const AncestorChain *ancestors) const;

    Entry makeEntry(const std::filesystem::path &path, const std::string &name, const EntryMetadata &metadata,
                    std::uintmax_t size) const;

private:
    const ScanConfig &scanConfig;
    const ScanHooks &hooks;
    WorkerBudget workers;
};

std::uintmax_t sumDirectory(ScanContext &context, const std::filesystem::path &directory,
                            const AncestorChain &self, std::size_t depth);

std::vector<Entry> searchDirectory(ScanContext &context, const std::filesystem::path &directory,
                                   const AncestorChain &self, std::size_t depth, const std::string &filter);

} // namespace disksight::scan::detail
