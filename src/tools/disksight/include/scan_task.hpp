#pragma once

#include "disk_scan_core.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace disksight::scan
{

// Runs scan() on a worker thread. The owning thread polls finished(),
// currentPath() and errors() while the scan runs, then calls takeResult().
class ScanTask
{
public:
    static constexpr std::size_t kMaxRecordedErrors = 200;

    explicit ScanTask(ScanConfig config, ProgressSink *forward = nullptr);
    ~ScanTask();

    ScanTask(const ScanTask &) = delete;
    ScanTask &operator=(const ScanTask &) = delete;

    void start();
    bool started() const noexcept { return worker.joinable() || done.load(); }
    bool finished() const noexcept { return done.load(); }
    void cancel() noexcept { cancelRequested.store(true); }
    void wait();

    const ScanConfig &config() const noexcept { return scanConfig; }
    std::string currentPath() const;
    std::string lastStatus() const;
    // "cannot access '<path>': <reason>", oldest first.
    std::vector<std::string> errors() const;
    std::size_t errorCount() const;

    // Waits for the worker, then returns the result or rethrows the failure
    // that ended the scan (std::filesystem::filesystem_error for an
    // unreadable root). May be called once.
    ScanResult takeResult();

private:
    class RecordingSink : public ProgressSink
    {
    public:
        explicit RecordingSink(ScanTask &task)
            : task(task)
        {
        }
        void notify(const ProgressEvent &event) override;

    private:
        ScanTask &task;
    };

    void run();
    void recordError(const std::filesystem::path &path, const std::error_code &ec);

    ScanConfig scanConfig;
    ProgressSink *forward = nullptr;
    RecordingSink recorder{*this};
    std::thread worker;
    mutable std::mutex mutex;
    std::optional<ScanResult> result;
    std::exception_ptr failure;
    std::string currentPathText;
    std::string status;
    std::vector<std::string> errorMessages;
    std::size_t totalErrors = 0;
    std::atomic<bool> cancelRequested{false};
    std::atomic<bool> done{false};
};

} // namespace disksight::scan
