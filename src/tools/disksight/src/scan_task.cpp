#include "scan_task.hpp"

#include "directory_lister.hpp"

#include <stdexcept>
#include <utility>

namespace disksight::scan
{

ScanTask::ScanTask(ScanConfig config, ProgressSink *forward)
    : scanConfig(std::move(config))
    , forward(forward)
    , currentPathText(scanConfig.root.string())
{
}

ScanTask::~ScanTask()
{
    cancel();
    if (worker.joinable())
        worker.join();
}

void ScanTask::start()
{
    if (started())
        throw std::logic_error("scan task already started");
    worker = std::thread([this]() { run(); });
}

void ScanTask::wait()
{
    if (worker.joinable())
        worker.join();
}

std::string ScanTask::currentPath() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return currentPathText;
}

std::string ScanTask::lastStatus() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return status;
}

std::vector<std::string> ScanTask::errors() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return errorMessages;
}

std::size_t ScanTask::errorCount() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return totalErrors;
}

ScanResult ScanTask::takeResult()
{
    if (!started())
        throw std::logic_error("scan task was never started");
    wait();

    std::lock_guard<std::mutex> lock(mutex);
    if (failure)
        std::rethrow_exception(std::exchange(failure, nullptr));
    if (!result)
        throw std::logic_error("scan result already taken");
    ScanResult taken = std::move(*result);
    result.reset();
    return taken;
}

void ScanTask::RecordingSink::notify(const ProgressEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(task.mutex);
        task.currentPathText = event.currentEntry.string();
        task.status = event.status;
    }
    if (task.forward)
        task.forward->notify(event);
}

void ScanTask::recordError(const std::filesystem::path &path, const std::error_code &ec)
{
    std::lock_guard<std::mutex> lock(mutex);
    ++totalErrors;
    if (errorMessages.size() >= kMaxRecordedErrors)
        return;
    std::string message = "cannot access '" + path.string() + "'";
    if (!ec.message().empty())
        message += ": " + ec.message();
    errorMessages.push_back(std::move(message));
}

void ScanTask::run()
{
    ScanHooks hooks;
    hooks.progress = &recorder;
    hooks.errorCallback = [this](const std::filesystem::path &path, const std::error_code &ec) {
        recordError(path, ec);
    };
    hooks.cancelRequested = [this]() { return cancelRequested.load(); };

    try
    {
        ScanResult scanned = scan(scanConfig, hooks);
        std::lock_guard<std::mutex> lock(mutex);
        result = std::move(scanned);
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(mutex);
        failure = std::current_exception();
    }
    done.store(true);
}

} // namespace disksight::scan
