#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace disksight::scan
{

struct ProgressEvent
{
    std::filesystem::path currentDirectory;
    std::filesystem::path currentEntry;
    std::string status;
};

namespace status
{
inline constexpr std::string_view ScanStarted = "scan_started";
inline constexpr std::string_view Processing = "processing";
inline constexpr std::string_view CalculatingDirectorySize = "calculating_directory_size";
inline constexpr std::string_view DirectoryCalculationCompleted = "directory_calculation_completed";
inline constexpr std::string_view SearchingInDirectory = "searching_in_directory";
inline constexpr std::string_view CheckingFile = "checking_file";
inline constexpr std::string_view CalculatingMatchingDirectory = "calculating_matching_directory";
inline constexpr std::string_view MatchingDirectoryCompleted = "matching_directory_completed";
inline constexpr std::string_view ProcessingFile = "processing_file";
inline constexpr std::string_view Completed = "completed";
inline constexpr std::string_view ScanCompleted = "scan_completed";

// "progress_40%"
std::string milestone(std::size_t percent);
} // namespace status

// Receives progress notifications while a scan runs. With parallel scanning
// enabled notify() is called from several worker threads at once.
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;
    virtual void notify(const ProgressEvent &event) = 0;
};

class NullProgressSink final : public ProgressSink
{
public:
    void notify(const ProgressEvent &) override {}
};

class FunctionProgressSink final : public ProgressSink
{
public:
    explicit FunctionProgressSink(std::function<void(const ProgressEvent &)> handler);

    void notify(const ProgressEvent &event) override;

private:
    std::function<void(const ProgressEvent &)> handler;
};

} // namespace disksight::scan
