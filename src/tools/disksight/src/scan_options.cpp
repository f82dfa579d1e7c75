#include "scan_options.hpp"

#include <cstdint>
#include <string>

namespace disksight::scan
{
namespace
{
const char *const kOptionLongFormat = "longFormat";
const char *const kOptionHumanReadable = "humanReadable";
const char *const kOptionShowHidden = "showHidden";
const char *const kOptionShowCreatedTime = "showCreatedTime";
const char *const kOptionParallel = "parallel";
const char *const kOptionSortBySize = "sortBySize";
const char *const kOptionSortDescending = "sortDescending";
const char *const kOptionFullPath = "fullPath";
const char *const kOptionNameFilter = "nameFilter";
const char *const kOptionDefaultPath = "defaultPath";
const char *const kOptionReportErrors = "reportErrors";
const char *const kOptionWorkerThreads = "workerThreads";
const char *const kOptionMaxDepth = "maxDepth";
const char *const kOptionDetectCycles = "detectCycles";
const char *const kOptionSizeUnit = "sizeUnit";

std::size_t nonNegative(std::int64_t value)
{
    return value < 0 ? 0 : static_cast<std::size_t>(value);
}
}

void registerScanOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionLongFormat, config::OptionKind::Boolean, config::OptionValue(true),
                              "Long Format",
                              "Show type, permissions and aggregated size for every entry instead of names only."});
    registry.registerOption({kOptionHumanReadable, config::OptionKind::Boolean, config::OptionValue(true),
                              "Human Readable Sizes", "Scale sizes to B, KB, MB, GB or TB."});
    registry.registerOption({kOptionShowHidden, config::OptionKind::Boolean, config::OptionValue(true),
                              "Show Hidden Entries", "List entries whose names start with a dot."});
    registry.registerOption({kOptionShowCreatedTime, config::OptionKind::Boolean, config::OptionValue(false),
                              "Show Creation Time", "Read and print the birth time of every entry."});
    registry.registerOption({kOptionParallel, config::OptionKind::Boolean, config::OptionValue(true),
                              "Parallel Scan", "Measure sibling directories on several threads."});
    registry.registerOption({kOptionSortBySize, config::OptionKind::Boolean, config::OptionValue(true),
                              "Sort by Size", "Order entries by aggregated size instead of by name."});
    registry.registerOption({kOptionSortDescending, config::OptionKind::Boolean, config::OptionValue(true),
                              "Largest First", "When sorting by size, put the largest entries first."});
    registry.registerOption({kOptionFullPath, config::OptionKind::Boolean, config::OptionValue(false),
                              "Show Full Paths", "Print canonical absolute paths instead of base names."});
    registry.registerOption({kOptionNameFilter, config::OptionKind::String, config::OptionValue(std::string()),
                              "Directory Name Filter",
                              "Report only directories whose name contains this text, searched recursively."});
    registry.registerOption({kOptionDefaultPath, config::OptionKind::String, config::OptionValue(std::string(".")),
                              "Default Path", "Directory scanned when no path is given."});
    registry.registerOption({kOptionReportErrors, config::OptionKind::Boolean, config::OptionValue(true),
                              "Report Read Errors", "Display warnings for entries that cannot be read."});
    registry.registerOption({kOptionWorkerThreads, config::OptionKind::Integer,
                              config::OptionValue(static_cast<std::int64_t>(0)), "Worker Threads",
                              "Upper bound on scanning threads; 0 uses the hardware concurrency."});
    registry.registerOption({kOptionMaxDepth, config::OptionKind::Integer,
                              config::OptionValue(static_cast<std::int64_t>(0)), "Maximum Depth",
                              "Do not descend more than this many levels below the root; 0 means unlimited."});
    registry.registerOption({kOptionDetectCycles, config::OptionKind::Boolean, config::OptionValue(true),
                              "Detect Link Cycles",
                              "Skip directories that are reached again through a symbolic link."});
    registry.registerOption({kOptionSizeUnit, config::OptionKind::String, config::OptionValue(std::string("auto")),
                              "Size Unit", "auto, bytes, kb, mb, gb, tb or blocks."});
}

ScanConfig scanConfigFromRegistry(const config::OptionRegistry &registry)
{
    ScanConfig scanConfig;
    std::string root = registry.getString(kOptionDefaultPath, ".");
    scanConfig.root = root.empty() ? std::filesystem::path(".") : std::filesystem::path(root);
    scanConfig.recurseDetailed = registry.getBool(kOptionLongFormat, true);
    scanConfig.humanReadable = registry.getBool(kOptionHumanReadable, true);
    scanConfig.showHidden = registry.getBool(kOptionShowHidden, true);
    scanConfig.nameFilter = registry.getString(kOptionNameFilter);
    scanConfig.parallel = registry.getBool(kOptionParallel, true);
    scanConfig.sortBySize = registry.getBool(kOptionSortBySize, true);
    scanConfig.sortDescending = registry.getBool(kOptionSortDescending, true);
    scanConfig.fullPath = registry.getBool(kOptionFullPath, false);
    scanConfig.collectCreatedTime = registry.getBool(kOptionShowCreatedTime, false);
    scanConfig.reportErrors = registry.getBool(kOptionReportErrors, true);
    scanConfig.workerThreads = nonNegative(registry.getInteger(kOptionWorkerThreads, 0));
    scanConfig.maxDepth = nonNegative(registry.getInteger(kOptionMaxDepth, 0));
    scanConfig.detectCycles = registry.getBool(kOptionDetectCycles, true);
    return scanConfig;
}

void storeScanConfig(config::OptionRegistry &registry, const ScanConfig &scanConfig)
{
    registry.set(kOptionDefaultPath, config::OptionValue(scanConfig.root.string()));
    registry.set(kOptionLongFormat, config::OptionValue(scanConfig.recurseDetailed));
    registry.set(kOptionHumanReadable, config::OptionValue(scanConfig.humanReadable));
    registry.set(kOptionShowHidden, config::OptionValue(scanConfig.showHidden));
    registry.set(kOptionNameFilter, config::OptionValue(scanConfig.nameFilter));
    registry.set(kOptionParallel, config::OptionValue(scanConfig.parallel));
    registry.set(kOptionSortBySize, config::OptionValue(scanConfig.sortBySize));
    registry.set(kOptionSortDescending, config::OptionValue(scanConfig.sortDescending));
    registry.set(kOptionFullPath, config::OptionValue(scanConfig.fullPath));
    registry.set(kOptionShowCreatedTime, config::OptionValue(scanConfig.collectCreatedTime));
    registry.set(kOptionReportErrors, config::OptionValue(scanConfig.reportErrors));
    registry.set(kOptionWorkerThreads, config::OptionValue(static_cast<std::int64_t>(scanConfig.workerThreads)));
    registry.set(kOptionMaxDepth, config::OptionValue(static_cast<std::int64_t>(scanConfig.maxDepth)));
    registry.set(kOptionDetectCycles, config::OptionValue(scanConfig.detectCycles));
}

SizeUnit sizeUnitFromRegistry(const config::OptionRegistry &registry)
{
    return parseSizeUnit(registry.getString(kOptionSizeUnit, "auto")).value_or(SizeUnit::Auto);
}

} // namespace disksight::scan
