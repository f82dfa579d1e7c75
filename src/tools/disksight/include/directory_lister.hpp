#pragma once

#include "disk_scan_core.hpp"

#include <filesystem>
#include <system_error>

namespace disksight::scan
{

// Lists the children of root as described by config. Only a root that cannot
// be opened is an error; everything beneath it degrades to diagnostics.
ListResult listDirectory(const std::filesystem::path &root, const ScanConfig &config, const ScanHooks &hooks,
                         std::error_code &ec);

// Throws std::filesystem::filesystem_error when root cannot be opened.
ListResult listDirectory(const std::filesystem::path &root, const ScanConfig &config, const ScanHooks &hooks = {});

// listDirectory(config.root, ...) with timing and scan_started/scan_completed
// notifications.
ScanResult scan(const ScanConfig &config, const ScanHooks &hooks = {});

} // namespace disksight::scan
