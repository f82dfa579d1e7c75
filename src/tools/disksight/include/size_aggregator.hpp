#pragma once

#include "disk_scan_core.hpp"

#include <cstdint>
#include <filesystem>

namespace disksight::scan
{

// Total length of every file beneath directory. Entries that cannot be read add
// nothing and are passed to hooks.errorCallback. Uses config.parallel,
// workerThreads, maxDepth and detectCycles. Throws ScanCancelled.
std::uintmax_t aggregateSize(const std::filesystem::path &directory, const ScanConfig &config,
                             const ScanHooks &hooks = {});

} // namespace disksight::scan
