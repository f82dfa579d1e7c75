#pragma once

#include "disk_scan_core.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace disksight::scan
{

// Searches the directories beneath directory for names containing filter
// (case-sensitive). Each match is reported with its aggregated size and is not
// searched further; files are never reported. Matches come back in
// depth-first name order. Throws ScanCancelled.
std::vector<Entry> findMatches(const std::filesystem::path &directory, const std::string &filter,
                               const ScanConfig &config, const ScanHooks &hooks = {});

} // namespace disksight::scan
