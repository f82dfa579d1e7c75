#pragma once

#include "disk_scan_core.hpp"
#include "size_formatter.hpp"

#include "disksight/options.hpp"

namespace disksight::scan
{

void registerScanOptions(config::OptionRegistry &registry);

// Builds a ScanConfig from the registry. The root comes from "defaultPath";
// negative counts are treated as 0.
ScanConfig scanConfigFromRegistry(const config::OptionRegistry &registry);

// Writes every ScanConfig field (root as "defaultPath") into the registry.
void storeScanConfig(config::OptionRegistry &registry, const ScanConfig &scanConfig);

// Display unit pinned by "sizeUnit"; Auto when unset or unrecognised.
SizeUnit sizeUnitFromRegistry(const config::OptionRegistry &registry);

} // namespace disksight::scan
