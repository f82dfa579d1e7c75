#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace disksight::scan
{

enum class SizeUnit
{
    Auto,
    Bytes,
    Kilobytes,
    Megabytes,
    Gigabytes,
    Terabytes,
    Blocks
};

const char *unitName(SizeUnit unit) noexcept;

// Accepts unit names as typed on a command line: "auto", "b", "kb", "mb",
// "gb", "tb", "blocks" (case-insensitive, long names too).
std::optional<SizeUnit> parseSizeUnit(std::string_view text);

// Raw decimal string when humanReadable is false, otherwise a binary-scaled
// value such as "512 B", "1.50 KB" or "120 GB".
std::string formatSize(std::uintmax_t bytes, bool humanReadable);

std::string formatSize(std::uintmax_t bytes, SizeUnit unit);

} // namespace disksight::scan
