#include "size_formatter.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace disksight::scan
{
namespace
{

constexpr std::uintmax_t kKilobyte = 1ULL << 10;
constexpr std::uintmax_t kMegabyte = 1ULL << 20;
constexpr std::uintmax_t kGigabyte = 1ULL << 30;
constexpr std::uintmax_t kTerabyte = 1ULL << 40;

// Two decimals below 10, one below 100, none above, judged on the value as
// it will be printed so that 9.999 becomes "10.0" rather than "10.00".
int decimalsFor(double value)
{
    if (value >= 100 || std::round(value * 10) / 10 >= 100)
        return 0;
    if (value >= 10 || std::round(value * 100) / 100 >= 10)
        return 1;
    return 2;
}

double displayedValue(double value)
{
    const double scale = std::pow(10.0, decimalsFor(value));
    return std::round(value * scale) / scale;
}

std::string renderValue(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimalsFor(value)) << value;
    return out.str();
}

std::string scaled(std::uintmax_t bytes, std::uintmax_t divisor, const char *suffix)
{
    return renderValue(static_cast<double>(bytes) / static_cast<double>(divisor)) + " " + suffix;
}

} // namespace

const char *unitName(SizeUnit unit) noexcept
{
    switch (unit)
    {
    case SizeUnit::Auto:
        return "Auto";
    case SizeUnit::Bytes:
        return "Bytes";
    case SizeUnit::Kilobytes:
        return "Kilobytes";
    case SizeUnit::Megabytes:
        return "Megabytes";
    case SizeUnit::Gigabytes:
        return "Gigabytes";
    case SizeUnit::Terabytes:
        return "Terabytes";
    case SizeUnit::Blocks:
        return "Blocks";
    }
    return "";
}

std::optional<SizeUnit> parseSizeUnit(std::string_view text)
{
    std::string lower;
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (lower == "auto")
        return SizeUnit::Auto;
    if (lower == "b" || lower == "bytes")
        return SizeUnit::Bytes;
    if (lower == "k" || lower == "kb" || lower == "kilobytes")
        return SizeUnit::Kilobytes;
    if (lower == "m" || lower == "mb" || lower == "megabytes")
        return SizeUnit::Megabytes;
    if (lower == "g" || lower == "gb" || lower == "gigabytes")
        return SizeUnit::Gigabytes;
    if (lower == "t" || lower == "tb" || lower == "terabytes")
        return SizeUnit::Terabytes;
    if (lower == "blocks")
        return SizeUnit::Blocks;
    return std::nullopt;
}

std::string formatSize(std::uintmax_t bytes, bool humanReadable)
{
    if (!humanReadable)
        return std::to_string(bytes);
    return formatSize(bytes, SizeUnit::Auto);
}

std::string formatSize(std::uintmax_t bytes, SizeUnit unit)
{
    SizeUnit effectiveUnit = unit;
    if (unit == SizeUnit::Auto)
    {
        if (bytes >= kTerabyte)
            effectiveUnit = SizeUnit::Terabytes;
        else if (bytes >= kGigabyte)
            effectiveUnit = SizeUnit::Gigabytes;
        else if (bytes >= kMegabyte)
            effectiveUnit = SizeUnit::Megabytes;
        else if (bytes >= kKilobyte)
            effectiveUnit = SizeUnit::Kilobytes;
        else
            effectiveUnit = SizeUnit::Bytes;

        // 1048575 bytes is 1023.999 KB, which would print as "1024 KB".
        if (effectiveUnit == SizeUnit::Kilobytes &&
            displayedValue(static_cast<double>(bytes) / static_cast<double>(kKilobyte)) >= 1024)
            effectiveUnit = SizeUnit::Megabytes;
        else if (effectiveUnit == SizeUnit::Megabytes &&
                 displayedValue(static_cast<double>(bytes) / static_cast<double>(kMegabyte)) >= 1024)
            effectiveUnit = SizeUnit::Gigabytes;
        else if (effectiveUnit == SizeUnit::Gigabytes &&
                 displayedValue(static_cast<double>(bytes) / static_cast<double>(kGigabyte)) >= 1024)
            effectiveUnit = SizeUnit::Terabytes;
    }

    switch (effectiveUnit)
    {
    case SizeUnit::Auto:
    case SizeUnit::Bytes:
        break;
    case SizeUnit::Kilobytes:
        return scaled(bytes, kKilobyte, "KB");
    case SizeUnit::Megabytes:
        return scaled(bytes, kMegabyte, "MB");
    case SizeUnit::Gigabytes:
        return scaled(bytes, kGigabyte, "GB");
    case SizeUnit::Terabytes:
        return scaled(bytes, kTerabyte, "TB");
    case SizeUnit::Blocks:
        return std::to_string((bytes + 511) / 512) + " blocks";
    }
    return std::to_string(bytes) + " B";
}

} // namespace disksight::scan
