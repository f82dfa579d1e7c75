#include "disksight/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace disksight::appinfo
{
namespace
{

constexpr std::array<ToolInfo, 2> kTools{{
    ToolInfo{
        "disksight",
        "disksight",
        "DiskSight",
        "List a directory with recursively aggregated sizes.",
        "DiskSight lists the immediate children of a directory and annotates every subdirectory with the total "
        "size of everything beneath it. Unreadable files and subtrees are reported and skipped, so a partially "
        "accessible tree still produces a useful answer. Filter by directory name to locate build caches or "
        "dependency folders buried deep in a project."},
    ToolInfo{
        "disksight-config",
        "disksight-config",
        "DiskSight Config",
        "Manage saved DiskSight defaults.",
        "DiskSight Config shows, edits, imports and exports the option defaults that DiskSight loads at "
        "startup, so preferred units, sorting and parallelism carry over between runs."},
}};

} // namespace

std::span<const ToolInfo> tools() noexcept
{
    return std::span<const ToolInfo>{kTools};
}

const ToolInfo *findTool(std::string_view id) noexcept
{
    auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info) { return info.id == id; });
    if (it == kTools.end())
        return nullptr;
    return &*it;
}

const ToolInfo &requireTool(std::string_view id)
{
    if (const ToolInfo *info = findTool(id))
        return *info;
    throw std::runtime_error("Unknown tool id: " + std::string{id});
}

const ToolInfo *findToolByExecutable(std::string_view executable) noexcept
{
    auto it = std::find_if(kTools.begin(), kTools.end(),
                           [&](const ToolInfo &info) { return info.executable == executable; });
    if (it == kTools.end())
        return nullptr;
    return &*it;
}

const ToolInfo &requireToolByExecutable(std::string_view executable)
{
    if (const ToolInfo *info = findToolByExecutable(executable))
        return *info;
    throw std::runtime_error("Unknown tool executable: " + std::string{executable});
}

} // namespace disksight::appinfo
