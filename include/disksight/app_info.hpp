#pragma once

#include <span>
#include <string_view>

#ifndef DISKSIGHT_VERSION
#define DISKSIGHT_VERSION "dev"
#endif

namespace disksight::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view aboutDescription;
};

std::span<const ToolInfo> tools() noexcept;

const ToolInfo *findTool(std::string_view id) noexcept;
const ToolInfo &requireTool(std::string_view id);

const ToolInfo *findToolByExecutable(std::string_view executable) noexcept;
const ToolInfo &requireToolByExecutable(std::string_view executable);

} // namespace disksight::appinfo
