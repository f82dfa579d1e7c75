#include "scan_options.hpp"

#include "disksight/app_info.hpp"
#include "disksight/options.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace config = disksight::config;

namespace
{

constexpr std::string_view kToolId = "disksight-config";

const disksight::appinfo::ToolInfo &toolInfo()
{
    return disksight::appinfo::requireTool(kToolId);
}

using RegisterFn = void (*)(config::OptionRegistry &);

struct ApplicationInfo
{
    std::string id;
    std::string name;
    RegisterFn registerFn = nullptr;
};

struct ApplicationEntry
{
    ApplicationInfo info;
    bool hasDefaults = false;
};

enum class CliAction
{
    None,
    ListApps,
    ListProfiles,
    Show,
    Clear,
    Reset,
    Export,
    Import,
    Set,
    ConfigRoot
};

struct CliOptions
{
    CliAction action = CliAction::None;
    std::string appId;
    std::string key;
    std::string value;
    std::filesystem::path file;
};

const std::vector<ApplicationInfo> &knownApplications()
{
    static const std::vector<ApplicationInfo> apps = []() {
        std::vector<ApplicationInfo> result;
        for (const auto &tool : disksight::appinfo::tools())
        {
            RegisterFn reg = nullptr;
            if (tool.id == "disksight")
                reg = &disksight::scan::registerScanOptions;
            result.push_back(ApplicationInfo{std::string(tool.id), std::string(tool.displayName), reg});
        }
        return result;
    }();
    return apps;
}

const ApplicationInfo *findKnownApplication(const std::string &id)
{
    const auto &apps = knownApplications();
    auto it = std::find_if(apps.begin(), apps.end(), [&](const ApplicationInfo &info) { return info.id == id; });
    if (it != apps.end())
        return &*it;
    return nullptr;
}

// Only applications that register options have settings to manage.
const ApplicationInfo *requireConfigurable(const std::string &id, std::string_view action)
{
    const ApplicationInfo *info = findKnownApplication(id);
    if (!info || !info->registerFn)
    {
        std::cerr << "disksight-config: application '" << id << "' does not support " << action << std::endl;
        return nullptr;
    }
    return info;
}

std::vector<ApplicationEntry> gatherApplicationEntries()
{
    std::vector<std::string> profiles = config::OptionRegistry::availableProfiles();
    std::unordered_set<std::string> savedProfiles(profiles.begin(), profiles.end());
    std::vector<ApplicationEntry> entries;
    for (const auto &info : knownApplications())
        entries.push_back({info, savedProfiles.count(info.id) > 0});
    std::sort(entries.begin(), entries.end(), [](const ApplicationEntry &a, const ApplicationEntry &b) {
        return a.info.id < b.info.id;
    });
    return entries;
}

void printUsage()
{
    const auto &info = toolInfo();
    std::cout << info.executable << " - " << info.shortDescription << "\n\n"
              << "Usage: " << info.executable << " [options]\n"
              << "  --list-apps             List known applications\n"
              << "  --list-profiles         List profiles with saved defaults\n"
              << "  --config-root           Print the configuration root path\n"
              << "  --show APP              Display the effective defaults for APP\n"
              << "  --clear APP             Remove saved defaults for APP\n"
              << "  --reset APP             Reset APP to built-in defaults\n"
              << "  --export APP FILE       Export APP defaults to FILE\n"
              << "  --import APP FILE       Import defaults for APP from FILE\n"
              << "  --set APP KEY VALUE     Set KEY to VALUE for APP\n"
              << "  --help                  Show this help message\n\n"
              << "Configuration lives under $XDG_CONFIG_HOME/disksight (or ~/.config/disksight)." << std::endl;
}

int listApps()
{
    auto entries = gatherApplicationEntries();
    if (entries.empty())
        std::cout << "(no applications found)" << std::endl;
    for (const auto &entry : entries)
    {
        std::cout << entry.info.id << "\t" << entry.info.name;
        if (entry.hasDefaults)
            std::cout << "\t[saved]";
        std::cout << std::endl;
    }
    return 0;
}

int listProfiles()
{
    auto profiles = config::OptionRegistry::availableProfiles();
    if (profiles.empty())
        std::cout << "(no profiles found)" << std::endl;
    for (const auto &id : profiles)
        std::cout << id << std::endl;
    return 0;
}

int showApplication(const CliOptions &opts)
{
    const ApplicationInfo *info = requireConfigurable(opts.appId, "options");
    if (!info)
        return 1;

    config::OptionRegistry registry(opts.appId);
    info->registerFn(registry);
    std::filesystem::path path = registry.defaultOptionsPath();
    std::error_code ec;
    const bool saved = std::filesystem::exists(path, ec);
    std::string error;
    if (saved && !registry.loadFromFile(path, &error))
    {
        std::cerr << "disksight-config: " << error << std::endl;
        return 1;
    }

    std::cout << "Application: " << info->name << " (" << info->id << ")" << std::endl;
    std::cout << "Defaults: " << (saved ? path.string() : std::string("(built-in)")) << std::endl;
    for (const auto &def : registry.listRegisteredOptions())
    {
        std::cout << def.key << " = " << config::describeValue(def, registry.get(def.key));
        if (!registry.isOverridden(def.key))
            std::cout << " (default)";
        std::cout << std::endl;
    }
    return 0;
}

int clearApplication(const CliOptions &opts)
{
    config::OptionRegistry registry(opts.appId);
    std::filesystem::path path = registry.defaultOptionsPath();
    if (registry.clearDefaults())
    {
        std::cout << "Cleared defaults for '" << opts.appId << "' (" << path.string() << ")" << std::endl;
        return 0;
    }
    std::cerr << "disksight-config: failed to clear defaults at " << path.string() << std::endl;
    return 1;
}

int resetApplication(const CliOptions &opts)
{
    const ApplicationInfo *info = requireConfigurable(opts.appId, "reset");
    if (!info)
        return 1;
    config::OptionRegistry registry(opts.appId);
    info->registerFn(registry);
    registry.resetToDefaults();
    if (!registry.saveDefaults())
    {
        std::cerr << "disksight-config: failed to save defaults for '" << opts.appId << "'" << std::endl;
        return 1;
    }
    std::cout << "Defaults reset for '" << opts.appId << "' (" << registry.defaultOptionsPath().string() << ")"
              << std::endl;
    return 0;
}

int exportApplication(const CliOptions &opts)
{
    config::OptionRegistry registry(opts.appId);
    std::filesystem::path source = registry.defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(source, ec))
    {
        std::cerr << "disksight-config: no saved defaults for '" << opts.appId << "'" << std::endl;
        return 1;
    }
    if (opts.file.has_parent_path())
    {
        std::filesystem::create_directories(opts.file.parent_path(), ec);
        if (ec)
        {
            std::cerr << "disksight-config: failed to prepare export directory: " << ec.message() << std::endl;
            return 1;
        }
    }
    if (!std::filesystem::copy_file(source, opts.file, std::filesystem::copy_options::overwrite_existing, ec))
    {
        std::cerr << "disksight-config: failed to export defaults: " << ec.message() << std::endl;
        return 1;
    }
    std::cout << "Exported defaults for '" << opts.appId << "' to " << opts.file.string() << std::endl;
    return 0;
}

int importApplication(const CliOptions &opts)
{
    const ApplicationInfo *info = requireConfigurable(opts.appId, "import");
    if (!info)
        return 1;
    std::error_code ec;
    if (!std::filesystem::exists(opts.file, ec))
    {
        std::cerr << "disksight-config: import file not found: " << opts.file.string() << std::endl;
        return 1;
    }
    config::OptionRegistry registry(opts.appId);
    info->registerFn(registry);
    std::string error;
    if (!registry.loadFromFile(opts.file, &error))
    {
        std::cerr << "disksight-config: " << error << std::endl;
        return 1;
    }
    if (!registry.saveDefaults())
    {
        std::cerr << "disksight-config: failed to save defaults for '" << opts.appId << "'" << std::endl;
        return 1;
    }
    std::cout << "Imported defaults for '" << opts.appId << "'" << std::endl;
    return 0;
}

int setApplicationOption(const CliOptions &opts)
{
    const ApplicationInfo *info = requireConfigurable(opts.appId, "option editing");
    if (!info)
        return 1;
    config::OptionRegistry registry(opts.appId);
    info->registerFn(registry);
    const config::OptionDefinition *definition = registry.definition(opts.key);
    if (!definition)
    {
        std::cerr << "disksight-config: unknown option '" << opts.key << "'" << std::endl;
        return 1;
    }

    std::filesystem::path path = registry.defaultOptionsPath();
    std::error_code ec;
    std::string error;
    if (std::filesystem::exists(path, ec) && !registry.loadFromFile(path, &error))
    {
        std::cerr << "disksight-config: " << error << std::endl;
        return 1;
    }
    if (!registry.setFromText(definition->key, opts.value))
    {
        std::cerr << "disksight-config: invalid value '" << opts.value << "' for " << definition->key << std::endl;
        return 1;
    }
    if (!registry.saveDefaults())
    {
        std::cerr << "disksight-config: failed to save defaults for '" << opts.appId << "'" << std::endl;
        return 1;
    }
    std::cout << definition->key << " = " << config::describeValue(*definition, registry.get(definition->key))
              << std::endl;
    return 0;
}

int executeCliAction(const CliOptions &opts)
{
    switch (opts.action)
    {
    case CliAction::ListApps:
        return listApps();
    case CliAction::ListProfiles:
        return listProfiles();
    case CliAction::Show:
        return showApplication(opts);
    case CliAction::Clear:
        return clearApplication(opts);
    case CliAction::Reset:
        return resetApplication(opts);
    case CliAction::Export:
        return exportApplication(opts);
    case CliAction::Import:
        return importApplication(opts);
    case CliAction::Set:
        return setApplicationOption(opts);
    case CliAction::ConfigRoot:
        std::cout << config::OptionRegistry::configRoot().string() << std::endl;
        return 0;
    case CliAction::None:
        break;
    }
    printUsage();
    return 1;
}

// Number of operands each action takes after its flag.
int operandCount(CliAction action)
{
    switch (action)
    {
    case CliAction::Show:
    case CliAction::Clear:
    case CliAction::Reset:
        return 1;
    case CliAction::Export:
    case CliAction::Import:
        return 2;
    case CliAction::Set:
        return 3;
    default:
        return 0;
    }
}

} // namespace

int main(int argc, char **argv)
{
    CliOptions opts;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        CliAction action = CliAction::None;
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--list-apps")
            action = CliAction::ListApps;
        else if (arg == "--list-profiles")
            action = CliAction::ListProfiles;
        else if (arg == "--config-root")
            action = CliAction::ConfigRoot;
        else if (arg == "--show")
            action = CliAction::Show;
        else if (arg == "--clear")
            action = CliAction::Clear;
        else if (arg == "--reset")
            action = CliAction::Reset;
        else if (arg == "--export")
            action = CliAction::Export;
        else if (arg == "--import")
            action = CliAction::Import;
        else if (arg == "--set")
            action = CliAction::Set;
        else
        {
            std::cerr << "disksight-config: unknown option '" << arg << "'" << std::endl;
            printUsage();
            return 1;
        }

        if (opts.action != CliAction::None)
        {
            std::cerr << "disksight-config: only one action may be given" << std::endl;
            return 1;
        }
        const int operands = operandCount(action);
        if (i + operands >= argc)
        {
            std::cerr << "disksight-config: " << arg << " requires " << operands
                      << (operands == 1 ? " argument" : " arguments") << std::endl;
            return 1;
        }
        opts.action = action;
        if (operands >= 1)
            opts.appId = argv[++i];
        if (action == CliAction::Export || action == CliAction::Import)
            opts.file = argv[++i];
        if (action == CliAction::Set)
        {
            opts.key = argv[++i];
            opts.value = argv[++i];
        }
    }
    return executeCliAction(opts);
}
