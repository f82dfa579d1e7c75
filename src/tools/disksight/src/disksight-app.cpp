#include "scan_options.hpp"
#include "scan_task.hpp"
#include "size_formatter.hpp"

#include "disksight/app_info.hpp"
#include "disksight/options.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace config = disksight::config;
using namespace disksight::scan;

namespace
{

constexpr std::string_view kToolId = "disksight";
constexpr int kExitUsage = 1;
constexpr int kExitRootFailure = 2;
constexpr int kExitInterrupted = 130;
constexpr std::size_t kStatusWidth = 78;

volatile std::sig_atomic_t gInterrupted = 0;

void handleInterrupt(int)
{
    gInterrupted = 1;
}

const disksight::appinfo::ToolInfo &toolInfo()
{
    return disksight::appinfo::requireTool(kToolId);
}

struct CommandLine
{
    bool loadDefaults = true;
    bool saveDefaults = false;
    bool showProgress = false;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::filesystem::path> paths;
};

void printUsage()
{
    const auto &info = toolInfo();
    std::cout << info.executable << " - " << info.shortDescription << "\n\n"
              << "Usage: " << info.executable << " [options] [paths...]\n"
              << "  -l             Long format with types, permissions and sizes (default)\n"
              << "  -1             Print names only\n"
              << "  -H             Human readable sizes (default)\n"
              << "  -b             Print sizes in bytes\n"
              << "  -a             Include hidden entries (default)\n"
              << "  -A             Leave out hidden entries\n"
              << "  -t             Show creation times\n"
              << "  -p             Scan sibling directories in parallel (default)\n"
              << "  -P             Scan sequentially\n"
              << "  -s             Sort by size (default)\n"
              << "  -S             Keep name order\n"
              << "  -r             Smallest entries first\n"
              << "  -f             Print full paths\n"
              << "  -n NAME        Report only directories whose name contains NAME\n"
              << "  -j N           Use at most N threads (0 = hardware concurrency)\n"
              << "  -d N           Descend at most N levels (0 = unlimited)\n"
              << "  -q             Suppress read error warnings\n"
              << "  --unit UNIT    auto, bytes, kb, mb, gb, tb or blocks\n"
              << "  --no-cycle-check       Follow directory links without loop detection\n"
              << "  --progress             Show scan progress on stderr\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  --save-defaults        Save the resulting options as defaults\n"
              << "  --version              Print the version\n\n"
              << "Every option can also be set through DISKSIGHT_<OPTION> environment variables,\n"
              << "for example DISKSIGHT_SORT_BY_SIZE=false." << std::endl;
}

bool takeValue(int argc, char **argv, int &i, const std::string &arg, std::size_t &j, std::string &value)
{
    if (j + 1 < arg.size())
    {
        value = arg.substr(j + 1);
        j = arg.size();
        return true;
    }
    if (i + 1 < argc)
    {
        value = argv[++i];
        j = arg.size();
        return true;
    }
    return false;
}

// Returns an exit code when the command line asks to stop early.
std::optional<int> parseCommandLine(int argc, char **argv, CommandLine &cli)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--version")
        {
            std::cout << toolInfo().executable << " " << DISKSIGHT_VERSION << std::endl;
            return 0;
        }
        else if (arg == "--no-default-options")
        {
            cli.loadDefaults = false;
        }
        else if (arg == "--save-defaults")
        {
            cli.saveDefaults = true;
        }
        else if (arg == "--progress")
        {
            cli.showProgress = true;
        }
        else if (arg == "--no-cycle-check")
        {
            cli.overrides.emplace_back("detectCycles", "false");
        }
        else if (arg.rfind("--unit", 0) == 0 || arg.rfind("--load-options", 0) == 0)
        {
            const bool isUnit = arg.rfind("--unit", 0) == 0;
            const std::string name = isUnit ? "--unit" : "--load-options";
            std::string value;
            if (arg == name)
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "disksight: " << name << " requires a value" << std::endl;
                    return kExitUsage;
                }
                value = argv[++i];
            }
            else if (arg.size() > name.size() + 1 && arg[name.size()] == '=')
            {
                value = arg.substr(name.size() + 1);
            }
            else
            {
                std::cerr << "disksight: unknown option '" << arg << "'" << std::endl;
                return kExitUsage;
            }

            if (isUnit)
            {
                if (!parseSizeUnit(value))
                {
                    std::cerr << "disksight: unknown size unit '" << value << "'" << std::endl;
                    return kExitUsage;
                }
                cli.overrides.emplace_back("sizeUnit", value);
            }
            else
            {
                cli.optionFiles.emplace_back(value);
            }
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-')
        {
            for (std::size_t j = 1; j < arg.size(); ++j)
            {
                char opt = arg[j];
                switch (opt)
                {
                case 'l':
                    cli.overrides.emplace_back("longFormat", "true");
                    break;
                case '1':
                    cli.overrides.emplace_back("longFormat", "false");
                    break;
                case 'H':
                    cli.overrides.emplace_back("humanReadable", "true");
                    break;
                case 'b':
                    cli.overrides.emplace_back("humanReadable", "false");
                    break;
                case 'a':
                    cli.overrides.emplace_back("showHidden", "true");
                    break;
                case 'A':
                    cli.overrides.emplace_back("showHidden", "false");
                    break;
                case 't':
                    cli.overrides.emplace_back("showCreatedTime", "true");
                    break;
                case 'p':
                    cli.overrides.emplace_back("parallel", "true");
                    break;
                case 'P':
                    cli.overrides.emplace_back("parallel", "false");
                    break;
                case 's':
                    cli.overrides.emplace_back("sortBySize", "true");
                    break;
                case 'S':
                    cli.overrides.emplace_back("sortBySize", "false");
                    break;
                case 'r':
                    cli.overrides.emplace_back("sortDescending", "false");
                    break;
                case 'f':
                    cli.overrides.emplace_back("fullPath", "true");
                    break;
                case 'q':
                    cli.overrides.emplace_back("reportErrors", "false");
                    break;
                case 'n':
                case 'j':
                case 'd':
                {
                    std::string value;
                    if (!takeValue(argc, argv, i, arg, j, value))
                    {
                        std::cerr << "disksight: option -" << opt << " requires a value" << std::endl;
                        return kExitUsage;
                    }
                    const char *key = opt == 'n' ? "nameFilter" : (opt == 'j' ? "workerThreads" : "maxDepth");
                    cli.overrides.emplace_back(key, value);
                    break;
                }
                default:
                    std::cerr << "disksight: unknown option -" << opt << std::endl;
                    printUsage();
                    return kExitUsage;
                }
            }
        }
        else
        {
            cli.paths.emplace_back(arg);
        }
    }
    return std::nullopt;
}

std::string truncateStatus(std::string text)
{
    if (text.size() <= kStatusWidth)
        return text;
    return "..." + text.substr(text.size() - (kStatusWidth - 3));
}

void clearStatusLine()
{
    std::cerr << '\r' << std::string(kStatusWidth, ' ') << '\r' << std::flush;
}

std::string displaySize(const Entry &entry, const ScanConfig &scanConfig, SizeUnit unit)
{
    if (scanConfig.humanReadable && unit != SizeUnit::Auto)
        return formatSize(entry.sizeRaw, unit);
    return entry.sizeDisplay;
}

void printListing(const ScanResult &result, const ScanConfig &scanConfig, SizeUnit unit)
{
    if (!scanConfig.recurseDetailed)
    {
        for (const auto &name : result.names)
            std::cout << name << '\n';
        std::cout << std::flush;
        return;
    }

    std::vector<std::string> sizes;
    sizes.reserve(result.entries.size());
    std::size_t width = 0;
    std::uintmax_t total = 0;
    for (const auto &entry : result.entries)
    {
        sizes.push_back(displaySize(entry, scanConfig, unit));
        width = std::max(width, sizes.back().size());
        total += entry.sizeRaw;
    }

    for (std::size_t i = 0; i < result.entries.size(); ++i)
    {
        const Entry &entry = result.entries[i];
        std::cout << entry.typeChar() << entry.permissionFlags << "  " << std::setw(static_cast<int>(width))
                  << sizes[i] << "  ";
        if (scanConfig.collectCreatedTime)
        {
            std::string created = entry.createdTime ? formatTimePoint(*entry.createdTime) : std::string("-");
            std::cout << std::left << std::setw(16) << created << std::right << "  ";
        }
        std::cout << (scanConfig.fullPath ? entry.path : entry.name) << '\n';
    }

    std::ostringstream footer;
    footer << std::fixed << std::setprecision(2) << result.elapsedSeconds;
    std::cout << "total " << formatSize(total, scanConfig.humanReadable) << " in " << result.entries.size()
              << (result.entries.size() == 1 ? " entry" : " entries") << " (" << footer.str() << " s)"
              << std::endl;
}

// Runs one scan on a worker and returns the process exit code for it.
int runScan(const ScanConfig &scanConfig, SizeUnit unit, bool showProgress)
{
    ScanTask task(scanConfig);
    task.start();

    std::string lastLine;
    while (!task.finished())
    {
        if (gInterrupted)
            task.cancel();
        if (showProgress)
        {
            std::string line = truncateStatus(task.lastStatus() + " " + task.currentPath());
            if (line != lastLine)
            {
                clearStatusLine();
                std::cerr << line << std::flush;
                lastLine = std::move(line);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (showProgress)
        clearStatusLine();

    ScanResult result;
    try
    {
        result = task.takeResult();
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::cerr << "disksight: cannot access '" << e.path1().string() << "': " << e.code().message()
                  << std::endl;
        return kExitRootFailure;
    }

    for (const auto &message : task.errors())
        std::cerr << "disksight: " << message << std::endl;
    if (task.errorCount() > ScanTask::kMaxRecordedErrors)
        std::cerr << "disksight: " << (task.errorCount() - ScanTask::kMaxRecordedErrors)
                  << " further errors not shown" << std::endl;

    if (result.cancelled)
    {
        std::cerr << "disksight: scan cancelled" << std::endl;
        return kExitInterrupted;
    }

    printListing(result, scanConfig, unit);
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    config::OptionRegistry registry{std::string(kToolId)};
    registerScanOptions(registry);

    CommandLine cli;
    if (auto exitCode = parseCommandLine(argc, argv, cli))
        return *exitCode;

    if (cli.loadDefaults)
    {
        std::error_code ec;
        std::filesystem::path defaults = registry.defaultOptionsPath();
        std::string error;
        if (std::filesystem::exists(defaults, ec) && !registry.loadFromFile(defaults, &error))
            std::cerr << "disksight: ignoring saved defaults: " << error << std::endl;
    }
    registry.applyEnvironment();

    for (const auto &file : cli.optionFiles)
    {
        std::string error;
        if (!registry.loadFromFile(file, &error))
        {
            std::cerr << "disksight: " << error << std::endl;
            return kExitUsage;
        }
    }

    for (const auto &[key, value] : cli.overrides)
    {
        if (!registry.setFromText(key, value))
        {
            std::cerr << "disksight: invalid value '" << value << "' for " << key << std::endl;
            return kExitUsage;
        }
    }

    if (cli.saveDefaults)
    {
        if (!registry.saveDefaults())
        {
            std::cerr << "disksight: failed to save defaults to " << registry.defaultOptionsPath() << std::endl;
            return kExitUsage;
        }
        std::cerr << "disksight: saved defaults to " << registry.defaultOptionsPath() << std::endl;
    }

    ScanConfig scanConfig = scanConfigFromRegistry(registry);
    const SizeUnit unit = sizeUnitFromRegistry(registry);
    if (cli.paths.empty())
        cli.paths.push_back(scanConfig.root);

    std::signal(SIGINT, handleInterrupt);

    int exitCode = 0;
    for (std::size_t i = 0; i < cli.paths.size(); ++i)
    {
        if (cli.paths.size() > 1)
            std::cout << (i > 0 ? "\n" : "") << cli.paths[i].string() << ":" << std::endl;
        scanConfig.root = cli.paths[i];
        int result = runScan(scanConfig, unit, cli.showProgress);
        if (result == kExitInterrupted)
            return result;
        exitCode = std::max(exitCode, result);
    }
    return exitCode;
}
