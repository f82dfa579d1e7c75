#include "directory_lister.hpp"

#include "scan_context.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace disksight::scan
{
namespace
{
namespace fs = std::filesystem;

void sortBySize(std::vector<Entry> &entries, bool descending)
{
    std::stable_sort(entries.begin(), entries.end(), [descending](const Entry &a, const Entry &b) {
        return descending ? a.sizeRaw > b.sizeRaw : a.sizeRaw < b.sizeRaw;
    });
}

void collectEntries(detail::ScanContext &context, const fs::path &root, const std::vector<std::string> &names,
                    std::vector<Entry> &entries)
{
    const ScanConfig &config = context.config();

    std::error_code rootEc;
    auto rootMetadata = detail::readMetadata(root, rootEc);
    detail::AncestorChain rootLink{rootMetadata ? rootMetadata->identity : detail::FileIdentity{}, nullptr};

    const std::size_t total = names.size();
    const std::size_t step = std::max<std::size_t>(1, total / 10);

    for (std::size_t index = 0; index < total; ++index)
    {
        context.checkCancelled();

        const std::string &name = names[index];
        const fs::path childPath = root / name;

        context.progress(root, name, status::Processing);
        if (index % step == 0)
            context.progress(root, name, status::milestone(index * 100 / total));

        std::error_code ec;
        auto metadata = detail::readMetadata(childPath, ec);
        if (!metadata)
        {
            context.reportError(childPath, ec);
            continue;
        }

        if (!config.nameFilter.empty())
        {
            if (!metadata->isDirectory)
                continue;
            if (name.find(config.nameFilter) == std::string::npos)
            {
                if (context.closesCycle(childPath, metadata->identity, &rootLink))
                    continue;
                detail::AncestorChain link{metadata->identity, &rootLink};
                for (auto &match : detail::searchDirectory(context, childPath, link, 1, config.nameFilter))
                    entries.push_back(std::move(match));
                continue;
            }
        }

        std::uintmax_t size = metadata->size;
        if (metadata->isDirectory)
        {
            if (context.closesCycle(childPath, metadata->identity, &rootLink))
                continue;
            context.progress(root, childPath, status::CalculatingDirectorySize);
            detail::AncestorChain link{metadata->identity, &rootLink};
            size = detail::sumDirectory(context, childPath, link, 1);
            context.progress(root, childPath, status::DirectoryCalculationCompleted);
        }

        entries.push_back(context.makeEntry(childPath, name, *metadata, size));
        context.progress(root, childPath, status::Completed);
    }
}

} // namespace

ListResult listDirectory(const fs::path &root, const ScanConfig &config, const ScanHooks &hooks,
                         std::error_code &ec)
{
    ListResult result;
    fs::directory_iterator it(root, ec);
    if (ec)
        return result;

    detail::ScanContext context(config, hooks);

    std::error_code entryEc;
    for (; it != fs::directory_iterator(); it.increment(entryEc))
    {
        if (entryEc)
        {
            context.reportError(root, entryEc);
            break;
        }
        std::string name = it->path().filename().string();
        if (context.isListed(name))
            result.names.push_back(std::move(name));
    }
    std::sort(result.names.begin(), result.names.end());

    if (!config.recurseDetailed)
        return result;

    try
    {
        collectEntries(context, root, result.names, result.entries);
    }
    catch (const ScanCancelled &)
    {
        result.entries.clear();
        result.cancelled = true;
        return result;
    }

    if (config.sortBySize)
        sortBySize(result.entries, config.sortDescending);
    return result;
}

ListResult listDirectory(const fs::path &root, const ScanConfig &config, const ScanHooks &hooks)
{
    std::error_code ec;
    ListResult result = listDirectory(root, config, hooks, ec);
    if (ec)
        throw fs::filesystem_error("cannot open directory", root, ec);
    return result;
}

ScanResult scan(const ScanConfig &config, const ScanHooks &hooks)
{
    const auto start = std::chrono::steady_clock::now();
    auto notify = [&hooks, &config](std::string_view status) {
        detail::deliverProgress(hooks.progress, ProgressEvent{config.root, config.root, std::string(status)});
    };

    notify(status::ScanStarted);
    ListResult listed = listDirectory(config.root, config, hooks);

    ScanResult result;
    result.entries = std::move(listed.entries);
    result.names = std::move(listed.names);
    result.cancelled = listed.cancelled;
    result.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    notify(status::ScanCompleted);
    return result;
}

} // namespace disksight::scan
