#include "name_filter_walker.hpp"

#include "scan_context.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <utility>

namespace disksight::scan
{
namespace fs = std::filesystem;

namespace detail
{
namespace
{

std::vector<std::string> sortedChildNames(ScanContext &context, const fs::path &directory)
{
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec)
    {
        context.reportError(directory, ec);
        return names;
    }
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            context.reportError(directory, ec);
            break;
        }
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

std::vector<Entry> searchDirectory(ScanContext &context, const fs::path &directory, const AncestorChain &self,
                                   std::size_t depth, const std::string &filter)
{
    context.checkCancelled();
    context.progress(directory, directory, status::SearchingInDirectory);

    // One slot per child in name order; concurrent branches fill their slot
    // when joined below.
    const std::vector<std::string> names = sortedChildNames(context, directory);
    std::vector<std::vector<Entry>> branches(names.size());
    std::vector<std::pair<std::size_t, std::future<std::vector<Entry>>>> pending;

    for (std::size_t index = 0; index < names.size(); ++index)
    {
        context.checkCancelled();

        const std::string &name = names[index];
        const fs::path child = directory / name;

        std::error_code ec;
        auto metadata = readMetadata(child, ec);
        if (!metadata)
        {
            context.reportError(child, ec);
            continue;
        }

        context.progress(directory, child, status::CheckingFile);
        if (!metadata->isDirectory || !context.isListed(name))
            continue;
        if (!context.mayDescend(depth + 1) || context.closesCycle(child, metadata->identity, &self))
            continue;

        AncestorChain link{metadata->identity, &self};
        if (name.find(filter) != std::string::npos)
        {
            context.progress(directory, child, status::CalculatingMatchingDirectory);
            std::uintmax_t size = sumDirectory(context, child, link, depth + 1);
            branches[index].push_back(context.makeEntry(child, name, *metadata, size));
            context.progress(directory, child, status::MatchingDirectoryCompleted);
            continue;
        }

        if (context.config().parallel && context.budget().tryAcquire())
        {
            try
            {
                pending.emplace_back(index, std::async(std::launch::async, [&context, child, link, depth, &filter]() {
                                         BudgetSlot slot(context.budget());
                                         return searchDirectory(context, child, link, depth + 1, filter);
                                     }));
                continue;
            }
            catch (const std::system_error &)
            {
                // No thread could be started; the slot was never handed over.
                context.budget().release();
            }
        }
        branches[index] = searchDirectory(context, child, link, depth + 1, filter);
    }

    for (auto &[index, branch] : pending)
        branches[index] = branch.get();

    std::vector<Entry> matches;
    for (auto &branch : branches)
    {
        for (auto &entry : branch)
            matches.push_back(std::move(entry));
    }
    return matches;
}

} // namespace detail

std::vector<Entry> findMatches(const fs::path &directory, const std::string &filter, const ScanConfig &config,
                               const ScanHooks &hooks)
{
    detail::ScanContext context(config, hooks);

    std::error_code ec;
    auto metadata = detail::readMetadata(directory, ec);
    if (!metadata)
    {
        context.reportError(directory, ec);
        return {};
    }
    if (!metadata->isDirectory)
        return {};

    detail::AncestorChain root{metadata->identity, nullptr};
    return detail::searchDirectory(context, directory, root, 0, filter);
}

} // namespace disksight::scan
