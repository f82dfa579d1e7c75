#include "size_aggregator.hpp"

#include "scan_context.hpp"

#include <future>
#include <system_error>
#include <utility>
#include <vector>

namespace disksight::scan
{
namespace fs = std::filesystem;

namespace detail
{
namespace
{

std::vector<fs::path> readChildren(ScanContext &context, const fs::path &directory)
{
    std::vector<fs::path> children;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec)
    {
        context.reportError(directory, ec);
        return children;
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            context.reportError(directory, ec);
            break;
        }
        children.push_back(it->path());
        context.progress(directory, children.back(), status::ProcessingFile);
    }
    return children;
}

} // namespace

std::uintmax_t sumDirectory(ScanContext &context, const fs::path &directory, const AncestorChain &self,
                            std::size_t depth)
{
    context.checkCancelled();
    context.progress(directory, directory, status::CalculatingDirectorySize);

    const bool parallel = context.config().parallel;
    std::uintmax_t total = 0;
    std::vector<std::future<std::uintmax_t>> pending;

    for (const fs::path &child : readChildren(context, directory))
    {
        context.checkCancelled();

        std::error_code ec;
        auto metadata = readMetadata(child, ec);
        if (!metadata)
        {
            context.reportError(child, ec);
            continue;
        }

        if (!metadata->isDirectory)
        {
            total += metadata->size;
            continue;
        }

        if (!context.mayDescend(depth + 1) || context.closesCycle(child, metadata->identity, &self))
            continue;

        AncestorChain link{metadata->identity, &self};
        if (parallel && context.budget().tryAcquire())
        {
            try
            {
                pending.push_back(std::async(std::launch::async, [&context, child, link, depth]() {
                    BudgetSlot slot(context.budget());
                    return sumDirectory(context, child, link, depth + 1);
                }));
                continue;
            }
            catch (const std::system_error &)
            {
                // No thread could be started; the slot was never handed over.
                context.budget().release();
            }
        }
        total += sumDirectory(context, child, link, depth + 1);
    }

    for (auto &branch : pending)
        total += branch.get();
    return total;
}

} // namespace detail

std::uintmax_t aggregateSize(const fs::path &directory, const ScanConfig &config, const ScanHooks &hooks)
{
    detail::ScanContext context(config, hooks);

    std::error_code ec;
    auto metadata = detail::readMetadata(directory, ec);
    if (!metadata)
    {
        context.reportError(directory, ec);
        return 0;
    }
    if (!metadata->isDirectory)
        return metadata->size;

    detail::AncestorChain root{metadata->identity, nullptr};
    return detail::sumDirectory(context, directory, root, 0);
}

} // namespace disksight::scan
