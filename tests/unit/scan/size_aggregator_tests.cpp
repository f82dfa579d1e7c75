#include <gtest/gtest.h>

#include "size_aggregator.hpp"

#include "scan_test_support.hpp"
#include "temp_tree.hpp"

#include <string>

using namespace disksight::scan;
using disksight::test::ErrorLog;
using disksight::test::TempTree;

namespace
{

ScanConfig sequentialConfig()
{
    ScanConfig config;
    config.parallel = false;
    return config;
}

} // namespace

TEST(SizeAggregator, SumsEveryNestedFile)
{
    TempTree tree;
    tree.addFile("a/one.bin", 100);
    tree.addFile("a/b/two.bin", 200);
    tree.addFile("a/b/c/three.bin", 300);
    tree.addDirectory("a/empty");

    EXPECT_EQ(aggregateSize(tree.root(), sequentialConfig()), 600u);
    EXPECT_EQ(aggregateSize(tree.root() / "a" / "b", sequentialConfig()), 500u);
    EXPECT_EQ(aggregateSize(tree.root() / "a" / "empty", sequentialConfig()), 0u);
}

TEST(SizeAggregator, ParallelTotalEqualsSequentialTotal)
{
    TempTree tree;
    std::uintmax_t expected = 0;
    for (int dir = 0; dir < 12; ++dir)
    {
        for (int file = 0; file < 5; ++file)
        {
            const std::size_t bytes = static_cast<std::size_t>(dir * 37 + file * 11 + 1);
            tree.addFile("d" + std::to_string(dir) + "/sub" + std::to_string(file % 2) + "/f" +
                             std::to_string(file),
                         bytes);
            expected += bytes;
        }
    }

    ScanConfig parallel;
    parallel.parallel = true;
    parallel.workerThreads = 4;

    EXPECT_EQ(aggregateSize(tree.root(), sequentialConfig()), expected);
    EXPECT_EQ(aggregateSize(tree.root(), parallel), expected);
}

TEST(SizeAggregator, UnreadableEntryContributesNothing)
{
    TempTree tree;
    tree.addFile("data/kept.bin", 64);
    auto broken = tree.addSymlink("data/broken", tree.root() / "does-not-exist");

    ErrorLog errors;
    ScanHooks hooks;
    hooks.errorCallback = errors.callback();

    EXPECT_EQ(aggregateSize(tree.root(), sequentialConfig(), hooks), 64u);
    EXPECT_TRUE(errors.contains(broken));
}

TEST(SizeAggregator, ReportErrorsFalseSilencesDiagnostics)
{
    TempTree tree;
    tree.addFile("kept.bin", 10);
    tree.addSymlink("broken", tree.root() / "missing");

    ErrorLog errors;
    ScanHooks hooks;
    hooks.errorCallback = errors.callback();
    ScanConfig config = sequentialConfig();
    config.reportErrors = false;

    EXPECT_EQ(aggregateSize(tree.root(), config, hooks), 10u);
    EXPECT_TRUE(errors.snapshot().empty());
}

TEST(SizeAggregator, FollowsSymlinkedFiles)
{
    TempTree tree;
    auto target = tree.addFile("real/target.bin", 40);
    tree.addSymlink("links/alias.bin", target);

    EXPECT_EQ(aggregateSize(tree.root() / "links", sequentialConfig()), 40u);
}

TEST(SizeAggregator, SkipsDirectoryLinksBackToAnAncestor)
{
    TempTree tree;
    tree.addFile("a/file.bin", 25);
    auto loop = tree.addDirectorySymlink("a/b/loop", tree.root() / "a");

    ErrorLog errors;
    ScanHooks hooks;
    hooks.errorCallback = errors.callback();

    EXPECT_EQ(aggregateSize(tree.root(), sequentialConfig(), hooks), 25u);
    auto logged = errors.snapshot();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged.front().first.string(), loop.string());
    EXPECT_TRUE(logged.front().second == std::errc::too_many_symbolic_link_levels);
}

TEST(SizeAggregator, MaxDepthCapsRecursion)
{
    TempTree tree;
    tree.addFile("top.bin", 10);
    tree.addFile("a/first.bin", 20);
    tree.addFile("a/b/second.bin", 40);

    ScanConfig config = sequentialConfig();
    EXPECT_EQ(aggregateSize(tree.root(), config), 70u);

    config.maxDepth = 1;
    EXPECT_EQ(aggregateSize(tree.root(), config), 30u);

    config.maxDepth = 2;
    EXPECT_EQ(aggregateSize(tree.root(), config), 70u);
}

TEST(SizeAggregator, HandlesFilesAndMissingPathsAtTheTop)
{
    TempTree tree;
    auto file = tree.addFile("single.bin", 123);

    EXPECT_EQ(aggregateSize(file, sequentialConfig()), 123u);

    ErrorLog errors;
    ScanHooks hooks;
    hooks.errorCallback = errors.callback();
    EXPECT_EQ(aggregateSize(tree.root() / "missing", sequentialConfig(), hooks), 0u);
    EXPECT_TRUE(errors.contains(tree.root() / "missing"));
}

TEST(SizeAggregator, CancellationUnwindsWithScanCancelled)
{
    TempTree tree;
    tree.addFile("a/file.bin", 10);

    ScanHooks hooks;
    hooks.cancelRequested = []() { return true; };

    EXPECT_THROW(aggregateSize(tree.root(), sequentialConfig(), hooks), ScanCancelled);
}
