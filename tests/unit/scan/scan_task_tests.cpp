#include <gtest/gtest.h>

#include "scan_task.hpp"

#include "scan_test_support.hpp"
#include "temp_tree.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

using namespace disksight::scan;
using disksight::test::StatusLog;
using disksight::test::TempTree;

namespace
{

ScanConfig configFor(const std::filesystem::path &root)
{
    ScanConfig config;
    config.root = root;
    config.workerThreads = 2;
    return config;
}

} // namespace

TEST(ScanTask, CompletesOnAWorkerThread)
{
    TempTree tree;
    tree.addFile("a/one.bin", 10);
    tree.addFile("b/two.bin", 20);

    StatusLog forwarded;
    ScanTask task(configFor(tree.root()), &forwarded);
    EXPECT_FALSE(task.started());
    task.start();
    EXPECT_TRUE(task.started());
    task.wait();

    EXPECT_TRUE(task.finished());
    EXPECT_EQ(task.lastStatus(), "scan_completed");
    EXPECT_EQ(task.errorCount(), 0u);

    ScanResult result = task.takeResult();
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].sizeRaw, 20u);
    EXPECT_EQ(result.entries[1].sizeRaw, 10u);
    EXPECT_TRUE(forwarded.saw("scan_started"));
    EXPECT_TRUE(forwarded.saw("completed"));
}

TEST(ScanTask, RethrowsRootFailure)
{
    TempTree tree;
    ScanTask task(configFor(tree.root() / "missing"));
    task.start();

    EXPECT_THROW(task.takeResult(), std::filesystem::filesystem_error);
    EXPECT_TRUE(task.finished());
}

TEST(ScanTask, RecordsDiagnostics)
{
    TempTree tree;
    tree.addFile("kept.bin", 5);
    auto broken = tree.addSymlink("broken", tree.root() / "gone");

    ScanTask task(configFor(tree.root()));
    task.start();
    ScanResult result = task.takeResult();

    EXPECT_EQ(result.entries.size(), 1u);
    ASSERT_EQ(task.errorCount(), 1u);
    auto errors = task.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.front().rfind("cannot access '" + broken.string() + "'", 0), 0u);
}

TEST(ScanTask, CancelledBeforeStartReportsCancellation)
{
    TempTree tree;
    tree.addFile("a/one.bin", 10);

    ScanTask task(configFor(tree.root()));
    task.cancel();
    task.start();
    ScanResult result = task.takeResult();

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.entries.empty());
}

TEST(ScanTask, RejectsMisuse)
{
    TempTree tree;
    ScanTask idle(configFor(tree.root()));
    EXPECT_THROW(idle.takeResult(), std::logic_error);

    ScanTask task(configFor(tree.root()));
    task.start();
    EXPECT_THROW(task.start(), std::logic_error);
    task.takeResult();
    EXPECT_THROW(task.takeResult(), std::logic_error);
}

TEST(ScanTask, DestructorStopsARunningScan)
{
    TempTree tree;
    for (int i = 0; i < 20; ++i)
        tree.addFile("dir" + std::to_string(i) + "/file.bin", 16);

    auto task = std::make_unique<ScanTask>(configFor(tree.root()));
    task->start();
    task.reset();
    SUCCEED();
}
