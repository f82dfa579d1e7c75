#include <gtest/gtest.h>

#include "progress_sink.hpp"
#include "scan_context.hpp"

#include <stdexcept>

using namespace disksight::scan;
using namespace disksight::scan::detail;

TEST(WorkerBudget, HandsOutAtMostItsSlots)
{
    WorkerBudget budget(2);
    EXPECT_TRUE(budget.tryAcquire());
    EXPECT_TRUE(budget.tryAcquire());
    EXPECT_FALSE(budget.tryAcquire());
}

TEST(WorkerBudget, ReleasedSlotCanBeAcquiredAgain)
{
    WorkerBudget budget(1);
    ASSERT_TRUE(budget.tryAcquire());
    // A branch whose thread failed to start gives its slot straight back.
    budget.release();
    EXPECT_TRUE(budget.tryAcquire());
    EXPECT_FALSE(budget.tryAcquire());
}

TEST(WorkerBudget, BudgetSlotReturnsItsSlotOnScopeExit)
{
    WorkerBudget budget(1);
    ASSERT_TRUE(budget.tryAcquire());
    {
        BudgetSlot slot(budget);
        EXPECT_FALSE(budget.tryAcquire());
    }
    EXPECT_TRUE(budget.tryAcquire());
}

TEST(WorkerBudget, ZeroSlotsMeansInlineOnly)
{
    WorkerBudget budget(0);
    EXPECT_FALSE(budget.tryAcquire());
}

TEST(DeliverProgress, SwallowsWhateverTheSinkThrows)
{
    ProgressEvent event{"/tmp", "/tmp/x", std::string(status::ProcessingFile)};
    int calls = 0;

    FunctionProgressSink standard([&calls](const ProgressEvent &) {
        ++calls;
        throw std::runtime_error("sink failure");
    });
    FunctionProgressSink other([&calls](const ProgressEvent &) {
        ++calls;
        throw 42;
    });

    EXPECT_NO_THROW(deliverProgress(&standard, event));
    EXPECT_NO_THROW(deliverProgress(&other, event));
    EXPECT_NO_THROW(deliverProgress(nullptr, event));
    EXPECT_EQ(calls, 2);
}
