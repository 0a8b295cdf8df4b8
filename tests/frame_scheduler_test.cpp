#include "gtest/gtest.h"
#include <relgraph/core/frame_scheduler.h>
#include <vector>

using relgraph::core::FrameScheduler;

TEST(FrameSchedulerTest, RunsEverySubscriberOncePerFrame) {
    FrameScheduler scheduler;
    int a = 0;
    int b = 0;
    scheduler.Subscribe([&](double) { ++a; });
    scheduler.Subscribe([&](double) { ++b; });

    scheduler.RunFrame(0.0);
    scheduler.RunFrame(0.016);

    EXPECT_EQ(a, 2);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(scheduler.frame_count(), 2u);
    EXPECT_EQ(scheduler.active_count(), 2u);
}

TEST(FrameSchedulerTest, PassesFrameTime) {
    FrameScheduler scheduler;
    double seen = -1.0;
    scheduler.Subscribe([&](double now) { seen = now; });
    scheduler.RunFrame(1.25);
    EXPECT_DOUBLE_EQ(seen, 1.25);
}

TEST(FrameSchedulerTest, UnsubscribeStopsCallbacks) {
    FrameScheduler scheduler;
    int calls = 0;
    FrameScheduler::SubscriptionId id = scheduler.Subscribe([&](double) { ++calls; });
    EXPECT_NE(id, FrameScheduler::kInvalidSubscription);
    EXPECT_TRUE(scheduler.IsSubscribed(id));

    scheduler.RunFrame(0.0);
    EXPECT_TRUE(scheduler.Unsubscribe(id));
    EXPECT_FALSE(scheduler.Unsubscribe(id));
    EXPECT_FALSE(scheduler.Unsubscribe(FrameScheduler::kInvalidSubscription));
    scheduler.RunFrame(0.016);

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(scheduler.IsSubscribed(id));
}

TEST(FrameSchedulerTest, CallbackMayUnsubscribeItself) {
    FrameScheduler scheduler;
    int calls = 0;
    FrameScheduler::SubscriptionId id = FrameScheduler::kInvalidSubscription;
    id = scheduler.Subscribe([&](double) {
        ++calls;
        scheduler.Unsubscribe(id);
    });

    scheduler.RunFrame(0.0);
    scheduler.RunFrame(0.016);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(scheduler.active_count(), 0u);
}

TEST(FrameSchedulerTest, RemovedMidFrameIsNotInvoked) {
    FrameScheduler scheduler;
    std::vector<int> order;
    FrameScheduler::SubscriptionId second = FrameScheduler::kInvalidSubscription;
    scheduler.Subscribe([&](double) {
        order.push_back(1);
        scheduler.Unsubscribe(second);
    });
    second = scheduler.Subscribe([&](double) { order.push_back(2); });

    scheduler.RunFrame(0.0);

    ASSERT_EQ(order.size(), 1u);
    EXPECT_EQ(order[0], 1);
}

TEST(FrameSchedulerTest, AddedMidFrameRunsNextFrame) {
    FrameScheduler scheduler;
    int late_calls = 0;
    bool added = false;
    scheduler.Subscribe([&](double) {
        if (!added) {
            added = true;
            scheduler.Subscribe([&](double) { ++late_calls; });
        }
    });

    scheduler.RunFrame(0.0);
    EXPECT_EQ(late_calls, 0);
    scheduler.RunFrame(0.016);
    EXPECT_EQ(late_calls, 1);
}

TEST(FrameSchedulerTest, IdsAreNotReused) {
    FrameScheduler scheduler;
    FrameScheduler::SubscriptionId first = scheduler.Subscribe([](double) {});
    scheduler.Unsubscribe(first);
    FrameScheduler::SubscriptionId second = scheduler.Subscribe([](double) {});
    EXPECT_NE(first, second);
}
