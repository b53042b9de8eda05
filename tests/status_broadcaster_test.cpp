#include "offloader/status_broadcaster.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono_literals;

namespace {

ProgressSnapshot at(const double &percent) {
    ProgressSnapshot s;
    s.job_id = "j1";
    s.state = JobState::Copying;
    s.percent = percent;
    return s;
}

}

TEST(StatusBroadcaster, PublishAssignsIncreasingSeq) {
    StatusBroadcaster broadcaster;
    EXPECT_EQ(broadcaster.seq(), 0u);
    broadcaster.publish(at(10));
    broadcaster.publish(at(20));
    EXPECT_EQ(broadcaster.seq(), 2u);
    EXPECT_EQ(broadcaster.current().seq, 2u);
    EXPECT_DOUBLE_EQ(broadcaster.current().percent, 20.0);
}

TEST(StatusBroadcaster, LateSubscriberGetsCurrentFirst) {
    StatusBroadcaster broadcaster;
    broadcaster.publish(at(10));
    broadcaster.publish(at(30));

    StatusBroadcaster::Subscription sub = broadcaster.subscribe();
    std::optional<ProgressSnapshot> first = sub.poll();
    ASSERT_TRUE(first.has_value());
    EXPECT_DOUBLE_EQ(first->percent, 30.0);
    EXPECT_FALSE(sub.poll().has_value());
}

TEST(StatusBroadcaster, SlowSubscriberSeesOnlyLatest) {
    StatusBroadcaster broadcaster;
    StatusBroadcaster::Subscription sub = broadcaster.subscribe();
    sub.poll();

    broadcaster.publish(at(10));
    broadcaster.publish(at(20));
    broadcaster.publish(at(30));

    std::optional<ProgressSnapshot> next = sub.poll();
    ASSERT_TRUE(next.has_value());
    EXPECT_DOUBLE_EQ(next->percent, 30.0);
    EXPECT_EQ(sub.getLastSeq(), 3u);
    EXPECT_FALSE(sub.poll().has_value());
}

TEST(StatusBroadcaster, NextWakesOnPublish) {
    StatusBroadcaster broadcaster;
    StatusBroadcaster::Subscription sub = broadcaster.subscribe();
    sub.poll();

    std::thread publisher([&broadcaster]() {
        std::this_thread::sleep_for(20ms);
        broadcaster.publish(at(50));
    });
    std::optional<ProgressSnapshot> next = sub.next(5s);
    publisher.join();

    ASSERT_TRUE(next.has_value());
    EXPECT_DOUBLE_EQ(next->percent, 50.0);
}

TEST(StatusBroadcaster, NextTimesOutWithoutChange) {
    StatusBroadcaster broadcaster;
    StatusBroadcaster::Subscription sub = broadcaster.subscribe();
    sub.poll();
    EXPECT_FALSE(sub.next(10ms).has_value());
}

TEST(StatusBroadcaster, SubscribersAreIndependent) {
    StatusBroadcaster broadcaster;
    StatusBroadcaster::Subscription a = broadcaster.subscribe();
    StatusBroadcaster::Subscription b = broadcaster.subscribe();
    a.poll();
    b.poll();

    broadcaster.publish(at(40));
    EXPECT_TRUE(a.poll().has_value());
    EXPECT_TRUE(b.poll().has_value());
}

TEST(StatusBroadcaster, OlderRevisionIsDropped) {
    StatusBroadcaster broadcaster;
    ProgressSnapshot newer = at(60);
    newer.revision = 5;
    ProgressSnapshot older = at(40);
    older.revision = 3;

    EXPECT_TRUE(broadcaster.publish(newer));
    EXPECT_FALSE(broadcaster.publish(older));
    EXPECT_EQ(broadcaster.seq(), 1u);
    EXPECT_DOUBLE_EQ(broadcaster.current().percent, 60.0);
}

TEST(StatusBroadcaster, IdleSnapshotAlwaysPublished) {
    StatusBroadcaster broadcaster;
    ProgressSnapshot running = at(60);
    running.revision = 9;
    broadcaster.publish(running);

    EXPECT_TRUE(broadcaster.publish(ProgressSnapshot{}));
    EXPECT_EQ(broadcaster.current().state, JobState::Idle);

    // next job starts over from the idle view
    ProgressSnapshot next = at(0);
    next.revision = 10;
    EXPECT_TRUE(broadcaster.publish(next));
}
