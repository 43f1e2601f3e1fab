#include <gtest/gtest.h>

#include <replayhub/snapshot_poller.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

using namespace std::chrono_literals;
using replayhub::DatasetBuilder;
using replayhub::LoopingSeriesStore;
using replayhub::PollerOptions;
using replayhub::SeriesHub;
using replayhub::SnapshotPoller;
using replayhub::Timestamp;

namespace {

Timestamp at(long long seconds) { return Timestamp(std::chrono::seconds(seconds)); }

LoopingSeriesStore make_store() {
    DatasetBuilder builder(true);
    builder.define({"T1", "Temperature", {}, "degC", {}, {}});
    builder.add("T1", at(0), "20");
    builder.add("T1", at(5), "21");
    builder.add("T1", at(10), "22");
    builder.add("P1", at(0), "1");
    builder.add("P1", at(10), "1");
    return LoopingSeriesStore(std::move(builder).build());
}

struct FakeClock {
    std::atomic<long long> seconds{0};
    Timestamp operator()() const { return at(seconds.load()); }
};

} // anonymous namespace

TEST(snapshot_poller_tests, publishes_only_changes) {
    DatasetBuilder builder(true);
    builder.define({"T1", "Temperature", {}, "degC", {}, {}});
    builder.add("T1", at(0), "20");
    builder.add("T1", at(5), "21");
    builder.add("T1", at(10), "22");
    LoopingSeriesStore store(std::move(builder).build());

    SeriesHub hub;
    FakeClock clock;
    PollerOptions options;
    options.clock = [&clock] { return clock(); };
    SnapshotPoller poller(store, hub, options);

    // Nobody subscribed yet: nothing is read or published.
    EXPECT_EQ(poller.poll_once(), 0u);

    auto sub = hub.subscribe({"c", "u"}, {"Temperature"});
    clock.seconds = 1;
    EXPECT_EQ(poller.poll_once(), 1u);
    clock.seconds = 2;
    EXPECT_EQ(poller.poll_once(), 0u); // same sample as before
    clock.seconds = 6;
    EXPECT_EQ(poller.poll_once(), 1u);

    auto first = sub.next(2s);
    auto second = sub.next(2s);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ((*first)->topic, "Temperature");
    EXPECT_EQ((*first)->value.series_id, "T1");
    EXPECT_DOUBLE_EQ((*first)->value.point.numeric_value, 20.0);
    EXPECT_EQ((*first)->value.point.units, "degC");
    EXPECT_DOUBLE_EQ((*second)->value.point.numeric_value, 21.0);
    EXPECT_EQ((*second)->value.point.utc_sample_time, at(5));

    // Looping: the next pass republishes with shifted time stamps.
    clock.seconds = 16;
    EXPECT_EQ(poller.poll_once(), 1u);
    auto third = sub.next(2s);
    ASSERT_TRUE(third);
    EXPECT_EQ((*third)->value.point.utc_sample_time, at(15));
}

TEST(snapshot_poller_tests, unsubscribed_topics_are_evicted) {
    auto store = make_store();
    SeriesHub hub;
    FakeClock clock;
    PollerOptions options;
    options.clock = [&clock] { return clock(); };
    SnapshotPoller poller(store, hub, options);

    {
        auto sub = hub.subscribe({"c", "u"}, {"P1"});
        EXPECT_EQ(poller.poll_once(), 1u);
        EXPECT_EQ(poller.poll_once(), 0u);
    }
    EXPECT_EQ(poller.poll_once(), 0u);

    // A fresh subscriber gets the current value again.
    auto again = hub.subscribe({"c", "u"}, {"P1"});
    EXPECT_EQ(poller.poll_once(), 1u);
    EXPECT_TRUE(again.next(2s));
}

TEST(snapshot_poller_tests, late_subscriber_gets_current_value) {
    auto store = make_store();
    SeriesHub hub;
    FakeClock clock;
    PollerOptions options;
    options.clock = [&clock] { return clock(); };
    SnapshotPoller poller(store, hub, options);

    auto first = hub.subscribe({"first", "u"}, {"P1"});
    EXPECT_EQ(poller.poll_once(), 1u);
    ASSERT_TRUE(first.next(2s));

    auto second = hub.subscribe({"second", "u"}, {"P1"});
    EXPECT_EQ(poller.poll_once(), 1u);
    auto current = second.next(2s);
    ASSERT_TRUE(current);
    EXPECT_EQ((*current)->topic, "P1");
    EXPECT_EQ((*current)->value.series_id, "P1");
    EXPECT_DOUBLE_EQ((*current)->value.point.numeric_value, 1.0);

    // Nothing new for either subscriber until the value changes.
    EXPECT_EQ(poller.poll_once(), 0u);
    EXPECT_FALSE(first.try_next());
    EXPECT_FALSE(second.try_next());
}

TEST(snapshot_poller_tests, unknown_topics_publish_nothing) {
    auto store = make_store();
    SeriesHub hub;
    SnapshotPoller poller(store, hub);
    auto sub = hub.subscribe({"c", "u"}, {"missing"});
    EXPECT_EQ(poller.poll_once(), 0u);
}

TEST(snapshot_poller_tests, background_thread_polls_on_interval) {
    auto store = make_store();
    SeriesHub hub;
    FakeClock clock;
    PollerOptions options;
    options.interval = 5ms;
    options.clock = [&clock] { return clock(); };
    SnapshotPoller poller(store, hub, options);

    auto sub = hub.subscribe({"c", "u"}, {"T1"});
    poller.start();
    EXPECT_TRUE(poller.running());

    auto first = sub.next(2s);
    ASSERT_TRUE(first);
    EXPECT_DOUBLE_EQ((*first)->value.point.numeric_value, 20.0);

    clock.seconds = 7;
    auto second = sub.next(2s);
    ASSERT_TRUE(second);
    EXPECT_DOUBLE_EQ((*second)->value.point.numeric_value, 21.0);

    poller.stop();
    poller.stop();
    EXPECT_FALSE(poller.running());
}

TEST(snapshot_poller_tests, keeps_running_after_hub_dispose) {
    auto store = make_store();
    SeriesHub hub;
    PollerOptions options;
    options.interval = 1ms;
    SnapshotPoller poller(store, hub, options);

    auto sub = hub.subscribe({"c", "u"}, {"T1"});
    poller.start();
    hub.dispose();
    std::this_thread::sleep_for(10ms);
    EXPECT_TRUE(poller.running());
    poller.stop();
}
