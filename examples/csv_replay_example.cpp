/**
 * @file csv_replay_example.cpp
 * @brief Replays a small recorded CSV as a live feed.
 *
 * A @ref replayhub::LoopingSeriesStore loads ten seconds of recorded data
 * with looping enabled.  A @ref replayhub::SnapshotPoller polls it through a
 * fake clock that advances one second per poll, publishing changes to two
 * subscribers:
 *
 *   * **dashboard** – interested in every series.
 *   * **alarm**     – interested only in the pump state.
 *
 * Once the clock passes the end of the recording, the values repeat with
 * shifted time stamps.
 */

#include <replayhub/replayhub.hpp>

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <thread>

namespace {

constexpr const char* recording =
    "Time,[id=T1|name=Temperature|units=degC],[name=Pump|STATE_On=1|STATE_Off=0]\n"
    "2024-01-01 00:00:00,20.5,Off\n"
    "2024-01-01 00:00:04,21.0,On\n"
    "2024-01-01 00:00:07,22.5,On\n"
    "2024-01-01 00:00:10,21.5,Off\n";

void print(const char* who, const replayhub::SubscriptionHub<replayhub::SeriesQueryResult>::Message& message) {
    const auto& result = message->value;
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        result.point.utc_sample_time.time_since_epoch());
    fmt::print("{:>9} #{:<3} {:<12} t={} {} {}\n", who, message->sequence, result.series_name,
               seconds.count(), result.point.text_value, result.point.units);
}

} // anonymous namespace

int main() {
    // Quill uses a dedicated backend thread. Start it once per process.
    replayhub::logging::start_backend();

    replayhub::LoaderOptions loader;
    loader.source = [] { return std::make_unique<std::istringstream>(recording); };
    loader.time_zone = "UTC";
    loader.looping_enabled = true;

    replayhub::LoopingSeriesStore store(loader);
    store.wait_until_loaded();
    const auto start = store.dataset().earliest;

    replayhub::SeriesHub hub;
    auto dashboard = hub.subscribe({"dashboard", "operator"}, {"Temperature", "Pump"});
    auto alarm = hub.subscribe({"alarm", "system"}, {"Pump"});

    std::atomic<int> tick{0};
    replayhub::PollerOptions options;
    options.interval = std::chrono::milliseconds(20);
    options.clock = [&tick, start] { return start + std::chrono::seconds(tick.load()); };
    replayhub::SnapshotPoller poller(store, hub, options);
    poller.start();

    // Walk the clock through two passes of the recording.
    for (int second = 0; second <= 20; ++second) {
        tick = second;
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        while (auto message = dashboard.try_next()) {
            print("dashboard", *message);
        }
        while (auto message = alarm.try_next()) {
            print("alarm", *message);
        }
    }

    poller.stop();
    const auto stats = hub.statistics();
    fmt::print("published {} delivered {} dropped {}\n", stats.published, stats.delivered,
               stats.dropped);
    return 0;
}
