/**
 * @file snapshot_poller.hpp
 * @brief Turns a pull‑only @ref LoopingSeriesStore into a push source.
 *
 * A worker thread wakes every `interval`, reads a snapshot for each topic
 * some subscriber is interested in and publishes the ones that changed.
 * Subscribers that join a topic after its value was published get the
 * cached value re-sent to them alone.  Topics are series ids or names, as accepted by the store.
 */

#pragma once

#include "replayhub/errors.hpp"
#include "replayhub/logging.hpp"
#include "replayhub/looping_series_store.hpp"
#include "replayhub/series_types.hpp"
#include "replayhub/subscription_hub.hpp"

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>

namespace replayhub {

using SeriesHub = SubscriptionHub<SeriesQueryResult>;

struct PollerOptions {
    std::chrono::milliseconds interval{std::chrono::minutes(1)};
    std::function<Timestamp()> clock; ///< Defaults to the system clock.
    logging::Logger logger{nullptr};
};

class SnapshotPoller {
  private:
    const LoopingSeriesStore& m_store;
    SeriesHub& m_hub;
    const std::chrono::milliseconds m_interval;
    const std::function<Timestamp()> m_clock;
    logging::Logger m_logger;

    struct CachedTopic {
        SeriesQueryResult value;
        std::set<SubscriberId> served; ///< Subscribers that hold @ref value.
    };

    std::mutex m_cache_mutex; ///< Serialises poll cycles.
    std::map<std::string, CachedTopic> m_last_published;

    std::mutex m_wait_mutex;
    std::condition_variable_any m_wakeup;
    std::stop_source m_stop;
    std::thread m_thread;

    static bool changed(const SeriesPoint& before, const SeriesPoint& after) {
        return before.utc_sample_time != after.utc_sample_time ||
               before.text_value != after.text_value ||
               !(before.numeric_value == after.numeric_value ||
                 (std::isnan(before.numeric_value) && std::isnan(after.numeric_value)));
    }

    void run(std::stop_token stop) {
        REPLAYHUB_LOG_INFO(m_logger, "snapshot poller started, interval {} ms",
                           m_interval.count());
        while (!stop.stop_requested()) {
            try {
                poll_once(stop);
            } catch (const OperationCancelled&) {
                break;
            } catch (const std::exception& e) {
                REPLAYHUB_LOG_ERROR(m_logger, "snapshot poll failed: {}", e.what());
            }
            std::unique_lock<std::mutex> lock(m_wait_mutex);
            m_wakeup.wait_for(lock, stop, m_interval, [] { return false; });
        }
        REPLAYHUB_LOG_INFO(m_logger, "snapshot poller stopped");
    }

  public:
    SnapshotPoller(const LoopingSeriesStore& store, SeriesHub& hub, PollerOptions options = {})
        : m_store(store), m_hub(hub), m_interval(options.interval),
          m_clock(options.clock ? options.clock : std::function<Timestamp()>([] {
              return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
          })),
          m_logger(options.logger ? options.logger : logging::create_logger("snapshot-poller")) {}

    SnapshotPoller(const SnapshotPoller&) = delete;
    SnapshotPoller& operator=(const SnapshotPoller&) = delete;

    ~SnapshotPoller() { stop(); }

    /// Start the worker thread.  No‑op if it is already running.
    void start() {
        if (m_thread.joinable()) {
            return;
        }
        m_stop = std::stop_source();
        m_thread = std::thread([this, stop = m_stop.get_token()] { run(stop); });
    }

    /// Stop and join the worker thread.  Idempotent.
    void stop() {
        m_stop.request_stop();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    bool running() const { return m_thread.joinable(); }

    /**
     * @brief Run one poll cycle on the calling thread.
     * @return Number of values published or re-sent to late subscribers.
     * @throws HubError if the hub has been disposed; store errors as raised
     *         by @ref LoopingSeriesStore::read_snapshot.
     */
    std::size_t poll_once(std::stop_token stop = {}) {
        std::lock_guard<std::mutex> lock(m_cache_mutex);
        const auto topics = m_hub.subscribers_by_topic();

        for (auto it = m_last_published.begin(); it != m_last_published.end();) {
            it = topics.count(it->first) == 0 ? m_last_published.erase(it) : std::next(it);
        }

        const Timestamp now = m_clock();
        std::size_t published = 0;
        for (const auto& [topic, subscribers] : topics) {
            auto results = m_store.read_snapshot(now, {topic}, stop);
            if (results.empty()) {
                continue;
            }
            auto& result = results.front();
            auto cached = m_last_published.find(topic);
            if (cached != m_last_published.end() &&
                !changed(cached->second.value.point, result.point)) {
                for (const auto id : subscribers) {
                    if (cached->second.served.count(id) == 0 &&
                        m_hub.send_to(id, cached->second.value, topic)) {
                        ++published;
                    }
                }
                cached->second.served = subscribers;
                continue;
            }
            m_last_published[topic] = CachedTopic{result, subscribers};
            m_hub.publish(std::move(result), topic);
            ++published;
        }
        return published;
    }
};

} // namespace replayhub
