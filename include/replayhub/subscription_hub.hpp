/**
 * @file subscription_hub.hpp
 * @brief Generic multi‑subscriber push engine.
 *
 * The hub accepts a stream of values and fans each one out to every
 * interested subscriber without letting a slow subscriber stall the
 * publisher or its peers.
 *
 *   * **Published**      – a value stamped with its topic and sequence number.
 *                          One immutable instance is shared by every queue
 *                          that receives it.
 *   * **Subscriber**     – registry entry: topic set, staleness guard,
 *                          outbound @ref SubscriberQueue and stop source.
 *   * **Subscription**   – move‑only RAII handle handed to the consumer.
 *                          Destroying it cancels the subscription.
 *   * **SubscriptionHub** – owns the registry and a dispatcher thread that
 *                          drains the publish queue.
 *
 * Publishing only appends to the hub's dispatch queue.  The dispatcher
 * offers each value to the matching subscribers; a full queue or a throwing
 * delivery is counted and logged against that subscriber alone.
 */

#pragma once

#include "replayhub/errors.hpp"
#include "replayhub/logging.hpp"
#include "replayhub/sequence.hpp"
#include "replayhub/subscriber_queue.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace replayhub {

using SubscriberId = std::uint64_t;

/// Who subscribed.  Carried for logging and observer callbacks only.
struct CallContext {
    std::string connection_id;
    std::string user;
};

/// A value as it travels through the hub.
template <typename T> struct Published {
    SequenceNumber sequence{0};
    std::optional<std::string> topic;
    T value{};
};

/// Counters reported by @ref SubscriptionHub::statistics.
struct HubStatistics {
    std::size_t subscribers{0};
    std::uint64_t published{0}; ///< Values accepted by publish().
    std::uint64_t delivered{0}; ///< Successful per‑subscriber enqueues.
    std::uint64_t dropped{0};   ///< Rejected by a full subscriber queue.
    std::uint64_t stale{0};     ///< Rejected by a staleness guard.
    std::uint64_t faulted{0};   ///< Deliveries that threw.
};

using SubscriptionObserver =
    std::function<void(SubscriberId, const CallContext&)>;

struct HubOptions {
    std::string id{"subscription-hub"};
    std::size_t max_subscriptions{0};    ///< `0` = unlimited.
    std::size_t channel_capacity{10000}; ///< Per subscriber; `0` = unbounded.
    bool retain_last_per_topic{false};   ///< Replay latest value per topic.
    SequenceNumber initial_sequence{1};
    logging::Logger logger{nullptr}; ///< Defaults to "subscription-hub".
    SubscriptionObserver on_subscription_added;
    SubscriptionObserver on_subscription_cancelled;
};

enum class DeliveryResult { Delivered, Stale, Dropped, Closed };

namespace detail {

// ==========================================================================
// Subscriber: registry entry shared by the hub and the consumer handle
// ==========================================================================

template <typename T> class Subscriber {
  public:
    using Message = std::shared_ptr<const Published<T>>;
    using Callback = std::stop_callback<std::function<void()>>;

  private:
    const SubscriberId m_id;
    const CallContext m_context;
    const void* m_owner;
    SubscriberQueue<Message> m_queue;

    mutable std::mutex m_topics_mutex;
    std::set<std::string> m_topics;

    SequenceGuard m_guard;
    std::mutex m_offer_mutex; ///< Serialises producers of m_queue.
    std::atomic<std::uint64_t> m_dropped{0};

    std::function<void()> m_cleanup;
    std::atomic<bool> m_cleaned_up{false};

    std::stop_source m_stop;
    // Declared last: destroyed before anything their callbacks touch.
    std::unique_ptr<Callback> m_on_stop;
    std::vector<std::unique_ptr<Callback>> m_links;

    void run_cleanup() {
        m_queue.close();
        if (!m_cleaned_up.exchange(true) && m_cleanup) {
            m_cleanup();
        }
    }

  public:
    Subscriber(SubscriberId id, CallContext context, const void* owner,
               std::size_t capacity, std::set<std::string> topics,
               std::function<void()> cleanup)
        : m_id(id), m_context(std::move(context)), m_owner(owner),
          m_queue(capacity), m_topics(std::move(topics)),
          m_cleanup(std::move(cleanup)) {
        m_on_stop = std::make_unique<Callback>(
            m_stop.get_token(), std::function<void()>([this] { run_cleanup(); }));
    }

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    /**
     * @brief Cancel this subscriber when any of @p tokens fires.
     * @note Must be called without holding the registry lock: a token that
     *       has already fired runs the cleanup synchronously.
     */
    void link(std::initializer_list<std::stop_token> tokens) {
        for (const auto& token : tokens) {
            if (!token.stop_possible()) {
                continue;
            }
            m_links.push_back(std::make_unique<Callback>(
                token, std::function<void()>([this] { m_stop.request_stop(); })));
        }
    }

    SubscriberId id() const { return m_id; }
    const CallContext& context() const { return m_context; }
    const void* owner() const { return m_owner; }
    bool is_cancelled() const { return m_stop.stop_requested(); }
    std::stop_token stop_token() const { return m_stop.get_token(); }
    std::uint64_t dropped_count() const {
        return m_dropped.load(std::memory_order_relaxed);
    }

    std::set<std::string> topics() const {
        std::lock_guard<std::mutex> lock(m_topics_mutex);
        return m_topics;
    }

    /// An empty topic set matches everything.
    bool matches(const std::optional<std::string>& topic) const {
        std::lock_guard<std::mutex> lock(m_topics_mutex);
        if (m_topics.empty()) {
            return true;
        }
        return topic && m_topics.count(*topic) > 0;
    }

    /// @return Topics from @p add that were not already subscribed.
    std::vector<std::string> update_topics(const std::vector<std::string>& add,
                                           const std::vector<std::string>& remove) {
        std::vector<std::string> added;
        std::lock_guard<std::mutex> lock(m_topics_mutex);
        for (const auto& topic : remove) {
            m_topics.erase(topic);
        }
        for (const auto& topic : add) {
            if (m_topics.insert(topic).second) {
                added.push_back(topic);
            }
        }
        return added;
    }

    /// @param resend Snapshot re-send: bypasses the staleness guard.
    DeliveryResult offer(const Message& message, bool resend = false) {
        std::lock_guard<std::mutex> lock(m_offer_mutex);
        if (is_cancelled() || m_queue.closed()) {
            return DeliveryResult::Closed;
        }
        if (!resend && !m_guard.try_accept(message->sequence)) {
            return DeliveryResult::Stale;
        }
        if (!m_queue.push(message)) {
            if (m_queue.closed()) {
                return DeliveryResult::Closed;
            }
            m_dropped.fetch_add(1, std::memory_order_relaxed);
            return DeliveryResult::Dropped;
        }
        return DeliveryResult::Delivered;
    }

    std::optional<Message> try_next() { return m_queue.pop(); }

    std::optional<Message> next(std::stop_token stop) {
        return m_queue.wait_pop(stop);
    }

    template <typename Rep, typename Period>
    std::optional<Message> next(std::stop_token stop,
                                std::chrono::duration<Rep, Period> timeout) {
        return m_queue.wait_pop(stop, timeout);
    }

    /// Idempotent.
    void cancel() { m_stop.request_stop(); }
};

} // namespace detail

// ==========================================================================
// Subscription: consumer handle
// ==========================================================================

/**
 * @brief Move‑only handle returned by @ref SubscriptionHub::subscribe.
 *
 * Values are pulled with @ref try_next, @ref next or @ref read_all.  The
 * subscription ends when the handle is cancelled or destroyed, when the
 * caller's stop token fires, or when the hub is disposed; any values still
 * queued at that point can be drained.
 */
template <typename T> class Subscription {
  public:
    using Message = typename detail::Subscriber<T>::Message;

  private:
    std::shared_ptr<detail::Subscriber<T>> m_subscriber;

    template <typename> friend class SubscriptionHub;

    explicit Subscription(std::shared_ptr<detail::Subscriber<T>> subscriber)
        : m_subscriber(std::move(subscriber)) {}

  public:
    /**
     * @brief Lazy input range over the subscription.  Each increment blocks
     *        until the next value arrives; iteration ends when the
     *        subscription closes or the stop token fires.
     */
    class Range {
      private:
        detail::Subscriber<T>* m_subscriber;
        std::stop_token m_stop;

      public:
        struct sentinel {};

        class iterator {
          private:
            Range* m_range{nullptr};
            std::optional<Message> m_current;

            void fetch() { m_current = m_range->m_subscriber->next(m_range->m_stop); }

          public:
            using value_type = Message;
            using difference_type = std::ptrdiff_t;

            iterator() = default;
            explicit iterator(Range* range) : m_range(range) { fetch(); }

            const Message& operator*() const { return *m_current; }
            const Message* operator->() const { return &*m_current; }

            iterator& operator++() {
                fetch();
                return *this;
            }
            void operator++(int) { fetch(); }

            friend bool operator==(const iterator& it, sentinel) {
                return !it.m_current.has_value();
            }
        };

        Range(detail::Subscriber<T>* subscriber, std::stop_token stop)
            : m_subscriber(subscriber), m_stop(std::move(stop)) {}

        iterator begin() { return iterator(this); }
        sentinel end() const { return {}; }
    };

    Subscription() = default;
    ~Subscription() { cancel(); }

    Subscription(Subscription&&) noexcept = default;
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            m_subscriber = std::move(other.m_subscriber);
        }
        return *this;
    }

    explicit operator bool() const { return m_subscriber != nullptr; }

    SubscriberId id() const { return m_subscriber ? m_subscriber->id() : 0; }
    /// @throws HubError `InvalidSubscription` on an empty handle.
    const CallContext& context() const {
        if (!m_subscriber) {
            throw HubError(HubErrorCode::InvalidSubscription, "empty subscription handle");
        }
        return m_subscriber->context();
    }
    std::set<std::string> topics() const {
        return m_subscriber ? m_subscriber->topics() : std::set<std::string>{};
    }
    bool is_cancelled() const {
        return !m_subscriber || m_subscriber->is_cancelled();
    }
    std::uint64_t dropped_count() const {
        return m_subscriber ? m_subscriber->dropped_count() : 0;
    }

    /// Non‑blocking pull.
    std::optional<Message> try_next() {
        if (!m_subscriber) {
            return std::nullopt;
        }
        return m_subscriber->try_next();
    }

    /// Blocking pull; `std::nullopt` once closed and drained or stopped.
    std::optional<Message> next(std::stop_token stop = {}) {
        if (!m_subscriber) {
            return std::nullopt;
        }
        return m_subscriber->next(std::move(stop));
    }

    /// Blocking pull with a timeout.
    template <typename Rep, typename Period>
    std::optional<Message> next(std::chrono::duration<Rep, Period> timeout,
                                std::stop_token stop = {}) {
        if (!m_subscriber) {
            return std::nullopt;
        }
        return m_subscriber->next(std::move(stop), timeout);
    }

    Range read_all(std::stop_token stop = {}) {
        if (!m_subscriber) {
            throw HubError(HubErrorCode::InvalidSubscription,
                           "subscription handle is empty");
        }
        return Range(m_subscriber.get(), std::move(stop));
    }

    /// Idempotent; safe to race with publishes and other cancellations.
    void cancel() {
        if (m_subscriber) {
            m_subscriber->cancel();
        }
    }
};

// ==========================================================================
// SubscriptionHub
// ==========================================================================

/**
 * @tparam T Value type.  Copied once per publish; shared between queues.
 *
 * All methods are thread safe.  `publish` never blocks on a subscriber.
 */
template <typename T> class SubscriptionHub {
  public:
    using Message = std::shared_ptr<const Published<T>>;

  private:
    using SubscriberPtr = std::shared_ptr<detail::Subscriber<T>>;

    // State reachable from subscriber cleanup callbacks; may outlive the hub.
    struct State {
        HubOptions options;
        logging::Logger logger;
        std::atomic<bool> disposed{false};

        mutable std::shared_mutex registry_mutex;
        std::unordered_map<SubscriberId, SubscriberPtr> registry;

        std::mutex retained_mutex;
        std::map<std::string, Message> retained;

        std::atomic<std::uint64_t> published{0};
        std::atomic<std::uint64_t> delivered{0};
        std::atomic<std::uint64_t> dropped{0};
        std::atomic<std::uint64_t> stale{0};
        std::atomic<std::uint64_t> faulted{0};

        void remove(SubscriberId id) {
            if (disposed.load(std::memory_order_acquire)) {
                return;
            }
            SubscriberPtr removed;
            {
                std::unique_lock<std::shared_mutex> lock(registry_mutex);
                auto it = registry.find(id);
                if (it == registry.end()) {
                    return;
                }
                removed = std::move(it->second);
                registry.erase(it);
            }
            REPLAYHUB_LOG_DEBUG(logger, "hub {}: subscription {} removed",
                                options.id, id);
            if (options.on_subscription_cancelled) {
                options.on_subscription_cancelled(id, removed->context());
            }
        }

        std::vector<SubscriberPtr> snapshot() const {
            std::shared_lock<std::shared_mutex> lock(registry_mutex);
            std::vector<SubscriberPtr> result;
            result.reserve(registry.size());
            for (const auto& [id, subscriber] : registry) {
                result.push_back(subscriber);
            }
            return result;
        }
    };

    std::shared_ptr<State> m_state;
    std::atomic<SubscriberId> m_last_subscriber_id{0};
    std::atomic<SequenceNumber> m_next_sequence;
    std::stop_source m_lifetime;

    // Dispatch queue: many producers, one dispatcher.
    std::mutex m_dispatch_mutex;
    std::condition_variable m_dispatch_ready;
    std::deque<Message> m_pending;
    bool m_should_run{true};
    std::thread m_thread;

    void throw_if_disposed() const {
        if (m_state->disposed.load(std::memory_order_acquire)) {
            throw HubError(HubErrorCode::Unavailable,
                           "hub '" + m_state->options.id + "' has been disposed");
        }
    }

    void retain(const Message& message) {
        if (!m_state->options.retain_last_per_topic || !message->topic) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_state->retained_mutex);
        auto& slot = m_state->retained[*message->topic];
        if (!slot || is_newer(message->sequence, slot->sequence)) {
            slot = message;
        }
    }

    // Re-sends retained values for @p topics, oldest first.  Replays bypass
    // the staleness guard: the subscriber may already hold newer values on
    // other topics.
    void replay_retained(const SubscriberPtr& subscriber,
                         const std::vector<std::string>& topics) {
        if (!m_state->options.retain_last_per_topic || topics.empty()) {
            return;
        }
        std::vector<Message> replay;
        {
            std::lock_guard<std::mutex> lock(m_state->retained_mutex);
            for (const auto& topic : topics) {
                auto it = m_state->retained.find(topic);
                if (it != m_state->retained.end()) {
                    replay.push_back(it->second);
                }
            }
        }
        std::sort(replay.begin(), replay.end(),
                  [](const Message& a, const Message& b) {
                      return is_newer(b->sequence, a->sequence);
                  });
        for (const auto& message : replay) {
            deliver(*subscriber, message, true);
        }
    }

    /// @return `true` if the value was queued.
    bool deliver(detail::Subscriber<T>& subscriber, const Message& message,
                 bool resend = false) {
        try {
            switch (subscriber.offer(message, resend)) {
            case DeliveryResult::Delivered:
                m_state->delivered.fetch_add(1, std::memory_order_relaxed);
                return true;
            case DeliveryResult::Stale:
                m_state->stale.fetch_add(1, std::memory_order_relaxed);
                REPLAYHUB_LOG_DEBUG(m_state->logger,
                                    "hub {}: discarded stale value {} for "
                                    "subscriber {}",
                                    m_state->options.id, message->sequence,
                                    subscriber.id());
                break;
            case DeliveryResult::Dropped:
                m_state->dropped.fetch_add(1, std::memory_order_relaxed);
                REPLAYHUB_LOG_WARNING(m_state->logger,
                                      "hub {}: publish to subscriber {} ('{}') "
                                      "failed: queue full",
                                      m_state->options.id, subscriber.id(),
                                      subscriber.context().connection_id);
                break;
            case DeliveryResult::Closed:
                break;
            }
        } catch (const std::exception& e) {
            m_state->faulted.fetch_add(1, std::memory_order_relaxed);
            REPLAYHUB_LOG_ERROR(m_state->logger,
                                "hub {}: publish to subscriber {} ('{}') "
                                "faulted: {}",
                                m_state->options.id, subscriber.id(),
                                subscriber.context().connection_id, e.what());
        }
        return false;
    }

    void enqueue(Message message) {
        retain(message);
        m_state->published.fetch_add(1, std::memory_order_relaxed);
        m_pending.push_back(std::move(message));
    }

    void fan_out(const Message& message) {
        for (const auto& subscriber : m_state->snapshot()) {
            if (subscriber->matches(message->topic)) {
                deliver(*subscriber, message);
            }
        }
    }

    void run_dispatcher() {
        while (true) {
            std::deque<Message> batch;
            {
                std::unique_lock<std::mutex> lock(m_dispatch_mutex);
                m_dispatch_ready.wait(
                    lock, [this] { return !m_pending.empty() || !m_should_run; });
                if (!m_should_run) {
                    return;
                }
                batch.swap(m_pending);
            }
            for (const auto& message : batch) {
                fan_out(message);
            }
        }
    }

    SubscriberPtr checked(const Subscription<T>& subscription) const {
        const auto& subscriber = subscription.m_subscriber;
        if (!subscriber || subscriber->owner() != this) {
            throw HubError(HubErrorCode::InvalidSubscription,
                           "subscription does not belong to hub '" +
                               m_state->options.id + "'");
        }
        return subscriber;
    }

  public:
    explicit SubscriptionHub(HubOptions options = {})
        : m_state(std::make_shared<State>()),
          m_next_sequence(options.initial_sequence) {
        m_state->logger = options.logger ? options.logger
                                         : logging::create_logger("subscription-hub");
        m_state->options = std::move(options);
        m_thread = std::thread([this] { run_dispatcher(); });
    }

    SubscriptionHub(const SubscriptionHub&) = delete;
    SubscriptionHub& operator=(const SubscriptionHub&) = delete;

    ~SubscriptionHub() { dispose(); }

    const std::string& id() const { return m_state->options.id; }

    /**
     * @brief Register a new subscriber.
     * @param context Owner of the subscription, used in logs and callbacks.
     * @param topics  Initial topic set; empty receives every value.
     * @param stop    Caller's cancellation signal.
     * @throws HubError `Unavailable` after dispose, `TooManySubscriptions`
     *         when `max_subscriptions` is reached.
     */
    Subscription<T> subscribe(CallContext context,
                              std::vector<std::string> topics = {},
                              std::stop_token stop = {}) {
        throw_if_disposed();

        const SubscriberId id =
            m_last_subscriber_id.fetch_add(1, std::memory_order_relaxed) + 1;
        std::weak_ptr<State> weak_state = m_state;
        auto subscriber = std::make_shared<detail::Subscriber<T>>(
            id, std::move(context), this, m_state->options.channel_capacity,
            std::set<std::string>(topics.begin(), topics.end()),
            [weak_state, id] {
                if (auto state = weak_state.lock()) {
                    state->remove(id);
                }
            });

        {
            std::unique_lock<std::shared_mutex> lock(m_state->registry_mutex);
            // dispose() may have swapped the registry out since the check above.
            throw_if_disposed();
            const auto limit = m_state->options.max_subscriptions;
            if (limit > 0 && m_state->registry.size() >= limit) {
                throw HubError(HubErrorCode::TooManySubscriptions,
                               "hub '" + m_state->options.id +
                                   "' cannot accept more than " +
                                   std::to_string(limit) + " subscriptions");
            }
            m_state->registry.emplace(id, subscriber);
        }

        REPLAYHUB_LOG_DEBUG(m_state->logger,
                            "hub {}: subscription {} added for '{}'",
                            m_state->options.id, id,
                            subscriber->context().connection_id);
        if (m_state->options.on_subscription_added) {
            m_state->options.on_subscription_added(id, subscriber->context());
        }

        subscriber->link({stop, m_lifetime.get_token()});
        replay_retained(subscriber, topics);
        return Subscription<T>(std::move(subscriber));
    }

    /**
     * @brief Add and remove topics on one subscription.  No‑op once the
     *        subscription is cancelled.
     */
    void update_topics(const Subscription<T>& subscription,
                       const std::vector<std::string>& add,
                       const std::vector<std::string>& remove = {}) {
        auto subscriber = checked(subscription);
        if (subscriber->is_cancelled()) {
            return;
        }
        const auto added = subscriber->update_topics(add, remove);
        replay_retained(subscriber, added);
    }

    /// Reserve a sequence number for a value that is still being computed.
    SequenceNumber next_sequence() {
        return m_next_sequence.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Publish @p value under a sequence number reserved earlier with
     *        @ref next_sequence.  Subscribers that already accepted a newer
     *        value discard it.
     * @throws HubError `Unavailable` after dispose.
     */
    void publish_sequenced(SequenceNumber sequence, T value,
                           std::optional<std::string> topic = std::nullopt) {
        throw_if_disposed();
        auto message = std::make_shared<const Published<T>>(
            Published<T>{sequence, std::move(topic), std::move(value)});
        {
            std::lock_guard<std::mutex> lock(m_dispatch_mutex);
            enqueue(std::move(message));
        }
        m_dispatch_ready.notify_one();
    }

    /**
     * @brief Fire‑and‑forget publish.
     * @return The sequence number assigned to the value.
     * @throws HubError `Unavailable` after dispose.
     */
    SequenceNumber publish(T value,
                           std::optional<std::string> topic = std::nullopt) {
        throw_if_disposed();
        SequenceNumber sequence;
        {
            // Numbered under the dispatch lock so the pending queue stays in
            // sequence order across concurrent publishers.
            std::lock_guard<std::mutex> lock(m_dispatch_mutex);
            sequence = next_sequence();
            enqueue(std::make_shared<const Published<T>>(
                Published<T>{sequence, std::move(topic), std::move(value)}));
        }
        m_dispatch_ready.notify_one();
        return sequence;
    }

    /**
     * @brief Re-send @p value to one subscriber only, bypassing its
     *        staleness guard.  Used to give a late joiner the current value
     *        of a topic.  Delivered synchronously; not counted as published.
     * @return `true` if the value was queued.
     * @throws HubError `Unavailable` after dispose.
     */
    bool send_to(SubscriberId id, T value,
                 std::optional<std::string> topic = std::nullopt) {
        throw_if_disposed();
        SubscriberPtr subscriber;
        {
            std::shared_lock<std::shared_mutex> lock(m_state->registry_mutex);
            auto it = m_state->registry.find(id);
            if (it == m_state->registry.end()) {
                return false;
            }
            subscriber = it->second;
        }
        auto message = std::make_shared<const Published<T>>(
            Published<T>{next_sequence(), std::move(topic), std::move(value)});
        return deliver(*subscriber, message, true);
    }

    /// @return `true` if @p id was live.  Idempotent.
    bool unsubscribe(SubscriberId id) {
        SubscriberPtr subscriber;
        {
            std::shared_lock<std::shared_mutex> lock(m_state->registry_mutex);
            auto it = m_state->registry.find(id);
            if (it == m_state->registry.end()) {
                return false;
            }
            subscriber = it->second;
        }
        subscriber->cancel();
        return true;
    }

    std::size_t subscriber_count() const {
        std::shared_lock<std::shared_mutex> lock(m_state->registry_mutex);
        return m_state->registry.size();
    }

    /// Union of every live subscriber's explicit topics.
    std::set<std::string> subscribed_topics() const {
        std::set<std::string> result;
        for (const auto& subscriber : m_state->snapshot()) {
            auto topics = subscriber->topics();
            result.insert(topics.begin(), topics.end());
        }
        return result;
    }

    /// Live subscriber ids per explicit topic.
    std::map<std::string, std::set<SubscriberId>> subscribers_by_topic() const {
        std::map<std::string, std::set<SubscriberId>> result;
        for (const auto& subscriber : m_state->snapshot()) {
            for (const auto& topic : subscriber->topics()) {
                result[topic].insert(subscriber->id());
            }
        }
        return result;
    }

    HubStatistics statistics() const {
        HubStatistics stats;
        stats.subscribers = subscriber_count();
        stats.published = m_state->published.load(std::memory_order_relaxed);
        stats.delivered = m_state->delivered.load(std::memory_order_relaxed);
        stats.dropped = m_state->dropped.load(std::memory_order_relaxed);
        stats.stale = m_state->stale.load(std::memory_order_relaxed);
        stats.faulted = m_state->faulted.load(std::memory_order_relaxed);
        return stats;
    }

    bool is_disposed() const {
        return m_state->disposed.load(std::memory_order_acquire);
    }

    /**
     * @brief Stop dispatching and cancel every subscription.  Values not yet
     *        dispatched are discarded.  Idempotent.
     */
    void dispose() {
        if (m_state->disposed.exchange(true)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_dispatch_mutex);
            m_should_run = false;
            m_pending.clear();
        }
        m_dispatch_ready.notify_all();
        if (m_thread.joinable()) {
            m_thread.join();
        }

        std::unordered_map<SubscriberId, SubscriberPtr> subscribers;
        {
            std::unique_lock<std::shared_mutex> lock(m_state->registry_mutex);
            subscribers.swap(m_state->registry);
        }
        m_lifetime.request_stop();
        REPLAYHUB_LOG_DEBUG(m_state->logger,
                            "hub {}: disposed, {} subscriptions cancelled",
                            m_state->options.id, subscribers.size());
    }
};

} // namespace replayhub
