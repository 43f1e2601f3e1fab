/**
 * @file subscriber_queue.hpp
 * @brief Per‑subscriber outbound queue: lock‑free ring plus optional
 *        locked overflow path.
 */

#pragma once

#include <boost/lockfree/spsc_queue.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <utility>

namespace replayhub {

/**
 * @brief Single‑consumer queue feeding one subscriber.
 *
 * The fast path is a Boost.Lockfree single‑producer/single‑consumer ring.
 * Producers must be serialised by the caller (the hub holds a per‑subscriber
 * offer lock); the subscriber task is the only consumer.
 *
 *   * **Bounded** (`capacity > 0`): the ring holds @p capacity items and a
 *     push into a full ring is rejected.  The caller counts the drop.
 *   * **Unbounded** (`capacity == 0`): once the ring is full, writers spill
 *     into a mutex‑protected std::queue.  While the overflow queue holds
 *     anything every new item goes there too, so FIFO order survives the
 *     switch between paths.
 *
 * A closed queue refuses pushes but still yields what it already holds.
 *
 * @tparam T Item type; must be default constructible and copyable.
 */
template <typename T> class SubscriberQueue {
  public:
    static constexpr std::size_t fast_queue_size = 1024; ///< Unbounded ring.

  private:
    const std::size_t m_capacity;

    // Slow overflow path (unbounded mode only)
    std::queue<T> m_slow_queue;
    std::mutex m_mutex;
    std::atomic<std::size_t> m_slow_size{0};

    // Fast lock‑free ring
    boost::lockfree::spsc_queue<T> m_fast_queue;

    // Consumer wake‑up
    std::mutex m_wait_mutex;
    std::condition_variable_any m_ready;
    std::atomic<bool> m_closed{false};

    void push_slow(T&& item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slow_queue.push(std::move(item));
        m_slow_size.fetch_add(1, std::memory_order_release);
    }

    std::optional<T> pop_slow() {
        if (m_slow_size.load(std::memory_order_acquire) == 0) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_slow_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_slow_queue.front());
        m_slow_queue.pop();
        m_slow_size.fetch_sub(1, std::memory_order_release);
        return item;
    }

    void notify() {
        {
            std::lock_guard<std::mutex> lock(m_wait_mutex);
        }
        m_ready.notify_all();
    }

    // Consumer side only.
    bool has_items() {
        return m_fast_queue.read_available() > 0 ||
               m_slow_size.load(std::memory_order_acquire) > 0;
    }

  public:
    /// @param capacity Maximum queued items; `0` means unbounded.
    explicit SubscriberQueue(std::size_t capacity)
        : m_capacity(capacity),
          m_fast_queue(capacity > 0 ? capacity : fast_queue_size) {}

    SubscriberQueue(const SubscriberQueue&) = delete;
    SubscriberQueue& operator=(const SubscriberQueue&) = delete;

    std::size_t capacity() const { return m_capacity; }
    bool closed() const { return m_closed.load(std::memory_order_acquire); }

    /**
     * @brief Non‑blocking push.  Producer side.
     * @return `false` if the queue is closed, or bounded and full.
     */
    bool push(T item) {
        if (closed()) {
            return false;
        }
        if (m_capacity > 0) {
            if (!m_fast_queue.push(item)) {
                return false;
            }
        } else if (m_slow_size.load(std::memory_order_acquire) > 0 ||
                   !m_fast_queue.push(item)) {
            push_slow(std::move(item));
        }
        notify();
        return true;
    }

    /// @return Next item or `std::nullopt` when the queue is empty.
    std::optional<T> pop() {
        T item;
        if (m_fast_queue.pop(item)) {
            return item;
        }
        return pop_slow();
    }

    /**
     * @brief Block until an item arrives, the queue closes and drains,
     *        @p stop fires, or @p timeout elapses.
     */
    template <typename Rep, typename Period>
    std::optional<T> wait_pop(std::stop_token stop,
                              std::chrono::duration<Rep, Period> timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (auto item = pop()) {
                return item;
            }
            if (closed() || stop.stop_requested()) {
                return pop();
            }
            std::unique_lock<std::mutex> lock(m_wait_mutex);
            const bool ready = m_ready.wait_until(
                lock, stop, deadline, [this] { return has_items() || closed(); });
            if (!ready) {
                // Timed out or stop requested; one last look.
                lock.unlock();
                return pop();
            }
        }
    }

    /// As above, without a deadline.
    std::optional<T> wait_pop(std::stop_token stop) {
        while (true) {
            if (auto item = pop()) {
                return item;
            }
            if (closed() || stop.stop_requested()) {
                return pop();
            }
            std::unique_lock<std::mutex> lock(m_wait_mutex);
            m_ready.wait(lock, stop,
                         [this] { return has_items() || closed(); });
        }
    }

    /// Refuse further pushes and wake any blocked consumer.
    void close() {
        m_closed.store(true, std::memory_order_release);
        notify();
    }
};

} // namespace replayhub
