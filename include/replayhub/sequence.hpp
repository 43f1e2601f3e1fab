/**
 * @file sequence.hpp
 * @brief Publish sequence numbers and the per‑subscriber staleness guard.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

namespace replayhub {

/// Monotonic publish counter. Wraps from `UINT64_MAX` to `0`.
using SequenceNumber = std::uint64_t;

/**
 * @brief Serial‑number comparison: is @p candidate newer than @p reference?
 *
 * Two numbers are compared by the sign of their 64‑bit difference, so the
 * step from `UINT64_MAX` to `0` counts as moving forward.  Valid while fewer
 * than 2^63 numbers separate the operands.
 */
constexpr bool is_newer(SequenceNumber candidate,
                        SequenceNumber reference) noexcept {
    return static_cast<std::int64_t>(candidate - reference) > 0;
}

/**
 * @brief Remembers the last accepted sequence number and rejects anything
 *        that is not strictly newer.
 *
 * A recomputed value (for example an aggregate health status) may reach a
 * subscriber after a value computed later.  The guard drops the late one.
 * The check‑and‑record step runs under a narrow lock so two racing
 * deliveries cannot both be accepted out of order.
 */
class SequenceGuard {
  private:
    mutable std::mutex m_mutex;
    std::optional<SequenceNumber> m_last;

  public:
    /// @return `true` if @p sequence was recorded as the newest value.
    bool try_accept(SequenceNumber sequence) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_last && !is_newer(sequence, *m_last)) {
            return false;
        }
        m_last = sequence;
        return true;
    }

    /// Last accepted sequence number, if any value has been accepted.
    std::optional<SequenceNumber> last() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last;
    }
};

} // namespace replayhub
