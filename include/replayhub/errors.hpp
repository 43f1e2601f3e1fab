/**
 * @file errors.hpp
 * @brief Exception types raised by replayhub.
 *
 * Lookup misses (unknown series, topics nobody publishes to) are never
 * reported as errors, and per‑subscriber delivery failures never escape the
 * hub.  What remains is misuse of a disposed hub, bad load options and
 * cancellation of an in‑flight query.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace replayhub {

enum class HubErrorCode {
    Unavailable,          ///< The hub has been disposed.
    TooManySubscriptions, ///< `max_subscriptions` has been reached.
    InvalidSubscription,  ///< Handle is empty or owned by another hub.
};

/// Raised by @ref SubscriptionHub operations that cannot proceed.
class HubError : public std::runtime_error {
  private:
    HubErrorCode m_code;

  public:
    HubError(HubErrorCode code, const std::string& what)
        : std::runtime_error(what), m_code(code) {}

    HubErrorCode code() const noexcept { return m_code; }
};

/// Load options are invalid; fatal to the load attempt only.
class ConfigurationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// The stop token passed to a query fired before the query completed.
class OperationCancelled : public std::runtime_error {
  public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

} // namespace replayhub
