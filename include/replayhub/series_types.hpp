/**
 * @file series_types.hpp
 * @brief Value types shared by the series loader, store and poller.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace replayhub {

using Duration = std::chrono::microseconds;
/// UTC instant with microsecond resolution.
using Timestamp = std::chrono::sys_time<Duration>;

enum class SeriesKind { Numeric, State };

enum class Quality { Good };

/// Which samples a raw query may return at the range edges.
enum class BoundaryType {
    Inside,  ///< Only samples within `[start, end]`.
    Outside, ///< Also the nearest sample before `start` and after `end`.
};

struct SeriesDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string units;
    SeriesKind kind{SeriesKind::Numeric};
    std::map<std::string, int> states; ///< State name → value.
};

struct SeriesPoint {
    Timestamp utc_sample_time{};
    double numeric_value{0.0};
    std::string text_value; ///< State name, or the formatted number.
    Quality quality{Quality::Good};
    std::string units;

    bool operator==(const SeriesPoint&) const = default;
};

struct SeriesQueryResult {
    std::string series_id;
    std::string series_name;
    SeriesPoint point;
};

struct RawQuery {
    std::vector<std::string> series; ///< Ids or names.
    Timestamp start{};
    Timestamp end{};
    BoundaryType boundary{BoundaryType::Inside};
    std::size_t sample_count{0}; ///< `0` = unlimited.
};

/**
 * @brief Wildcard filter for @ref LoopingSeriesStore::find_series.
 *
 * Each non‑empty pattern is matched case‑insensitively against the
 * corresponding field; `*` matches any run and `?` a single character.
 */
struct SeriesFilter {
    std::string name;
    std::string description;
    std::string units;
    std::size_t page{1}; ///< 1‑based.
    std::size_t page_size{10};
};

} // namespace replayhub
