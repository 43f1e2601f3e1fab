/**
 * @file dataset.hpp
 * @brief Immutable in‑memory series data and the builder that produces it.
 */

#pragma once

#include "replayhub/series_types.hpp"
#include "replayhub/string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace replayhub {

/**
 * @brief Everything a @ref LoopingSeriesStore serves.
 *
 * Points per series are sorted ascending with unique timestamps;
 * @ref sample_times is the sorted union of all of them.
 */
struct Dataset {
    template <typename V>
    using CaseInsensitiveMap = std::map<std::string, V, CaseInsensitiveLess>;

    CaseInsensitiveMap<SeriesDefinition> definitions; ///< Keyed by id.
    CaseInsensitiveMap<std::string> names;            ///< Name → id.
    CaseInsensitiveMap<std::vector<SeriesPoint>> points;

    std::vector<Timestamp> sample_times;
    Timestamp earliest{};
    Timestamp latest{};
    Duration duration{0};
    bool looping_enabled{false};

    std::size_t rows_read{0};
    std::size_t rows_skipped{0};
    std::size_t values_skipped{0}; ///< Duplicate (series, timestamp) pairs.

    bool empty() const { return sample_times.empty(); }
};

/**
 * @brief Numeric value of a raw cell.
 *
 * A state name (case‑insensitive) yields its integer, anything else is
 * parsed as a number.  Text that is neither becomes NaN.
 */
inline double numeric_value(const SeriesDefinition& definition, const std::string& raw) {
    const std::string text = trim(raw);
    for (const auto& [state, value] : definition.states) {
        if (iequals(state, text)) {
            return static_cast<double>(value);
        }
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') {
        ++first;
    }
    double parsed = 0.0;
    const auto [end, error] = std::from_chars(first, last, parsed);
    if (error != std::errc() || end != last || first == last) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return parsed;
}

/// Display label: the state name when one matches, otherwise the number.
inline std::string text_value(const SeriesDefinition& definition, const std::string& raw,
                              double numeric) {
    const std::string text = trim(raw);
    for (const auto& [state, value] : definition.states) {
        if (iequals(state, text)) {
            return state;
        }
    }
    if (definition.kind == SeriesKind::State && !std::isnan(numeric)) {
        for (const auto& [state, value] : definition.states) {
            if (static_cast<double>(value) == numeric) {
                return state;
            }
        }
    }
    return fmt::format("{}", numeric);
}

/**
 * @brief Collects `(series, timestamp, raw value)` tuples in any order.
 *
 * Unknown series names passed to @ref add are defined on the fly as numeric
 * series whose id and name are that string.
 */
class DatasetBuilder {
  private:
    Dataset m_dataset;
    Dataset::CaseInsensitiveMap<std::map<Timestamp, SeriesPoint>> m_points;

    const SeriesDefinition* lookup(const std::string& series) const {
        auto by_id = m_dataset.definitions.find(series);
        if (by_id != m_dataset.definitions.end()) {
            return &by_id->second;
        }
        auto by_name = m_dataset.names.find(series);
        if (by_name != m_dataset.names.end()) {
            return &m_dataset.definitions.at(by_name->second);
        }
        return nullptr;
    }

  public:
    explicit DatasetBuilder(bool looping_enabled = false) {
        m_dataset.looping_enabled = looping_enabled;
    }

    /**
     * @brief Register @p definition.  A missing id or name is filled from the
     *        other one.
     * @return The registered definition, or the existing one with that id.
     */
    const SeriesDefinition& define(SeriesDefinition definition) {
        if (definition.id.empty()) {
            definition.id = definition.name;
        }
        if (definition.name.empty()) {
            definition.name = definition.id;
        }
        if (!definition.states.empty()) {
            definition.kind = SeriesKind::State;
        }
        auto [it, inserted] = m_dataset.definitions.emplace(definition.id, definition);
        if (inserted) {
            m_dataset.names.emplace(definition.name, definition.id);
        }
        return it->second;
    }

    /**
     * @brief Add one value.
     * @return `false` when the series already holds a value at @p time; the
     *         first value is kept.
     */
    bool add(const std::string& series, Timestamp time, const std::string& raw) {
        const SeriesDefinition* definition = lookup(series);
        if (definition == nullptr) {
            definition = &define(SeriesDefinition{series, series, {}, {}, SeriesKind::Numeric, {}});
        }

        SeriesPoint point;
        point.utc_sample_time = time;
        point.numeric_value = numeric_value(*definition, raw);
        point.text_value = text_value(*definition, raw, point.numeric_value);
        point.units = definition->units;

        if (!m_points[definition->id].emplace(time, std::move(point)).second) {
            ++m_dataset.values_skipped;
            return false;
        }
        return true;
    }

    void count_row() { ++m_dataset.rows_read; }
    void count_skipped_row() {
        ++m_dataset.rows_read;
        ++m_dataset.rows_skipped;
    }

    Dataset build() && {
        std::set<Timestamp> times;
        for (auto& [id, series] : m_points) {
            auto& points = m_dataset.points[id];
            points.reserve(series.size());
            for (auto& [time, point] : series) {
                times.insert(time);
                points.push_back(std::move(point));
            }
        }
        m_points.clear();

        m_dataset.sample_times.assign(times.begin(), times.end());
        if (!m_dataset.sample_times.empty()) {
            m_dataset.earliest = m_dataset.sample_times.front();
            m_dataset.latest = m_dataset.sample_times.back();
            m_dataset.duration = m_dataset.latest - m_dataset.earliest;
        }
        return std::move(m_dataset);
    }
};

} // namespace replayhub
