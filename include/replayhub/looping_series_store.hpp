/**
 * @file looping_series_store.hpp
 * @brief Read‑only time‑series store that can replay its window forever.
 *
 * The store answers raw‑range and snapshot queries against a @ref Dataset
 * loaded once.  With looping enabled, times outside `[earliest, latest]` are
 * served by shifting the whole window by a whole multiple of its duration,
 * so the recording repeats end to end.
 *
 * Where two passes meet, the last sample of one pass and the first sample of
 * the next fall on the same instant.  The earlier pass's sample is the one
 * reported.
 */

#pragma once

#include "replayhub/dataset.hpp"
#include "replayhub/errors.hpp"
#include "replayhub/logging.hpp"
#include "replayhub/series_loader.hpp"
#include "replayhub/series_types.hpp"
#include "replayhub/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <future>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace replayhub {

class LoopingSeriesStore {
  private:
    using DatasetPtr = std::shared_ptr<const Dataset>;

    // Definitions visible to lookups.  Replaced wholesale by add_series().
    struct Index {
        Dataset::CaseInsensitiveMap<SeriesDefinition> definitions;
        Dataset::CaseInsensitiveMap<std::string> names;

        const SeriesDefinition* find(const std::string& id_or_name) const {
            auto by_id = definitions.find(id_or_name);
            if (by_id != definitions.end()) {
                return &by_id->second;
            }
            auto by_name = names.find(id_or_name);
            if (by_name != names.end()) {
                auto it = definitions.find(by_name->second);
                return it == definitions.end() ? nullptr : &it->second;
            }
            return nullptr;
        }
    };

    struct Selected {
        const SeriesDefinition* definition;
        const std::vector<SeriesPoint>* points;
    };

    logging::Logger m_logger;
    std::shared_future<DatasetPtr> m_dataset;

    mutable std::mutex m_index_mutex;
    mutable std::shared_ptr<const Index> m_index;

    static void throw_if_stopped(const std::stop_token& stop) {
        if (stop.stop_requested()) {
            throw OperationCancelled();
        }
    }

    static Duration floor_multiple(Duration value, Duration step) {
        auto k = value / step;
        if (value % step != Duration::zero() && value < Duration::zero()) {
            --k;
        }
        return step * k;
    }

    static Duration ceil_multiple(Duration value, Duration step) {
        auto k = value / step;
        if (value % step != Duration::zero() && value > Duration::zero()) {
            ++k;
        }
        return step * k;
    }

    static SeriesQueryResult make_result(const SeriesDefinition& definition,
                                         const SeriesPoint& point, Duration offset) {
        SeriesQueryResult result{definition.id, definition.name, point};
        result.point.utc_sample_time += offset;
        return result;
    }

    std::shared_ptr<const Index> index(const std::stop_token& stop) const {
        const Dataset& data = dataset(stop);
        std::lock_guard<std::mutex> lock(m_index_mutex);
        if (!m_index) {
            auto built = std::make_shared<Index>();
            built->definitions = data.definitions;
            built->names = data.names;
            m_index = std::move(built);
        }
        return m_index;
    }

    std::vector<Selected> select(const Dataset& data, const Index& index,
                                 const std::vector<std::string>& series) const {
        std::vector<Selected> selected;
        for (const auto& key : series) {
            const SeriesDefinition* definition = index.find(key);
            if (definition == nullptr) {
                continue;
            }
            auto points = data.points.find(definition->id);
            if (points == data.points.end() || points->second.empty()) {
                continue;
            }
            selected.push_back({definition, &points->second});
        }
        return selected;
    }

    // Last point at or before @p time, or nullptr.
    static const SeriesPoint* at_or_before(const std::vector<SeriesPoint>& points,
                                           Timestamp time) {
        auto it = std::upper_bound(points.begin(), points.end(), time,
                                   [](Timestamp t, const SeriesPoint& p) {
                                       return t < p.utc_sample_time;
                                   });
        return it == points.begin() ? nullptr : &*std::prev(it);
    }

    static const SeriesPoint* exactly_at(const std::vector<SeriesPoint>& points,
                                         Timestamp time) {
        auto it = std::lower_bound(points.begin(), points.end(), time,
                                   [](const SeriesPoint& p, Timestamp t) {
                                       return p.utc_sample_time < t;
                                   });
        return it != points.end() && it->utc_sample_time == time ? &*it : nullptr;
    }

    template <typename Sink>
    void read_window(const std::vector<Selected>& selected, const RawQuery& query,
                     Sink& sink, const std::stop_token& stop) const {
        for (const auto& series : selected) {
            throw_if_stopped(stop);
            std::size_t emitted = 0;
            for (const auto& point : *series.points) {
                if (point.utc_sample_time < query.start) {
                    continue;
                }
                if (point.utc_sample_time > query.end) {
                    break;
                }
                sink(make_result(*series.definition, point, Duration::zero()));
                if (query.sample_count > 0 && ++emitted >= query.sample_count) {
                    break;
                }
            }
        }
    }

    template <typename Sink>
    void read_looped(const Dataset& data, const std::vector<Selected>& selected,
                     const RawQuery& query, Sink& sink, const std::stop_token& stop) const {
        const Duration duration = data.duration;
        if (duration <= Duration::zero()) {
            return;
        }
        const auto& times = data.sample_times;

        // Shift so that start lies in [earliest + offset, latest + offset).
        Duration offset = floor_multiple(query.start - data.earliest, duration);
        std::size_t i = static_cast<std::size_t>(
            std::lower_bound(times.begin(), times.end(), query.start - offset) - times.begin());
        if (query.boundary == BoundaryType::Outside && i > 0 && i < times.size() &&
            times[i] + offset > query.start) {
            --i;
        }

        bool allow_past_end = query.boundary == BoundaryType::Outside;
        std::size_t emitted = 0;
        // Per series: shifted time of the last emitted point.  The first
        // sample of a pass repeats the last one of the previous pass only for
        // series that have a point at both ends of the window.
        std::vector<std::optional<Timestamp>> last_emitted(selected.size());
        while (true) {
            throw_if_stopped(stop);
            for (; i < times.size(); ++i) {
                const Timestamp shifted = times[i] + offset;
                if (shifted > query.end) {
                    if (!allow_past_end) {
                        return;
                    }
                    allow_past_end = false;
                } else if (shifted == query.end) {
                    allow_past_end = false;
                }
                throw_if_stopped(stop);

                for (std::size_t s = 0; s < selected.size(); ++s) {
                    if (last_emitted[s] && shifted <= *last_emitted[s]) {
                        continue;
                    }
                    const SeriesPoint* point = exactly_at(*selected[s].points, times[i]);
                    if (point == nullptr) {
                        continue;
                    }
                    sink(make_result(*selected[s].definition, *point, offset));
                    last_emitted[s] = shifted;
                    if (query.sample_count > 0 && ++emitted >= query.sample_count) {
                        return;
                    }
                }
                if (shifted > query.end) {
                    return;
                }
            }
            offset += duration;
            i = 0;
        }
    }

  public:
    /// Start loading @p options in the background.
    explicit LoopingSeriesStore(LoaderOptions options)
        : m_logger(options.logger ? options.logger
                                  : logging::create_logger("looping-series-store")) {
        options.logger = m_logger;
        m_dataset = std::async(std::launch::async,
                               [options = std::move(options)]() -> DatasetPtr {
                                   return std::make_shared<const Dataset>(load_dataset(options));
                               })
                        .share();
    }

    /// Serve an already built dataset.
    explicit LoopingSeriesStore(Dataset dataset, logging::Logger logger = nullptr)
        : m_logger(logger ? logger : logging::create_logger("looping-series-store")) {
        std::promise<DatasetPtr> ready;
        ready.set_value(std::make_shared<const Dataset>(std::move(dataset)));
        m_dataset = ready.get_future().share();
    }

    LoopingSeriesStore(const LoopingSeriesStore&) = delete;
    LoopingSeriesStore& operator=(const LoopingSeriesStore&) = delete;

    /**
     * @brief Block until the load finishes.
     * @throws ConfigurationError (or any other load error) if loading failed.
     * @throws OperationCancelled if @p stop fires first.
     */
    void wait_until_loaded(std::stop_token stop = {}) const { dataset(stop); }

    /// The loaded dataset.  Same errors as @ref wait_until_loaded.
    const Dataset& dataset(const std::stop_token& stop = {}) const {
        using namespace std::chrono_literals;
        while (m_dataset.wait_for(20ms) != std::future_status::ready) {
            throw_if_stopped(stop);
        }
        return *m_dataset.get();
    }

    /// Definitions matching @p filter, ordered by name and paged.
    std::vector<SeriesDefinition> find_series(const SeriesFilter& filter,
                                              std::stop_token stop = {}) const {
        const auto current = index(stop);
        std::vector<const SeriesDefinition*> matches;
        for (const auto& [id, definition] : current->definitions) {
            if (wildcard_match(filter.name, definition.name) &&
                wildcard_match(filter.description, definition.description) &&
                wildcard_match(filter.units, definition.units)) {
                matches.push_back(&definition);
            }
        }
        std::stable_sort(matches.begin(), matches.end(),
                         [](const SeriesDefinition* a, const SeriesDefinition* b) {
                             return CaseInsensitiveLess{}(a->name, b->name);
                         });

        const std::size_t page_size = filter.page_size > 0 ? filter.page_size : 10;
        const std::size_t page = filter.page > 0 ? filter.page : 1;
        const std::size_t skip = page_size * (page - 1);

        std::vector<SeriesDefinition> result;
        for (std::size_t i = skip; i < matches.size() && result.size() < page_size; ++i) {
            result.push_back(*matches[i]);
        }
        return result;
    }

    /// Definitions by id, else by name.  Unknown entries are skipped.
    std::vector<SeriesDefinition> get_series(const std::vector<std::string>& ids_or_names,
                                             std::stop_token stop = {}) const {
        const auto current = index(stop);
        std::vector<SeriesDefinition> result;
        for (const auto& key : ids_or_names) {
            if (const auto* definition = current->find(key)) {
                result.push_back(*definition);
            }
        }
        return result;
    }

    /**
     * @brief Add definitions for series the source does not contain.
     *
     * Definitions whose id or name is already known are ignored.  No points
     * are added, so queries for the new series return nothing.
     *
     * @return Number of definitions added.
     */
    std::size_t add_series(const std::vector<SeriesDefinition>& definitions,
                           std::stop_token stop = {}) {
        index(stop);
        std::lock_guard<std::mutex> lock(m_index_mutex);
        auto updated = std::make_shared<Index>(*m_index);
        std::size_t added = 0;
        for (auto definition : definitions) {
            if (definition.id.empty()) {
                definition.id = definition.name;
            }
            if (definition.name.empty()) {
                definition.name = definition.id;
            }
            if (definition.id.empty() || updated->find(definition.id) != nullptr ||
                updated->find(definition.name) != nullptr) {
                continue;
            }
            if (!definition.states.empty()) {
                definition.kind = SeriesKind::State;
            }
            updated->names.emplace(definition.name, definition.id);
            updated->definitions.emplace(definition.id, std::move(definition));
            ++added;
        }
        if (added > 0) {
            m_index = std::move(updated);
            REPLAYHUB_LOG_INFO(m_logger, "added {} series definitions", added);
        }
        return added;
    }

    /**
     * @brief Value of each series as of @p now.
     *
     * Without looping, times past either end clamp to the first or last
     * point.  With looping, the window is shifted to contain @p now.
     */
    std::vector<SeriesQueryResult> read_snapshot(Timestamp now,
                                                 const std::vector<std::string>& ids_or_names,
                                                 std::stop_token stop = {}) const {
        const Dataset& data = dataset(stop);
        const auto current = index(stop);
        std::vector<SeriesQueryResult> results;
        if (data.empty() || data.duration <= Duration::zero()) {
            return results;
        }

        const bool inside = now >= data.earliest && now <= data.latest;
        Duration offset = Duration::zero();
        if (data.looping_enabled && !inside) {
            offset = now > data.latest ? ceil_multiple(now - data.latest, data.duration)
                                       : -ceil_multiple(data.earliest - now, data.duration);
        }

        for (const auto& series : select(data, *current, ids_or_names)) {
            throw_if_stopped(stop);
            const auto& points = *series.points;
            if (!data.looping_enabled) {
                const SeriesPoint* point = now > data.latest   ? &points.back()
                                           : now < data.earliest ? &points.front()
                                                                 : at_or_before(points, now);
                if (point != nullptr) {
                    results.push_back(make_result(*series.definition, *point, Duration::zero()));
                }
                continue;
            }
            if (offset == Duration::zero()) {
                if (const SeriesPoint* point = at_or_before(points, now)) {
                    results.push_back(make_result(*series.definition, *point, offset));
                }
                continue;
            }

            // The previous pass's final sample wins over this pass when it is
            // at least as recent.
            const SeriesPoint* current_pass = at_or_before(points, now - offset);
            const SeriesPoint& previous_pass = points.back();
            const Duration previous_offset = offset - data.duration;
            if (current_pass == nullptr ||
                previous_pass.utc_sample_time + previous_offset >=
                    current_pass->utc_sample_time + offset) {
                results.push_back(make_result(*series.definition, previous_pass, previous_offset));
            } else {
                results.push_back(make_result(*series.definition, *current_pass, offset));
            }
        }
        return results;
    }

    /// Snapshot at the current system time.
    std::vector<SeriesQueryResult> read_snapshot(const std::vector<std::string>& ids_or_names,
                                                 std::stop_token stop = {}) const {
        return read_snapshot(
            std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now()),
            ids_or_names, std::move(stop));
    }

    /**
     * @brief Raw samples in `[query.start, query.end]`, ascending.
     *
     * Non‑looping datasets, and ranges inside the loaded window, return the
     * stored points as they are, capped at `sample_count` per series.
     * Otherwise the window is replayed from the pass containing `start`
     * until `end` is passed; `sample_count` then caps the total.
     *
     * @param sink Called with each @ref SeriesQueryResult.
     * @throws std::invalid_argument if `start > end`.
     * @throws OperationCancelled if @p stop fires during the query.
     */
    template <typename Sink>
    void read_raw(const RawQuery& query, Sink&& sink, std::stop_token stop = {}) const {
        if (query.start > query.end) {
            throw std::invalid_argument("raw query start is after its end");
        }
        const Dataset& data = dataset(stop);
        const auto current = index(stop);
        if (data.empty()) {
            return;
        }
        const auto selected = select(data, *current, query.series);
        if (selected.empty()) {
            return;
        }

        const bool contained = query.start >= data.earliest && query.end <= data.latest;
        if (!data.looping_enabled || contained) {
            read_window(selected, query, sink, stop);
        } else {
            read_looped(data, selected, query, sink, stop);
        }
    }

    std::vector<SeriesQueryResult> read_raw(const RawQuery& query,
                                            std::stop_token stop = {}) const {
        std::vector<SeriesQueryResult> results;
        read_raw(
            query, [&results](SeriesQueryResult&& result) { results.push_back(std::move(result)); },
            std::move(stop));
        return results;
    }
};

} // namespace replayhub
