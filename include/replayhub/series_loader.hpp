/**
 * @file series_loader.hpp
 * @brief Builds a @ref Dataset from comma separated input.
 *
 * The first record is the header.  One column holds the time stamp; every
 * other column is a series, declared either by a plain name or by a
 * bracketed property list:
 *
 * @code
 * Time,Pressure,[id=T1|name=Temperature|units=degC],[name=Pump|STATE_On=1|STATE_Off=0]
 * @endcode
 */

#pragma once

#include "replayhub/csv_reader.hpp"
#include "replayhub/dataset.hpp"
#include "replayhub/errors.hpp"
#include "replayhub/logging.hpp"
#include "replayhub/string_utils.hpp"
#include "replayhub/time_parsing.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <fstream>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace replayhub {

struct LoaderOptions {
    /// Opens the input.  Takes precedence over @ref path.
    std::function<std::unique_ptr<std::istream>()> source;
    std::string path;
    std::string time_zone;          ///< Empty = process‑local zone.
    std::string time_zone_database; ///< Boost.DateTime zone CSV for regions.
    std::string time_stamp_format;  ///< Boost.DateTime input‑facet format.
    std::size_t time_stamp_field_index{0};
    bool looping_enabled{false};
    logging::Logger logger{nullptr};
};

/**
 * @brief Parse one header cell.
 * @return `std::nullopt` for a cell that names no series.
 */
inline std::optional<SeriesDefinition> parse_series_header(const std::string& cell) {
    const std::string text = trim(cell);
    if (text.empty()) {
        return std::nullopt;
    }
    SeriesDefinition definition;
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        definition.id = text;
        definition.name = text;
        return definition;
    }

    constexpr std::string_view state_prefix = "STATE_";
    const std::string_view body(text.data() + 1, text.size() - 2);
    std::size_t begin = 0;
    while (begin <= body.size()) {
        std::size_t end = body.find('|', begin);
        if (end == std::string_view::npos) {
            end = body.size();
        }
        const std::string_view property = body.substr(begin, end - begin);
        begin = end + 1;

        const auto equals = property.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        const std::string key = trim(property.substr(0, equals));
        const std::string value = trim(property.substr(equals + 1));
        if (iequals(key, "id")) {
            definition.id = value;
        } else if (iequals(key, "name")) {
            definition.name = value;
        } else if (iequals(key, "description")) {
            definition.description = value;
        } else if (iequals(key, "units")) {
            definition.units = value;
        } else if (iequals(key, "dataType")) {
            if (iequals(value, "State")) {
                definition.kind = SeriesKind::State;
            }
        } else if (key.size() > state_prefix.size() &&
                   iequals(std::string_view(key).substr(0, state_prefix.size()),
                           state_prefix)) {
            int state = 0;
            const auto [ptr, error] =
                std::from_chars(value.data(), value.data() + value.size(), state);
            if (error == std::errc() && ptr == value.data() + value.size()) {
                definition.states.emplace(key.substr(state_prefix.size()), state);
                definition.kind = SeriesKind::State;
            }
        }
    }

    if (definition.id.empty() && definition.name.empty()) {
        return std::nullopt;
    }
    if (definition.id.empty()) {
        definition.id = definition.name;
    }
    if (definition.name.empty()) {
        definition.name = definition.id;
    }
    return definition;
}

namespace detail {

inline std::unique_ptr<std::istream> open_source(const LoaderOptions& options) {
    std::unique_ptr<std::istream> input;
    if (options.source) {
        input = options.source();
    } else if (!options.path.empty()) {
        input = std::make_unique<std::ifstream>(options.path);
    } else {
        throw ConfigurationError("no data source configured");
    }
    if (!input || !*input) {
        throw ConfigurationError("cannot open data source" +
                                 (options.path.empty() ? std::string() : " '" + options.path + "'"));
    }
    return input;
}

} // namespace detail

/**
 * @brief Read the configured source into a @ref Dataset.
 *
 * Rows whose time stamp is missing or does not parse are skipped and
 * counted; empty value cells are skipped.
 *
 * @throws ConfigurationError for a missing source, an unknown time zone or
 *         a time‑stamp index outside the header.
 * @throws OperationCancelled if @p stop fires while reading.
 */
inline Dataset load_dataset(const LoaderOptions& options, std::stop_token stop = {}) {
    logging::Logger logger =
        options.logger ? options.logger : logging::create_logger("series-loader");

    const auto zone =
        TimeZoneConverter::resolve(options.time_zone, options.time_zone_database);
    auto input = detail::open_source(options);
    CsvReader reader(*input);
    DatasetBuilder builder(options.looping_enabled);

    std::vector<std::string> fields;
    if (!reader.next(fields)) {
        REPLAYHUB_LOG_WARNING(logger, "data source is empty");
        return std::move(builder).build();
    }
    const std::size_t ts_index = options.time_stamp_field_index;
    if (ts_index >= fields.size()) {
        throw ConfigurationError("time stamp field index " + std::to_string(ts_index) +
                                 " is outside the header (" + std::to_string(fields.size()) +
                                 " columns)");
    }

    // Column → series id; empty for the time stamp and unnamed columns.
    std::vector<std::string> columns(fields.size());
    for (std::size_t c = 0; c < fields.size(); ++c) {
        if (c == ts_index) {
            continue;
        }
        if (auto definition = parse_series_header(fields[c])) {
            columns[c] = builder.define(std::move(*definition)).id;
        }
    }

    while (reader.next(fields)) {
        if (stop.stop_requested()) {
            throw OperationCancelled();
        }
        if (ts_index >= fields.size()) {
            builder.count_skipped_row();
            REPLAYHUB_LOG_DEBUG(logger, "line {}: no time stamp, row skipped", reader.line());
            continue;
        }
        std::optional<Timestamp> time;
        if (auto parsed = parse_time_stamp(fields[ts_index], options.time_stamp_format)) {
            time = zone.to_utc(*parsed);
        }
        if (!time) {
            builder.count_skipped_row();
            REPLAYHUB_LOG_DEBUG(logger, "line {}: invalid time stamp '{}', row skipped",
                                reader.line(), fields[ts_index]);
            continue;
        }
        builder.count_row();

        const std::size_t width = std::min(fields.size(), columns.size());
        for (std::size_t c = 0; c < width; ++c) {
            if (columns[c].empty() || trim(fields[c]).empty()) {
                continue;
            }
            builder.add(columns[c], *time, fields[c]);
        }
    }

    Dataset dataset = std::move(builder).build();
    REPLAYHUB_LOG_INFO(logger,
                       "loaded {} series: {} rows read, {} rows skipped, {} duplicate values",
                       dataset.definitions.size(), dataset.rows_read, dataset.rows_skipped,
                       dataset.values_skipped);
    return dataset;
}

} // namespace replayhub
