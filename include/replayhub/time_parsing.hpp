/**
 * @file time_parsing.hpp
 * @brief Time‑stamp parsing and time‑zone conversion for the series loader,
 *        built on Boost.DateTime.
 */

#pragma once

#include "replayhub/errors.hpp"
#include "replayhub/series_types.hpp"
#include "replayhub/string_utils.hpp"

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <locale>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>

namespace replayhub {

/// A parsed wall‑clock time; @ref utc is set when the text carried a `Z`.
struct ParsedTime {
    boost::posix_time::ptime value;
    bool utc{false};
};

/// Convert a UTC ptime to a @ref Timestamp.
inline Timestamp to_timestamp(const boost::posix_time::ptime& utc) {
    static const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
    return Timestamp(Duration((utc - epoch).total_microseconds()));
}

/**
 * @brief Interprets wall‑clock times in one configured time zone.
 *
 * Resolution rules for the zone identifier:
 *   * empty                      – the process‑local zone (via `mktime`);
 *   * `UTC`, `Etc/UTC`, `GMT`, `Z` – UTC;
 *   * a region such as `Europe/London` – looked up in the Boost.DateTime
 *     zone database CSV when one is configured;
 *   * a POSIX TZ string such as `EST-5EDT,M3.2.0,M11.1.0`.
 */
class TimeZoneConverter {
  public:
    enum class Kind { Local, Utc, Zone };

  private:
    Kind m_kind{Kind::Local};
    boost::local_time::time_zone_ptr m_zone;
    std::string m_name;

    static bool is_utc_name(const std::string& id) {
        return iequals(id, "UTC") || iequals(id, "Etc/UTC") || iequals(id, "GMT") ||
               iequals(id, "Etc/GMT") || iequals(id, "Z");
    }

    std::optional<Timestamp> local_to_utc(const boost::posix_time::ptime& local) const {
        std::tm parts = boost::posix_time::to_tm(local);
        parts.tm_isdst = -1;
        const std::time_t seconds = std::mktime(&parts);
        if (seconds == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        const auto fraction =
            boost::posix_time::time_duration(0, 0, 0, local.time_of_day().fractional_seconds())
                .total_microseconds();
        return Timestamp(std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds)) +
                         Duration(fraction));
    }

    std::optional<Timestamp> zone_to_utc(const boost::posix_time::ptime& local) const {
        using boost::local_time::local_date_time;
        const auto date = local.date();
        const auto time_of_day = local.time_of_day();
        local_date_time converted(date, time_of_day, m_zone,
                                  local_date_time::NOT_DATE_TIME_ON_ERROR);
        if (converted.is_not_a_date_time()) {
            // Repeated hour at the end of DST resolves to standard time;
            // a skipped hour at the start of DST has no UTC instant.
            if (local_date_time::check_dst(date, time_of_day, m_zone) !=
                boost::date_time::ambiguous) {
                return std::nullopt;
            }
            converted = local_date_time(date, time_of_day, m_zone, false);
        }
        return to_timestamp(converted.utc_time());
    }

  public:
    TimeZoneConverter() = default;

    /**
     * @throws ConfigurationError for an unknown identifier or an unreadable
     *         zone database.
     */
    static TimeZoneConverter resolve(const std::string& identifier,
                                     const std::string& database_path = {}) {
        TimeZoneConverter converter;
        const std::string id = trim(identifier);
        converter.m_name = id.empty() ? "local" : id;
        if (id.empty()) {
            return converter;
        }
        if (is_utc_name(id)) {
            converter.m_kind = Kind::Utc;
            return converter;
        }

        if (!database_path.empty()) {
            boost::local_time::tz_database database;
            try {
                database.load_from_file(database_path);
            } catch (const std::exception& e) {
                throw ConfigurationError("cannot load time zone database '" +
                                         database_path + "': " + e.what());
            }
            if (auto zone = database.time_zone_from_region(id)) {
                converter.m_kind = Kind::Zone;
                converter.m_zone = zone;
                return converter;
            }
        }

        // A POSIX TZ string always carries a numeric UTC offset.
        const bool has_offset = std::any_of(id.begin(), id.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (has_offset) {
            try {
                converter.m_zone = boost::make_shared<boost::local_time::posix_time_zone>(id);
                converter.m_kind = Kind::Zone;
                return converter;
            } catch (const std::exception& e) {
                throw ConfigurationError("invalid time zone '" + id + "': " + e.what());
            }
        }
        throw ConfigurationError("unknown time zone '" + id + "'");
    }

    Kind kind() const { return m_kind; }
    const std::string& name() const { return m_name; }

    /// @return `std::nullopt` for a wall‑clock time that does not exist.
    std::optional<Timestamp> to_utc(const ParsedTime& parsed) const {
        if (parsed.utc || m_kind == Kind::Utc) {
            return to_timestamp(parsed.value);
        }
        if (m_kind == Kind::Zone) {
            return zone_to_utc(parsed.value);
        }
        return local_to_utc(parsed.value);
    }
};

namespace detail {

inline bool is_digits(const std::string& text, std::size_t from, std::size_t count) {
    if (from + count > text.size()) {
        return false;
    }
    for (std::size_t i = from; i < from + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

// "YYYY-MM-DD" optionally followed by " HH:MM[:SS[.f]]".
inline bool looks_like_date_time(const std::string& text) {
    if (!is_digits(text, 0, 4) || text.size() < 10 || text[4] != '-' ||
        !is_digits(text, 5, 2) || text[7] != '-' || !is_digits(text, 8, 2)) {
        return false;
    }
    if (text.size() == 10) {
        return true;
    }
    return text.size() >= 16 && text[10] == ' ' && is_digits(text, 11, 2) &&
           text[13] == ':' && is_digits(text, 14, 2);
}

} // namespace detail

/**
 * @brief Parse one time‑stamp cell.
 * @param format Boost.DateTime input‑facet format (for example
 *        `"%d/%m/%Y %H:%M:%S"`); when empty the ISO forms
 *        `YYYY-MM-DD HH:MM:SS[.f]` and `YYYY-MM-DDTHH:MM:SS[.f][Z]` are
 *        accepted.
 * @return `std::nullopt` when @p text does not parse.
 */
inline std::optional<ParsedTime> parse_time_stamp(const std::string& text,
                                                  const std::string& format = {}) {
    using boost::posix_time::ptime;
    const std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    if (!format.empty()) {
        std::istringstream stream(value);
        stream.imbue(std::locale(std::locale::classic(),
                                 new boost::posix_time::time_input_facet(format)));
        ptime parsed(boost::posix_time::not_a_date_time);
        try {
            stream >> parsed;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (stream.fail() || parsed.is_special()) {
            return std::nullopt;
        }
        return ParsedTime{parsed, false};
    }

    ParsedTime result;
    std::string normalised = value;
    if (normalised.back() == 'Z' || normalised.back() == 'z') {
        normalised.pop_back();
        result.utc = true;
    }
    if (normalised.size() > 10 && (normalised[10] == 'T' || normalised[10] == 't')) {
        normalised[10] = ' ';
    }
    if (!detail::looks_like_date_time(normalised)) {
        return std::nullopt;
    }
    if (normalised.size() == 16) {
        normalised += ":00";
    }
    try {
        result.value = normalised.size() == 10
                           ? ptime(boost::gregorian::from_simple_string(normalised))
                           : boost::posix_time::time_from_string(normalised);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::bad_cast&) {
        return std::nullopt;
    }
    if (result.value.is_special()) {
        return std::nullopt;
    }
    return result;
}

} // namespace replayhub
