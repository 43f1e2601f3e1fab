#include <gtest/gtest.h>

#include <replayhub/series_loader.hpp>

#include <chrono>
#include <cmath>
#include <memory>
#include <sstream>
#include <string>

using namespace std::chrono_literals;
using replayhub::ConfigurationError;
using replayhub::LoaderOptions;
using replayhub::SeriesKind;
using replayhub::Timestamp;

namespace {

LoaderOptions csv(const std::string& text) {
    LoaderOptions options;
    options.source = [text] { return std::make_unique<std::istringstream>(text); };
    options.time_zone = "UTC";
    return options;
}

// 2024-01-01T00:00:00Z
constexpr std::chrono::seconds new_year{1704067200};

Timestamp utc(std::chrono::seconds since_new_year) {
    return Timestamp(new_year + since_new_year);
}

} // anonymous namespace

TEST(series_header_tests, plain_cell_is_id_and_name) {
    auto definition = replayhub::parse_series_header(" Pressure ");
    ASSERT_TRUE(definition);
    EXPECT_EQ(definition->id, "Pressure");
    EXPECT_EQ(definition->name, "Pressure");
    EXPECT_EQ(definition->kind, SeriesKind::Numeric);

    EXPECT_FALSE(replayhub::parse_series_header("  "));
}

TEST(series_header_tests, bracketed_properties) {
    auto definition = replayhub::parse_series_header(
        "[id=T1|name=Temperature|description=Inlet temperature|units=degC]");
    ASSERT_TRUE(definition);
    EXPECT_EQ(definition->id, "T1");
    EXPECT_EQ(definition->name, "Temperature");
    EXPECT_EQ(definition->description, "Inlet temperature");
    EXPECT_EQ(definition->units, "degC");
    EXPECT_TRUE(definition->states.empty());
}

TEST(series_header_tests, state_properties_make_state_series) {
    auto definition = replayhub::parse_series_header("[name=Pump|STATE_On=1|state_Off=0]");
    ASSERT_TRUE(definition);
    EXPECT_EQ(definition->id, "Pump");
    EXPECT_EQ(definition->kind, SeriesKind::State);
    ASSERT_EQ(definition->states.size(), 2u);
    EXPECT_EQ(definition->states.at("On"), 1);
    EXPECT_EQ(definition->states.at("Off"), 0);

    auto typed = replayhub::parse_series_header("[id=V|dataType=State]");
    ASSERT_TRUE(typed);
    EXPECT_EQ(typed->kind, SeriesKind::State);

    EXPECT_FALSE(replayhub::parse_series_header("[units=degC|description=nameless]"));
}

TEST(time_stamp_tests, iso_forms) {
    const auto zone = replayhub::TimeZoneConverter::resolve("UTC");

    auto plain = replayhub::parse_time_stamp("2024-01-01 00:00:10");
    ASSERT_TRUE(plain);
    EXPECT_EQ(zone.to_utc(*plain), utc(10s));

    auto iso = replayhub::parse_time_stamp("2024-01-01T00:01:00.250Z");
    ASSERT_TRUE(iso);
    EXPECT_TRUE(iso->utc);
    EXPECT_EQ(zone.to_utc(*iso), utc(60s) + 250ms);

    EXPECT_FALSE(replayhub::parse_time_stamp(""));
    EXPECT_FALSE(replayhub::parse_time_stamp("yesterday"));
    EXPECT_FALSE(replayhub::parse_time_stamp("2024-13-01 00:00:00"));
}

TEST(time_stamp_tests, explicit_format) {
    const auto zone = replayhub::TimeZoneConverter::resolve("UTC");
    auto parsed = replayhub::parse_time_stamp("01/01/2024 00:00:05", "%d/%m/%Y %H:%M:%S");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(zone.to_utc(*parsed), utc(5s));

    EXPECT_FALSE(replayhub::parse_time_stamp("not a date", "%d/%m/%Y %H:%M:%S"));
}

TEST(time_stamp_tests, posix_zone_applies_offset) {
    const auto zone = replayhub::TimeZoneConverter::resolve("EST-5EDT,M3.2.0,M11.1.0");
    EXPECT_EQ(zone.kind(), replayhub::TimeZoneConverter::Kind::Zone);

    auto winter = replayhub::parse_time_stamp("2024-01-01 00:00:00");
    ASSERT_TRUE(winter);
    EXPECT_EQ(zone.to_utc(*winter), utc(5h));

    auto summer = replayhub::parse_time_stamp("2024-07-01 00:00:00");
    ASSERT_TRUE(summer);
    EXPECT_EQ(zone.to_utc(*summer), Timestamp(std::chrono::seconds{1719792000} + 4h));
}

TEST(time_stamp_tests, unknown_zone_is_configuration_error) {
    EXPECT_THROW(replayhub::TimeZoneConverter::resolve("Not/AZone"), ConfigurationError);
    EXPECT_THROW(replayhub::TimeZoneConverter::resolve("Europe/London", "/nonexistent/tz.csv"),
                 ConfigurationError);
    EXPECT_EQ(replayhub::TimeZoneConverter::resolve("").kind(),
              replayhub::TimeZoneConverter::Kind::Local);
    EXPECT_EQ(replayhub::TimeZoneConverter::resolve("etc/utc").kind(),
              replayhub::TimeZoneConverter::Kind::Utc);
}

TEST(series_loader_tests, loads_rows_and_counts_skips) {
    const auto dataset = replayhub::load_dataset(csv(
        "Time,Pressure,[id=T1|name=Temperature|units=degC],[name=Pump|STATE_On=1|STATE_Off=0]\n"
        "2024-01-01 00:00:00,1.5,20,On\n"
        "2024-01-01T00:00:10Z,2.5,,off\n"
        "not a time,1,1,On\n"
        ",3,3,On\n"
        "2024-01-01 00:00:00,9,9,Off\n"
        "2024-01-01 00:00:20,\"3,5\",bad\n"));

    EXPECT_EQ(dataset.rows_read, 6u);
    EXPECT_EQ(dataset.rows_skipped, 2u);
    EXPECT_EQ(dataset.values_skipped, 3u);
    EXPECT_EQ(dataset.definitions.size(), 3u);

    ASSERT_EQ(dataset.sample_times.size(), 3u);
    EXPECT_EQ(dataset.earliest, utc(0s));
    EXPECT_EQ(dataset.latest, utc(20s));
    EXPECT_EQ(dataset.duration, std::chrono::microseconds(20s));

    const auto& pressure = dataset.points.at("pressure");
    ASSERT_EQ(pressure.size(), 3u);
    EXPECT_DOUBLE_EQ(pressure[0].numeric_value, 1.5); // first duplicate wins
    EXPECT_EQ(pressure[0].text_value, "1.5");
    EXPECT_TRUE(std::isnan(pressure[2].numeric_value));

    const auto& temperature = dataset.points.at("T1");
    ASSERT_EQ(temperature.size(), 2u);
    EXPECT_EQ(temperature[0].units, "degC");
    EXPECT_EQ(temperature[1].utc_sample_time, utc(20s));
    EXPECT_TRUE(std::isnan(temperature[1].numeric_value));
    EXPECT_EQ(dataset.names.at("temperature"), "T1");

    const auto& pump = dataset.points.at("Pump");
    ASSERT_EQ(pump.size(), 2u);
    EXPECT_DOUBLE_EQ(pump[0].numeric_value, 1.0);
    EXPECT_EQ(pump[0].text_value, "On");
    EXPECT_DOUBLE_EQ(pump[1].numeric_value, 0.0);
    EXPECT_EQ(pump[1].text_value, "Off");
}

TEST(series_loader_tests, time_stamp_column_can_move) {
    auto options = csv("A,Time\n1,2024-01-01 00:00:00\n2,2024-01-01 00:00:01\n");
    options.time_stamp_field_index = 1;
    const auto dataset = replayhub::load_dataset(options);
    ASSERT_EQ(dataset.points.at("A").size(), 2u);
    EXPECT_EQ(dataset.definitions.size(), 1u);
}

TEST(series_loader_tests, time_stamp_index_outside_header) {
    auto options = csv("Time,A\n2024-01-01 00:00:00,1\n");
    options.time_stamp_field_index = 2;
    EXPECT_THROW(replayhub::load_dataset(options), ConfigurationError);
}

TEST(series_loader_tests, invalid_time_zone) {
    auto options = csv("Time,A\n2024-01-01 00:00:00,1\n");
    options.time_zone = "Mars/Olympus_Mons";
    EXPECT_THROW(replayhub::load_dataset(options), ConfigurationError);
}

TEST(series_loader_tests, missing_source) {
    LoaderOptions options;
    EXPECT_THROW(replayhub::load_dataset(options), ConfigurationError);

    options.path = "/nonexistent/replayhub/data.csv";
    EXPECT_THROW(replayhub::load_dataset(options), ConfigurationError);
}

TEST(series_loader_tests, empty_source_is_degenerate_dataset) {
    const auto dataset = replayhub::load_dataset(csv(""));
    EXPECT_TRUE(dataset.empty());
    EXPECT_EQ(dataset.duration, replayhub::Duration::zero());
}

TEST(dataset_builder_tests, unordered_input_is_sorted) {
    replayhub::DatasetBuilder builder(true);
    builder.add("S", utc(20s), "3");
    builder.add("S", utc(0s), "1");
    builder.add("S", utc(10s), "2");
    EXPECT_FALSE(builder.add("s", utc(10s), "99"));
    const auto dataset = std::move(builder).build();

    EXPECT_TRUE(dataset.looping_enabled);
    const auto& points = dataset.points.at("S");
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].numeric_value, 1.0);
    EXPECT_DOUBLE_EQ(points[1].numeric_value, 2.0);
    EXPECT_DOUBLE_EQ(points[2].numeric_value, 3.0);
    EXPECT_EQ(dataset.values_skipped, 1u);
}
