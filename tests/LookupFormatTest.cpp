#include "lookup/HfConditionsLookup.h"
#include "lookup/WeatherLookup.h"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace meshirc::lookup;
namespace json = boost::json;

TEST(WeatherFormat, MetricReport) {
    const json::value doc = json::parse(R"({
        "name": "Port Colborne",
        "weather": [{"description": "light rain"}],
        "main": {"temp": 12.34, "feels_like": 10, "humidity": 81, "pressure": 1012},
        "wind": {"speed": 4.1, "deg": 230}
    })");
    WeatherSettings settings;
    settings.location = "Port Colborne,CA";

    const auto lines = format_weather_report(doc, settings);
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[0], "--- Weather for Port Colborne (as of N/A) ---");
    EXPECT_EQ(lines[1], "Conditions: Light rain");
    EXPECT_EQ(lines[2], "Temperature: 12.3\xC2\xB0" "C (Feels like: 10.0\xC2\xB0" "C)");
    EXPECT_EQ(lines[3], "Humidity: 81% | Pressure: 1012 hPa");
    EXPECT_EQ(lines[4], "Wind: 4.1m/s (230\xC2\xB0)");
    EXPECT_EQ(lines[5], "Sunrise: N/A | Sunset: N/A");
    EXPECT_EQ(lines[6], "--- End of Weather ---");
}

TEST(WeatherFormat, ImperialAndMissingFields) {
    const json::value doc = json::parse(R"({"weather": [{}], "main": {}})");
    WeatherSettings settings;
    settings.location = "Buffalo,US";
    settings.units = "imperial";

    const auto lines = format_weather_report(doc, settings);
    EXPECT_EQ(lines[0], "--- Weather for Buffalo,US (as of N/A) ---");
    EXPECT_EQ(lines[1], "Conditions: N/A");
    EXPECT_EQ(lines[2], "Temperature: N/A (Feels like: N/A)");
    EXPECT_EQ(lines[4], "Wind: N/A");
}

TEST(WeatherFormat, MissingSectionsAreRejected) {
    WeatherSettings settings;
    EXPECT_THROW(format_weather_report(json::parse(R"({"cod": 404})"), settings), LookupError);
    EXPECT_THROW(format_weather_report(json::parse(R"({"main": {}, "weather": []})"), settings), LookupError);
}

TEST(WeatherLookup, NeedsKeyAndLocation) {
    WeatherSettings settings;
    settings.location = "Port Colborne,CA";
    WeatherLookup without_key(settings);
    EXPECT_TRUE(without_key.configuration_problem().has_value());
    EXPECT_THROW(without_key.fetch(), LookupError);

    settings.api_key = "abc";
    WeatherLookup configured(settings);
    EXPECT_FALSE(configured.configuration_problem().has_value());
    EXPECT_EQ(configured.progress_line(), "Fetching weather for Port Colborne,CA...");
}

TEST(HfFormat, KpDescriptions) {
    EXPECT_EQ(describe_kp(0), "Inactive");
    EXPECT_EQ(describe_kp(1), "Inactive");
    EXPECT_EQ(describe_kp(2), "Quiet");
    EXPECT_EQ(describe_kp(3), "Unsettled");
    EXPECT_EQ(describe_kp(4), "Active");
    EXPECT_EQ(describe_kp(5), "Minor Storm");
    EXPECT_EQ(describe_kp(6), "Major Storm");
    EXPECT_EQ(describe_kp(9), "Severe/Extreme Storm");
}

TEST(HfFormat, UsesLatestSummary) {
    const json::value doc = json::parse(R"([
        {"issue_datetime": "2024-04-30T00:00:00Z", "10cm_flux": 99, "kp_index": [1]},
        {"issue_datetime": "2024-05-01T00:00:00Z", "10cm_flux": 150, "kp_index": [1, 2, "5.33"],
         "r_scale_forecast": ["R1-R2: 35%", "R3: 5%"]},
        {"issue_datetime": "not a date", "10cm_flux": 1}
    ])");

    EXPECT_EQ(format_hf_report(doc), (std::vector<std::string>{
        "--- HF Conditions (Source: NOAA SWPC @ 2024-05-01 00:00 Z) ---",
        "Solar Flux (10.7cm): 150",
        "Planetary K-Index (Kp): 5.33",
        "Geomagnetic Activity: Minor Storm (Kp=5)",
        "--- Forecasts (Next ~24hrs) ---",
        "Radio Blackout (R): R1-R2: 35%",
        "--- End of HF Conditions ---",
    }));
}

TEST(HfFormat, FallbackKeysAndNonNumericKp) {
    const json::value doc = json::parse(R"([
        {"issue_datetime": "2024-05-01 06:00", "f107": 120, "kp": "unknown", "geomagnetic_storm": "G1"}
    ])");

    const auto lines = format_hf_report(doc);
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[1], "Solar Flux (10.7cm): 120");
    EXPECT_EQ(lines[3], "Geomagnetic Activity: N/A (Kp=unknown)");
    EXPECT_EQ(lines[5], "Geomagnetic Storm (G): G1");
}

TEST(HfFormat, NothingUsable) {
    EXPECT_THROW(format_hf_report(json::parse("[]")), LookupError);
    EXPECT_THROW(format_hf_report(json::parse(R"({"issue_datetime": "2024-05-01T00:00:00Z"})")), LookupError);
    EXPECT_THROW(format_hf_report(json::parse(R"([{"10cm_flux": 150}])")), LookupError);
}
