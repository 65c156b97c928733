#pragma once

#include "lookup/DataLookup.h"

#include <boost/json/value.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace meshirc::lookup {

struct WeatherSettings {
    std::string api_key;
    std::string location;
    std::string units = "metric";   // "metric" or "imperial"
    std::string url = "http://api.openweathermap.org/data/2.5/weather";
    std::chrono::seconds timeout{10};
};

// Current conditions from OpenWeatherMap.
class WeatherLookup : public DataLookup {
public:
    explicit WeatherLookup(WeatherSettings settings);

    std::optional<std::string> configuration_problem() const override;
    std::string progress_line() const override;
    std::vector<std::string> fetch() override;

private:
    WeatherSettings settings_;
};

// Turns an OpenWeatherMap "current weather" document into report lines.
// Throws LookupError if the document lacks the "main"/"weather" sections.
std::vector<std::string> format_weather_report(const boost::json::value& data, const WeatherSettings& settings);

} // namespace meshirc::lookup
