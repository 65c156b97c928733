#include "lookup/WeatherLookup.h"

#include "Version.h"
#include "lookup/JsonFields.hpp"
#include "networking/HttpClient.h"
#include "util/Log.hpp"
#include "util/Time.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/json.hpp>

#include <cctype>
#include <stdexcept>
#include <utility>

namespace meshirc::lookup {

namespace {

constexpr const char* kUserAgent = "MeshIrcGateway/" MESHIRC_VERSION;

std::string capitalize(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

std::string clock_at(const json::object& obj, std::string_view key, const char* fmt) {
    if (auto ts = number_at(obj, key)) {
        return util::format_local(util::from_epoch_seconds(static_cast<std::int64_t>(*ts)), fmt);
    }
    return "N/A";
}

} // namespace

WeatherLookup::WeatherLookup(WeatherSettings settings)
    : settings_(std::move(settings)) {}

std::optional<std::string> WeatherLookup::configuration_problem() const {
    if (settings_.api_key.empty() || settings_.location.empty()) {
        return std::string("Weather command is not configured (API key or location missing).");
    }
    return std::nullopt;
}

std::string WeatherLookup::progress_line() const {
    return "Fetching weather for " + settings_.location + "...";
}

std::vector<std::string> WeatherLookup::fetch() {
    if (auto problem = configuration_problem()) throw LookupError(*problem);

    const std::string url = settings_.url +
                            "?q=" + networking::url_encode(settings_.location) +
                            "&appid=" + networking::url_encode(settings_.api_key) +
                            "&units=" + networking::url_encode(settings_.units);

    networking::HttpResponse response;
    try {
        response = networking::http_get(url, settings_.timeout, kUserAgent);
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::beast::error::timeout) {
            util::log_error("weather") << "Weather API request timed out";
            throw LookupError("Error: Request to weather API timed out.");
        }
        util::log_error("weather") << "Weather API request failed: " << e.what();
        throw LookupError("Error fetching weather data: Network or connection issue.");
    } catch (const std::invalid_argument& e) {
        util::log_error("weather") << "Bad weather URL: " << e.what();
        throw LookupError("Error: Weather API URL is invalid.");
    }

    if (response.status != 200) {
        util::log_error("weather") << "Weather API HTTP error: " << response.status << " - " << response.body;
        switch (response.status) {
            case 401: throw LookupError("Error: Invalid weather API key.");
            case 404: throw LookupError("Error: Weather location '" + settings_.location + "' not found.");
            case 429: throw LookupError("Error: Weather API rate limit exceeded.");
            default:
                throw LookupError("Error: Weather API returned status code " + std::to_string(response.status) + ".");
        }
    }

    boost::system::error_code ec;
    json::value data = json::parse(response.body, ec);
    if (ec) {
        util::log_error("weather") << "Weather API returned invalid JSON: " << ec.message();
        throw LookupError("Error: Received invalid data format from weather API.");
    }
    util::log_debug("weather") << "OpenWeatherMap response: " << response.body;

    return format_weather_report(data, settings_);
}

std::vector<std::string> format_weather_report(const json::value& data, const WeatherSettings& settings) {
    const json::object* root = data.if_object();
    const json::object* main = nullptr;
    const json::object* weather = nullptr;
    if (root) {
        if (const json::value* m = root->if_contains("main")) main = m->if_object();
        if (const json::value* w = root->if_contains("weather")) {
            if (const json::array* arr = w->if_array(); arr && !arr->empty()) weather = (*arr)[0].if_object();
        }
    }
    if (!main || !weather) {
        util::log_error("weather") << "Unexpected API response format: " << json::serialize(data);
        throw LookupError("Error: Received unexpected data format from weather API.");
    }

    static const json::object empty;
    const json::object* wind = &empty;
    const json::object* sys = &empty;
    if (const json::value* v = root->if_contains("wind"); v && v->is_object()) wind = &v->get_object();
    if (const json::value* v = root->if_contains("sys"); v && v->is_object()) sys = &v->get_object();

    const bool metric = settings.units == "metric";
    const std::string unit = metric ? "\xC2\xB0" "C" : "\xC2\xB0" "F";
    const std::string speed_unit = metric ? "m/s" : "mph";

    auto temp_str = [&](std::string_view key) {
        auto v = number_at(*main, key);
        return v ? util::format_fixed(*v, 1) + unit : std::string("N/A");
    };

    const auto humidity = number_at(*main, "humidity");
    const auto pressure = number_at(*main, "pressure");
    const auto wind_speed = number_at(*wind, "speed");
    const auto wind_deg = number_at(*wind, "deg");

    std::string wind_str = wind_speed ? util::format_fixed(*wind_speed, 1) + speed_unit : std::string("N/A");
    if (wind_deg) wind_str += " (" + plain_number(*wind_deg) + "\xC2\xB0)";

    const std::string location = string_at(*root, "name").value_or(settings.location);
    const auto raw_description = string_at(*weather, "description");
    const std::string description = raw_description ? capitalize(*raw_description) : std::string("N/A");

    return {
        "--- Weather for " + location + " (as of " + clock_at(*root, "dt", "%H:%M:%S %Z") + ") ---",
        "Conditions: " + description,
        "Temperature: " + temp_str("temp") + " (Feels like: " + temp_str("feels_like") + ")",
        "Humidity: " + (humidity ? plain_number(*humidity) + "%" : std::string("N/A")) +
            " | Pressure: " + (pressure ? plain_number(*pressure) + " hPa" : std::string("N/A")),
        "Wind: " + wind_str,
        "Sunrise: " + clock_at(*sys, "sunrise", "%H:%M") + " | Sunset: " + clock_at(*sys, "sunset", "%H:%M"),
        "--- End of Weather ---",
    };
}

} // namespace meshirc::lookup
