#include "lookup/HfConditionsLookup.h"

#include "Version.h"
#include "lookup/JsonFields.hpp"
#include "networking/HttpClient.h"
#include "util/Log.hpp"
#include "util/Time.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/json.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace meshirc::lookup {

namespace {

constexpr const char* kUserAgent = "MeshIrcGateway/" MESHIRC_VERSION;

// First key present wins; lists collapse to one element (front or back).
std::string pick(const json::object& obj, std::string_view key, std::string_view fallback, bool take_last) {
    const json::value* v = obj.if_contains(key);
    if (!v) v = obj.if_contains(fallback);
    if (!v) return "N/A";
    if (const json::array* arr = v->if_array()) {
        if (arr->empty()) return display(*v);
        return display(take_last ? arr->back() : arr->front());
    }
    return display(*v);
}

} // namespace

HfConditionsLookup::HfConditionsLookup(HfConditionsSettings settings)
    : settings_(std::move(settings)) {}

std::optional<std::string> HfConditionsLookup::configuration_problem() const {
    if (settings_.url.empty()) {
        return std::string("HF Conditions command is not configured (data source URL missing).");
    }
    return std::nullopt;
}

std::string HfConditionsLookup::progress_line() const {
    return "Fetching HF conditions from NOAA SWPC...";
}

std::vector<std::string> HfConditionsLookup::fetch() {
    if (auto problem = configuration_problem()) throw LookupError(*problem);

    networking::HttpResponse response;
    try {
        response = networking::http_get(settings_.url, settings_.timeout, kUserAgent);
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::beast::error::timeout) {
            util::log_error("hf") << "NOAA SWPC request timed out";
            throw LookupError("Error: Request to NOAA SWPC timed out.");
        }
        util::log_error("hf") << "NOAA SWPC request failed: " << e.what();
        throw LookupError("Error fetching HF conditions data: Network or connection issue.");
    } catch (const std::invalid_argument& e) {
        util::log_error("hf") << "Bad SWPC URL: " << e.what();
        throw LookupError("Error fetching HF conditions data: Network or connection issue.");
    }

    if (response.status < 200 || response.status >= 300) {
        util::log_error("hf") << "NOAA SWPC HTTP error: " << response.status << " - " << response.body;
        throw LookupError("Error: NOAA SWPC returned status code " + std::to_string(response.status) + ".");
    }

    boost::system::error_code ec;
    json::value data = json::parse(response.body, ec);
    if (ec) {
        util::log_error("hf") << "Failed to decode JSON response from SWPC: " << ec.message();
        throw LookupError("Error: Received invalid data format from SWPC.");
    }
    return format_hf_report(data);
}

std::string describe_kp(int kp) {
    if (kp <= 1) return "Inactive";
    switch (kp) {
        case 2: return "Quiet";
        case 3: return "Unsettled";
        case 4: return "Active";
        case 5: return "Minor Storm";
        case 6: return "Major Storm";
        default: return "Severe/Extreme Storm";
    }
}

std::vector<std::string> format_hf_report(const json::value& data) {
    const json::object* latest = nullptr;
    util::WallClock::time_point latest_ts{};
    std::string issued_raw;

    if (const json::array* entries = data.if_array()) {
        for (const json::value& entry : *entries) {
            const json::object* obj = entry.if_object();
            if (!obj) continue;
            auto issued = string_at(*obj, "issue_datetime");
            if (!issued) continue;
            auto ts = util::parse_iso8601_utc(*issued);
            if (!ts) {
                util::log_warning("hf") << "Could not parse timestamp: " << *issued;
                continue;
            }
            if (!latest || *ts > latest_ts) {
                latest = obj;
                latest_ts = *ts;
                issued_raw = *issued;
            }
        }
    }
    if (!latest) {
        util::log_warning("hf") << "No SWPC summary entry with a valid issue_datetime";
        throw LookupError("Error: Could not parse relevant data from SWPC response.");
    }
    util::log_debug("hf") << "Using SWPC summary issued at " << issued_raw;

    const std::string kp = pick(*latest, "kp_index", "kp", true);
    const std::string flux = pick(*latest, "10cm_flux", "f107", false);
    const std::string r_scale = pick(*latest, "r_scale_forecast", "radio_blackout", false);
    const std::string g_scale = pick(*latest, "g_scale_forecast", "geomagnetic_storm", false);
    const std::string s_scale = pick(*latest, "s_scale_forecast", "solar_radiation_storm", false);

    std::vector<std::string> lines;
    lines.push_back("--- HF Conditions (Source: NOAA SWPC @ " + util::format_utc(latest_ts, "%Y-%m-%d %H:%M Z") + ") ---");
    lines.push_back("Solar Flux (10.7cm): " + flux);
    lines.push_back("Planetary K-Index (Kp): " + kp);

    auto kp_value = as_number(json::value(json::string_view(kp)));
    if (kp_value && std::isfinite(*kp_value)) {
        const int kp_int = static_cast<int>(*kp_value);
        lines.push_back("Geomagnetic Activity: " + describe_kp(kp_int) + " (Kp=" + std::to_string(kp_int) + ")");
    } else {
        lines.push_back("Geomagnetic Activity: N/A (Kp=" + kp + ")");
    }

    lines.push_back("--- Forecasts (Next ~24hrs) ---");
    if (r_scale != "N/A") lines.push_back("Radio Blackout (R): " + r_scale);
    if (g_scale != "N/A") lines.push_back("Geomagnetic Storm (G): " + g_scale);
    if (s_scale != "N/A") lines.push_back("Solar Radiation Storm (S): " + s_scale);
    lines.push_back("--- End of HF Conditions ---");
    return lines;
}

} // namespace meshirc::lookup
