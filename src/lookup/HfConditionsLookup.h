#pragma once

#include "lookup/DataLookup.h"

#include <boost/json/value.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace meshirc::lookup {

struct HfConditionsSettings {
    std::string url = "https://services.swpc.noaa.gov/products/summary/3-day-forecast.json";
    std::chrono::seconds timeout{15};
};

// Solar flux, Kp and R/G/S forecasts from the NOAA SWPC summary product.
class HfConditionsLookup : public DataLookup {
public:
    explicit HfConditionsLookup(HfConditionsSettings settings);

    std::optional<std::string> configuration_problem() const override;
    std::string progress_line() const override;
    std::vector<std::string> fetch() override;

private:
    HfConditionsSettings settings_;
};

// "Inactive" .. "Severe/Extreme Storm" for a planetary K index.
std::string describe_kp(int kp);

// Picks the most recently issued summary and formats it. Throws LookupError
// when no entry carries a usable issue_datetime.
std::vector<std::string> format_hf_report(const boost::json::value& data);

} // namespace meshirc::lookup
