#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshirc::lookup {

// A lookup that could not produce a report. what() is shown to the user.
class LookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A request/response data source returning display-ready lines.
class DataLookup {
public:
    virtual ~DataLookup() = default;

    // Set when the lookup cannot run at all (missing key, missing URL...).
    virtual std::optional<std::string> configuration_problem() const = 0;

    // One line announcing the fetch ("Fetching weather for ...").
    virtual std::string progress_line() const = 0;

    // Blocking. Throws LookupError.
    virtual std::vector<std::string> fetch() = 0;
};

} // namespace meshirc::lookup
