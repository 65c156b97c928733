#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace meshirc::mesh {

using NodeNum   = std::uint32_t;
using RequestId = std::uint32_t;
using WallClock = std::chrono::system_clock;

static constexpr NodeNum kBroadcastNum = 0xFFFFFFFFu;

// Conventional "!xxxxxxxx" identifier for a node number.
inline std::string node_id_string(NodeNum num) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "!%08x", static_cast<unsigned>(num));
    return buf;
}

struct SignalInfo {
    std::optional<int>   rssi;
    std::optional<float> snr;
};

struct Position {
    double latitude  = 0.0;
    double longitude = 0.0;
    std::optional<int> altitude;                  // metres
    std::optional<WallClock::time_point> time;    // fix time
};

struct DeviceMetrics {
    std::optional<int>           battery_level;   // percent
    std::optional<float>         voltage;
    std::optional<float>         channel_utilization;
    std::optional<float>         air_util_tx;
    std::optional<std::uint32_t> uptime_seconds;
};

// Partial node attributes as carried by a mesh event. Unset fields leave the
// cached value untouched.
struct NodeUpdate {
    std::optional<std::string> id;
    std::optional<std::string> short_name;
    std::optional<std::string> long_name;
    std::optional<std::string> hw_model;
    std::optional<float>       snr;
    std::optional<int>         rssi;
    std::optional<int>         hops_away;
    std::optional<Position>      position;
    std::optional<DeviceMetrics> metrics;
    std::optional<WallClock::time_point> heard_at;
};

} // namespace meshirc::mesh
