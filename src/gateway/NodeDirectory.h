#pragma once

#include "mesh/MeshTypes.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshirc::gateway {

struct NodeRecord {
    mesh::NodeNum num = 0;
    std::string id;
    std::string short_name;
    std::string long_name;
    std::string hw_model;

    std::optional<mesh::WallClock::time_point> last_heard;
    std::optional<float> snr;
    std::optional<int>   rssi;
    std::optional<int>   hops_away;

    std::optional<mesh::Position>      position;
    std::optional<mesh::DeviceMetrics> metrics;

    // Short name, else long name, else id.
    std::string display_name() const;
};

// Every node the gateway has ever heard of, keyed by node number. Entries are
// never removed for the lifetime of the process.
class NodeDirectory {
public:
    // Merges the set fields of `update` into the record (creating it if
    // needed). Returns true when the record is new.
    bool upsert(mesh::NodeNum num, const mesh::NodeUpdate& update);

    std::optional<NodeRecord> lookup(mesh::NodeNum num) const;
    std::vector<NodeRecord> all() const;
    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<mesh::NodeNum, NodeRecord> nodes_;
};

} // namespace meshirc::gateway
