#pragma once

#include "mesh/MeshTypes.h"

#include <string>
#include <variant>

namespace meshirc::mesh {

struct NodeHeard {
    NodeNum num = 0;
    NodeUpdate update;
};

struct MessageReceived {
    NodeNum from = 0;
    NodeNum to   = kBroadcastNum;
    int channel  = 0;
    std::string text;
    SignalInfo signal;
    WallClock::time_point rx_time{};
};

struct DeliveryAcknowledged {
    RequestId id = 0;
    NodeNum from = 0;
};

struct DeliveryFailed {
    RequestId id = 0;
    std::string reason;
};

// id is 0 when the reply cannot be tied to a request.
struct PingReply {
    RequestId id = 0;
    NodeNum from = 0;
    SignalInfo signal;
};

struct ConnectionStatus {
    std::string text;
};

using MeshEvent = std::variant<NodeHeard,
                               MessageReceived,
                               DeliveryAcknowledged,
                               DeliveryFailed,
                               PingReply,
                               ConnectionStatus>;

} // namespace meshirc::mesh
