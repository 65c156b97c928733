#pragma once

#include "mesh/MeshEvents.h"
#include "mesh/MeshTypes.h"

#include <functional>
#include <stdexcept>
#include <string>

namespace meshirc::mesh {

// Thrown when the mesh interface rejects an operation synchronously.
class MeshError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Destination {
    static Destination channel(int index) { return Destination{index, kBroadcastNum}; }
    static Destination node(NodeNum num)  { return Destination{0, num}; }

    bool is_broadcast() const noexcept { return node_num == kBroadcastNum; }

    int channel_index = 0;
    NodeNum node_num  = kBroadcastNum;
};

// Capability the gateway core needs from a mesh radio. Events are delivered on
// the implementation's own thread; subscribers must hand them off.
class MeshInterface {
public:
    using EventSink = std::function<void(MeshEvent)>;

    virtual ~MeshInterface() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    virtual void subscribe(EventSink sink) = 0;

    virtual RequestId send_text(const Destination& dest, const std::string& text, bool want_ack) = 0;
    virtual RequestId ping(NodeNum target) = 0;

    virtual NodeNum my_node_num() const = 0;
    virtual std::string describe() const = 0;
};

} // namespace meshirc::mesh
