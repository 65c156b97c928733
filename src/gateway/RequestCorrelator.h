#pragma once

#include "mesh/MeshTypes.h"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meshirc::gateway {

enum class RequestKind { DirectMessage, Ping };

struct PendingRequest {
    using Clock = std::chrono::steady_clock;

    mesh::RequestId id = 0;
    RequestKind kind = RequestKind::DirectMessage;
    std::string requester;        // nickname to notify
    mesh::NodeNum target = 0;
    std::string target_label;     // e.g. "MK1 (!00bc614e)"
    Clock::time_point created_at{};
    Clock::time_point deadline{};
};

struct Outcome {
    enum class Kind { Acknowledged, NegativeAcknowledged, Pong };

    static Outcome acknowledged() { return Outcome{Kind::Acknowledged, {}, {}}; }
    static Outcome negative(std::string reason) { return Outcome{Kind::NegativeAcknowledged, std::move(reason), {}}; }
    static Outcome pong(mesh::SignalInfo signal) { return Outcome{Kind::Pong, {}, signal}; }

    Kind kind = Kind::Acknowledged;
    std::string reason;
    mesh::SignalInfo signal;
};

// A chat line owed to one requester.
struct Notification {
    std::string requester;
    std::string text;
};

// Tracks mesh operations still waiting for a terminal event. Each request is
// reported exactly once: by resolve() or by sweep_expired(), whichever comes
// first.
class RequestCorrelator {
public:
    using Clock = PendingRequest::Clock;

    // False (and no change) if the id is already tracked.
    bool add(PendingRequest request);

    // Unknown or already-finished ids yield nothing.
    std::optional<Notification> resolve(mesh::RequestId id, const Outcome& outcome,
                                        Clock::time_point now = Clock::now());

    std::vector<Notification> sweep_expired(Clock::time_point now);

    std::size_t drop_requester(std::string_view nick);
    void rename_requester(std::string_view old_nick, const std::string& new_nick);

    bool contains(mesh::RequestId id) const;
    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<mesh::RequestId, PendingRequest> pending_;
};

} // namespace meshirc::gateway
