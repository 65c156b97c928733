#include "gateway/MeshEventRelay.h"

#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <type_traits>
#include <utility>

namespace meshirc::gateway {

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

std::string signal_tag(const mesh::SignalInfo& signal) {
    return "RSSI:" + util::or_na(signal.rssi) + " SNR:" + util::or_na(signal.snr, 1);
}

} // namespace

MeshEventRelay::MeshEventRelay(boost::asio::io_context& ioc,
                               NodeDirectory& directory,
                               RequestCorrelator& correlator,
                               chat::ChatServer& chat,
                               mesh::MeshInterface& mesh,
                               RelayOptions options)
    : ioc_(ioc),
      directory_(directory),
      correlator_(correlator),
      chat_(chat),
      mesh_(mesh),
      options_(options),
      queue_(options.queue_capacity),
      sweeper_(ioc, options.sweep_interval, [this] { sweep(RequestCorrelator::Clock::now()); }) {}

void MeshEventRelay::attach() {
    mesh_.subscribe([this](mesh::MeshEvent event) { enqueue(std::move(event)); });
}

void MeshEventRelay::enqueue(mesh::MeshEvent event) {
    if (!queue_.push(std::move(event))) {
        util::log_warning("relay") << "Event queue full; dropped oldest event (" << queue_.dropped() << " total)";
    }
    if (!drain_scheduled_.exchange(true)) {
        boost::asio::post(ioc_, [this] { drain(); });
    }
}

std::size_t MeshEventRelay::drain() {
    drain_scheduled_.store(false);
    auto events = queue_.take_all();
    for (const auto& event : events) {
        try {
            handle(event);
        } catch (const std::exception& e) {
            util::log_error("relay") << "Error processing mesh event: " << e.what();
            chat_.send_to_room(std::string("Error processing mesh event: ") + e.what(), "[GW ERROR]");
        }
    }
    return events.size();
}

void MeshEventRelay::handle(const mesh::MeshEvent& event) {
    std::visit([this](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, mesh::NodeHeard>) {
            on_node_heard_(ev);
        } else if constexpr (std::is_same_v<T, mesh::MessageReceived>) {
            on_message_(ev);
        } else if constexpr (std::is_same_v<T, mesh::DeliveryAcknowledged>) {
            on_resolved_(ev.id, Outcome::acknowledged());
        } else if constexpr (std::is_same_v<T, mesh::DeliveryFailed>) {
            on_resolved_(ev.id, Outcome::negative(ev.reason));
        } else if constexpr (std::is_same_v<T, mesh::PingReply>) {
            on_ping_reply_(ev);
        } else if constexpr (std::is_same_v<T, mesh::ConnectionStatus>) {
            on_status_(ev);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled mesh event");
        }
    }, event);
}

void MeshEventRelay::on_node_heard_(const mesh::NodeHeard& ev) {
    mesh::NodeUpdate update = ev.update;
    if (!update.heard_at) update.heard_at = mesh::WallClock::now();
    const bool created = directory_.upsert(ev.num, update);
    if (!created) return;

    auto rec = directory_.lookup(ev.num);
    const std::string id = rec ? rec->id : mesh::node_id_string(ev.num);
    const std::string name = rec && !rec->short_name.empty() ? rec->short_name : std::string("N/A");
    util::log_info("relay") << "New node heard: " << name << " (" << id << ")";
    if (options_.announce_new_nodes) {
        chat_.send_to_room("New node heard: " + name + " (" + id + ")", "[MESH]");
    }
}

void MeshEventRelay::on_message_(const mesh::MessageReceived& ev) {
    mesh::NodeUpdate seen;
    seen.heard_at = ev.rx_time == mesh::WallClock::time_point{} ? mesh::WallClock::now() : ev.rx_time;
    seen.rssi = ev.signal.rssi;
    seen.snr = ev.signal.snr;
    if (directory_.upsert(ev.from, seen)) {
        util::log_debug("relay") << "First message from unknown node " << mesh::node_id_string(ev.from);
    }

    const std::string sender = "<" + sender_label_(ev.from) + ">";
    const std::string prefix = "[MESH Rx ch" + std::to_string(ev.channel) + " " + signal_tag(ev.signal) + "]";

    if (ev.to == mesh::kBroadcastNum) {
        chat_.send_to_room(sender + " " + ev.text, prefix);
    } else if (ev.to == mesh_.my_node_num()) {
        chat_.send_to_room("DM From " + sender + ": " + ev.text, prefix);
    } else {
        util::log_debug("relay") << "Ignoring DM from " << sender << " to " << mesh::node_id_string(ev.to);
    }
}

void MeshEventRelay::on_resolved_(mesh::RequestId id, const Outcome& outcome) {
    auto note = correlator_.resolve(id, outcome);
    if (!note) {
        util::log_debug("relay") << "No pending request for id " << id;
        return;
    }
    chat_.send_to_session(note->requester, note->text);
}

void MeshEventRelay::on_ping_reply_(const mesh::PingReply& ev) {
    mesh::NodeUpdate seen;
    seen.heard_at = mesh::WallClock::now();
    seen.rssi = ev.signal.rssi;
    seen.snr = ev.signal.snr;
    directory_.upsert(ev.from, seen);

    if (ev.id != 0) {
        if (auto note = correlator_.resolve(ev.id, Outcome::pong(ev.signal))) {
            chat_.send_to_session(note->requester, note->text);
            return;
        }
    }
    chat_.send_to_room("PONG reply from <" + sender_label_(ev.from) + "> " + signal_tag(ev.signal), "[PING]");
}

void MeshEventRelay::on_status_(const mesh::ConnectionStatus& ev) {
    util::log_info("relay") << "Mesh status: " << ev.text;
    chat_.send_to_room("Mesh Status: " + ev.text, "[MESH]");
}

void MeshEventRelay::start_sweeping() { sweeper_.start(); }
void MeshEventRelay::stop_sweeping() { sweeper_.stop(); }

std::size_t MeshEventRelay::sweep(RequestCorrelator::Clock::time_point now) {
    auto expired = correlator_.sweep_expired(now);
    for (const auto& note : expired) {
        util::log_info("relay") << "Request for " << note.requester << " expired: " << note.text;
        chat_.send_to_session(note.requester, note.text);
    }
    return expired.size();
}

std::string MeshEventRelay::sender_label_(mesh::NodeNum num) const {
    if (auto rec = directory_.lookup(num)) return rec->display_name();
    return mesh::node_id_string(num);
}

} // namespace meshirc::gateway
