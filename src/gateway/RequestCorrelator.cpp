#include "gateway/RequestCorrelator.h"

#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <utility>

namespace meshirc::gateway {

namespace {

const char* verb_of(RequestKind kind) {
    return kind == RequestKind::Ping ? "PING" : "DM";
}

std::string resolution_text(const PendingRequest& req, const Outcome& outcome,
                            PendingRequest::Clock::time_point now) {
    switch (outcome.kind) {
        case Outcome::Kind::Acknowledged:
            if (req.kind == RequestKind::Ping) return "[ACK] PING to " + req.target_label + " acknowledged";
            return "[ACK] DM to " + req.target_label + " delivered";

        case Outcome::Kind::NegativeAcknowledged: {
            const std::string reason = outcome.reason.empty() ? "unknown error" : outcome.reason;
            return std::string("[NAK] ") + verb_of(req.kind) + " to " + req.target_label + " failed: " + reason;
        }

        case Outcome::Kind::Pong: {
            const double rtt = std::chrono::duration<double>(now - req.created_at).count();
            return "[PONG] Reply from " + req.target_label +
                   " RSSI:" + util::or_na(outcome.signal.rssi) +
                   " SNR:" + util::or_na(outcome.signal.snr, 1) +
                   " RTT:" + util::format_fixed(std::max(rtt, 0.0), 1) + "s";
        }
    }
    return std::string("[GW] ") + verb_of(req.kind) + " to " + req.target_label + " finished";
}

std::string timeout_text(const PendingRequest& req) {
    const auto waited = std::chrono::duration_cast<std::chrono::seconds>(req.deadline - req.created_at).count();
    if (req.kind == RequestKind::Ping) {
        return "[TIMEOUT] PING to " + req.target_label + " got no reply after " + std::to_string(waited) + "s";
    }
    return "[TIMEOUT] DM to " + req.target_label + " not acknowledged after " + std::to_string(waited) + "s";
}

} // namespace

bool RequestCorrelator::add(PendingRequest request) {
    std::lock_guard<std::mutex> lk(mu_);
    const mesh::RequestId id = request.id;
    auto [it, inserted] = pending_.try_emplace(id, std::move(request));
    if (!inserted) {
        util::log_warning("Correlator") << "Request " << id << " is already pending, ignoring duplicate";
        return false;
    }
    util::log_debug("Correlator") << "Tracking " << verb_of(it->second.kind) << " request " << id
                                  << " for " << it->second.requester;
    return true;
}

std::optional<Notification> RequestCorrelator::resolve(mesh::RequestId id, const Outcome& outcome,
                                                       Clock::time_point now) {
    PendingRequest req;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            util::log_debug("Correlator") << "No pending request " << id << ", ignoring completion";
            return std::nullopt;
        }
        req = std::move(it->second);
        pending_.erase(it);
    }
    return Notification{req.requester, resolution_text(req, outcome, now)};
}

std::vector<Notification> RequestCorrelator::sweep_expired(Clock::time_point now) {
    std::vector<PendingRequest> expired;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::sort(expired.begin(), expired.end(),
              [](const PendingRequest& a, const PendingRequest& b) { return a.deadline < b.deadline; });

    std::vector<Notification> out;
    out.reserve(expired.size());
    for (const auto& req : expired) {
        util::log_info("Correlator") << verb_of(req.kind) << " request " << req.id << " to "
                                     << req.target_label << " timed out";
        out.push_back(Notification{req.requester, timeout_text(req)});
    }
    return out;
}

std::size_t RequestCorrelator::drop_requester(std::string_view nick) {
    const std::string folded = util::irc_lower(nick);
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t dropped = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (util::irc_lower(it->second.requester) == folded) {
            it = pending_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void RequestCorrelator::rename_requester(std::string_view old_nick, const std::string& new_nick) {
    const std::string folded = util::irc_lower(old_nick);
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& [id, req] : pending_) {
        if (util::irc_lower(req.requester) == folded) req.requester = new_nick;
    }
}

bool RequestCorrelator::contains(mesh::RequestId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.count(id) != 0;
}

std::size_t RequestCorrelator::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

} // namespace meshirc::gateway
