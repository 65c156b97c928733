#include "gateway/NodeDirectory.h"

namespace meshirc::gateway {

std::string NodeRecord::display_name() const {
    if (!short_name.empty()) return short_name;
    if (!long_name.empty()) return long_name;
    return id.empty() ? mesh::node_id_string(num) : id;
}

bool NodeDirectory::upsert(mesh::NodeNum num, const mesh::NodeUpdate& update) {
    std::lock_guard<std::mutex> lk(mu_);

    auto [it, created] = nodes_.try_emplace(num);
    NodeRecord& rec = it->second;
    if (created) {
        rec.num = num;
        rec.id = mesh::node_id_string(num);
    }

    if (update.id && !update.id->empty()) rec.id = *update.id;
    if (update.short_name) rec.short_name = *update.short_name;
    if (update.long_name)  rec.long_name  = *update.long_name;
    if (update.hw_model)   rec.hw_model   = *update.hw_model;
    if (update.snr)        rec.snr        = update.snr;
    if (update.rssi)       rec.rssi       = update.rssi;
    if (update.hops_away)  rec.hops_away  = update.hops_away;
    if (update.position)   rec.position   = update.position;
    if (update.metrics)    rec.metrics    = update.metrics;

    // Out-of-order delivery must not move last-heard backwards.
    if (update.heard_at && (!rec.last_heard || *update.heard_at > *rec.last_heard)) {
        rec.last_heard = update.heard_at;
    }

    return created;
}

std::optional<NodeRecord> NodeDirectory::lookup(mesh::NodeNum num) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = nodes_.find(num);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeRecord> NodeDirectory::all() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<NodeRecord> out;
    out.reserve(nodes_.size());
    for (const auto& [num, rec] : nodes_) out.push_back(rec);
    return out;
}

std::size_t NodeDirectory::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return nodes_.size();
}

} // namespace meshirc::gateway
