// ============================================================================
// pending_requests.cpp — implementation for bacgate/pending_requests.hpp
// ============================================================================

#include "bacgate/pending_requests.hpp"

namespace bacgate {

static inline uint8_t next_after(uint8_t id) {
    return id == 255 ? 1 : static_cast<uint8_t>(id + 1);
}

std::optional<uint8_t> PendingRequests::allocate(const PendingRequest& req) {
    std::lock_guard<std::mutex> lock(mu_);
    if (table_.full()) return std::nullopt;

    uint8_t id = next_id_;
    for (size_t tries = 0; tries < CAPACITY; ++tries, id = next_after(id)) {
        if (table_.find(id) != table_.end()) continue;   // still outstanding
        table_.insert(std::make_pair(id, req));
        next_id_ = next_after(id);
        return id;
    }
    return std::nullopt;
}

std::optional<PendingRequest> PendingRequests::complete(uint8_t invoke_id, const BipAddress& source,
                                                        uint8_t service) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = table_.find(invoke_id);
    if (it == table_.end()) return std::nullopt;
    if (it->second.target != source || it->second.service != service) return std::nullopt;

    PendingRequest req = it->second;
    table_.erase(it);
    return req;
}

std::vector<std::pair<uint8_t, PendingRequest>> PendingRequests::expire(Clock::time_point now) {
    std::vector<std::pair<uint8_t, PendingRequest>> out;
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = table_.begin(); it != table_.end();) {
        if (it->second.deadline <= now) {
            out.emplace_back(it->first, it->second);
            it = table_.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

bool PendingRequests::release(uint8_t invoke_id) {
    std::lock_guard<std::mutex> lock(mu_);
    return table_.erase(invoke_id) > 0;
}

std::optional<PendingRequests::Clock::time_point> PendingRequests::next_deadline() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::optional<Clock::time_point> earliest;
    for (const auto& kv : table_)
        if (!earliest || kv.second.deadline < *earliest) earliest = kv.second.deadline;
    return earliest;
}

size_t PendingRequests::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return table_.size();
}

bool PendingRequests::contains(uint8_t invoke_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return table_.find(invoke_id) != table_.end();
}

} // namespace bacgate
