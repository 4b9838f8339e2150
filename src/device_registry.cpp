// ============================================================================
// device_registry.cpp — implementation for bacgate/device_registry.hpp
// ============================================================================

#include "bacgate/device_registry.hpp"

#include <mutex>

namespace bacgate {

void DeviceRegistry::unlink_address(const BipAddress& address, uint32_t instance) {
    auto it = by_address_.find(address);
    if (it == by_address_.end()) return;
    it->second.erase(instance);
    if (it->second.empty()) by_address_.erase(it);
}

DeviceRecord DeviceRegistry::make_record(uint32_t instance, const Entry& e, Clock::time_point now) const {
    DeviceRecord r;
    r.instance  = instance;
    r.address   = e.address;
    r.vendor_id = e.vendor_id;
    r.last_seen = e.last_seen;
    r.stale     = (now - e.last_seen) > stale_after_;
    return r;
}

bool DeviceRegistry::upsert(uint32_t instance, const BipAddress& address, uint16_t vendor_id,
                            Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mu_);

    auto it = by_instance_.find(instance);
    const bool fresh = (it == by_instance_.end());
    if (!fresh && it->second.address != address)
        unlink_address(it->second.address, instance);    // device moved

    Entry& e = by_instance_[instance];
    e.address   = address;
    e.vendor_id = vendor_id;
    e.last_seen = now;
    by_address_[address].insert(instance);
    return fresh;
}

bool DeviceRegistry::touch(uint32_t instance, Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = by_instance_.find(instance);
    if (it == by_instance_.end()) return false;
    it->second.last_seen = now;
    return true;
}

std::vector<DeviceRecord> DeviceRegistry::snapshot(Clock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<DeviceRecord> out;
    out.reserve(by_instance_.size());
    for (const auto& kv : by_instance_) out.push_back(make_record(kv.first, kv.second, now));
    return out;
}

std::optional<DeviceRecord> DeviceRegistry::find(uint32_t instance, Clock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = by_instance_.find(instance);
    if (it == by_instance_.end()) return std::nullopt;
    return make_record(it->first, it->second, now);
}

Resolution DeviceRegistry::resolve_address_to_instance(const BipAddress& address) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    Resolution r;
    auto it = by_address_.find(address);
    if (it == by_address_.end() || it->second.empty()) return r;   // Unknown

    if (it->second.size() == 1) {
        r.kind = Resolution::Kind::Resolved;
        r.instance = *it->second.begin();
    } else {
        r.kind = Resolution::Kind::Ambiguous;
        r.candidates.assign(it->second.begin(), it->second.end());
    }
    return r;
}

size_t DeviceRegistry::evict_older_than(Clock::time_point cutoff) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    size_t n = 0;
    for (auto it = by_instance_.begin(); it != by_instance_.end();) {
        if (it->second.last_seen < cutoff) {
            unlink_address(it->second.address, it->first);
            it = by_instance_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return by_instance_.size();
}

} // namespace bacgate
