// ============================================================================
// bridge.cpp — implementation for bacgate/bridge.hpp
// ============================================================================

#include "bacgate/bridge.hpp"

#include <cmath>        // std::isfinite: NaN/Inf never reach MQTT

#include "bacgate/log.hpp"
#include "bacgate/payload.hpp"

namespace bacgate {

Bridge::Bridge(DeviceRegistry& registry, IPublisher& publisher, Options opts)
    : registry_(registry), publisher_(publisher), opts_(std::move(opts)) {}

bool Bridge::publish(const std::string& topic, const std::string& payload) {
    if (publisher_.publish(topic, payload, true, Qos::AtLeastOnce)) return true;
    ++publish_failures_;
    log_error("bridge: publish to " + topic + " failed");
    return false;
}

// ---------------------------------------------------------------------------
// I-Am: registry first, then discovery config, then availability.
// ---------------------------------------------------------------------------
void Bridge::on_i_am(const BacnetEvent& ev, Clock::time_point now) {
    const uint32_t instance = ev.i_am.device.instance;
    const bool fresh = registry_.upsert(instance, ev.source, ev.i_am.vendor_id, now);
    if (fresh)
        log_info("Discovered BACnet device " + std::to_string(instance) + " at " + ev.source.to_string());
    else
        log_debug("I-Am refresh for device " + std::to_string(instance) + " at " + ev.source.to_string());

    const DiscoveryConfig cfg = make_discovery_config(opts_.discovery_prefix, instance, ev.i_am.vendor_id);
    if (publish(discovery_topic(opts_.discovery_prefix, cfg.unique_id), serialize(cfg)))
        log_debug("published discovery for " + cfg.unique_id);
    publish(cfg.state_topic, "online");
}

void Bridge::on_read_ack(const BacnetEvent& ev, Clock::time_point now) {
    const ReadPropertyAck& ack = ev.read_ack;
    if (ack.property != PROP_PRESENT_VALUE) {
        log_debug("bridge: ignoring property " + std::to_string(ack.property) + " from " + ev.source.to_string());
        return;
    }

    const auto value = decode_real(ack.value);
    if (!value) {
        log_debug("bridge: present-value from " + ev.source.to_string() + " is not REAL, raw=" +
                  to_hex(ack.value.raw));
        return;
    }
    if (!std::isfinite(*value)) {
        log_warn("bridge: non-finite present-value from " + ev.source.to_string() + ", not published");
        return;
    }

    const Resolution who = registry_.resolve_address_to_instance(ev.source);
    switch (who.kind) {
        case Resolution::Kind::Unknown:
            log_warn("bridge: value from unregistered address " + ev.source.to_string() + " dropped");
            return;
        case Resolution::Kind::Ambiguous:
            log_warn("bridge: " + std::to_string(who.candidates.size()) + " devices share " +
                     ev.source.to_string() + ", value dropped");
            return;
        case Resolution::Kind::Resolved:
            break;
    }

    const std::string text = format_value(*value);
    log_info("Device " + std::to_string(who.instance) + " AI " + std::to_string(ack.object.instance) +
             " value " + text);
    registry_.touch(who.instance, now);
    publish(state_topic(opts_.discovery_prefix, unique_id_for(who.instance)), text);
}

void Bridge::handle(const BacnetEvent& ev, Clock::time_point now) {
    switch (ev.kind) {
        case EventKind::IAm:
            on_i_am(ev, now);
            break;
        case EventKind::ReadPropertyAck:
            on_read_ack(ev, now);
            break;
        case EventKind::RequestTimeout:
            log_warn("request timed out: " + describe(ev));
            break;
        case EventKind::WhoIs:
        case EventKind::ReadPropertyRequest:
            log_debug("received " + describe(ev));
            break;
    }
}

void Bridge::run(EventChannel& channel) {
    log_info("bridge: started");
    BacnetEvent ev;
    while (channel.pop(ev)) handle(ev, Clock::now());
    channel.close();     // producer must not block on a dead consumer
    log_info("bridge: stopped");
}

bool Bridge::handle_command(const std::string& topic, const std::string& payload) {
    if (topic == command_topic(opts_.base_topic, "discover")) {
        log_info("command: discover");
        if (on_discover_) on_discover_();
        return true;
    }
    log_warn("command: unsupported topic " + topic + " (" + std::to_string(payload.size()) + " bytes)");
    return false;
}

} // namespace bacgate
