// ============================================================================
// poller.cpp — implementation for bacgate/poller.hpp
// ============================================================================

#include "bacgate/poller.hpp"

#include "bacgate/log.hpp"

namespace bacgate {

Poller::Poller(Engine& engine, DeviceRegistry& registry, Options opts)
    : engine_(engine), registry_(registry), opts_(opts) {}

size_t Poller::tick(Clock::time_point now) {
    ++ticks_;

    if (opts_.evict_after) {
        const size_t gone = registry_.evict_older_than(now - *opts_.evict_after);
        if (gone) log_info("poller: evicted " + std::to_string(gone) + " silent device(s)");
    }

    if (opts_.rediscover_every && ticks_ % opts_.rediscover_every == 0 &&
        engine_.discover() != transport::TransportError::None)
        log_debug("poller: rediscovery deferred to the next cycle");

    size_t sent = 0;
    size_t skipped = 0;
    for (const DeviceRecord& dev : registry_.snapshot(now)) {
        if (dev.stale) { ++skipped; continue; }

        uint8_t invoke = 0;
        const RequestError rc = engine_.read_property(dev.address, opts_.object, opts_.property, invoke);
        if (rc != RequestError::None) {
            log_warn("poller: read of device " + std::to_string(dev.instance) + " failed: " +
                     request_error_name(rc));
            continue;
        }
        log_debug("poller: read device=" + std::to_string(dev.instance) + " invoke=" +
                  std::to_string(invoke) + " target=" + dev.address.to_string());
        ++sent;
    }

    if (skipped) log_debug("poller: skipped " + std::to_string(skipped) + " stale device(s)");
    return sent;
}

void Poller::run(CancelToken& cancel) {
    log_info("poller: every " + std::to_string(opts_.interval.count()) + " ms");
    while (!cancel.stop_requested()) {
        tick(Clock::now());
        if (cancel.wait_for(opts_.interval)) break;
    }
    log_info("poller: stopped");
}

} // namespace bacgate
