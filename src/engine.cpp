// ============================================================================
// engine.cpp — implementation for bacgate/engine.hpp
// ============================================================================

#include "bacgate/engine.hpp"

#include "bacgate/apdu.hpp"
#include "bacgate/log.hpp"
#include "bacgate/npdu.hpp"

namespace bacgate {

using transport::Frame;
using transport::TransportError;

const char* request_error_name(RequestError e) {
    switch (e) {
        case RequestError::None:       return "none";
        case RequestError::NoInvokeId: return "no_invoke_id";
        case RequestError::Transport:  return "transport";
    }
    return "unknown";
}

Engine::Engine(transport::IDatalink& link, EventChannel& events, Options opts)
    : link_(link), events_(events), opts_(opts) {}

Engine::~Engine() { stop(); }

// ============================================================================
// Outbound
// ============================================================================

TransportError Engine::discover(const WhoIs& req) {
    std::vector<uint8_t> body;
    encode_who_is(body, req);

    Npdu npdu;                          // local, no reply expected
    std::vector<uint8_t> frame;
    encode_npdu(frame, npdu);
    encode_apdu(frame, Apdu::unconfirmed(SERVICE_WHO_IS, std::move(body)));

    const TransportError rc = link_.send_broadcast(frame);
    if (rc != TransportError::None)
        log_warn(std::string("who-is broadcast failed: ") + transport::transport_error_name(rc));
    else
        log_debug("who-is broadcast sent");
    return rc;
}

// ---------------------------------------------------------------------------
// read_property()
// Reserve the invoke id first so a fast answer always finds its entry; give
// it back if the send fails.
// ---------------------------------------------------------------------------
RequestError Engine::read_property(const BipAddress& target, const ObjectIdentifier& object,
                                   uint32_t property, uint8_t& invoke_id) {
    PendingRequest entry;
    entry.target   = target;
    entry.service  = SERVICE_READ_PROPERTY;
    entry.object   = object;
    entry.property = property;
    entry.deadline = Clock::now() + opts_.request_timeout;

    const auto id = pending_.allocate(entry);
    if (!id) {
        log_warn("read-property to " + target.to_string() + ": no free invoke id");
        return RequestError::NoInvokeId;
    }

    ReadPropertyRequest req;
    req.object   = object;
    req.property = property;
    std::vector<uint8_t> body;
    encode_read_property(body, req);

    Npdu npdu;
    npdu.expecting_reply = true;
    std::vector<uint8_t> frame;
    encode_npdu(frame, npdu);
    encode_apdu(frame, Apdu::confirmed(*id, SERVICE_READ_PROPERTY, std::move(body)));

    const TransportError rc = link_.send_unicast(frame, target);
    if (rc != TransportError::None) {
        pending_.release(*id);
        log_warn("read-property to " + target.to_string() + " failed: " +
                 transport::transport_error_name(rc));
        return RequestError::Transport;
    }

    invoke_id = *id;
    return RequestError::None;
}

// ============================================================================
// Inbound
// ============================================================================

// Log and drop a frame that failed to decode.
static void log_drop(const char* layer, DecodeError e, const BipAddress& from) {
    if (log_enabled(LogLevel::Debug))
        log_debug(std::string("dropped frame from ") + from.to_string() + ": " + layer + " " +
                  decode_error_name(e));
}

std::optional<BacnetEvent> Engine::decode_frame(const Frame& frame) {
    Npdu npdu;
    size_t used = 0;
    DecodeError e = decode_npdu(frame.npdu.data(), frame.npdu.size(), npdu, used);
    if (e != DecodeError::None) { log_drop("npdu", e, frame.source); return std::nullopt; }
    if (npdu.network_message) {
        log_trace("ignored network-layer message type " + std::to_string(npdu.message_type) +
                  " from " + frame.source.to_string());
        return std::nullopt;
    }

    Apdu apdu;
    e = decode_apdu(frame.npdu.data() + used, frame.npdu.size() - used, apdu);
    if (e != DecodeError::None) { log_drop("apdu", e, frame.source); return std::nullopt; }

    const uint8_t* body = apdu.service_data.data();
    const size_t   blen = apdu.service_data.size();

    switch (apdu.kind) {
        case ApduKind::UnconfirmedRequest:
            if (apdu.service_choice == SERVICE_WHO_IS) {
                WhoIs w;
                e = decode_who_is(body, blen, w);
                if (e != DecodeError::None) { log_drop("who-is", e, frame.source); return std::nullopt; }
                return BacnetEvent::make_who_is(w, frame.source);
            }
            if (apdu.service_choice == SERVICE_I_AM) {
                IAm a;
                e = decode_i_am(body, blen, a);
                if (e != DecodeError::None) { log_drop("i-am", e, frame.source); return std::nullopt; }
                return BacnetEvent::make_i_am(a, frame.source);
            }
            break;

        case ApduKind::ConfirmedRequest:
            if (apdu.service_choice == SERVICE_READ_PROPERTY) {
                ReadPropertyRequest r;
                e = decode_read_property(body, blen, r);
                if (e != DecodeError::None) { log_drop("read-property", e, frame.source); return std::nullopt; }
                return BacnetEvent::make_read_request(r, apdu.invoke_id, frame.source);
            }
            break;

        case ApduKind::ComplexAck:
            if (apdu.service_choice == SERVICE_READ_PROPERTY) {
                ReadPropertyAck ack;
                e = decode_read_property_ack(body, blen, ack);
                if (e != DecodeError::None) { log_drop("read-property-ack", e, frame.source); return std::nullopt; }
                if (!pending_.complete(apdu.invoke_id, frame.source, apdu.service_choice)) {
                    log_debug("unmatched read-property ack invoke=" + std::to_string(apdu.invoke_id) +
                              " from " + frame.source.to_string());
                    return std::nullopt;
                }
                return BacnetEvent::make_read_ack(ack, apdu.invoke_id, frame.source);
            }
            break;
    }

    log_trace("ignored service " + std::to_string(apdu.service_choice) + " from " + frame.source.to_string());
    return std::nullopt;
}

size_t Engine::expire_pending(Clock::time_point now) {
    const auto expired = pending_.expire(now);
    for (const auto& kv : expired) {
        const PendingRequest& p = kv.second;
        if (!events_.push(BacnetEvent::make_timeout(kv.first, p.service, p.object, p.property, p.target)))
            break;   // consumer gone
    }
    return expired.size();
}

// ============================================================================
// Receive thread
// ============================================================================

std::chrono::milliseconds Engine::next_wait(Clock::time_point now) const {
    const auto deadline = pending_.next_deadline();
    if (!deadline) return opts_.request_timeout;
    if (*deadline <= now) return std::chrono::milliseconds(0);
    // round up so the deadline has passed when poll() returns
    return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) + std::chrono::milliseconds(1);
}

void Engine::start() {
    if (cancel_.stop_requested()) {
        log_warn("engine: start after stop ignored");
        return;
    }
    if (running_.exchange(true)) return;
    rx_thread_ = std::thread(&Engine::receive_loop, this);
}

void Engine::stop() {
    cancel_.request_stop();
    link_.interrupt();
    if (rx_thread_.joinable()) rx_thread_.join();
    running_.store(false);
}

void Engine::receive_loop() {
    log_info(std::string("engine: receive loop started on ") + link_.name());

    while (!cancel_.stop_requested()) {
        Frame frame;
        const TransportError rc = link_.receive_frame(frame, next_wait(Clock::now()));

        if (rc == TransportError::Cancelled) break;
        if (rc == TransportError::None) {
            auto ev = decode_frame(frame);
            if (ev) {
                if (log_enabled(LogLevel::Debug)) log_debug(describe(*ev));
                if (!events_.push(*ev)) break;
            }
        } else if (rc == TransportError::Foreign) {
            log_trace("ignored non-BACnet/IP datagram");
        } else if (rc != TransportError::Timeout) {
            log_warn(std::string("engine: receive failed: ") + transport::transport_error_name(rc));
            if (cancel_.wait_for(std::chrono::milliseconds(100))) break;   // no hot spin on a broken socket
        }

        expire_pending(Clock::now());
        if (events_.closed()) break;
    }

    log_info("engine: receive loop stopped");
}

} // namespace bacgate
