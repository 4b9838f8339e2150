/**
 * @file main.cpp
 * @brief bacgate-responder: a one-device BACnet/IP simulator for manual and end-to-end testing.
 *
 * Behaves like a small controller:
 *  - answers Who-Is (when its instance is in range) with a unicast I-Am to the asker,
 *  - answers ReadProperty for Analog-Input <n> present-value with a REAL,
 *  - with --announce, broadcasts one I-Am at startup.
 *
 * Runs on 47809 by default so it can share a host with the gateway on 47808.
 * Point the gateway's --broadcast at this host's :47809 to see it discovered.
 *
 * Usage:
 *   bacgate-responder --device 99999 --value 21.5 --step 0.5
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <pthread.h>        // pthread_sigmask: block signals before the receive thread starts
#include <unistd.h>         // getpid

#include "CLI/CLI11.hpp"

#include "bacgate/apdu.hpp"
#include "bacgate/log.hpp"
#include "bacgate/npdu.hpp"
#include "bacgate/services.hpp"
#include "bacgate/transport/transport_bip.hpp"

using namespace bacgate;
using transport::TransportError;

struct Sim {
  uint32_t device{99999};
  uint16_t vendor{260};
  uint32_t ai_instance{0};
  float    value{21.5f};
  float    step{0.0f};
};

static std::vector<uint8_t> frame_for(const Apdu& apdu, bool expecting_reply) {
  Npdu npdu;
  npdu.expecting_reply = expecting_reply;
  std::vector<uint8_t> out;
  encode_npdu(out, npdu);
  encode_apdu(out, apdu);
  return out;
}

static std::vector<uint8_t> i_am_frame(const Sim& sim) {
  IAm ann;
  ann.device = ObjectIdentifier(ObjectType::Device, sim.device);
  ann.max_apdu = MAX_APDU_LENGTH;
  ann.segmentation = Segmentation::None;
  ann.vendor_id = sim.vendor;
  std::vector<uint8_t> body;
  encode_i_am(body, ann);
  return frame_for(Apdu::unconfirmed(SERVICE_I_AM, std::move(body)), false);
}

// ---------------------------------------------------------------------------
// Decode one request and send whatever answer it deserves.
// ---------------------------------------------------------------------------
static void serve(transport::BipDatalink& link, Sim& sim, const transport::Frame& f) {
  Npdu npdu;
  size_t used = 0;
  if (decode_npdu(f.npdu.data(), f.npdu.size(), npdu, used) != DecodeError::None || npdu.network_message)
    return;
  Apdu apdu;
  if (decode_apdu(f.npdu.data() + used, f.npdu.size() - used, apdu) != DecodeError::None) return;

  if (apdu.kind == ApduKind::UnconfirmedRequest && apdu.service_choice == SERVICE_WHO_IS) {
    WhoIs w;
    if (decode_who_is(apdu.service_data.data(), apdu.service_data.size(), w) != DecodeError::None) return;
    if (w.range && !w.range->contains(sim.device)) return;
    log_info("who-is from " + f.source.to_string() + ", answering");
    if (link.send_unicast(i_am_frame(sim), f.source) != TransportError::None)
      log_warn("i-am to " + f.source.to_string() + " failed");
    return;
  }

  if (apdu.kind == ApduKind::ConfirmedRequest && apdu.service_choice == SERVICE_READ_PROPERTY) {
    ReadPropertyRequest req;
    if (decode_read_property(apdu.service_data.data(), apdu.service_data.size(), req) != DecodeError::None) return;
    if (req.object != ObjectIdentifier(ObjectType::AnalogInput, sim.ai_instance) ||
        req.property != PROP_PRESENT_VALUE) {
      log_info("read-property for unsupported object/property, ignored");
      return;
    }

    ReadPropertyAck ack;
    ack.object = req.object;
    ack.property = req.property;
    ack.array_index = req.array_index;
    ack.value = PropertyValue::real(sim.value);
    std::vector<uint8_t> body;
    encode_read_property_ack(body, ack);

    log_info("read-property from " + f.source.to_string() + " invoke=" + std::to_string(apdu.invoke_id) +
             " -> " + std::to_string(sim.value));
    if (link.send_unicast(frame_for(Apdu::complex_ack(apdu.invoke_id, SERVICE_READ_PROPERTY, std::move(body)), false),
                          f.source) != TransportError::None)
      log_warn("ack to " + f.source.to_string() + " failed");
    sim.value += sim.step;
  }
}

int main(int argc, char** argv) {
  CLI::App app{"bacgate-responder: simulated BACnet/IP device"};

  Sim sim;
  std::string bind = "0.0.0.0:47809", broadcast = "255.255.255.255:47808", level = "info";
  bool announce = false;

  app.add_option("--device", sim.device, "Device instance (default 99999)");
  app.add_option("--vendor", sim.vendor, "Vendor identifier");
  app.add_option("--ai", sim.ai_instance, "Analog-input instance served (default 0)");
  app.add_option("--value", sim.value, "Present value returned");
  app.add_option("--step", sim.step, "Added to the value after every read");
  app.add_option("--bind", bind, "Local address a.b.c.d[:port]");
  app.add_option("--broadcast", broadcast, "Where --announce sends its I-Am");
  app.add_flag("--announce", announce, "Broadcast an I-Am at startup");
  app.add_option("--log-level", level, "trace|debug|info|warn|error|off");

  CLI11_PARSE(app, argc, argv);

  LogLevel lvl = LogLevel::Info;
  if (!parse_log_level(level, lvl) || sim.device > MAX_INSTANCE || sim.ai_instance > MAX_INSTANCE) {
    std::cerr << "status=error reason=bad_argument\n";
    return 2;
  }
  set_log_level(lvl);

  // SIGINT/SIGTERM are taken with sigwait() on the main thread.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  transport::BipConfig cfg;
  if (!parse_address(bind, cfg.bind) || !parse_address(broadcast, cfg.broadcast)) {
    std::cerr << "status=error reason=bad_address\n";
    return 2;
  }

  transport::BipDatalink link;
  if (link.begin(cfg) != TransportError::None) {
    std::cerr << "status=error reason=bind addr=" << bind << "\n";
    return 1;
  }

  log_info("responder: device " + std::to_string(sim.device) + " on " + link.local_address().to_string());
  if (announce && link.send_broadcast(i_am_frame(sim)) != TransportError::None)
    log_warn("startup i-am broadcast failed");

  std::thread rx([&link, &sim] {
    for (;;) {
      transport::Frame f;
      const TransportError rc = link.receive_frame(f, std::chrono::milliseconds(1000));
      if (rc == TransportError::Cancelled) return;
      if (rc == TransportError::None) serve(link, sim, f);
      if (rc == TransportError::Receive || rc == TransportError::NotOpen) {
        log_error(std::string("responder: receive failed: ") + transport::transport_error_name(rc));
        kill(getpid(), SIGTERM);   // wake the sigwait below
        return;
      }
    }
  });

  int sig = 0;
  sigwait(&stop_signals, &sig);
  link.interrupt();
  rx.join();

  link.end();
  log_info("responder: stopped");
  return 0;
}
