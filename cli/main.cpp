/**
 * @file main.cpp
 * @brief bacgate-cli: one-shot BACnet/IP probe built on the gateway engine.
 *
 * Responsibilities:
 *  - --whois: broadcast Who-Is, collect I-Am answers for --wait ms, print one line per device.
 *  - --read <ip:port>: ReadProperty (default AI:0 present-value), print the ack or time out.
 *  - Output is key=value lines (same renderer the daemon logs with), or JSON with --json.
 *
 * Notes:
 *  - Binds an ephemeral port by default so it can run next to the daemon on 47808.
 *    Devices that answer Who-Is by broadcast to 47808 are only seen with --bind 0.0.0.0:47808.
 *  - Exit codes: 0 ok, 1 socket/bind, 2 usage, 3 nothing received.
 */

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <iostream>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "bacgate/engine.hpp"
#include "bacgate/log.hpp"
#include "bacgate/transport/transport_bip.hpp"

using json = nlohmann::json;
using namespace bacgate;
using Clock = std::chrono::steady_clock;

// ---------- small utilities ----------

static json device_json(const BacnetEvent& ev) {
  return json{
    {"device",       ev.i_am.device.instance},
    {"address",      ev.source.to_string()},
    {"vendor",       ev.i_am.vendor_id},
    {"max_apdu",     ev.i_am.max_apdu},
    {"segmentation", static_cast<int>(ev.i_am.segmentation)}
  };
}

static json ack_json(const BacnetEvent& ev) {
  json j{
    {"invoke",   ev.invoke_id},
    {"address",  ev.source.to_string()},
    {"object",   {{"type", static_cast<unsigned>(ev.read_ack.object.type)},
                  {"instance", ev.read_ack.object.instance}}},
    {"property", ev.read_ack.property},
    {"tag",      ev.read_ack.value.app_tag}
  };
  const auto f = decode_real(ev.read_ack.value);
  if (f) j["value"] = *f;
  else   j["raw"] = to_hex(ev.read_ack.value.raw);
  return j;
}

// ---------- modes ----------

static int run_whois(Engine& engine, EventChannel& channel, int wait_ms, bool as_json,
                     const std::optional<InstanceRange>& range) {
  WhoIs req;
  req.range = range;
  if (engine.discover(req) != transport::TransportError::None) {
    std::cerr << "status=error reason=send_failed\n";
    return 1;
  }

  std::map<uint32_t, BacnetEvent> seen;                // last answer per instance
  const auto until = Clock::now() + std::chrono::milliseconds(wait_ms);
  for (;;) {
    const auto now = Clock::now();
    if (now >= until) break;
    BacnetEvent ev;
    if (!channel.pop_for(ev, std::chrono::duration_cast<std::chrono::milliseconds>(until - now))) continue;
    if (ev.kind == EventKind::IAm) seen[ev.i_am.device.instance] = ev;
  }

  if (as_json) {
    json arr = json::array();
    for (const auto& kv : seen) arr.push_back(device_json(kv.second));
    std::cout << arr.dump(2) << "\n";
  } else {
    for (const auto& kv : seen) std::cout << describe(kv.second) << "\n";
  }
  return seen.empty() ? 3 : 0;
}

static int run_read(Engine& engine, EventChannel& channel, const BipAddress& target,
                    const ObjectIdentifier& obj, uint32_t property, bool as_json) {
  uint8_t invoke = 0;
  const RequestError rc = engine.read_property(target, obj, property, invoke);
  if (rc != RequestError::None) {
    std::cerr << "status=error reason=" << request_error_name(rc) << "\n";
    return 1;
  }

  BacnetEvent ev;
  while (channel.pop(ev)) {
    if (ev.invoke_id != invoke) continue;
    if (ev.kind == EventKind::RequestTimeout) {
      std::cerr << "status=error reason=timeout target=" << target.to_string() << "\n";
      return 3;
    }
    if (ev.kind == EventKind::ReadPropertyAck) {
      if (as_json) std::cout << ack_json(ev).dump(2) << "\n";
      else         std::cout << describe(ev) << "\n";
      return 0;
    }
  }
  std::cerr << "status=error reason=channel_closed\n";
  return 1;
}

int main(int argc, char** argv) {
  CLI::App app{"bacgate-cli: BACnet/IP probe"};

  bool whois = false, as_json = false;
  std::string read_target, bind = "0.0.0.0:0", broadcast = "255.255.255.255:47808", level = "warn";
  int wait_ms = 3000, timeout_ms = 3000;
  uint16_t object_type = 0;
  uint32_t object_instance = 0, property = PROP_PRESENT_VALUE;
  std::vector<uint32_t> range;

  app.add_flag("--whois", whois, "Broadcast Who-Is and list answering devices");
  app.add_option("--range", range, "Who-Is instance range: --range <low> <high>")->expected(2);
  app.add_option("--read", read_target, "ReadProperty from a.b.c.d[:port]");
  app.add_option("--object-type", object_type, "Object type for --read (default 0, analog-input)");
  app.add_option("--instance", object_instance, "Object instance for --read (default 0)");
  app.add_option("--property", property, "Property id for --read (default 85, present-value)");
  app.add_option("--bind", bind, "Local address a.b.c.d[:port] (port 0 = ephemeral)");
  app.add_option("--broadcast", broadcast, "Who-Is destination a.b.c.d[:port]");
  app.add_option("--wait", wait_ms, "How long --whois collects answers (ms)");
  app.add_option("--timeout", timeout_ms, "ReadProperty timeout (ms)");
  app.add_flag("--json", as_json, "Print JSON instead of key=value lines");
  app.add_option("--log-level", level, "trace|debug|info|warn|error|off");

  CLI11_PARSE(app, argc, argv);

  if (whois == !read_target.empty()) {
    std::cerr << "status=error reason=need_exactly_one_of --whois --read\n";
    return 2;
  }

  LogLevel lvl = LogLevel::Warn;
  if (!parse_log_level(level, lvl)) {
    std::cerr << "status=error reason=bad_log_level value=" << level << "\n";
    return 2;
  }
  set_log_level(lvl);

  transport::BipConfig bip;
  if (!parse_address(bind, bip.bind, 0) || !parse_address(broadcast, bip.broadcast)) {
    std::cerr << "status=error reason=bad_address\n";
    return 2;
  }

  std::optional<InstanceRange> who_range;
  if (range.size() == 2) {
    if (range[0] > range[1] || range[1] > MAX_INSTANCE) {
      std::cerr << "status=error reason=bad_range\n";
      return 2;
    }
    who_range = InstanceRange{range[0], range[1]};
  }

  BipAddress target;
  if (!read_target.empty() && !parse_address(read_target, target)) {
    std::cerr << "status=error reason=bad_address value=" << read_target << "\n";
    return 2;
  }
  if (object_type > MAX_OBJECT_TYPE || object_instance > MAX_INSTANCE) {
    std::cerr << "status=error reason=bad_object\n";
    return 2;
  }

  transport::BipDatalink link;
  if (link.begin(bip) != transport::TransportError::None) {
    std::cerr << "status=error reason=bind addr=" << bind << "\n";
    return 1;
  }

  EventChannel channel;
  Engine::Options opts;
  opts.request_timeout = std::chrono::milliseconds(timeout_ms);
  Engine engine(link, channel, opts);
  engine.start();

  int rc = whois
      ? run_whois(engine, channel, wait_ms, as_json, who_range)
      : run_read(engine, channel, target,
                 ObjectIdentifier(static_cast<ObjectType>(object_type), object_instance), property, as_json);

  channel.close();
  engine.stop();
  link.end();
  return rc;
}
