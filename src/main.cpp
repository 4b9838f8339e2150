#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <cstdint>
#include <csignal>          // sigset_t, sigwait
#include <pthread.h>        // pthread_sigmask: block signals before threads start
#include "CLI/CLI11.hpp"

#include "gateway_config.hpp"                   // GatewayConfig, load/validate/dump
#include "mqtt_client.hpp"                      // MqttClient (IPublisher)
#include "bacgate/bridge.hpp"                   // Bridge: events -> registry + MQTT
#include "bacgate/engine.hpp"                   // Engine: datagrams <-> events
#include "bacgate/log.hpp"
#include "bacgate/payload.hpp"                  // topic helpers
#include "bacgate/poller.hpp"
#include "bacgate/transport/transport_bip.hpp"  // BipDatalink

using namespace bacgate;

// Address options accept "a.b.c.d[:port]"; CLI11 only sees strings.
static bool override_address(const std::string& text, BipAddress& field, const char* what) {
  if (text.empty()) return true;
  if (!parse_address(text, field)) {
    std::cerr << "status=error reason=bad_address option=" << what << " value=" << text << "\n";
    return false;
  }
  return true;
}

int main(int argc, char** argv) {
  CLI::App app{"bacgate: BACnet/IP to MQTT gateway"};

  std::string config_path, save_path, bind, broadcast, log_level_name_opt;
  std::string mqtt_host, mqtt_user, mqtt_pass, prefix, base_topic;
  uint32_t device_id = 0, poll_ms = 0, timeout_ms = 0;
  uint16_t mqtt_port = 0;
  bool print_config = false;

  app.add_option("-c,--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);
  auto* o_device  = app.add_option("--device-id", device_id, "Gateway device instance");
  app.add_option("--bind", bind, "Local B/IP address a.b.c.d[:port]");
  app.add_option("--broadcast", broadcast, "Who-Is broadcast address a.b.c.d[:port]");
  auto* o_timeout = app.add_option("--request-timeout", timeout_ms, "Confirmed request timeout (ms)");
  app.add_option("--mqtt-host", mqtt_host, "MQTT broker host");
  auto* o_port    = app.add_option("--mqtt-port", mqtt_port, "MQTT broker port");
  app.add_option("--mqtt-user", mqtt_user, "MQTT username");
  app.add_option("--mqtt-pass", mqtt_pass, "MQTT password");
  app.add_option("--discovery-prefix", prefix, "Auto-discovery topic prefix");
  app.add_option("--base-topic", base_topic, "Gateway status/command topic root");
  auto* o_poll    = app.add_option("--poll-interval", poll_ms, "Polling interval (ms)");
  app.add_option("--log-level", log_level_name_opt, "trace|debug|info|warn|error|off");
  app.add_flag("--print-config", print_config, "Print the effective configuration and exit");
  app.add_option("--save-config", save_path, "Write the effective configuration to a file and exit");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration: defaults <- file <- command line --------
  GatewayConfig cfg;
  std::string err;
  if (!config_path.empty() && !load_config(config_path, cfg, err)) {
    std::cerr << "status=error reason=config " << err << "\n";
    return 2;
  }

  if (o_device->count())  cfg.bacnet.device_id = device_id;
  if (o_timeout->count()) cfg.bacnet.request_timeout_ms = timeout_ms;
  if (!override_address(bind, cfg.bacnet.bind_addr, "--bind")) return 2;
  if (!override_address(broadcast, cfg.bacnet.broadcast_addr, "--broadcast")) return 2;
  if (!mqtt_host.empty())  cfg.mqtt.broker_host = mqtt_host;
  if (o_port->count())     cfg.mqtt.broker_port = mqtt_port;
  if (!mqtt_user.empty())  cfg.mqtt.username = mqtt_user;
  if (!mqtt_pass.empty())  cfg.mqtt.password = mqtt_pass;
  if (!prefix.empty())     cfg.mqtt.discovery_prefix = prefix;
  if (!base_topic.empty()) cfg.mqtt.base_topic = base_topic;
  if (o_poll->count())     cfg.poll.interval_ms = poll_ms;
  if (!log_level_name_opt.empty()) cfg.log_level = log_level_name_opt;

  if (!validate_config(cfg, err)) {
    std::cerr << "status=error reason=config " << err << "\n";
    return 2;
  }

  if (print_config) {
    std::cout << config_to_json(cfg).dump(2) << "\n";
    return 0;
  }
  if (!save_path.empty()) {
    if (!save_config(save_path, cfg, err)) {
      std::cerr << "status=error reason=save " << err << "\n";
      return 1;
    }
    std::cout << "status=ok saved=" << save_path << "\n";
    return 0;
  }

  LogLevel level = LogLevel::Info;
  if (parse_log_level(cfg.log_level, level)) set_log_level(level);
  log_info("Starting BACnet-MQTT gateway, device " + std::to_string(cfg.bacnet.device_id) +
           " (" + cfg.bacnet.vendor_name + ", " + cfg.bacnet.model_name + ")");

  // Every thread inherits this mask; only sigwait() below sees the signals.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  // -------- BACnet side --------
  transport::BipDatalink link;
  transport::BipConfig bip;
  bip.bind = cfg.bacnet.bind_addr;
  bip.broadcast = cfg.bacnet.broadcast_addr;
  if (link.begin(bip) != transport::TransportError::None) {
    std::cerr << "status=error reason=bind addr=" << cfg.bacnet.bind_addr.to_string() << "\n";
    return 1;
  }

  EventChannel channel;
  Engine::Options eng_opts;
  eng_opts.request_timeout = std::chrono::milliseconds(cfg.bacnet.request_timeout_ms);
  Engine engine(link, channel, eng_opts);
  DeviceRegistry registry(std::chrono::seconds(cfg.poll.stale_after_s));

  // -------- MQTT side --------
  MqttOptions mopts;
  mopts.host = cfg.mqtt.broker_host;
  mopts.port = cfg.mqtt.broker_port;
  mopts.username = cfg.mqtt.username;
  mopts.password = cfg.mqtt.password;
  mopts.keepalive_s = cfg.mqtt.keepalive_s;
  mopts.reconnect_delay_s = cfg.mqtt.reconnect_delay_s;
  mopts.status_topic = status_topic(cfg.mqtt.base_topic);
  mopts.subscriptions.push_back(command_topic(cfg.mqtt.base_topic, "#"));
  MqttClient mqtt(mopts);
  if (!mqtt.create()) {
    std::cerr << "status=error reason=mqtt_create host=" << cfg.mqtt.broker_host << "\n";
    return 1;
  }

  Bridge::Options bopts;
  bopts.discovery_prefix = cfg.mqtt.discovery_prefix;
  bopts.base_topic = cfg.mqtt.base_topic;
  Bridge bridge(registry, mqtt, bopts);
  bridge.set_discover_handler([&engine] {
    if (engine.discover() != transport::TransportError::None)
      log_warn("discover command: Who-Is not sent");
  });
  mqtt.set_message_handler([&bridge](const std::string& topic, const std::string& payload) {
    if (!bridge.handle_command(topic, payload)) log_debug("command ignored: " + topic);
  });

  Poller::Options popts;
  popts.interval = std::chrono::milliseconds(cfg.poll.interval_ms);
  popts.rediscover_every = cfg.poll.rediscover_every;
  if (cfg.poll.evict_after_s) popts.evict_after = std::chrono::seconds(cfg.poll.evict_after_s);
  Poller poller(engine, registry, popts);

  // -------- run --------
  CancelToken cancel;
  // first attempt inline so the startup I-Ams can be published
  if (!mqtt.connect()) log_warn("MQTT broker not reachable yet, retrying in the background");
  engine.start();
  std::thread bridge_thread([&] { bridge.run(channel); });
  std::thread mqtt_thread([&] { mqtt.run(cancel); });
  std::thread poll_thread([&] { poller.run(cancel); });

  if (engine.discover() != transport::TransportError::None)
    log_error("initial Who-Is failed; relying on periodic rediscovery");

  int sig = 0;
  sigwait(&stop_signals, &sig);
  log_info(std::string("received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");

  // Shutdown order: poller, MQTT loop, engine, channel, bridge, final disconnect.
  cancel.request_stop();
  poll_thread.join();
  mqtt_thread.join();
  engine.stop();
  channel.close();
  bridge_thread.join();
  mqtt.disconnect();
  link.end();

  log_info("gateway stopped");
  return 0;
}
