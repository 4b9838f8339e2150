// ============================================================================
// gateway_config.cpp — implementation for gateway_config.hpp
// ============================================================================

#include "gateway_config.hpp"

#include <fstream>      // std::ifstream / std::ofstream for the config file
#include <sstream>      // slurp the file into a string
#include <limits>

#include "bacgate/log.hpp"
#include "bacgate/types.hpp"

using nlohmann::json;

namespace bacgate {

// ---------------------------------------------------------------------------
// Field readers. Each one leaves the target alone when the key is missing
// and reports "<section>.<key>: <problem>" when the value is unusable.
// ---------------------------------------------------------------------------
static bool read_string(const json& obj, const char* section, const char* key,
                        std::string& out, std::string& err) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_string()) { err = std::string(section) + "." + key + ": expected a string"; return false; }
    out = it->get<std::string>();
    return true;
}

static bool read_opt_string(const json& obj, const char* section, const char* key,
                            std::optional<std::string>& out, std::string& err) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (it->is_null()) { out.reset(); return true; }
    std::string s;
    if (!read_string(obj, section, key, s, err)) return false;
    out = s;
    return true;
}

static bool read_uint(const json& obj, const char* section, const char* key, uint64_t max,
                      uint64_t& out, std::string& err) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        err = std::string(section) + "." + key + ": expected a non-negative integer";
        return false;
    }
    const uint64_t v = it->get<uint64_t>();
    if (v > max) {
        err = std::string(section) + "." + key + ": " + std::to_string(v) + " exceeds " + std::to_string(max);
        return false;
    }
    out = v;
    return true;
}

template <class T>
static bool read_num(const json& obj, const char* section, const char* key, T& field, std::string& err) {
    uint64_t v = field;
    if (!read_uint(obj, section, key, std::numeric_limits<T>::max(), v, err)) return false;
    field = static_cast<T>(v);
    return true;
}

static bool read_address(const json& obj, const char* section, const char* key,
                         BipAddress& out, std::string& err) {
    std::string text;
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!read_string(obj, section, key, text, err)) return false;
    if (!parse_address(text, out)) {
        err = std::string(section) + "." + key + ": '" + text + "' is not a.b.c.d[:port]";
        return false;
    }
    return true;
}

static bool section_object(const json& doc, const char* name, const json*& out, std::string& err) {
    out = nullptr;
    auto it = doc.find(name);
    if (it == doc.end()) return true;
    if (!it->is_object()) { err = std::string(name) + ": expected an object"; return false; }
    out = &*it;
    return true;
}

bool parse_config(const std::string& text, GatewayConfig& cfg, std::string& err) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!doc.is_object()) { err = "top level must be an object"; return false; }

    const json* b = nullptr;
    if (!section_object(doc, "bacnet", b, err)) return false;
    if (b) {
        if (!read_num(*b, "bacnet", "device_id", cfg.bacnet.device_id, err)) return false;
        if (!read_address(*b, "bacnet", "bind_addr", cfg.bacnet.bind_addr, err)) return false;
        if (!read_address(*b, "bacnet", "broadcast_addr", cfg.bacnet.broadcast_addr, err)) return false;
        if (!read_string(*b, "bacnet", "vendor_name", cfg.bacnet.vendor_name, err)) return false;
        if (!read_string(*b, "bacnet", "model_name", cfg.bacnet.model_name, err)) return false;
        if (!read_num(*b, "bacnet", "request_timeout_ms", cfg.bacnet.request_timeout_ms, err)) return false;
    }

    const json* m = nullptr;
    if (!section_object(doc, "mqtt", m, err)) return false;
    if (m) {
        if (!read_string(*m, "mqtt", "broker_host", cfg.mqtt.broker_host, err)) return false;
        if (!read_num(*m, "mqtt", "broker_port", cfg.mqtt.broker_port, err)) return false;
        if (!read_opt_string(*m, "mqtt", "username", cfg.mqtt.username, err)) return false;
        if (!read_opt_string(*m, "mqtt", "password", cfg.mqtt.password, err)) return false;
        if (!read_string(*m, "mqtt", "discovery_prefix", cfg.mqtt.discovery_prefix, err)) return false;
        if (!read_string(*m, "mqtt", "base_topic", cfg.mqtt.base_topic, err)) return false;
        if (!read_num(*m, "mqtt", "keepalive_s", cfg.mqtt.keepalive_s, err)) return false;
        if (!read_num(*m, "mqtt", "reconnect_delay_s", cfg.mqtt.reconnect_delay_s, err)) return false;
    }

    const json* p = nullptr;
    if (!section_object(doc, "poll", p, err)) return false;
    if (p) {
        if (!read_num(*p, "poll", "interval_ms", cfg.poll.interval_ms, err)) return false;
        if (!read_num(*p, "poll", "rediscover_every", cfg.poll.rediscover_every, err)) return false;
        if (!read_num(*p, "poll", "stale_after_s", cfg.poll.stale_after_s, err)) return false;
        if (!read_num(*p, "poll", "evict_after_s", cfg.poll.evict_after_s, err)) return false;
    }

    if (!read_string(doc, "config", "log_level", cfg.log_level, err)) return false;
    return true;
}

bool load_config(const std::string& path, GatewayConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "cannot open " + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!parse_config(ss.str(), cfg, err)) { err = path + ": " + err; return false; }
    return true;
}

// MQTT topic levels may not contain wildcards; empty levels are pointless here.
static bool valid_topic_root(const std::string& t) {
    if (t.empty() || t.front() == '/' || t.back() == '/') return false;
    return t.find_first_of("+#") == std::string::npos;
}

bool validate_config(const GatewayConfig& cfg, std::string& err) {
    if (cfg.bacnet.device_id > MAX_INSTANCE) {
        err = "bacnet.device_id must be <= " + std::to_string(MAX_INSTANCE);
        return false;
    }
    if (cfg.bacnet.request_timeout_ms == 0) { err = "bacnet.request_timeout_ms must be > 0"; return false; }
    if (cfg.mqtt.broker_host.empty())       { err = "mqtt.broker_host is empty"; return false; }
    if (cfg.mqtt.broker_port == 0)          { err = "mqtt.broker_port must be > 0"; return false; }
    if (cfg.mqtt.password && !cfg.mqtt.username) {
        err = "mqtt.password given without mqtt.username";
        return false;
    }
    if (!valid_topic_root(cfg.mqtt.discovery_prefix)) {
        err = "mqtt.discovery_prefix '" + cfg.mqtt.discovery_prefix + "' is not a usable topic prefix";
        return false;
    }
    if (!valid_topic_root(cfg.mqtt.base_topic)) {
        err = "mqtt.base_topic '" + cfg.mqtt.base_topic + "' is not a usable topic prefix";
        return false;
    }
    if (cfg.mqtt.keepalive_s == 0) { err = "mqtt.keepalive_s must be > 0"; return false; }
    if (cfg.poll.interval_ms == 0) { err = "poll.interval_ms must be > 0"; return false; }
    if (cfg.poll.evict_after_s && cfg.poll.evict_after_s < cfg.poll.stale_after_s) {
        err = "poll.evict_after_s must be 0 or >= poll.stale_after_s";
        return false;
    }
    LogLevel lvl;
    if (!parse_log_level(cfg.log_level, lvl)) {
        err = "log_level '" + cfg.log_level + "' is not one of trace|debug|info|warn|error|off";
        return false;
    }
    return true;
}

json config_to_json(const GatewayConfig& cfg, bool redact) {
    json mqtt = {
        {"broker_host",       cfg.mqtt.broker_host},
        {"broker_port",       cfg.mqtt.broker_port},
        {"username",          cfg.mqtt.username ? json(*cfg.mqtt.username) : json(nullptr)},
        {"password",          cfg.mqtt.password ? json(redact ? "***" : *cfg.mqtt.password) : json(nullptr)},
        {"discovery_prefix",  cfg.mqtt.discovery_prefix},
        {"base_topic",        cfg.mqtt.base_topic},
        {"keepalive_s",       cfg.mqtt.keepalive_s},
        {"reconnect_delay_s", cfg.mqtt.reconnect_delay_s}
    };
    return json{
        {"bacnet", {
            {"device_id",          cfg.bacnet.device_id},
            {"bind_addr",          cfg.bacnet.bind_addr.to_string()},
            {"broadcast_addr",     cfg.bacnet.broadcast_addr.to_string()},
            {"vendor_name",        cfg.bacnet.vendor_name},
            {"model_name",         cfg.bacnet.model_name},
            {"request_timeout_ms", cfg.bacnet.request_timeout_ms}
        }},
        {"mqtt", mqtt},
        {"poll", {
            {"interval_ms",      cfg.poll.interval_ms},
            {"rediscover_every", cfg.poll.rediscover_every},
            {"stale_after_s",    cfg.poll.stale_after_s},
            {"evict_after_s",    cfg.poll.evict_after_s}
        }},
        {"log_level", cfg.log_level}
    };
}

bool save_config(const std::string& path, const GatewayConfig& cfg, std::string& err) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) { err = "cannot write " + path; return false; }
    out << config_to_json(cfg, false).dump(2) << '\n';
    if (!out) { err = "write failed: " + path; return false; }
    return true;
}

} // namespace bacgate
