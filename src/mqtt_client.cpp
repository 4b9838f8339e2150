// ============================================================================
// mqtt_client.cpp — implementation for mqtt_client.hpp
// ============================================================================

#include "mqtt_client.hpp"

#include <unistd.h>          // getpid for the client id
#include <chrono>
#include <cstring>           // strlen for NUL-terminated topic names

#include "etl/string.h"
#include "etl/to_string.h"
#include "bacgate/log.hpp"

namespace bacgate {

static constexpr int RECEIVE_SLICE_MS   = 50;     // how long the loop holds the client per turn
static constexpr unsigned long PUBLISH_TIMEOUT_MS = 5000;
static constexpr int DISCONNECT_TIMEOUT_MS = 1000;

std::string default_client_id() {
    etl::string<32> id("bacnet-gateway-");
    etl::to_string(static_cast<uint32_t>(::getpid()), id, true);
    return std::string(id.c_str());
}

MqttClient::MqttClient(MqttOptions opts) : opts_(std::move(opts)) {
    if (opts_.client_id.empty()) opts_.client_id = default_client_id();
}

MqttClient::~MqttClient() {
    disconnect();
    std::lock_guard<std::mutex> lock(mu_);
    if (client_) MQTTClient_destroy(&client_);
}

bool MqttClient::create() {
    std::lock_guard<std::mutex> lock(mu_);
    if (client_) return true;

    const std::string uri = "tcp://" + opts_.host + ":" + std::to_string(opts_.port);
    const int rc = MQTTClient_create(&client_, uri.c_str(), opts_.client_id.c_str(),
                                     MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTCLIENT_SUCCESS) {
        log_error("mqtt: create(" + uri + ") failed, rc=" + std::to_string(rc));
        client_ = nullptr;
        return false;
    }
    log_info("mqtt: client " + opts_.client_id + " for " + uri);
    return true;
}

// ---------------------------------------------------------------------------
// connect()
// Will -> connect -> "online" -> subscriptions. A failed subscription is
// logged but does not fail the connection (publishing still works).
// ---------------------------------------------------------------------------
bool MqttClient::connect() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!client_) return false;

    MQTTClient_connectOptions conn_opts = MQTTClient_connectOptions_initializer;
    conn_opts.keepAliveInterval = static_cast<int>(opts_.keepalive_s);
    conn_opts.cleansession = 1;
    if (opts_.username) conn_opts.username = opts_.username->c_str();
    if (opts_.password) conn_opts.password = opts_.password->c_str();

    MQTTClient_willOptions will_opts = MQTTClient_willOptions_initializer;
    if (!opts_.status_topic.empty()) {
        will_opts.topicName = opts_.status_topic.c_str();
        will_opts.message   = "offline";
        will_opts.retained  = 1;
        will_opts.qos       = static_cast<int>(Qos::AtLeastOnce);
        conn_opts.will = &will_opts;
    }

    const int rc = MQTTClient_connect(client_, &conn_opts);
    if (rc != MQTTCLIENT_SUCCESS) {
        log_warn("mqtt: connect to " + opts_.host + ":" + std::to_string(opts_.port) +
                 " failed, rc=" + std::to_string(rc));
        return false;
    }
    was_connected_.store(true);
    log_info("mqtt: connected to " + opts_.host + ":" + std::to_string(opts_.port));

    if (!opts_.status_topic.empty() && !publish_locked(opts_.status_topic, "online", true, Qos::AtLeastOnce))
        log_warn("mqtt: could not mark " + opts_.status_topic + " online");

    for (const std::string& filter : opts_.subscriptions) {
        const int src = MQTTClient_subscribe(client_, filter.c_str(), static_cast<int>(Qos::AtLeastOnce));
        if (src != MQTTCLIENT_SUCCESS)
            log_warn("mqtt: subscribe(" + filter + ") failed, rc=" + std::to_string(src));
        else
            log_debug("mqtt: subscribed " + filter);
    }
    return true;
}

bool MqttClient::connected() const {
    std::lock_guard<std::mutex> lock(mu_);
    return client_ && MQTTClient_isConnected(client_);
}

bool MqttClient::publish_locked(const std::string& topic, const std::string& payload, bool retained, Qos qos) {
    if (!client_ || !MQTTClient_isConnected(client_)) return false;

    MQTTClient_message msg = MQTTClient_message_initializer;
    msg.payload    = const_cast<char*>(payload.data());
    msg.payloadlen = static_cast<int>(payload.size());
    msg.qos        = static_cast<int>(qos);
    msg.retained   = retained ? 1 : 0;

    MQTTClient_deliveryToken token = 0;
    int rc = MQTTClient_publishMessage(client_, topic.c_str(), &msg, &token);
    if (rc != MQTTCLIENT_SUCCESS) {
        log_warn("mqtt: publish(" + topic + ") failed, rc=" + std::to_string(rc));
        return false;
    }
    if (qos != Qos::AtMostOnce) {
        rc = MQTTClient_waitForCompletion(client_, token, PUBLISH_TIMEOUT_MS);
        if (rc != MQTTCLIENT_SUCCESS) {
            log_warn("mqtt: delivery of " + topic + " not confirmed, rc=" + std::to_string(rc));
            return false;
        }
    }
    log_trace("mqtt: " + topic + " <- " + payload);
    return true;
}

bool MqttClient::publish(const std::string& topic, const std::string& payload, bool retained, Qos qos) {
    std::lock_guard<std::mutex> lock(mu_);
    return publish_locked(topic, payload, retained, qos);
}

// ---------------------------------------------------------------------------
// receive_slice()
// Poll for one incoming message; copy it out, free the Paho buffers, then
// call the handler without holding the client lock.
// ---------------------------------------------------------------------------
void MqttClient::receive_slice(int timeout_ms) {
    std::string topic;
    std::string payload;
    bool got = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!client_) return;

        char* name = nullptr;
        int name_len = 0;
        MQTTClient_message* msg = nullptr;
        const int rc = MQTTClient_receive(client_, &name, &name_len, &msg, static_cast<unsigned long>(timeout_ms));
        if ((rc == MQTTCLIENT_SUCCESS || rc == MQTTCLIENT_TOPICNAME_TRUNCATED) && msg) {
            topic.assign(name, name_len > 0 ? static_cast<size_t>(name_len) : std::strlen(name));
            payload.assign(static_cast<const char*>(msg->payload), static_cast<size_t>(msg->payloadlen));
            got = true;
        }
        if (msg)  MQTTClient_freeMessage(&msg);
        if (name) MQTTClient_free(name);
    }
    if (got) {
        log_debug("mqtt: message on " + topic);
        if (on_message_) on_message_(topic, payload);
    }
}

void MqttClient::run(CancelToken& cancel) {
    const auto delay = std::chrono::seconds(opts_.reconnect_delay_s);

    while (!cancel.stop_requested()) {
        if (!connected()) {
            if (was_connected_.exchange(false)) log_warn("mqtt: connection lost");
            if (!connect()) {
                if (cancel.wait_for(delay)) break;
                continue;
            }
        }
        receive_slice(RECEIVE_SLICE_MS);
    }
    log_info("mqtt: loop stopped");
}

void MqttClient::disconnect() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!client_ || !MQTTClient_isConnected(client_)) return;
    if (!opts_.status_topic.empty() && !publish_locked(opts_.status_topic, "offline", true, Qos::AtLeastOnce))
        log_debug("mqtt: offline status not delivered, broker will use the will");
    const int rc = MQTTClient_disconnect(client_, DISCONNECT_TIMEOUT_MS);
    if (rc != MQTTCLIENT_SUCCESS) log_warn("mqtt: disconnect rc=" + std::to_string(rc));
    was_connected_.store(false);
    log_info("mqtt: disconnected");
}

} // namespace bacgate
