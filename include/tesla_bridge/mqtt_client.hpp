/*
 * mqtt_client.hpp
 *
 * Bridge Tesla Owner API ↔ Local Mosquitto
 * Copyright (c) 2026 The tesla-mqtt-bridge authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#ifndef TESLA_BRIDGE_MQTT_CLIENT_HPP
#define TESLA_BRIDGE_MQTT_CLIENT_HPP

#include "tesla_bridge/publisher.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

struct mosquitto;
struct mosquitto_message;

namespace tesla_bridge {

struct MqttClientConfig {
    std::string host = "127.0.0.1";
    int port = 1883;
    std::string user;
    std::string password;
    std::string client_id = "tesla-mqtt-bridge";
    std::string basetopic = "tesla/car";
    int keepalive = 30;
};

using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

// Local broker connection. libmosquitto runs its own network thread and
// reconnects by itself; inbound "<basetopic>/+/set" messages go to the
// handler on that thread.
class MqttClient : public Publisher {
public:
    explicit MqttClient(MqttClientConfig config);
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    // Set before start().
    void set_message_handler(MessageHandler handler) { handler_ = std::move(handler); }

    bool start();
    void stop();

    bool publish(const std::string& topic,
                 const std::string& payload,
                 int qos = 0,
                 bool retain = false) override;

    bool connected() const { return connected_.load(); }

    std::string status_topic() const { return config_.basetopic + "/status"; }
    std::string command_subscription() const { return config_.basetopic + "/+/set"; }

    // Last payload handed to publish() for status_topic(), sent or not.
    std::optional<std::string> last_status() const;

    // Re-sends last_status() retained. Runs on every (re)connect, because the
    // broker may have published the Last Will while the link was down.
    bool replay_status();

private:
    static void on_connect(struct mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(struct mosquitto* mosq, void* obj, int rc);
    static void on_message(struct mosquitto* mosq, void* obj, const struct mosquitto_message* msg);

    MqttClientConfig config_;
    MessageHandler handler_;
    struct mosquitto* mosq_ = nullptr;
    std::atomic<bool> connected_{false};
    bool loop_running_ = false;

    mutable std::mutex status_mtx_;
    std::optional<std::string> last_status_;
};

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_MQTT_CLIENT_HPP
