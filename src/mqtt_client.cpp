/*
 * mqtt_client.cpp
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

#include "tesla_bridge/mqtt_client.hpp"
#include "tesla_bridge/log.hpp"

#include <mosquitto.h>

#include <cstring>

namespace tesla_bridge {

MqttClient::MqttClient(MqttClientConfig config) : config_(std::move(config)) {}

MqttClient::~MqttClient(){
    stop();
}

bool MqttClient::start(){
    mosq_ = mosquitto_new(config_.client_id.c_str(), true, this);
    if(!mosq_){
        TB_LOG_ERROR("mqtt", "mosquitto_new failed");
        return false;
    }

    mosquitto_reconnect_delay_set(mosq_, 1, 10, true);
    mosquitto_connect_callback_set(mosq_, &MqttClient::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MqttClient::on_disconnect);
    mosquitto_message_callback_set(mosq_, &MqttClient::on_message);

    const char* lwt = "{\"connected\":false}";
    std::string will_topic = status_topic();
    int rc = mosquitto_will_set(mosq_, will_topic.c_str(), (int)strlen(lwt), lwt, 0, true);
    if(rc != MOSQ_ERR_SUCCESS){
        TB_LOG_ERROR("mqtt", "will_set failed rc=" << rc << " (" << mosquitto_strerror(rc) << ")");
        return false;
    }

    // Set credentials if provided
    if (!config_.user.empty()) {
        rc = mosquitto_username_pw_set(mosq_, config_.user.c_str(),
                                       config_.password.empty() ? nullptr : config_.password.c_str());
        if(rc != MOSQ_ERR_SUCCESS){
            TB_LOG_ERROR("mqtt", "username_pw_set failed rc=" << rc);
            return false;
        }
    }

    rc = mosquitto_connect(mosq_, config_.host.c_str(), config_.port, config_.keepalive);
    if(rc != MOSQ_ERR_SUCCESS){
        TB_LOG_ERROR("mqtt", "connect " << config_.host << ":" << config_.port
                     << " failed rc=" << rc << " (" << mosquitto_strerror(rc) << ")");
        return false;
    }
    rc = mosquitto_loop_start(mosq_);
    if(rc != MOSQ_ERR_SUCCESS){
        TB_LOG_ERROR("mqtt", "loop_start failed rc=" << rc << " (" << mosquitto_strerror(rc) << ")");
        return false;
    }
    loop_running_ = true;
    return true;
}

void MqttClient::stop(){
    if(!mosq_) return;
    if(loop_running_){
        mosquitto_disconnect(mosq_);
        mosquitto_loop_stop(mosq_, false);
        loop_running_ = false;
    }
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
    connected_ = false;
}

bool MqttClient::publish(const std::string& topic, const std::string& payload, int qos, bool retain){
    if(topic == status_topic()){
        std::lock_guard<std::mutex> lock(status_mtx_);
        last_status_ = payload;
    }
    if(!mosq_) return false;
    int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(),
                               (int)payload.size(), payload.data(), qos, retain);
    if(rc != MOSQ_ERR_SUCCESS){
        TB_LOG_WARNING("mqtt", "publish rc=" << rc << " (" << mosquitto_strerror(rc) << ") topic='" << topic << "'");
        return false;
    }
    return true;
}

std::optional<std::string> MqttClient::last_status() const {
    std::lock_guard<std::mutex> lock(status_mtx_);
    return last_status_;
}

bool MqttClient::replay_status(){
    std::optional<std::string> payload = last_status();
    if(!payload || !mosq_) return false;
    std::string topic = status_topic();
    int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(),
                               (int)payload->size(), payload->data(), 0, true);
    if(rc != MOSQ_ERR_SUCCESS){
        TB_LOG_WARNING("mqtt", "status replay rc=" << rc << " (" << mosquitto_strerror(rc) << ")");
        return false;
    }
    TB_LOG_DEBUG("mqtt", "status replayed: " << *payload);
    return true;
}

// ===================== MQTT Callbacks =====================

void MqttClient::on_connect(struct mosquitto*, void* obj, int rc){
    auto* self = static_cast<MqttClient*>(obj);
    const char* reason = mosquitto_connack_string(rc);
    TB_LOG_INFO("mqtt", "on_connect rc=" << rc << " (" << (reason ? reason : "unknown") << ")");
    if(rc != 0){
        self->connected_ = false;
        return;
    }
    self->connected_ = true;

    std::string sub = self->command_subscription();
    int mid = 0;
    int s_rc = mosquitto_subscribe(self->mosq_, &mid, sub.c_str(), 0);
    TB_LOG_INFO("mqtt", "subscribe '" << sub << "' rc=" << s_rc << " mid=" << mid);

    self->replay_status();
}

void MqttClient::on_disconnect(struct mosquitto*, void* obj, int rc){
    auto* self = static_cast<MqttClient*>(obj);
    self->connected_ = false;
    if(rc != 0){
        TB_LOG_WARNING("mqtt", "disconnected rc=" << rc << ", reconnecting");
    }
}

void MqttClient::on_message(struct mosquitto*, void* obj, const struct mosquitto_message* m){
    auto* self = static_cast<MqttClient*>(obj);
    if(!m || !m->topic) return;
    std::string topic = m->topic;
    std::string payload = m->payload ? std::string(static_cast<const char*>(m->payload), m->payloadlen)
                                     : std::string();
    if(self->handler_) self->handler_(topic, payload);
}

} // namespace tesla_bridge
