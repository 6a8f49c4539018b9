/*
 * tesla_mqtt_bridge.cpp
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

// tesla_mqtt_bridge.cpp
//
// Purpose:
//   Bridge a Tesla vehicle (Owner API) <-> local Mosquitto.
//   Polls the car, republishes changed values as <basetopic>/<key>, announces
//   Home Assistant discovery configs, and turns <basetopic>/<setting>/set
//   messages into vehicle commands.
//   Uses: libmosquitto, libcurl, nlohmann/json
//
// Runtime configuration (command line --name=value, or env TESLA_<NAME>):
//   TESLA_EMAIL        : account login email                 (required)
//   TESLA_VIN          : VIN, only needed with several cars  (default: first car)
//   TESLA_MQTTHOST     : local broker host                   (required)
//   TESLA_MQTTPORT     : local broker port                   (default: 1883)
//   TESLA_MQTTUSER     : (optional)
//   TESLA_MQTTPASSWORD : (optional)
//   TESLA_BASETOPIC    : topic prefix, no trailing /         (default: tesla/car)
//   TESLA_GPSHOME      : "lat,lng" of home; unset = always home
//   TESLA_DEBUG        : any value enables debug logging
//
// State / .env location (fixed):
//   XDG:  $XDG_STATE_HOME/tesla-mqtt-bridge/.env
//   Fallback: $HOME/.local/state/tesla-mqtt-bridge/.env
//   refresh_token.txt is expected in the same directory and is rewritten
//   when the auth server rotates it.
//
// ------------------------------------------------------------------------

#include "tesla_bridge/command_queue.hpp"
#include "tesla_bridge/config.hpp"
#include "tesla_bridge/log.hpp"
#include "tesla_bridge/mqtt_client.hpp"
#include "tesla_bridge/supervisor.hpp"
#include "tesla_bridge/tesla_api.hpp"

#include <curl/curl.h>
#include <mosquitto.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace tesla_bridge;

static std::atomic<bool> g_stop{false};

static void sigint_handler(int){ g_stop = true; }

int main(int argc, char** argv){
    std::signal(SIGINT,  sigint_handler);
    std::signal(SIGTERM, sigint_handler);

    BridgeConfig cfg;
    try{
        cfg = load_config(argc, argv);
    }catch(const ConfigError& e){
        std::cerr << "✖ " << e.what() << "\n";
        return 1;
    }

    // ensure state directory and refresh token exist
    if (!std::filesystem::exists(cfg.state_dir)) {
        std::cerr << "✖ State directory missing: " << cfg.state_dir << "\n"
                  << "   Create it and put refresh_token.txt there first.\n";
        return 1;
    }
    TeslaApiConfig api_cfg;
    api_cfg.email = cfg.email;
    api_cfg.token_dir = cfg.state_dir;
    TeslaApi api(api_cfg);
    if (!std::filesystem::exists(api.refresh_token_path())) {
        std::cerr << "✖ refresh_token.txt missing in " << cfg.state_dir << "\n";
        return 1;
    }

    // libs init
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "curl_global_init failed\n";
        return 2;
    }
    if (mosquitto_lib_init() != MOSQ_ERR_SUCCESS) {
        std::cerr << "mosquitto_lib_init failed\n";
        curl_global_cleanup();
        return 2;
    }

    int exit_code = 0;
    {
        CommandQueue queue;

        MqttClientConfig mqtt_cfg;
        mqtt_cfg.host = cfg.mqtt_host;
        mqtt_cfg.port = cfg.mqtt_port;
        mqtt_cfg.user = cfg.mqtt_user;
        mqtt_cfg.password = cfg.mqtt_password;
        mqtt_cfg.basetopic = cfg.basetopic;

        MqttClient mqtt(mqtt_cfg);
        mqtt.set_message_handler([&queue](const std::string& topic, const std::string& payload){
            enqueue_message(queue, topic, payload);
        });

        if (!mqtt.start()) {
            std::cerr << "connect local failed\n";
            exit_code = 3;
        } else {
            Supervisor supervisor(api, mqtt, queue, cfg);
            std::thread worker([&supervisor]{ supervisor.run(); });

            TB_LOG_INFO("bridge", "running… (Ctrl+C / SIGTERM to stop)");
            while (!g_stop) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }

            TB_LOG_INFO("bridge", "stopping");
            supervisor.stop();
            worker.join();
            mqtt.stop();
        }
    }

    mosquitto_lib_cleanup();
    curl_global_cleanup();
    std::cout << "[bridge] bye\n";
    return exit_code;
}
