/*
 * test_mqtt_client.cpp
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

#include <cassert>
#include <string>

#include "fakes.hpp"
#include "tesla_bridge/mqtt_client.hpp"
#include "tesla_bridge/supervisor.hpp"

using nlohmann::json;
using tesla_bridge::BridgeConfig;
using tesla_bridge::CommandQueue;
using tesla_bridge::MqttClient;
using tesla_bridge::MqttClientConfig;
using tesla_bridge::Supervisor;

// No broker here: the client is never started, so every publish is refused,
// but the status payload must still be remembered for the next connect.
int main(){
    {
        MqttClientConfig cfg;
        cfg.basetopic = "garage/tesla";
        MqttClient client(cfg);
        assert(client.status_topic() == "garage/tesla/status");
        assert(client.command_subscription() == "garage/tesla/+/set");

        assert(!client.last_status());
        assert(!client.replay_status());

        assert(!client.publish("garage/tesla/battery_level", "64"));
        assert(!client.last_status());

        assert(!client.publish("garage/tesla/status", R"({"connected":true})", 0, true));
        assert(client.last_status() == std::string(R"({"connected":true})"));
        assert(!client.publish("garage/tesla/status", R"({"connected":false})", 0, true));
        assert(client.last_status() == std::string(R"({"connected":false})"));

        // not connected: nothing to replay to
        assert(!client.replay_status());
        assert(client.last_status() == std::string(R"({"connected":false})"));
    }

    {
        // a running session leaves connected=true to be replayed after a reconnect
        MqttClientConfig mcfg;
        mcfg.basetopic = "tesla/car";
        MqttClient client(mcfg);

        BridgeConfig cfg;
        cfg.email = "owner@example.com";
        cfg.mqtt_host = "localhost";
        cfg.timing.idle_max = tesla_bridge::Seconds(0.02);

        test::FakeVehicleApi api;
        CommandQueue queue;
        Supervisor sup(api, client, queue, cfg);
        api.car.on_data = [&sup](int n){
            if(n == 2) sup.stop();
        };
        auto r = sup.run_session();
        assert(r.ok);

        auto status = client.last_status();
        assert(status);
        assert(json::parse(*status)["connected"] == true);
    }

    return 0;
}
