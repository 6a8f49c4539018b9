/*
 * test_discovery.cpp
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
#include <set>
#include <string>

#include "fakes.hpp"
#include "tesla_bridge/discovery.hpp"

using nlohmann::json;
using tesla_bridge::VehicleIdentity;
using tesla_bridge::build_discovery;
using tesla_bridge::model_name;

namespace {

const json* find(const std::vector<tesla_bridge::DiscoveryMessage>& msgs, const std::string& topic){
    for(const auto& m : msgs){
        if(m.topic == topic) return &m.config;
    }
    return nullptr;
}

} // namespace

int main(){
    {
        assert(model_name("models", "p100d") == "Model S P100D");
        assert(model_name("model3", "") == "Model 3");
        assert(model_name("modelx", "100d") == "Model X 100D");
        assert(model_name("", "p100d").empty());
    }

    const VehicleIdentity id{"5YJSA1E26HF000001", "Blue Thunder", "models", "p100d"};
    const std::string vin = id.vin;
    auto msgs = build_discovery(id, "tesla/car");

    {
        assert(msgs.size() == 6);
        std::set<std::string> unique_ids;
        for(const auto& m : msgs){
            assert(m.topic.rfind("homeassistant/", 0) == 0);
            assert(m.topic.find("/" + vin + "/") != std::string::npos);
            assert(m.config["device"]["identifiers"][0] == vin + "_device");
            unique_ids.insert(m.config["unique_id"].get<std::string>());
        }
        assert(unique_ids.size() == msgs.size());
    }

    {
        const json* c = find(msgs, "homeassistant/sensor/" + vin + "/charging/config");
        assert(c);
        assert((*c)["name"] == "Blue Thunder Charging State");
        assert((*c)["state_topic"] == "tesla/car/charging");
        assert((*c)["unique_id"] == vin + "_charging");
        assert((*c)["icon"] == "mdi:ev-station");
    }

    {
        const json* c = find(msgs, "homeassistant/sensor/" + vin + "/battery/config");
        assert(c);
        assert((*c)["state_topic"] == "tesla/car/battery_level");
        assert((*c)["unit_of_measurement"] == "%");
        assert((*c)["device_class"] == "battery");
        assert((*c)["device"]["name"] == "Blue Thunder Vehicle");
        assert((*c)["device"]["manufacturer"] == "Tesla");
        assert((*c)["device"]["model"] == "Model S P100D");
    }

    {
        const json* c = find(msgs, "homeassistant/sensor/" + vin + "/timetofull/config");
        assert(c);
        assert((*c)["unit_of_measurement"] == "h");
        assert((*c)["state_topic"] == "tesla/car/time_to_full");
    }

    {
        const json* c = find(msgs, "homeassistant/number/" + vin + "/chargelimit/config");
        assert(c);
        assert((*c)["state_topic"] == "tesla/car/charge_limit");
        assert((*c)["command_topic"] == "tesla/car/charge_limit/set");
        assert((*c)["min"] == 50);
        assert((*c)["max"] == 100);
    }

    {
        const json* c = find(msgs, "homeassistant/switch/" + vin + "/charging/config");
        assert(c);
        assert((*c)["command_topic"] == "tesla/car/charging/set");
        assert((*c)["payload_on"] == "true");
        assert((*c)["payload_off"] == "false");
    }

    {
        const json* c = find(msgs, "homeassistant/device_tracker/" + vin + "/gps/config");
        assert(c);
        assert((*c)["state_topic"] == "tesla/car/gps");
        assert((*c)["json_attributes_topic"] == "tesla/car/gps");
        assert((*c)["value_template"] == "{{value_json.state}}");
        assert((*c)["source_type"] == "gps");
    }

    {
        // vehicle asleep at session start: no model information
        VehicleIdentity sleepy{"5YJ3E1EA7JF000002", "Sparky", "", ""};
        auto m = build_discovery(sleepy, "garage/tesla");
        const json* c = find(m, "homeassistant/sensor/5YJ3E1EA7JF000002/battery/config");
        assert(c);
        assert(!(*c)["device"].contains("model"));
        assert((*c)["state_topic"] == "garage/tesla/battery_level");
    }

    {
        test::MockPublisher out;
        assert(tesla_bridge::publish_discovery(out, id, "tesla/car") == 6);
        assert(out.total() == 6);
        json parsed = json::parse(out.published_payloads.front());
        assert(parsed.contains("unique_id"));

        out.clear();
        out.fail = true;
        assert(tesla_bridge::publish_discovery(out, id, "tesla/car") == 0);
    }

    return 0;
}
