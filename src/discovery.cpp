/*
 * discovery.cpp
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

#include "tesla_bridge/discovery.hpp"
#include "tesla_bridge/log.hpp"
#include "tesla_bridge/strings.hpp"

#include <cctype>

namespace tesla_bridge {

using json = nlohmann::json;

// Upper-cases the first letter of every word, lower-cases the rest.
static std::string title_case(const std::string& s){
    std::string out = s;
    bool word_start = true;
    for(auto& ch : out){
        unsigned char c = (unsigned char)ch;
        if(std::isalpha(c)){
            ch = word_start ? (char)std::toupper(c) : (char)std::tolower(c);
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return out;
}

std::string model_name(const std::string& car_type, const std::string& trim_badging){
    if(car_type.empty()) return {};
    std::string spaced = car_type.substr(0, car_type.size() - 1) + " " + car_type.substr(car_type.size() - 1);
    std::string model = title_case(spaced);
    if(!trim_badging.empty()) model += " " + to_upper(trim_badging);
    return model;
}

std::vector<DiscoveryMessage> build_discovery(const VehicleIdentity& id, const std::string& basetopic){
    const std::string& vin = id.vin;
    const std::string& car = id.name;
    const std::string base = std::string(kDiscoveryPrefix);
    const json device_ref = {{"identifiers", json::array({vin + "_device"})}};

    auto topic = [&](const char* component, const char* object){
        return base + "/" + component + "/" + vin + "/" + object + "/config";
    };

    std::vector<DiscoveryMessage> out;

    out.push_back({topic("sensor", "charging"), {
        {"name",        car + " Charging State"},
        {"state_topic", basetopic + "/charging"},
        {"unique_id",   vin + "_charging"},
        {"device",      device_ref},
        {"icon",        "mdi:ev-station"},
    }});

    // the battery sensor carries the full device description
    json device = device_ref;
    device["name"] = car + " Vehicle";
    device["manufacturer"] = "Tesla";
    std::string model = model_name(id.car_type, id.trim_badging);
    if(!model.empty()) device["model"] = model;

    out.push_back({topic("sensor", "battery"), {
        {"name",                car + " Battery Level"},
        {"state_topic",         basetopic + "/battery_level"},
        {"unique_id",           vin + "_battery_level"},
        {"unit_of_measurement", "%"},
        {"device_class",        "battery"},
        {"device",              device},
    }});

    out.push_back({topic("sensor", "timetofull"), {
        {"name",                car + " Time to Full"},
        {"state_topic",         basetopic + "/time_to_full"},
        {"unique_id",           vin + "_time_to_full"},
        {"unit_of_measurement", "h"},
        {"device",              device_ref},
        {"icon",                "hass:clock-fast"},
    }});

    out.push_back({topic("number", "chargelimit"), {
        {"name",          car + " Charge Limit"},
        {"state_topic",   basetopic + "/charge_limit"},
        {"command_topic", basetopic + "/charge_limit/set"},
        {"unique_id",     vin + "_charge_limit"},
        {"min",           50},
        {"max",           100},
        {"device",        device_ref},
        {"icon",          "hass:battery-alert"},
    }});

    out.push_back({topic("switch", "charging"), {
        {"name",           car + " Charging"},
        {"state_topic",    basetopic + "/charging"},
        {"command_topic",  basetopic + "/charging/set"},
        {"value_template", "{{ 'true' if value == 'Charging' else 'false' }}"},
        {"state_on",       "true"},
        {"state_off",      "false"},
        {"payload_on",     "true"},
        {"payload_off",    "false"},
        {"unique_id",      vin + "_charging_switch"},
        {"device",         device_ref},
        {"icon",           "mdi:ev-plug-type2"},
    }});

    out.push_back({topic("device_tracker", "gps"), {
        {"name",                  car + " Location"},
        {"json_attributes_topic", basetopic + "/gps"},
        {"state_topic",           basetopic + "/gps"},
        {"value_template",        "{{value_json.state}}"},
        {"unique_id",             vin + "_gps"},
        {"device",                device_ref},
        {"source_type",           "gps"},
        {"icon",                  "mdi:crosshairs-gps"},
    }});

    return out;
}

size_t publish_discovery(Publisher& out, const VehicleIdentity& id, const std::string& basetopic){
    size_t ok = 0;
    for(const auto& msg : build_discovery(id, basetopic)){
        std::string payload = msg.config.dump();
        if(out.publish(msg.topic, payload)){
            ++ok;
        } else {
            TB_LOG_WARNING("discovery", "publish failed topic='" << msg.topic << "'");
        }
    }
    TB_LOG_INFO("discovery", "announced " << ok << " entities for " << id.vin);
    return ok;
}

} // namespace tesla_bridge
