/*
 * discovery.hpp
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

#ifndef TESLA_BRIDGE_DISCOVERY_HPP
#define TESLA_BRIDGE_DISCOVERY_HPP

#include "tesla_bridge/publisher.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tesla_bridge {

struct VehicleIdentity {
    std::string vin;
    std::string name;          // user-facing vehicle name
    std::string car_type;      // e.g. "models"
    std::string trim_badging;  // e.g. "p100d"
};

constexpr const char* kDiscoveryPrefix = "homeassistant";

struct DiscoveryMessage {
    std::string topic;
    nlohmann::json config;
};

// "models" + "p100d" -> "Model S P100D"; empty car_type -> ""
std::string model_name(const std::string& car_type, const std::string& trim_badging);

// Home Assistant discovery configs for every channel the bridge exposes.
std::vector<DiscoveryMessage> build_discovery(const VehicleIdentity& id, const std::string& basetopic);

// Publishes build_discovery(); returns the number of configs accepted.
size_t publish_discovery(Publisher& out, const VehicleIdentity& id, const std::string& basetopic);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_DISCOVERY_HPP
