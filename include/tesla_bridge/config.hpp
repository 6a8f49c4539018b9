/*
 * config.hpp
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

#ifndef TESLA_BRIDGE_CONFIG_HPP
#define TESLA_BRIDGE_CONFIG_HPP

#include "tesla_bridge/geo.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace tesla_bridge {

using Seconds = std::chrono::duration<double>;

constexpr const char* kEnvPrefix = "TESLA_";
constexpr const char* kDefaultBasetopic = "tesla/car";

// Poll cadence and failure backoff constants.
struct Timing {
    Seconds idle_max{11 * 60};     // longest wait between polls
    Seconds active_interval{15};   // cadence while driving or commanded
    double parked_factor = 4.0;    // active but parked (e.g. charging)
    double idle_growth = 1.2;
    Seconds backoff_base{15};
    double backoff_factor = 1.5;
    Seconds backoff_max{3600};
};

struct BridgeConfig {
    std::string email;
    std::string vin;               // empty: first vehicle on the account
    std::string mqtt_host;
    int mqtt_port = 1883;
    std::string mqtt_user;
    std::string mqtt_password;
    std::string basetopic = kDefaultBasetopic;
    std::optional<GeoPoint> home;  // empty: always home
    bool debug = false;
    std::string state_dir;         // .env and refresh_token.txt live here
    Timing timing;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// $XDG_STATE_HOME/tesla-mqtt-bridge or $HOME/.local/state/tesla-mqtt-bridge
std::string state_dir();

// KEY=VALUE lines; existing environment variables are not overwritten.
void load_env_file(const std::string& path);

// Option values keyed by long option name ("email", "mqtthost", ...).
// Command line first, TESLA_* environment variables override.
std::map<std::string, std::string> collect_options(int argc, char** argv);

// Validates and converts collected options; throws ConfigError.
BridgeConfig config_from_options(const std::map<std::string, std::string>& options);

// .env + command line + environment
BridgeConfig load_config(int argc, char** argv);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_CONFIG_HPP
