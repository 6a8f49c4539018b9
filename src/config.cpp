/*
 * config.cpp
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

#include "tesla_bridge/config.hpp"
#include "tesla_bridge/log.hpp"
#include "tesla_bridge/strings.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>     // environ

extern char** environ;

namespace tesla_bridge {

static const std::set<std::string> kKnownOptions = {
    "email", "vin", "mqtthost", "mqttport", "mqttuser", "mqttpassword",
    "basetopic", "gpshome", "debug",
};

std::string state_dir(){
    const char* xdg = std::getenv("XDG_STATE_HOME");
    const char* home = std::getenv("HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tesla-mqtt-bridge";
    if (home && *home) return std::string(home) + "/.local/state/tesla-mqtt-bridge";
    // no HOME: stay relative but consistent
    return std::string("./.local/state/tesla-mqtt-bridge");
}

void load_env_file(const std::string& path){
    std::ifstream f(path);
    if(!f) return;
    std::string line;
    while(std::getline(f, line)){
        line = trim_copy(line);
        if(line.empty() || line[0]=='#') continue;
        auto pos = line.find('=');
        if(pos==std::string::npos) continue;
        std::string key = trim_copy(line.substr(0,pos));
        std::string val = trim_copy(line.substr(pos+1));
        if(val.size()>=2 && ((val.front()=='"' && val.back()=='"') || (val.front()=='\'' && val.back()=='\''))){
            val = val.substr(1, val.size()-2);
        }
        if(!key.empty()) setenv(key.c_str(), val.c_str(), 0);
    }
}

std::map<std::string, std::string> collect_options(int argc, char** argv){
    std::map<std::string, std::string> opts;

    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i] ? argv[i] : "";
        if(arg.rfind("--", 0) != 0){
            throw ConfigError("unexpected argument: " + arg);
        }
        arg = arg.substr(2);
        auto eq = arg.find('=');
        std::string key = eq == std::string::npos ? arg : arg.substr(0, eq);
        std::string val = eq == std::string::npos ? std::string("1") : arg.substr(eq + 1);
        if(!kKnownOptions.count(key)){
            throw ConfigError("unknown option: --" + key);
        }
        opts[key] = val;
    }

    const size_t prefix_len = std::strlen(kEnvPrefix);
    for(char** e = environ; e && *e; ++e){
        std::string entry = *e;
        if(entry.compare(0, prefix_len, kEnvPrefix) != 0) continue;
        auto eq = entry.find('=');
        if(eq == std::string::npos) continue;
        std::string key = to_lower(entry.substr(prefix_len, eq - prefix_len));
        std::string val = entry.substr(eq + 1);
        if(!kKnownOptions.count(key)){
            TB_LOG_WARNING("config", "ignoring unknown setting " << entry.substr(0, eq));
            continue;
        }
        opts[key] = val.empty() ? std::string("1") : val;
    }
    return opts;
}

static std::string opt(const std::map<std::string, std::string>& o, const char* key, const char* defv = ""){
    auto it = o.find(key);
    return it != o.end() && !it->second.empty() ? it->second : std::string(defv);
}

BridgeConfig config_from_options(const std::map<std::string, std::string>& o){
    BridgeConfig c;

    c.email = opt(o, "email");
    if(c.email.empty()) throw ConfigError("login email is required (--email / TESLA_EMAIL)");

    c.mqtt_host = opt(o, "mqtthost");
    if(c.mqtt_host.empty()) throw ConfigError("MQTT host is required (--mqtthost / TESLA_MQTTHOST)");

    std::string port = opt(o, "mqttport", "1883");
    try{
        size_t used = 0;
        c.mqtt_port = std::stoi(port, &used);
        if(used != port.size()) throw std::invalid_argument(port);
    }catch(const std::exception&){
        throw ConfigError("invalid MQTT port: " + port);
    }
    if(c.mqtt_port <= 0 || c.mqtt_port > 65535) throw ConfigError("invalid MQTT port: " + port);

    c.vin           = trim_copy(opt(o, "vin"));
    c.mqtt_user     = opt(o, "mqttuser");
    c.mqtt_password = opt(o, "mqttpassword");

    c.basetopic = opt(o, "basetopic", kDefaultBasetopic);
    while(!c.basetopic.empty() && c.basetopic.back() == '/') c.basetopic.pop_back();
    if(c.basetopic.empty()) throw ConfigError("base topic must not be empty");

    std::string home = opt(o, "gpshome");
    if(!home.empty()){
        try{
            c.home = parse_geo_point(home);
        }catch(const std::invalid_argument& e){
            throw ConfigError(std::string("invalid gpshome: ") + e.what());
        }
    }

    c.debug = !opt(o, "debug").empty();
    c.state_dir = state_dir();
    return c;
}

BridgeConfig load_config(int argc, char** argv){
    load_env_file((std::filesystem::path(state_dir()) / ".env").string());
    auto opts = collect_options(argc, argv);
    BridgeConfig c = config_from_options(opts);
    if(c.debug) log::set_level(log::Level::Debug);
    TB_LOG_DEBUG("config", "email=" << c.email << " vin=" << (c.vin.empty() ? "(first)" : c.vin)
                 << " mqtt=" << c.mqtt_host << ":" << c.mqtt_port << " basetopic=" << c.basetopic
                 << " home=" << (c.home ? "set" : "unset"));
    return c;
}

} // namespace tesla_bridge
