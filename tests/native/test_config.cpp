/*
 * test_config.cpp
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
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>

#include "tesla_bridge/config.hpp"

using tesla_bridge::BridgeConfig;
using tesla_bridge::ConfigError;
using tesla_bridge::collect_options;
using tesla_bridge::config_from_options;

namespace {

using Options = std::map<std::string, std::string>;

bool rejects(const Options& o){
    try{
        config_from_options(o);
    }catch(const ConfigError&){
        return true;
    }
    return false;
}

Options minimal() { return {{"email", "owner@example.com"}, {"mqtthost", "broker.lan"}}; }

} // namespace

int main(){
    {
        BridgeConfig c = config_from_options(minimal());
        assert(c.email == "owner@example.com");
        assert(c.mqtt_host == "broker.lan");
        assert(c.mqtt_port == 1883);
        assert(c.basetopic == "tesla/car");
        assert(c.vin.empty());
        assert(!c.home);
        assert(!c.debug);
        assert(c.timing.idle_max.count() == 660);
        assert(c.timing.active_interval.count() == 15);
        assert(c.timing.backoff_max.count() == 3600);
    }

    {
        Options o = minimal();
        o["basetopic"] = "garage/tesla//";
        o["mqttport"] = "8883";
        o["gpshome"] = "37.4925,-121.9447";
        o["vin"] = " 5yjsa1e26hf000001 ";
        o["debug"] = "yes";
        BridgeConfig c = config_from_options(o);
        assert(c.basetopic == "garage/tesla");
        assert(c.mqtt_port == 8883);
        assert(c.home && c.home->latitude == 37.4925);
        assert(c.vin == "5yjsa1e26hf000001");
        assert(c.debug);
    }

    {
        assert(rejects({{"mqtthost", "broker.lan"}}));
        assert(rejects({{"email", "owner@example.com"}}));

        Options o = minimal();
        o["mqttport"] = "http";
        assert(rejects(o));
        o["mqttport"] = "70000";
        assert(rejects(o));

        o = minimal();
        o["gpshome"] = "somewhere";
        assert(rejects(o));

        o = minimal();
        o["basetopic"] = "/";
        assert(rejects(o));
    }

    {
        // command line first, TESLA_* environment wins
        setenv("TESLA_BASETOPIC", "env/topic", 1);
        char prog[] = "tesla-mqtt-bridge";
        char a1[] = "--email=cli@example.com";
        char a2[] = "--basetopic=cli/topic";
        char a3[] = "--debug";
        char* argv[] = {prog, a1, a2, a3, nullptr};
        Options o = collect_options(4, argv);
        assert(o["email"] == "cli@example.com");
        assert(o["basetopic"] == "env/topic");
        assert(o["debug"] == "1");
        unsetenv("TESLA_BASETOPIC");

        char bad[] = "--password=x";
        char* argv_bad[] = {prog, bad, nullptr};
        bool thrown = false;
        try{
            collect_options(2, argv_bad);
        }catch(const ConfigError&){
            thrown = true;
        }
        assert(thrown);

        char positional[] = "broker.lan";
        char* argv_pos[] = {prog, positional, nullptr};
        thrown = false;
        try{
            collect_options(2, argv_pos);
        }catch(const ConfigError&){
            thrown = true;
        }
        assert(thrown);
    }

    {
        // .env never overrides the real environment
        char tmpl[] = "/tmp/tesla_bridge_env_XXXXXX";
        int fd = mkstemp(tmpl);
        assert(fd >= 0);
        close(fd);
        {
            std::ofstream f(tmpl);
            f << "# comment\n"
              << "TESLA_BRIDGE_TEST_A = \"from file\"\n"
              << "TESLA_BRIDGE_TEST_B='kept'\n"
              << "not a setting\n";
        }
        setenv("TESLA_BRIDGE_TEST_B", "from env", 1);
        tesla_bridge::load_env_file(tmpl);
        assert(std::string(std::getenv("TESLA_BRIDGE_TEST_A")) == "from file");
        assert(std::string(std::getenv("TESLA_BRIDGE_TEST_B")) == "from env");
        unsetenv("TESLA_BRIDGE_TEST_A");
        unsetenv("TESLA_BRIDGE_TEST_B");
        std::remove(tmpl);

        // missing file is not an error
        tesla_bridge::load_env_file("/nonexistent/tesla-mqtt-bridge/.env");
    }

    {
        setenv("XDG_STATE_HOME", "/var/lib/state", 1);
        assert(tesla_bridge::state_dir() == "/var/lib/state/tesla-mqtt-bridge");
        unsetenv("XDG_STATE_HOME");
        setenv("HOME", "/home/owner", 1);
        assert(tesla_bridge::state_dir() == "/home/owner/.local/state/tesla-mqtt-bridge");
    }

    return 0;
}
