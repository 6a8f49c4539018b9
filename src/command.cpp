/*
 * command.cpp
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

#include "tesla_bridge/command.hpp"
#include "tesla_bridge/log.hpp"
#include "tesla_bridge/strings.hpp"

#include <cmath>
#include <limits>
#include <type_traits>
#include <vector>

namespace tesla_bridge {

bool operator==(const SetChargeLimit& a, const SetChargeLimit& b){ return a.percent == b.percent; }
bool operator==(const StartCharge&, const StartCharge&){ return true; }
bool operator==(const StopCharge&, const StopCharge&){ return true; }

// "80", " 80 ", "80.0" -> 80; anything else -> nullopt
static std::optional<int> parse_percent(const std::string& payload){
    std::string s = trim_copy(payload);
    if(s.empty()) return std::nullopt;
    try{
        size_t used = 0;
        double v = std::stod(s, &used);
        if(used != s.size() || !std::isfinite(v)) return std::nullopt;
        if(v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }catch(const std::exception&){
        return std::nullopt;
    }
}

std::optional<Command> parse_command(const std::string& topic, const std::string& payload){
    std::vector<std::string> parts = split(topic, '/');
    if(parts.size() < 2){
        TB_LOG_ERROR("mqtt", "Unexpected command topic: " << topic);
        return std::nullopt;
    }
    const std::string& setting = parts[parts.size() - 2];
    TB_LOG_DEBUG("mqtt", "Incoming MQTT message: " << setting << " : " << payload);

    if(setting == "charge_limit"){
        auto percent = parse_percent(payload);
        if(!percent){
            TB_LOG_ERROR("mqtt", "Invalid charge_limit payload: '" << payload << "'");
            return std::nullopt;
        }
        return Command{SetChargeLimit{*percent}};
    }
    if(setting == "charging"){
        if(payload == "true")  return Command{StartCharge{}};
        if(payload == "false") return Command{StopCharge{}};
        TB_LOG_ERROR("mqtt", "Invalid charging payload: '" << payload << "'");
        return std::nullopt;
    }

    TB_LOG_ERROR("mqtt", "Unknown MQTT setting: " << setting);
    return std::nullopt;
}

void apply_command(VehicleSession& session, const VehicleInfo& vehicle, const Command& cmd){
    std::visit([&](const auto& c){
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, SetChargeLimit>){
            session.set_charge_limit(vehicle, c.percent);
        } else if constexpr (std::is_same_v<T, StartCharge>){
            session.charge_start(vehicle);
        } else {
            session.charge_stop(vehicle);
        }
    }, cmd);
}

std::string describe(const Command& cmd){
    if(auto* s = std::get_if<SetChargeLimit>(&cmd)){
        return "CHANGE_CHARGE_LIMIT percent=" + std::to_string(s->percent);
    }
    if(std::holds_alternative<StartCharge>(cmd)) return "START_CHARGE";
    return "STOP_CHARGE";
}

} // namespace tesla_bridge
