/*
 * vehicle_data.cpp
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

#include "tesla_bridge/vehicle_data.hpp"

#include <cmath>

namespace tesla_bridge {

using json = nlohmann::json;

static double number_or_zero(const json& obj, const char* key){
    if(!obj.is_object() || !obj.contains(key)) return 0.0;
    const json& v = obj[key];
    if(v.is_number()) return v.get<double>();
    if(v.is_string()){
        try{
            double d = std::stod(v.get<std::string>());
            return std::isfinite(d) ? d : 0.0;
        }catch(const std::exception&){
            return 0.0;
        }
    }
    return 0.0;
}

static std::optional<double> number_or_null(const json& obj, const char* key){
    if(!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return number_or_zero(obj, key);
}

static std::string string_or_empty(const json& obj, const char* key){
    if(!obj.is_object() || !obj.contains(key)) return {};
    const json& v = obj[key];
    return v.is_string() ? v.get<std::string>() : std::string();
}

static const json& section(const json& response, const char* name){
    static const json empty = json::object();
    if(response.is_object() && response.contains(name) && response[name].is_object()) return response[name];
    return empty;
}

json decode_response(long http_status, const std::string& body, const std::string& what){
    if(http_status == 401){
        throw VehicleError(VehicleError::Kind::Auth, what + ": HTTP 401 (token rejected)");
    }
    if(http_status == 408){
        throw VehicleError(VehicleError::Kind::Unavailable, what + ": HTTP 408 (vehicle unavailable)");
    }
    if(http_status < 200 || http_status >= 300){
        throw VehicleError(VehicleError::Kind::Protocol,
                           what + ": HTTP " + std::to_string(http_status) + " " + body.substr(0, 200));
    }

    json j = json::parse(body, nullptr, false);
    if(j.is_discarded()){
        throw VehicleError(VehicleError::Kind::Protocol, what + ": invalid JSON");
    }
    if(!j.is_object() || !j.contains("response") || j["response"].is_null()){
        std::string err = string_or_empty(j, "error");
        throw VehicleError(VehicleError::Kind::Protocol,
                           what + ": no response" + (err.empty() ? std::string() : " (" + err + ")"));
    }
    return j["response"];
}

std::vector<VehicleInfo> parse_vehicle_list(const json& response){
    if(!response.is_array()){
        throw VehicleError(VehicleError::Kind::Protocol, "vehicle list: expected an array");
    }
    std::vector<VehicleInfo> out;
    for(const auto& v : response){
        VehicleInfo info;
        info.id = string_or_empty(v, "id_s");
        if(info.id.empty() && v.contains("id")) info.id = v["id"].dump();
        info.vin = string_or_empty(v, "vin");
        info.display_name = string_or_empty(v, "display_name");
        if(info.id.empty() || info.vin.empty()){
            throw VehicleError(VehicleError::Kind::Protocol, "vehicle list: entry without id/vin");
        }
        out.push_back(std::move(info));
    }
    return out;
}

VehicleSummary parse_vehicle_summary(const json& response){
    VehicleSummary s;
    s.state = string_or_empty(response, "state");
    s.online = s.state == "online";
    return s;
}

VehicleSnapshot parse_vehicle_data(const json& response){
    const json& charge = section(response, "charge_state");
    const json& drive = section(response, "drive_state");
    const json& vstate = section(response, "vehicle_state");
    const json& vconfig = section(response, "vehicle_config");

    if(charge.empty() || drive.empty()){
        throw VehicleError(VehicleError::Kind::Protocol, "vehicle data: charge_state/drive_state missing");
    }

    VehicleSnapshot d;
    d.online = true;
    d.charging_state = string_or_empty(charge, "charging_state");
    d.time_to_full_h = number_or_null(charge, "time_to_full_charge");
    d.battery_level = static_cast<int>(number_or_zero(charge, "battery_level"));
    d.charge_limit_soc = static_cast<int>(number_or_zero(charge, "charge_limit_soc"));

    d.latitude = number_or_zero(drive, "latitude");
    d.longitude = number_or_zero(drive, "longitude");
    d.heading = number_or_zero(drive, "heading");
    d.speed = number_or_zero(drive, "speed");
    d.shift_state = string_or_empty(drive, "shift_state");

    d.vehicle_name = string_or_empty(vstate, "vehicle_name");
    d.car_type = string_or_empty(vconfig, "car_type");
    d.trim_badging = string_or_empty(vconfig, "trim_badging");
    return d;
}

void check_command_result(const json& response, const std::string& command){
    if(response.is_object() && response.contains("result")
       && response["result"].is_boolean() && response["result"].get<bool>()) return;

    std::string reason = string_or_empty(response, "reason");
    if(reason == "already_set"){
        throw VehicleError(VehicleError::Kind::AlreadySet, command + ": already_set");
    }
    throw VehicleError(VehicleError::Kind::Rejected,
                       command + ": " + (reason.empty() ? std::string("rejected") : reason));
}

} // namespace tesla_bridge
