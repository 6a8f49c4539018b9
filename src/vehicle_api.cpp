/*
 * vehicle_api.cpp
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

#include "tesla_bridge/vehicle_api.hpp"
#include "tesla_bridge/strings.hpp"

namespace tesla_bridge {

VehicleError::VehicleError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

const char* to_string(VehicleError::Kind kind){
    switch(kind){
        case VehicleError::Kind::AlreadySet:  return "already_set";
        case VehicleError::Kind::Rejected:    return "rejected";
        case VehicleError::Kind::Unavailable: return "unavailable";
        case VehicleError::Kind::Auth:        return "auth";
        case VehicleError::Kind::Transport:   return "transport";
        case VehicleError::Kind::Protocol:    return "protocol";
    }
    return "unknown";
}

VehicleInfo select_vehicle(const std::vector<VehicleInfo>& vehicles, const std::string& vin){
    if(vehicles.empty()){
        throw VehicleError(VehicleError::Kind::Protocol, "no vehicles on this account");
    }
    if(vin.empty()) return vehicles.front();

    for(const auto& v : vehicles){
        if(iequals(v.vin, vin)) return v;
    }
    throw VehicleError(VehicleError::Kind::Protocol, "no vehicle with VIN " + to_upper(vin) + " on this account");
}

} // namespace tesla_bridge
