/*
 * vehicle_data.hpp
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

#ifndef TESLA_BRIDGE_VEHICLE_DATA_HPP
#define TESLA_BRIDGE_VEHICLE_DATA_HPP

#include "tesla_bridge/vehicle_api.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tesla_bridge {

// Checks the HTTP status and returns the "response" member of an Owner API
// reply. 401 -> Auth, 408 -> Unavailable, other failures -> Protocol.
nlohmann::json decode_response(long http_status, const std::string& body, const std::string& what);

std::vector<VehicleInfo> parse_vehicle_list(const nlohmann::json& response);
VehicleSummary parse_vehicle_summary(const nlohmann::json& response);

// Null or missing numbers decode as 0, a null shift state as "".
VehicleSnapshot parse_vehicle_data(const nlohmann::json& response);

// {"result":false,"reason":"already_set"} -> VehicleError(AlreadySet), other
// reasons -> VehicleError(Rejected).
void check_command_result(const nlohmann::json& response, const std::string& command);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_VEHICLE_DATA_HPP
