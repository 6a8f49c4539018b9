/*
 * vehicle_api.hpp
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

#ifndef TESLA_BRIDGE_VEHICLE_API_HPP
#define TESLA_BRIDGE_VEHICLE_API_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tesla_bridge {

struct VehicleInfo {
    std::string id;            // API handle used in request paths
    std::string vin;
    std::string display_name;
};

struct VehicleSummary {
    std::string state;         // "online", "asleep", "offline", ...
    bool online = false;
};

// One poll cycle worth of telemetry.
struct VehicleSnapshot {
    bool online = true;

    std::string charging_state;
    std::optional<double> time_to_full_h;   // empty while not charging (null)
    int battery_level = 0;
    int charge_limit_soc = 0;

    double latitude = 0.0;
    double longitude = 0.0;
    double heading = 0.0;
    double speed = 0.0;
    std::string shift_state;   // empty when the vehicle reports none

    std::string vehicle_name;
    std::string car_type;
    std::string trim_badging;
};

class VehicleError : public std::runtime_error {
public:
    enum class Kind {
        AlreadySet,   // requested setting already in effect
        Rejected,     // command refused for another reason
        Unavailable,  // vehicle asleep / not reachable
        Auth,         // token rejected, session must be rebuilt
        Transport,    // network level failure
        Protocol      // unexpected HTTP status or body
    };

    VehicleError(Kind kind, const std::string& message);

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

const char* to_string(VehicleError::Kind kind);

// An authenticated session. Closing happens on destruction.
class VehicleSession {
public:
    virtual ~VehicleSession() = default;

    virtual std::vector<VehicleInfo> vehicle_list() = 0;
    virtual VehicleSummary vehicle_summary(const VehicleInfo& vehicle) = 0;
    virtual VehicleSnapshot vehicle_data(const VehicleInfo& vehicle) = 0;

    virtual void set_charge_limit(const VehicleInfo& vehicle, int percent) = 0;
    virtual void charge_start(const VehicleInfo& vehicle) = 0;
    virtual void charge_stop(const VehicleInfo& vehicle) = 0;
};

class VehicleApi {
public:
    virtual ~VehicleApi() = default;

    // Establishes a fresh session; throws VehicleError on failure.
    virtual std::unique_ptr<VehicleSession> open_session() = 0;
};

// Picks the vehicle matching vin (case-insensitive), or the first one when
// vin is empty. Throws VehicleError when nothing matches.
VehicleInfo select_vehicle(const std::vector<VehicleInfo>& vehicles, const std::string& vin);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_VEHICLE_API_HPP
