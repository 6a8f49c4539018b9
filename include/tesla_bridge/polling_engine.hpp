/*
 * polling_engine.hpp
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

#ifndef TESLA_BRIDGE_POLLING_ENGINE_HPP
#define TESLA_BRIDGE_POLLING_ENGINE_HPP

#include "tesla_bridge/change_publisher.hpp"
#include "tesla_bridge/command_queue.hpp"
#include "tesla_bridge/config.hpp"
#include "tesla_bridge/geo.hpp"
#include "tesla_bridge/vehicle_api.hpp"

#include <optional>
#include <string>

namespace tesla_bridge {

constexpr const char* kParked = "P";
constexpr const char* kCharging = "Charging";

struct CycleOutcome {
    bool command_processed = false;
    bool online = false;
    bool parked = true;
    bool charging = false;
    bool active = false;
    Seconds next_cadence{0};
};

// Active: base interval (times parked_factor when parked).
// Idle: current * idle_growth, never above idle_max.
Seconds next_cadence(Seconds current, bool active, bool parked, const Timing& timing);

// One vehicle session worth of polling. Owns the cadence; the published
// state belongs to the ChangePublisher so it outlives restarts.
class PollingEngine {
public:
    PollingEngine(VehicleSession& session,
                  VehicleInfo vehicle,
                  CommandQueue& queue,
                  ChangePublisher& publisher,
                  std::optional<GeoPoint> home,
                  const Timing& timing);

    // Waits for a command or the cadence, then polls once. Returns nullopt
    // when the queue was closed. Vehicle failures other than AlreadySet
    // propagate as exceptions.
    std::optional<CycleOutcome> run_cycle();

    Seconds cadence() const { return cadence_; }
    const VehicleInfo& vehicle() const { return vehicle_; }

private:
    void send_command(const Command& cmd);

    // Returns the effective shift state ("P" when none reported).
    std::string publish_snapshot(const VehicleSnapshot& data);

    VehicleSession& session_;
    VehicleInfo vehicle_;
    CommandQueue& queue_;
    ChangePublisher& publisher_;
    std::optional<GeoPoint> home_;
    Timing timing_;
    Seconds cadence_;
};

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_POLLING_ENGINE_HPP
