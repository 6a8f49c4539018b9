/*
 * polling_engine.cpp
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

#include "tesla_bridge/polling_engine.hpp"
#include "tesla_bridge/log.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace tesla_bridge {

using json = nlohmann::json;

Seconds next_cadence(Seconds current, bool active, bool parked, const Timing& timing){
    Seconds next = active
        ? timing.active_interval * (parked ? timing.parked_factor : 1.0)
        : current * timing.idle_growth;
    return std::min(next, timing.idle_max);
}

PollingEngine::PollingEngine(VehicleSession& session,
                             VehicleInfo vehicle,
                             CommandQueue& queue,
                             ChangePublisher& publisher,
                             std::optional<GeoPoint> home,
                             const Timing& timing)
    : session_(session),
      vehicle_(std::move(vehicle)),
      queue_(queue),
      publisher_(publisher),
      home_(home),
      timing_(timing),
      cadence_(timing.idle_max) {}

void PollingEngine::send_command(const Command& cmd){
    TB_LOG_DEBUG("engine", "Sending Tesla command: " << describe(cmd));
    try{
        apply_command(session_, vehicle_, cmd);
    }catch(const VehicleError& e){
        if(e.kind() != VehicleError::Kind::AlreadySet) throw;
        TB_LOG_DEBUG("engine", "Command already set, ignored: " << describe(cmd));
    }
}

std::string PollingEngine::publish_snapshot(const VehicleSnapshot& d){
    publisher_.publish_if_changed("charging",      d.charging_state);
    publisher_.publish_if_changed("time_to_full",  d.time_to_full_h ? json(*d.time_to_full_h) : json(nullptr));
    publisher_.publish_if_changed("battery_level", d.battery_level);
    publisher_.publish_if_changed("charge_limit",  d.charge_limit_soc);

    GeoPoint here{d.latitude, d.longitude};
    json gps = {
        {"latitude",     d.latitude},
        {"longitude",    d.longitude},
        {"heading",      d.heading},
        {"speed",        d.speed},
        {"state",        to_string(classify(home_, here))},
        {"gps_accuracy", 1},
    };
    publisher_.publish_if_changed("gps", gps);

    std::string shift = d.shift_state.empty() ? std::string(kParked) : d.shift_state;
    publisher_.publish_if_changed("shift_state", shift);
    return shift;
}

std::optional<CycleOutcome> PollingEngine::run_cycle(){
    cadence_ = std::min(cadence_, timing_.idle_max);
    TB_LOG_DEBUG("engine", "Sleeping " << cadence_.count() << "s");

    CommandQueue::WaitResult next = queue_.wait_next(cadence_);
    if(next.status == CommandQueue::Status::Closed) return std::nullopt;

    CycleOutcome out;
    if(next.status == CommandQueue::Status::Item && next.item){
        send_command(*next.item);
        out.command_processed = true;
    }

    VehicleSummary summary = session_.vehicle_summary(vehicle_);
    TB_LOG_DEBUG("engine", "Tesla car state: " << summary.state);
    out.online = summary.online;

    if(out.online){
        VehicleSnapshot data = session_.vehicle_data(vehicle_);
        std::string shift = publish_snapshot(data);
        out.parked = shift == kParked;
        out.charging = data.charging_state == kCharging;
    }

    out.active = out.command_processed || !out.parked || out.charging;
    cadence_ = next_cadence(cadence_, out.active, out.parked, timing_);
    out.next_cadence = cadence_;
    return out;
}

} // namespace tesla_bridge
