/*
 * supervisor.cpp
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

#include "tesla_bridge/supervisor.hpp"
#include "tesla_bridge/discovery.hpp"
#include "tesla_bridge/log.hpp"
#include "tesla_bridge/polling_engine.hpp"

#include <algorithm>
#include <ctime>
#include <nlohmann/json.hpp>

namespace tesla_bridge {

using json = nlohmann::json;

Backoff::Backoff(const Timing& timing)
    : base_(timing.backoff_base),
      factor_(timing.backoff_factor),
      max_(timing.backoff_max),
      current_(timing.backoff_base) {}

Seconds Backoff::fail(){
    Seconds delay = current_;
    current_ = std::min(current_ * factor_, max_);
    return delay;
}

Supervisor::Supervisor(VehicleApi& api, Publisher& out, CommandQueue& queue, const BridgeConfig& config)
    : api_(api),
      out_(out),
      queue_(queue),
      config_(config),
      publisher_(out, config.basetopic),
      backoff_(config.timing) {}

void Supervisor::publish_status(bool connected){
    json j;
    j["connected"] = connected;
    j["timestamp"] = static_cast<long>(time(nullptr));
    std::string payload = j.dump();
    out_.publish(config_.basetopic + "/status", payload, 0, true);
}

SessionResult Supervisor::run_session(){
    SessionResult result;
    ++sessions_;
    try{
        auto session = api_.open_session();
        VehicleInfo vehicle = select_vehicle(session->vehicle_list(), config_.vin);
        TB_LOG_INFO("supervisor", "session started for " << vehicle.vin << " (" << vehicle.display_name << ")");

        VehicleIdentity id{vehicle.vin, vehicle.display_name, "", ""};
        if(session->vehicle_summary(vehicle).online){
            VehicleSnapshot data = session->vehicle_data(vehicle);
            if(!data.vehicle_name.empty()) id.name = data.vehicle_name;
            id.car_type = data.car_type;
            id.trim_badging = data.trim_badging;
        }
        publish_discovery(out_, id, config_.basetopic);
        publish_status(true);

        PollingEngine engine(*session, vehicle, queue_, publisher_, config_.home, config_.timing);
        while(!stopping()){
            auto outcome = engine.run_cycle();
            if(!outcome) break;
            ++result.cycles;
            backoff_.reset();
        }
    }catch(const VehicleError& e){
        result.ok = false;
        result.error = std::string("vehicle error (") + to_string(e.kind()) + "): " + e.what();
    }catch(const std::exception& e){
        result.ok = false;
        result.error = e.what();
    }
    return result;
}

bool Supervisor::sleep_for(Seconds delay){
    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay);
    std::unique_lock<std::mutex> lock(sleep_mtx_);
    return !sleep_cv_.wait_until(lock, deadline, [this]{ return stop_.load(); });
}

void Supervisor::run(){
    while(!stopping()){
        SessionResult r = run_session();
        if(r.ok) break;

        size_t dropped = queue_.drain();
        TB_LOG_ERROR("supervisor", "Error in tesla session after " << r.cycles << " cycles: " << r.error
                     << " (discarded " << dropped << " queued commands)");
        publish_status(false);

        Seconds delay = backoff_.fail();
        TB_LOG_INFO("supervisor", "Sleeping " << delay.count() << " seconds from error");
        if(!sleep_for(delay)) break;
    }
    publish_status(false);
    TB_LOG_INFO("supervisor", "stopped");
}

void Supervisor::stop(){
    {
        std::lock_guard<std::mutex> lock(sleep_mtx_);
        stop_ = true;
    }
    sleep_cv_.notify_all();
    queue_.close();
}

} // namespace tesla_bridge
