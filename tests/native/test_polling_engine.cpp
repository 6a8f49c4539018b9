/*
 * test_polling_engine.cpp
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
#include <chrono>
#include <cmath>
#include <optional>
#include <string>

#include "fakes.hpp"
#include "tesla_bridge/polling_engine.hpp"

using nlohmann::json;
using tesla_bridge::ChangePublisher;
using tesla_bridge::Command;
using tesla_bridge::CommandQueue;
using tesla_bridge::GeoPoint;
using tesla_bridge::PollingEngine;
using tesla_bridge::Seconds;
using tesla_bridge::SetChargeLimit;
using tesla_bridge::Timing;
using tesla_bridge::VehicleError;
using tesla_bridge::next_cadence;

namespace {

bool near(Seconds a, double b) { return std::fabs(a.count() - b) < 1e-6; }

// Engine plus everything it borrows.
struct Rig {
    explicit Rig(std::optional<GeoPoint> home = std::nullopt, Timing t = Timing{})
        : timing(t),
          publisher(out, "tesla/car"),
          engine(session, car.vehicles.front(), queue, publisher, home, timing) {}

    // wake marker first, so no test ever sleeps a real cadence
    tesla_bridge::CycleOutcome cycle(){
        queue.wake();
        auto r = engine.run_cycle();
        assert(r);
        return *r;
    }

    Timing timing;
    test::FakeCar car;
    test::FakeSession session{car};
    test::MockPublisher out;
    CommandQueue queue;
    ChangePublisher publisher;
    PollingEngine engine;
};

} // namespace

int main(){
    {
        Timing t;
        assert(near(next_cadence(Seconds(300), true, false, t), 15));
        assert(near(next_cadence(Seconds(300), true, true, t), 60));
        assert(near(next_cadence(Seconds(60), false, true, t), 72));
        assert(near(next_cadence(Seconds(600), false, true, t), 660));
        assert(near(next_cadence(Seconds(660), false, true, t), 660));
    }

    {
        // first cycle runs on the startup marker and publishes every channel
        Rig rig;
        assert(near(rig.engine.cadence(), 660));
        auto r = rig.engine.run_cycle();
        assert(r && r->online && !r->command_processed);
        assert(rig.out.count("tesla/car/charging") == 1);
        assert(rig.out.count("tesla/car/time_to_full") == 1);
        assert(rig.out.count("tesla/car/battery_level") == 1);
        assert(rig.out.count("tesla/car/charge_limit") == 1);
        assert(rig.out.count("tesla/car/gps") == 1);
        assert(rig.out.count("tesla/car/shift_state") == 1);
        assert(rig.out.last_payload("tesla/car/battery_level") == "64");
        assert(rig.out.last_payload("tesla/car/charging") == "Disconnected");

        // missing shift state is parked
        assert(rig.out.last_payload("tesla/car/shift_state") == "P");
        assert(r->parked && !r->active);
        assert(near(rig.engine.cadence(), 660));

        // nothing changed: a second cycle is silent
        rig.cycle();
        assert(rig.out.total() == 6);
    }

    {
        // driving: base interval
        Rig rig;
        rig.car.snapshot.shift_state = "D";
        rig.car.snapshot.speed = 42;
        auto r = rig.cycle();
        assert(r.active && !r.parked);
        assert(near(r.next_cadence, 15));
        assert(rig.out.last_payload("tesla/car/shift_state") == "D");
    }

    {
        // charging while parked: base x4
        Rig rig;
        rig.car.snapshot.shift_state = "P";
        rig.car.snapshot.charging_state = "Charging";
        auto r = rig.cycle();
        assert(r.active && r.parked && r.charging);
        assert(near(rig.engine.cadence(), 60));

        // charge finished: idle growth from the previous cadence
        rig.car.snapshot.charging_state = "Complete";
        r = rig.cycle();
        assert(!r.active);
        assert(near(rig.engine.cadence(), 72));
        rig.cycle();
        assert(near(rig.engine.cadence(), 86.4));
    }

    {
        // a null time to full goes out as an empty payload, then the number once charging
        Rig rig;
        rig.car.snapshot.time_to_full_h = std::nullopt;
        rig.engine.run_cycle();
        assert(rig.out.count("tesla/car/time_to_full") == 1);
        assert(rig.out.last_payload("tesla/car/time_to_full").empty());

        rig.car.snapshot.time_to_full_h = 2.5;
        rig.cycle();
        assert(rig.out.last_payload("tesla/car/time_to_full") == "2.5");
        rig.cycle();
        assert(rig.out.count("tesla/car/time_to_full") == 2);
    }

    {
        // "Charging" must match exactly
        Rig rig;
        rig.car.snapshot.charging_state = "charging";
        assert(!rig.cycle().active);
    }

    {
        // offline: no telemetry, cadence advances as idle
        Rig rig;
        rig.car.snapshot.shift_state = "D";
        rig.cycle();
        assert(near(rig.engine.cadence(), 15));
        size_t before = rig.out.total();
        int data_before = rig.car.data_calls;

        rig.car.online = false;
        auto r = rig.cycle();
        assert(!r.online && !r.active);
        assert(rig.out.total() == before);
        assert(rig.car.data_calls == data_before);
        assert(near(rig.engine.cadence(), 18));
    }

    {
        // a command makes the cycle active even while offline
        Rig rig;
        rig.car.online = false;
        rig.queue.wait_next(Seconds(0));
        rig.queue.enqueue(Command{SetChargeLimit{70}});
        auto r = rig.engine.run_cycle();
        assert(r && r->command_processed && r->active);
        assert(rig.car.calls.size() == 1 && rig.car.calls[0] == "set_charge_limit:70");
        assert(near(rig.engine.cadence(), 60));
        assert(rig.out.total() == 0);
    }

    {
        // inbound charge_limit/set "80" ends in one charge_limit publish of 80
        Rig rig;
        rig.engine.run_cycle();
        assert(rig.out.last_payload("tesla/car/charge_limit") == "90");

        assert(tesla_bridge::enqueue_message(rig.queue, "tesla/car/charge_limit/set", "80"));
        auto r = rig.engine.run_cycle();
        assert(r && r->command_processed);
        assert(rig.car.calls.back() == "set_charge_limit:80");
        assert(rig.out.last_payload("tesla/car/charge_limit") == "80");

        for(int i = 0; i < 3; ++i) rig.cycle();
        assert(rig.out.count("tesla/car/charge_limit") == 2);
    }

    {
        // already_set is benign
        Rig rig;
        rig.engine.run_cycle();
        rig.car.command_error = VehicleError::Kind::AlreadySet;
        rig.queue.enqueue(Command{tesla_bridge::StartCharge{}});
        auto r = rig.engine.run_cycle();
        assert(r && r->command_processed);
        assert(rig.car.summary_calls == 2);
    }

    {
        // any other command failure propagates
        Rig rig;
        rig.engine.run_cycle();
        rig.car.command_error = VehicleError::Kind::Rejected;
        rig.queue.enqueue(Command{tesla_bridge::StopCharge{}});
        bool thrown = false;
        try{
            rig.engine.run_cycle();
        }catch(const VehicleError& e){
            thrown = e.kind() == VehicleError::Kind::Rejected;
        }
        assert(thrown);
        assert(rig.car.summary_calls == 1);
    }

    {
        // fetch failures propagate too
        Rig rig;
        rig.car.on_data = [](int){
            throw VehicleError(VehicleError::Kind::Unavailable, "vehicle unavailable");
        };
        bool thrown = false;
        try{
            rig.engine.run_cycle();
        }catch(const VehicleError& e){
            thrown = e.kind() == VehicleError::Kind::Unavailable;
        }
        assert(thrown);
    }

    {
        // gps record with geofence
        Rig rig(GeoPoint{37.4925, -121.9447});
        rig.engine.run_cycle();
        json gps = json::parse(rig.out.last_payload("tesla/car/gps"));
        assert(gps["state"] == "home");
        assert(gps["gps_accuracy"] == 1);
        assert(gps["latitude"] == 37.4925);
        assert(gps["longitude"] == -121.9447);
        assert(gps["heading"] == 180.0);
        assert(gps["speed"] == 0.0);

        rig.car.snapshot.latitude = 37.5100;
        rig.cycle();
        gps = json::parse(rig.out.last_payload("tesla/car/gps"));
        assert(gps["state"] == "not_home");
        assert(rig.out.count("tesla/car/gps") == 2);
    }

    {
        // without a command or marker the wait ends on the cadence
        Timing t;
        t.idle_max = Seconds(0.05);
        Rig rig(std::nullopt, t);
        rig.engine.run_cycle();
        auto start = std::chrono::steady_clock::now();
        auto r = rig.engine.run_cycle();
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(r && !r->command_processed);
        assert(elapsed >= std::chrono::milliseconds(50));
        assert(rig.car.summary_calls == 2);
    }

    {
        Rig rig;
        rig.queue.close();
        assert(!rig.engine.run_cycle());
        assert(rig.car.summary_calls == 0);
    }

    return 0;
}
