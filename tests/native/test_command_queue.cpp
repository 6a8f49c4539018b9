/*
 * test_command_queue.cpp
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
#include <thread>
#include <variant>

#include "tesla_bridge/command_queue.hpp"

using tesla_bridge::Command;
using tesla_bridge::CommandQueue;
using tesla_bridge::SetChargeLimit;
using tesla_bridge::StartCharge;
using tesla_bridge::StopCharge;
using namespace std::chrono_literals;

namespace {

int percent_of(const CommandQueue::WaitResult& r){
    assert(r.status == CommandQueue::Status::Item);
    assert(r.item);
    return std::get<SetChargeLimit>(*r.item).percent;
}

} // namespace

int main(){
    {
        // startup wake marker: the first wait returns at once, without a command
        CommandQueue q;
        assert(q.size() == 1);
        auto start = std::chrono::steady_clock::now();
        auto r = q.wait_next(10s);
        assert(std::chrono::steady_clock::now() - start < 1s);
        assert(r.status == CommandQueue::Status::Item);
        assert(!r.item);
    }

    {
        CommandQueue q;
        q.wait_next(0s);

        q.enqueue(Command{SetChargeLimit{60}});
        q.enqueue(Command{StartCharge{}});
        q.enqueue(std::nullopt);
        q.enqueue(Command{StopCharge{}});

        assert(percent_of(q.wait_next(1s)) == 60);
        auto r = q.wait_next(1s);
        assert(r.item && std::holds_alternative<StartCharge>(*r.item));
        r = q.wait_next(1s);
        assert(r.status == CommandQueue::Status::Item && !r.item);
        r = q.wait_next(1s);
        assert(r.item && std::holds_alternative<StopCharge>(*r.item));
    }

    {
        // empty queue: times out after the requested duration
        CommandQueue q;
        q.wait_next(0s);
        auto start = std::chrono::steady_clock::now();
        auto r = q.wait_next(std::chrono::duration<double>(0.05));
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(r.status == CommandQueue::Status::Timeout);
        assert(!r.item);
        assert(elapsed >= 50ms);
        assert(elapsed < 1s);
    }

    {
        // drain keeps exactly one wake marker
        CommandQueue q;
        q.enqueue(Command{SetChargeLimit{50}});
        q.enqueue(Command{StartCharge{}});
        q.enqueue(Command{StopCharge{}});
        assert(q.size() == 4);

        size_t dropped = q.drain();
        assert(dropped == 3);
        assert(q.size() == 1);

        auto r = q.wait_next(1s);
        assert(r.status == CommandQueue::Status::Item && !r.item);
        r = q.wait_next(std::chrono::duration<double>(0.01));
        assert(r.status == CommandQueue::Status::Timeout);

        // draining an empty queue still leaves the marker
        assert(q.drain() == 0);
        assert(q.size() == 1);
    }

    {
        // producer thread, FIFO preserved
        CommandQueue q;
        q.wait_next(0s);
        std::thread producer([&q] {
            for(int i = 0; i < 100; ++i){
                q.enqueue(Command{SetChargeLimit{i}});
            }
        });
        for(int i = 0; i < 100; ++i){
            assert(percent_of(q.wait_next(5s)) == i);
        }
        producer.join();
    }

    {
        // a waiting consumer is released by a late enqueue
        CommandQueue q;
        q.wait_next(0s);
        std::thread producer([&q] {
            std::this_thread::sleep_for(20ms);
            q.enqueue(Command{SetChargeLimit{88}});
        });
        auto start = std::chrono::steady_clock::now();
        assert(percent_of(q.wait_next(10s)) == 88);
        assert(std::chrono::steady_clock::now() - start < 5s);
        producer.join();
    }

    {
        CommandQueue q;
        std::thread closer([&q] {
            std::this_thread::sleep_for(20ms);
            q.close();
        });
        q.wait_next(0s);
        auto r = q.wait_next(10s);
        assert(r.status == CommandQueue::Status::Closed);
        closer.join();

        q.enqueue(Command{StartCharge{}});
        assert(q.closed());
        assert(q.wait_next(0s).status == CommandQueue::Status::Closed);
    }

    {
        CommandQueue q;
        q.wait_next(0s);
        assert(tesla_bridge::enqueue_message(q, "tesla/car/charge_limit/set", "80"));
        assert(!tesla_bridge::enqueue_message(q, "tesla/car/unknown/set", "80"));
        assert(q.size() == 1);
        assert(percent_of(q.wait_next(0s)) == 80);
    }

    return 0;
}
