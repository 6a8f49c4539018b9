/*
 * supervisor.hpp
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

#ifndef TESLA_BRIDGE_SUPERVISOR_HPP
#define TESLA_BRIDGE_SUPERVISOR_HPP

#include "tesla_bridge/change_publisher.hpp"
#include "tesla_bridge/command_queue.hpp"
#include "tesla_bridge/config.hpp"
#include "tesla_bridge/publisher.hpp"
#include "tesla_bridge/vehicle_api.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

namespace tesla_bridge {

// Delay applied after a failed session.
class Backoff {
public:
    explicit Backoff(const Timing& timing);

    Seconds current() const { return current_; }

    // Returns the delay to sleep now and grows the next one (capped).
    Seconds fail();

    void reset() { current_ = base_; }

private:
    Seconds base_;
    double factor_;
    Seconds max_;
    Seconds current_;
};

struct SessionResult {
    bool ok = true;          // false: the session died, error says why
    std::string error;
    size_t cycles = 0;       // successful poll cycles before the end
};

// Keeps a vehicle session alive: open, announce, poll until failure,
// back off, repeat. Never gives up on its own; stop() is the only way out.
class Supervisor {
public:
    Supervisor(VehicleApi& api, Publisher& out, CommandQueue& queue, const BridgeConfig& config);

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void run();

    // Safe from any thread.
    void stop();
    bool stopping() const { return stop_.load(); }

    // One session from login to failure (or stop). Exceptions end here.
    SessionResult run_session();

    const Backoff& backoff() const { return backoff_; }
    size_t sessions_started() const { return sessions_; }

private:
    // false when interrupted by stop()
    bool sleep_for(Seconds delay);
    void publish_status(bool connected);

    VehicleApi& api_;
    Publisher& out_;
    CommandQueue& queue_;
    BridgeConfig config_;
    ChangePublisher publisher_;
    Backoff backoff_;
    size_t sessions_ = 0;

    std::atomic<bool> stop_{false};
    std::mutex sleep_mtx_;
    std::condition_variable sleep_cv_;
};

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_SUPERVISOR_HPP
