/*
 * command_queue.hpp
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

#ifndef TESLA_BRIDGE_COMMAND_QUEUE_HPP
#define TESLA_BRIDGE_COMMAND_QUEUE_HPP

#include "tesla_bridge/command.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace tesla_bridge {

// FIFO between the MQTT callback thread (producer) and the polling thread
// (sole consumer). An empty entry is a wake marker: it ends the consumer's
// wait without carrying a command. One wake marker is queued at
// construction so the first poll happens immediately.
class CommandQueue {
public:
    using Item = std::optional<Command>;

    enum class Status {
        Item,
        Timeout,
        Closed
    };

    struct WaitResult {
        Status status = Status::Timeout;
        Item item;
    };

    CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Never blocks beyond the internal lock. Ignored after close().
    void enqueue(Item item);

    // Wakes the consumer without a command.
    void wake() { enqueue(std::nullopt); }

    WaitResult wait_next(std::chrono::duration<double> timeout);

    // Drops everything queued and leaves exactly one wake marker.
    // Returns the number of real commands discarded.
    size_t drain();

    // Releases any waiter with Status::Closed.
    void close();

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Item> items_;
    bool closed_ = false;
};

// MQTT inbound path: parses "<basetopic>/<setting>/set" and queues the
// command. Returns false when the message was dropped.
bool enqueue_message(CommandQueue& queue, const std::string& topic, const std::string& payload);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_COMMAND_QUEUE_HPP
