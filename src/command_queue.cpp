/*
 * command_queue.cpp
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

#include "tesla_bridge/command_queue.hpp"

namespace tesla_bridge {

CommandQueue::CommandQueue(){
    items_.emplace_back(std::nullopt);
}

void CommandQueue::enqueue(Item item){
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if(closed_) return;
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
}

CommandQueue::WaitResult CommandQueue::wait_next(std::chrono::duration<double> timeout){
    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);

    std::unique_lock<std::mutex> lock(mtx_);
    bool ready = cv_.wait_until(lock, deadline, [this]{ return closed_ || !items_.empty(); });

    WaitResult r;
    if(closed_){
        r.status = Status::Closed;
        return r;
    }
    if(!ready){
        r.status = Status::Timeout;
        return r;
    }
    r.status = Status::Item;
    r.item = std::move(items_.front());
    items_.pop_front();
    return r;
}

size_t CommandQueue::drain(){
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for(const auto& it : items_){
            if(it) ++dropped;
        }
        items_.clear();
        items_.emplace_back(std::nullopt);
    }
    cv_.notify_one();
    return dropped;
}

void CommandQueue::close(){
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool CommandQueue::closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
}

size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
}

bool enqueue_message(CommandQueue& queue, const std::string& topic, const std::string& payload){
    auto cmd = parse_command(topic, payload);
    if(!cmd) return false;
    queue.enqueue(std::move(cmd));
    return true;
}

} // namespace tesla_bridge
