/*
 * log.cpp
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

#include "tesla_bridge/log.hpp"

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace tesla_bridge {
namespace log {

static std::atomic<int> g_level{static_cast<int>(Level::Info)};
static std::mutex g_write_mutex;

void set_level(Level lvl){ g_level = static_cast<int>(lvl); }

Level level(){ return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl){ return static_cast<int>(lvl) >= g_level.load(); }

const char* level_name(Level lvl){
    switch(lvl){
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error:   return "ERROR";
    }
    return "?";
}

void write(Level lvl, const char* tag, const std::string& message){
    char stamp[32] = {0};
    std::time_t now = std::time(nullptr);
    std::tm tm_now{};
    localtime_r(&now, &tm_now);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << stamp << ": " << level_name(lvl) << ":[" << (tag ? tag : "bridge") << "] "
              << message << "\n";
}

} // namespace log
} // namespace tesla_bridge
