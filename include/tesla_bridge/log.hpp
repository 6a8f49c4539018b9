/*
 * log.hpp
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

#ifndef TESLA_BRIDGE_LOG_HPP
#define TESLA_BRIDGE_LOG_HPP

#include <sstream>
#include <string>

namespace tesla_bridge {
namespace log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

void set_level(Level level);
Level level();
bool enabled(Level level);

// One line to stderr: "<time>: <LEVEL>:[<tag>] <message>"
void write(Level level, const char* tag, const std::string& message);

const char* level_name(Level level);

} // namespace log
} // namespace tesla_bridge

// stream-style helpers: TB_LOG_INFO("bridge", "rc=" << rc);
#define TB_LOG(lvl, tag, expr)                                              \
    do {                                                                    \
        if (::tesla_bridge::log::enabled(lvl)) {                            \
            std::ostringstream tb_log_os_;                                  \
            tb_log_os_ << expr;                                             \
            ::tesla_bridge::log::write(lvl, tag, tb_log_os_.str());         \
        }                                                                   \
    } while (0)

#define TB_LOG_DEBUG(tag, expr)   TB_LOG(::tesla_bridge::log::Level::Debug,   tag, expr)
#define TB_LOG_INFO(tag, expr)    TB_LOG(::tesla_bridge::log::Level::Info,    tag, expr)
#define TB_LOG_WARNING(tag, expr) TB_LOG(::tesla_bridge::log::Level::Warning, tag, expr)
#define TB_LOG_ERROR(tag, expr)   TB_LOG(::tesla_bridge::log::Level::Error,   tag, expr)

#endif // TESLA_BRIDGE_LOG_HPP
