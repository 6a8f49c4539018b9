/*
 * change_publisher.hpp
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

#ifndef TESLA_BRIDGE_CHANGE_PUBLISHER_HPP
#define TESLA_BRIDGE_CHANGE_PUBLISHER_HPP

#include "tesla_bridge/publisher.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace tesla_bridge {

// Publishes "<basetopic>/<key>" only when the value differs from the last
// one published for that key. Keys are never forgotten.
class ChangePublisher {
public:
    ChangePublisher(Publisher& out, std::string basetopic);

    // true when a message went out
    bool publish_if_changed(const std::string& key, const nlohmann::json& value);

    const nlohmann::json* last_value(const std::string& key) const;

    std::string topic_for(const std::string& key) const { return basetopic_ + "/" + key; }

    // strings raw, null empty, everything else as JSON text
    static std::string render(const nlohmann::json& value);

private:
    Publisher& out_;
    std::string basetopic_;
    std::map<std::string, nlohmann::json> published_;
};

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_CHANGE_PUBLISHER_HPP
