/*
 * change_publisher.cpp
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

#include "tesla_bridge/change_publisher.hpp"
#include "tesla_bridge/log.hpp"

namespace tesla_bridge {

ChangePublisher::ChangePublisher(Publisher& out, std::string basetopic)
    : out_(out), basetopic_(std::move(basetopic)) {}

std::string ChangePublisher::render(const nlohmann::json& value){
    if(value.is_string()) return value.get<std::string>();
    if(value.is_null()) return {};
    return value.dump();
}

bool ChangePublisher::publish_if_changed(const std::string& key, const nlohmann::json& value){
    auto it = published_.find(key);
    if(it != published_.end() && it->second == value) return false;

    const std::string topic = topic_for(key);
    const std::string payload = render(value);
    if(!out_.publish(topic, payload)){
        // not recorded, so the next cycle tries again
        TB_LOG_WARNING("publish", "publish failed topic='" << topic << "'");
        return false;
    }
    TB_LOG_DEBUG("publish", topic << " = " << payload);
    published_[key] = value;
    return true;
}

const nlohmann::json* ChangePublisher::last_value(const std::string& key) const {
    auto it = published_.find(key);
    return it == published_.end() ? nullptr : &it->second;
}

} // namespace tesla_bridge
