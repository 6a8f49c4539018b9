/*
 * command.hpp
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

#ifndef TESLA_BRIDGE_COMMAND_HPP
#define TESLA_BRIDGE_COMMAND_HPP

#include "tesla_bridge/vehicle_api.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tesla_bridge {

struct SetChargeLimit {
    int percent = 0;
};

struct StartCharge {};

struct StopCharge {};

using Command = std::variant<SetChargeLimit, StartCharge, StopCharge>;

bool operator==(const SetChargeLimit& a, const SetChargeLimit& b);
bool operator==(const StartCharge&, const StartCharge&);
bool operator==(const StopCharge&, const StopCharge&);

// Maps an inbound "<basetopic>/<setting>/set" message to a command.
// Unknown settings and malformed payloads are logged and yield nullopt.
std::optional<Command> parse_command(const std::string& topic, const std::string& payload);

// Issues the typed vehicle call for cmd.
void apply_command(VehicleSession& session, const VehicleInfo& vehicle, const Command& cmd);

std::string describe(const Command& cmd);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_COMMAND_HPP
