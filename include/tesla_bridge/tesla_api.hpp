/*
 * tesla_api.hpp
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

#ifndef TESLA_BRIDGE_TESLA_API_HPP
#define TESLA_BRIDGE_TESLA_API_HPP

#include "tesla_bridge/vehicle_api.hpp"

#include <memory>
#include <string>

namespace tesla_bridge {

struct TeslaApiConfig {
    std::string email;
    std::string token_dir;   // holds refresh_token.txt
    std::string auth_url = "https://auth.tesla.com/oauth2/v3/token";
    std::string api_base = "https://owner-api.teslamotors.com";
    long timeout_s = 30;
};

// Tesla Owner API over libcurl. Every open_session() trades the stored
// refresh token for a new access token and persists a rotated refresh token.
class TeslaApi : public VehicleApi {
public:
    explicit TeslaApi(TeslaApiConfig config);

    std::unique_ptr<VehicleSession> open_session() override;

    std::string refresh_token_path() const;

private:
    TeslaApiConfig config_;
};

// Replaces path with data (mode 0600) via a temp file and rename, creating
// the directory if needed. Throws VehicleError(Auth) on any I/O failure.
void write_token_file(const std::string& path, const std::string& data);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_TESLA_API_HPP
