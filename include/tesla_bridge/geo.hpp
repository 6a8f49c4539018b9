/*
 * geo.hpp
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

#ifndef TESLA_BRIDGE_GEO_HPP
#define TESLA_BRIDGE_GEO_HPP

#include <optional>
#include <string>

namespace tesla_bridge {

// decimal degrees
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

enum class Presence {
    Home,
    NotHome
};

constexpr double kEarthRadiusMeters = 6372800.0;
constexpr double kHomeRadiusMeters  = 100.0;

// Great-circle distance in meters (haversine).
double haversine_m(const GeoPoint& a, const GeoPoint& b);

// Without a home point the vehicle is always home.
Presence classify(const std::optional<GeoPoint>& home, const GeoPoint& point);

const char* to_string(Presence p);

// "lat,lng" -> GeoPoint; throws std::invalid_argument on malformed text
GeoPoint parse_geo_point(const std::string& text);

} // namespace tesla_bridge

#endif // TESLA_BRIDGE_GEO_HPP
