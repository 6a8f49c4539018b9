/*
 * geo.cpp
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

#include "tesla_bridge/geo.hpp"
#include "tesla_bridge/strings.hpp"

#include <cmath>
#include <stdexcept>

namespace tesla_bridge {

static constexpr double kPi = 3.14159265358979323846;

static double radians(double deg){ return deg * kPi / 180.0; }

double haversine_m(const GeoPoint& a, const GeoPoint& b){
    const double phi1 = radians(a.latitude);
    const double phi2 = radians(b.latitude);
    const double dphi = radians(b.latitude - a.latitude);
    const double dlambda = radians(b.longitude - a.longitude);

    const double h = std::pow(std::sin(dphi / 2), 2)
                   + std::cos(phi1) * std::cos(phi2) * std::pow(std::sin(dlambda / 2), 2);

    return 2 * kEarthRadiusMeters * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

Presence classify(const std::optional<GeoPoint>& home, const GeoPoint& point){
    if(!home) return Presence::Home;
    return haversine_m(*home, point) > kHomeRadiusMeters ? Presence::NotHome : Presence::Home;
}

const char* to_string(Presence p){
    return p == Presence::Home ? "home" : "not_home";
}

GeoPoint parse_geo_point(const std::string& text){
    auto comma = text.find(',');
    if(comma == std::string::npos){
        throw std::invalid_argument("expected 'lat,lng', got '" + text + "'");
    }
    std::string lat = trim_copy(text.substr(0, comma));
    std::string lng = trim_copy(text.substr(comma + 1));

    GeoPoint p;
    try{
        size_t used = 0;
        p.latitude = std::stod(lat, &used);
        if(used != lat.size()) throw std::invalid_argument(lat);
        p.longitude = std::stod(lng, &used);
        if(used != lng.size()) throw std::invalid_argument(lng);
    }catch(const std::exception&){
        throw std::invalid_argument("expected 'lat,lng', got '" + text + "'");
    }
    if(std::fabs(p.latitude) > 90.0 || std::fabs(p.longitude) > 180.0){
        throw std::invalid_argument("coordinate out of range: '" + text + "'");
    }
    return p;
}

} // namespace tesla_bridge
