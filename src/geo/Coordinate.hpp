#pragma once

#include "core/Measurements.hpp"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace efb::geo {

// 平面几何使用的点，x 为经度，y 为纬度
struct Point {
    double x{0.0};
    double y{0.0};

    constexpr bool operator==(const Point&) const = default;
};

// WGS84 坐标（度）
struct Coordinate {
    double latitude{0.0};
    double longitude{0.0};

    constexpr Coordinate() = default;
    constexpr Coordinate(double latitude, double longitude)
        : latitude(latitude), longitude(longitude) {}

    static constexpr Coordinate fromPoint(const Point& p) noexcept { return Coordinate{p.y, p.x}; }
    constexpr Point toPoint() const noexcept { return Point{longitude, latitude}; }

    // 按位比较，不带容差
    bool operator==(const Coordinate& other) const noexcept {
        return std::bit_cast<std::uint64_t>(latitude) == std::bit_cast<std::uint64_t>(other.latitude) &&
               std::bit_cast<std::uint64_t>(longitude) == std::bit_cast<std::uint64_t>(other.longitude);
    }

    // 到 other 的大地线初始真方位
    [[nodiscard]] core::Angle bearing(const Coordinate& other) const;

    // 到 other 的大地线距离
    [[nodiscard]] core::Length dist(const Coordinate& other) const;

    // 沿方位角前进 distance 后的位置
    [[nodiscard]] Coordinate destination(const core::Angle& bearing, core::Length distance) const;

    [[nodiscard]] std::string toString() const;
};

} // namespace efb::geo

template<>
struct std::hash<efb::geo::Coordinate> {
    std::size_t operator()(const efb::geo::Coordinate& c) const noexcept {
        const auto lat = std::bit_cast<std::uint64_t>(c.latitude);
        const auto lon = std::bit_cast<std::uint64_t>(c.longitude);
        return std::hash<std::uint64_t>{}(lat ^ (lon + 0x9e3779b97f4a7c15ULL + (lat << 6) + (lat >> 2)));
    }
};
