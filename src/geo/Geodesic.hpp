#pragma once

#include "geo/Coordinate.hpp"

namespace efb::geo::geodesic {

// WGS84 椭球参数
inline constexpr double WGS84_A = 6378137.0;
inline constexpr double WGS84_F = 1.0 / 298.257223563;
inline constexpr double WGS84_B = WGS84_A * (1.0 - WGS84_F);

// 反算结果，方位角为度数 [0, 360)
struct Inverse {
    double distance{0.0};        // 米
    double initialBearing{0.0};
    double finalBearing{0.0};
};

// Vincenty 反算；近对跖点不收敛时退回球面公式
[[nodiscard]] Inverse inverse(const Coordinate& from, const Coordinate& to) noexcept;

// Vincenty 正算
[[nodiscard]] Coordinate direct(const Coordinate& from, double bearingDegrees, double distanceMeters) noexcept;

// 球面 Haversine 距离（米）
[[nodiscard]] double haversineMeters(const Coordinate& from, const Coordinate& to) noexcept;

} // namespace efb::geo::geodesic
