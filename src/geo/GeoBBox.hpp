#pragma once

#include <algorithm>
#include <optional>
#include <span>

namespace efb::geo {

struct Coordinate;

// WGS84 经纬度包围盒，边界包含在内
struct GeoBBox {
    double minLon{0.0};
    double minLat{0.0};
    double maxLon{0.0};
    double maxLat{0.0};

    constexpr GeoBBox() = default;
    constexpr GeoBBox(double minLon, double minLat, double maxLon, double maxLat)
        : minLon(minLon), minLat(minLat), maxLon(maxLon), maxLat(maxLat) {}

    // 退化为一点的包围盒
    static constexpr GeoBBox fromPoint(double lon, double lat) noexcept {
        return GeoBBox{lon, lat, lon, lat};
    }

    constexpr double width() const noexcept { return maxLon - minLon; }
    constexpr double height() const noexcept { return maxLat - minLat; }
    constexpr double centerLon() const noexcept { return (minLon + maxLon) * 0.5; }
    constexpr double centerLat() const noexcept { return (minLat + maxLat) * 0.5; }

    constexpr bool contains(double lon, double lat) const noexcept {
        return lon >= minLon && lon <= maxLon && lat >= minLat && lat <= maxLat;
    }

    constexpr bool intersects(const GeoBBox& other) const noexcept {
        return !(maxLon < other.minLon || minLon > other.maxLon ||
                 maxLat < other.minLat || minLat > other.maxLat);
    }

    constexpr GeoBBox unite(const GeoBBox& other) const noexcept {
        return GeoBBox{
            std::min(minLon, other.minLon),
            std::min(minLat, other.minLat),
            std::max(maxLon, other.maxLon),
            std::max(maxLat, other.maxLat)
        };
    }

    // 各方向按度数外扩
    constexpr GeoBBox expanded(double deltaLon, double deltaLat) const noexcept {
        return GeoBBox{minLon - deltaLon, minLat - deltaLat, maxLon + deltaLon, maxLat + deltaLat};
    }

    constexpr bool operator==(const GeoBBox&) const = default;
};

// 纯函数：从点集合计算包围盒
[[nodiscard]] std::optional<GeoBBox> computeBounds(std::span<const Coordinate> points) noexcept;

} // namespace efb::geo
