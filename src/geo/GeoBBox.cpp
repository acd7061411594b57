#include "geo/GeoBBox.hpp"
#include "geo/Coordinate.hpp"

namespace efb::geo {

std::optional<GeoBBox> computeBounds(std::span<const Coordinate> points) noexcept {
    if (points.empty()) {
        return std::nullopt;
    }

    auto bbox = GeoBBox::fromPoint(points[0].longitude, points[0].latitude);
    for (const auto& point : points) {
        bbox.minLon = std::min(bbox.minLon, point.longitude);
        bbox.maxLon = std::max(bbox.maxLon, point.longitude);
        bbox.minLat = std::min(bbox.minLat, point.latitude);
        bbox.maxLat = std::max(bbox.maxLat, point.latitude);
    }

    return bbox;
}

} // namespace efb::geo
