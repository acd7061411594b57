#include "nd/SpatialIndex.hpp"
#include <cmath>
#include <numbers>

namespace efb::nd {

namespace {
    // 近极点时经度扩展的上限倍数
    constexpr double POLAR_LONGITUDE_FACTOR = 100.0;
    constexpr double MIN_COS_LATITUDE = 0.01;
}

AirspaceIndex::AirspaceIndex(const std::vector<AirspacePtr>& airspaces) {
    std::vector<geo::RTree<AirspacePtr>::Entry> entries;
    entries.reserve(airspaces.size());
    for (const auto& airspace : airspaces) {
        if (airspace->polygon.empty()) {
            continue;
        }
        entries.push_back({airspace->polygon.envelope(), airspace});
    }
    tree_ = geo::RTree<AirspacePtr>{std::move(entries)};
}

std::vector<AirspacePtr> AirspaceIndex::candidatesAt(const geo::Coordinate& point) const {
    return tree_.locateAt(point.longitude, point.latitude);
}

std::vector<AirspacePtr> AirspaceIndex::candidatesIntersecting(const geo::GeoBBox& envelope) const {
    return tree_.locateIntersecting(envelope);
}

NavAidIndex::NavAidIndex(const std::vector<NavAid>& navaids) {
    std::vector<geo::RTree<NavAid>::Entry> entries;
    entries.reserve(navaids.size());
    for (const auto& navaid : navaids) {
        const auto c = navaid.coordinate();
        entries.push_back({geo::GeoBBox::fromPoint(c.longitude, c.latitude), navaid});
    }
    tree_ = geo::RTree<NavAid>{std::move(entries)};
}

geo::GeoBBox NavAidIndex::searchEnvelope(const geo::Coordinate& center, core::Length radius) noexcept {
    // 1 NM 约为 1/60 度纬度
    const double radiusDegrees = radius.nauticalMiles() / 60.0;
    const double cosLatitude = std::cos(center.latitude * std::numbers::pi / 180.0);
    const double lonDegrees = std::abs(cosLatitude) > MIN_COS_LATITUDE
        ? radiusDegrees / cosLatitude
        : radiusDegrees * POLAR_LONGITUDE_FACTOR;

    return geo::GeoBBox::fromPoint(center.longitude, center.latitude)
        .expanded(std::abs(lonDegrees), radiusDegrees);
}

std::vector<NavAid> NavAidIndex::withinRadius(const geo::Coordinate& center, core::Length radius) const {
    std::vector<NavAid> result;
    tree_.query(searchEnvelope(center, radius), [&](const NavAid& navaid) {
        if (center.dist(navaid.coordinate()) <= radius) {
            result.push_back(navaid);
        }
    });
    return result;
}

} // namespace efb::nd
