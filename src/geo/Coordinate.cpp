#include "geo/Coordinate.hpp"
#include "geo/Geodesic.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace efb::geo {

core::Angle Coordinate::bearing(const Coordinate& other) const {
    return core::Angle::trueNorth(geodesic::inverse(*this, other).initialBearing);
}

core::Length Coordinate::dist(const Coordinate& other) const {
    return core::Length::m(geodesic::inverse(*this, other).distance);
}

Coordinate Coordinate::destination(const core::Angle& bearing, core::Length distance) const {
    return geodesic::direct(*this, bearing.degrees(), distance.meters());
}

std::string Coordinate::toString() const {
    return fmt::format("{:.4f}{} {:.4f}{}",
                       std::abs(latitude), latitude < 0.0 ? 'S' : 'N',
                       std::abs(longitude), longitude < 0.0 ? 'W' : 'E');
}

} // namespace efb::geo
