#include "route/Leg.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace efb::route {

Leg::Leg(nd::NavAid from,
         nd::NavAid to,
         std::optional<core::VerticalDistance> level,
         std::optional<core::Speed> tas,
         std::optional<core::Wind> wind)
    : from_(std::move(from))
    , to_(std::move(to))
    , level_(level)
    , tas_(tas)
    , wind_(wind) {
    const auto fromCoordinate = from_.coordinate();
    const auto toCoordinate = to_.coordinate();

    bearing_ = fromCoordinate.bearing(toCoordinate);
    mc_ = bearing_.toMagnetic(from_.magVar());
    dist_ = fromCoordinate.dist(toCoordinate);

    if (tas_ && wind_) {
        wca_ = windCorrectionAngle(*wind_, *tas_, bearing_);
        gs_ = groundSpeed(*tas_, *wind_, *wca_, bearing_);
        heading_ = bearing_ + *wca_;
        mh_ = heading_->toMagnetic(from_.magVar());
        ete_ = dist_ / *gs_;
    }
}

core::Angle windCorrectionAngle(const core::Wind& wind,
                                const core::Speed& tas,
                                const core::Angle& bearing) noexcept {
    const auto windAzimuth = wind.direction + core::Angle::trueNorth(180.0);
    const auto windAngle = bearing - windAzimuth;

    const double tasMps = tas.metersPerSecond();
    if (tasMps <= 0.0) {
        return core::Angle::trueNorth(0.0);
    }
    // 风速大于真空速时无解，取极限值
    const double ratio = std::clamp(wind.speed.metersPerSecond() / tasMps * std::sin(windAngle.radians()), -1.0, 1.0);
    return core::Angle::trueNorth(std::asin(ratio) * 180.0 / std::numbers::pi);
}

core::Speed groundSpeed(const core::Speed& tas,
                        const core::Wind& wind,
                        const core::Angle& wca,
                        const core::Angle& bearing) noexcept {
    const double t = tas.metersPerSecond();
    const double w = wind.speed.metersPerSecond();
    const double angle = (bearing - wind.direction + wca).radians();
    const double squared = t * t + w * w - 2.0 * t * w * std::cos(angle);
    return core::Speed::fromMetersPerSecond(std::sqrt(std::max(squared, 0.0)), tas.unit());
}

} // namespace efb::route
