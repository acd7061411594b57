#include "nd/AirspaceBuilder.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace efb::nd {

namespace {

// 读取可选的坐标对
core::Result<std::optional<geo::Coordinate>> coordinateOf(const std::optional<Field<double>>& latitude,
                                                          const std::optional<Field<double>>& longitude) {
    if (!latitude || !longitude) {
        return std::nullopt;
    }
    if (!*latitude) {
        return std::unexpected(latitude->error());
    }
    if (!*longitude) {
        return std::unexpected(longitude->error());
    }
    return geo::Coordinate{**latitude, **longitude};
}

std::uint16_t clampFeet(int value) noexcept {
    return static_cast<std::uint16_t>(std::clamp(value, 0, 0xFFFF));
}

} // namespace

core::Result<void> AirspaceBuilder::addRecord(const ControlledAirspaceRecord& record) {
    const auto coordinate = coordinateOf(record.latitude, record.longitude);
    if (!coordinate) {
        return std::unexpected(coordinate.error());
    }

    const auto arcCenter = coordinateOf(record.arcOriginLatitude, record.arcOriginLongitude);
    if (!arcCenter) {
        return std::unexpected(arcCenter.error());
    }

    std::optional<core::Length> arcRadius;
    if (record.arcDistance) {
        if (!*record.arcDistance) {
            return std::unexpected(record.arcDistance->error());
        }
        arcRadius = core::Length::nm(**record.arcDistance);
    }

    if (!*coordinate && !*arcCenter) {
        throw std::logic_error(fmt::format(
            "boundary record of airspace '{}' has neither coordinate nor arc center",
            record.name.value_or("")));
    }

    if (!seeded_) {
        seeded_ = true;
        startPoint_ = *coordinate;
        name_ = record.name;
        type_ = toAirspaceType(record.type);
        classification_ = toAirspaceClass(record.type, record.classification);
        if (record.upperLimit) {
            ceiling_ = toVerticalDistance(*record.upperLimit, record.upperUnit);
        }
        if (record.lowerLimit) {
            floor_ = toVerticalDistance(*record.lowerLimit, record.lowerUnit);
        }
    }

    segments_.push_back(BoundarySegment{
        record.via.path,
        *coordinate ? **coordinate : **arcCenter,
        *arcCenter,
        arcRadius
    });

    return {};
}

Airspace AirspaceBuilder::build() const {
    Airspace airspace;
    airspace.name = name_.value_or("");
    airspace.type = type_;
    airspace.classification = classification_;
    airspace.ceiling = ceiling_.value_or(core::VerticalDistance::unlimited());
    airspace.floor = floor_.value_or(core::VerticalDistance::gnd());
    airspace.polygon = geo::Polygon{buildRing()};
    return airspace;
}

std::vector<geo::Coordinate> AirspaceBuilder::buildRing() const {
    if (segments_.size() == 1 && segments_.front().path == BoundaryPath::Circle) {
        return buildCircle(segments_.front());
    }

    std::vector<geo::Coordinate> ring;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& segment = segments_[i];
        const auto& previous = i == 0
            ? startPoint_.value_or(segment.endPoint)
            : segments_[i - 1].endPoint;

        switch (segment.path) {
            case BoundaryPath::Circle:
            case BoundaryPath::GreatCircle:
            case BoundaryPath::RhumbLine:
                // 直线段只取端点，不区分大圆与等角航线
                ring.push_back(segment.endPoint);
                break;
            case BoundaryPath::ClockwiseArc:
            case BoundaryPath::CounterClockwiseArc: {
                auto arc = interpolateArc(previous, segment, segment.path == BoundaryPath::ClockwiseArc);
                ring.insert(ring.end(), arc.begin(), arc.end());
                break;
            }
        }
    }

    if (!ring.empty() && ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
    return ring;
}

std::vector<geo::Coordinate> AirspaceBuilder::buildCircle(const BoundarySegment& segment) const {
    const auto& center = segment.endPoint;
    const auto radius = segment.arcRadius.value_or(core::Length{});
    const int count = ARC_POINTS_PER_QUADRANT * 4;

    std::vector<geo::Coordinate> ring;
    ring.reserve(count + 1);
    for (int i = 0; i < count; ++i) {
        const auto bearing = core::Angle::trueNorth(i * 360.0 / count);
        ring.push_back(center.destination(bearing, radius));
    }
    ring.push_back(ring.front());
    return ring;
}

std::vector<geo::Coordinate> AirspaceBuilder::interpolateArc(const geo::Coordinate& start,
                                                             const BoundarySegment& segment,
                                                             bool clockwise) const {
    if (!segment.arcCenter || !segment.arcRadius) {
        // 缺少圆心时按直线处理
        return {segment.endPoint};
    }

    const auto& center = *segment.arcCenter;
    const double startBearing = center.bearing(start).degrees();
    const double endBearing = center.bearing(segment.endPoint).degrees();
    const double sweep = calculateArcSweep(startBearing, endBearing, clockwise);

    const auto count = std::max(2, static_cast<int>(std::ceil(
        std::abs(sweep) / 90.0 * ARC_POINTS_PER_QUADRANT)));

    std::vector<geo::Coordinate> points;
    points.reserve(count);
    for (int i = 1; i <= count; ++i) {
        const double fraction = static_cast<double>(i) / count;
        const auto bearing = core::Angle::trueNorth(startBearing + sweep * fraction);
        points.push_back(center.destination(bearing, *segment.arcRadius));
    }
    return points;
}

double calculateArcSweep(double startDegrees, double endDegrees, bool clockwise) noexcept {
    double diff = endDegrees - startDegrees;
    if (clockwise) {
        if (diff <= 0.0) {
            diff += 360.0;
        }
    } else if (diff >= 0.0) {
        diff -= 360.0;
    }
    return diff;
}

AirspaceType toAirspaceType(ControlledAirspaceType type) noexcept {
    switch (type) {
        case ControlledAirspaceType::ClassB:
        case ControlledAirspaceType::ClassC:
        case ControlledAirspaceType::TerminalControlArea: return AirspaceType::TMA;
        case ControlledAirspaceType::ControlZone: return AirspaceType::CTR;
        case ControlledAirspaceType::ControlArea: return AirspaceType::CTA;
        case ControlledAirspaceType::RadarZone: return AirspaceType::RadarZone;
        case ControlledAirspaceType::RadioMandatoryZone: return AirspaceType::RMZ;
        case ControlledAirspaceType::TransponderMandatoryZone: return AirspaceType::TMZ;
    }
    return AirspaceType::CTA;
}

std::optional<AirspaceClass> toAirspaceClass(ControlledAirspaceType type,
                                             std::optional<char> classification) noexcept {
    if (classification) {
        if (auto parsed = airspaceClassFromChar(*classification)) {
            return parsed;
        }
    }
    switch (type) {
        case ControlledAirspaceType::ClassB: return AirspaceClass::B;
        case ControlledAirspaceType::ClassC: return AirspaceClass::C;
        default: return std::nullopt;
    }
}

core::VerticalDistance toVerticalDistance(const AirspaceLimit& limit,
                                          std::optional<UnitIndicator> unit) noexcept {
    using core::VerticalDistance;
    switch (limit.kind) {
        case AirspaceLimit::Kind::Altitude:
            return unit == UnitIndicator::Agl
                ? VerticalDistance::agl(clampFeet(limit.value))
                : VerticalDistance::msl(clampFeet(limit.value));
        case AirspaceLimit::Kind::FlightLevel: return VerticalDistance::fl(clampFeet(limit.value));
        case AirspaceLimit::Kind::Ground: return VerticalDistance::gnd();
        case AirspaceLimit::Kind::MeanSeaLevel: return VerticalDistance::msl(0);
        case AirspaceLimit::Kind::Unlimited:
        case AirspaceLimit::Kind::NotSpecified:
        case AirspaceLimit::Kind::Notam: return VerticalDistance::unlimited();
    }
    return VerticalDistance::unlimited();
}

} // namespace efb::nd
