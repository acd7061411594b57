#include "route/VerticalProfile.hpp"
#include "route/Route.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <spdlog/spdlog.h>

namespace efb::route {

namespace {

// 小于该距离的穿越点视为同一点
constexpr double CROSSING_TOLERANCE_METERS = 1.0;

struct Crossing {
    core::Length distance;
    geo::Point point;
};

// 每个穿越点所在的航路段序号
std::vector<std::pair<std::size_t, geo::Point>> segmentCrossings(const geo::LineString& line,
                                                                 const geo::Polygon& polygon) {
    std::vector<std::pair<std::size_t, geo::Point>> result;
    const auto boundary = polygon.lines();
    const auto segments = line.lines();

    for (std::size_t i = 0; i < segments.size(); ++i) {
        for (const auto& edge : boundary) {
            const auto intersection = geo::lineIntersection(segments[i], edge);
            if (!intersection) {
                continue;
            }
            if (const auto* single = std::get_if<geo::SinglePoint>(&*intersection)) {
                result.emplace_back(i, single->point);
            } else {
                const auto& overlap = std::get<geo::CollinearOverlap>(*intersection);
                result.emplace_back(i, overlap.start);
                result.emplace_back(i, overlap.end);
            }
        }
    }
    return result;
}

} // namespace

core::Length distanceAlongRoute(const geo::LineString& line,
                                const std::vector<core::Length>& segmentLengths,
                                std::size_t segment,
                                const geo::Point& point) {
    auto prior = core::Length::m(0.0);
    for (std::size_t i = 0; i < segment; ++i) {
        prior += segmentLengths[i];
    }
    // 段内按平面比例插值
    const auto lines = line.lines();
    const double fraction = geo::lineLocatePoint(lines[segment], point);
    return prior + segmentLengths[segment] * fraction;
}

std::vector<AirspaceIntersection> computeIntersections(const nd::AirspacePtr& airspace,
                                                       const geo::LineString& line,
                                                       const std::vector<core::Length>& segmentLengths,
                                                       core::Length totalLength) {
    const auto& points = line.points();
    if (points.empty()) {
        return {};
    }

    const auto& polygon = airspace->polygon;
    const bool firstInside = polygon.contains(points.front());
    const bool lastInside = polygon.contains(points.back());

    std::vector<Crossing> crossings;
    for (const auto& [segment, point] : segmentCrossings(line, polygon)) {
        crossings.push_back({distanceAlongRoute(line, segmentLengths, segment, point), point});
    }

    std::sort(crossings.begin(), crossings.end(), [](const Crossing& a, const Crossing& b) {
        return a.distance < b.distance;
    });

    // 共享顶点会产生重复穿越点
    std::vector<Crossing> transitions;
    if (firstInside) {
        transitions.push_back({core::Length::m(0.0), points.front().toPoint()});
    }
    const std::size_t firstCrossing = transitions.size();
    for (const auto& crossing : crossings) {
        if (transitions.size() > firstCrossing &&
            std::abs((crossing.distance - transitions.back().distance).meters()) < CROSSING_TOLERANCE_METERS) {
            continue;
        }
        transitions.push_back(crossing);
    }
    if (lastInside) {
        transitions.push_back({totalLength, points.back().toPoint()});
    }

    // 依次两两配对，落单的切点丢弃
    std::vector<AirspaceIntersection> result;
    for (std::size_t i = 0; i + 1 < transitions.size(); i += 2) {
        result.push_back({
            airspace,
            transitions[i].distance,
            transitions[i + 1].distance,
            geo::Coordinate::fromPoint(transitions[i].point),
            geo::Coordinate::fromPoint(transitions[i + 1].point),
        });
    }
    return result;
}

std::vector<VerticalPoint> computeProfile(const Route& route) {
    const auto& legs = route.legs();
    if (legs.empty()) {
        return {};
    }

    std::vector<VerticalPoint> profile;
    if (const auto& origin = route.origin()) {
        profile.push_back({VerticalPoint::Kind::NavAid, origin->elevation, core::Length::m(0.0), nd::NavAid{origin}});
    }

    const auto totals = route.accumulateLegs();
    for (std::size_t i = 0; i < legs.size(); ++i) {
        const auto& leg = legs[i];
        if (i + 1 == legs.size()) {
            if (const auto& destination = route.destination()) {
                profile.push_back({VerticalPoint::Kind::NavAid, destination->elevation, totals[i].dist,
                                   nd::NavAid{destination}});
            }
        } else if (leg.level()) {
            profile.push_back({VerticalPoint::Kind::NavAid, *leg.level(), totals[i].dist, leg.to()});
        }
    }
    return profile;
}

VerticalProfile VerticalProfile::compute(const Route& route, const nd::NavigationData& nd) {
    VerticalProfile result;
    const auto& legs = route.legs();
    if (legs.empty()) {
        return result;
    }

    std::vector<geo::Coordinate> points;
    points.reserve(legs.size() + 1);
    points.push_back(legs.front().from().coordinate());
    for (const auto& leg : legs) {
        points.push_back(leg.to().coordinate());
    }
    const geo::LineString line(std::move(points));

    std::vector<core::Length> segmentLengths;
    auto totalLength = core::Length::m(0.0);
    for (const auto& leg : legs) {
        segmentLengths.push_back(leg.dist());
        totalLength += leg.dist();
    }

    const auto envelope = line.envelope();
    const auto candidates = nd.candidateAirspaces(*envelope);
    spdlog::debug("{} airspace candidate(s) along route", candidates.size());

    for (const auto& airspace : candidates) {
        if (!line.intersects(airspace->polygon)) {
            continue;
        }
        auto found = computeIntersections(airspace, line, segmentLengths, totalLength);
        result.intersections_.insert(result.intersections_.end(),
                                     std::make_move_iterator(found.begin()),
                                     std::make_move_iterator(found.end()));
    }

    std::stable_sort(result.intersections_.begin(), result.intersections_.end(),
                     [](const AirspaceIntersection& a, const AirspaceIntersection& b) {
                         return a.entryDistance < b.entryDistance;
                     });

    result.profile_ = computeProfile(route);
    return result;
}

std::optional<core::VerticalDistance> VerticalProfile::maxLevel() const {
    using Kind = core::VerticalDistance::Kind;

    std::optional<core::VerticalDistance> result;
    for (const auto& point : profile_) {
        const auto kind = point.level.kind();
        if (kind == Kind::Agl || kind == Kind::PressureAltitude) {
            continue;
        }
        if (!result || point.level > *result) {
            result = point.level;
        }
    }
    return result;
}

} // namespace efb::route
