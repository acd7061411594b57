#pragma once

#include "core/Measurements.hpp"
#include "core/VerticalDistance.hpp"
#include "geo/Coordinate.hpp"
#include "geo/Polygon.hpp"
#include "nd/NavigationData.hpp"
#include <optional>
#include <vector>

namespace efb::route {

class Route;

// 航路穿越空域的区间，距离沿航路累计
struct AirspaceIntersection {
    nd::AirspacePtr airspace;
    core::Length entryDistance;
    core::Length exitDistance;
    geo::Coordinate entry;
    geo::Coordinate exit;

    core::Length length() const noexcept { return exitDistance - entryDistance; }
    const core::VerticalDistance& floor() const noexcept { return airspace->floor; }
    const core::VerticalDistance& ceiling() const noexcept { return airspace->ceiling; }
};

struct VerticalPoint {
    enum class Kind { TopOfClimb, NavAid, TopOfDescent, LevelOf };

    Kind kind = Kind::NavAid;
    core::VerticalDistance level;
    core::Length distance;
    // 仅 Kind::NavAid
    std::optional<nd::NavAid> navaid;
};

class VerticalProfile {
public:
    VerticalProfile() = default;

    [[nodiscard]] static VerticalProfile compute(const Route& route, const nd::NavigationData& nd);

    const std::vector<AirspaceIntersection>& intersections() const noexcept { return intersections_; }
    const std::vector<VerticalPoint>& profile() const noexcept { return profile_; }

    // 只比较基准相同的高度（GND、MSL、ALT、FL、unlimited）
    [[nodiscard]] std::optional<core::VerticalDistance> maxLevel() const;

    std::size_t size() const noexcept { return intersections_.size(); }
    bool empty() const noexcept { return intersections_.empty(); }

private:
    std::vector<AirspaceIntersection> intersections_;
    std::vector<VerticalPoint> profile_;
};

// 沿航路折线的测地距离，segmentLengths 为各段长度
[[nodiscard]] core::Length distanceAlongRoute(const geo::LineString& line,
                                              const std::vector<core::Length>& segmentLengths,
                                              std::size_t segment,
                                              const geo::Point& point);

// 单个空域与航路的穿越区间
[[nodiscard]] std::vector<AirspaceIntersection> computeIntersections(
    const nd::AirspacePtr& airspace,
    const geo::LineString& line,
    const std::vector<core::Length>& segmentLengths,
    core::Length totalLength);

[[nodiscard]] std::vector<VerticalPoint> computeProfile(const Route& route);

} // namespace efb::route
