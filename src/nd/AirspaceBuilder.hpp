#pragma once

#include "core/Error.hpp"
#include "nd/Airspace.hpp"
#include "nd/Records.hpp"
#include <optional>
#include <string>
#include <vector>

namespace efb::nd {

// 每 90 度圆弧的插值点数
inline constexpr int ARC_POINTS_PER_QUADRANT = 6;

// 由一串边界记录重建空域多边形
//
// 首条记录确定名称、类型、上下限和起点；每条记录追加一段从前一点到本点的边界。
class AirspaceBuilder {
public:
    AirspaceBuilder() = default;

    // 字段解析失败时返回错误且不改变状态；
    // 既无坐标又无圆心的记录抛出 std::logic_error
    core::Result<void> addRecord(const ControlledAirspaceRecord& record);

    bool empty() const noexcept { return segments_.empty(); }
    std::size_t segmentCount() const noexcept { return segments_.size(); }

    [[nodiscard]] Airspace build() const;

private:
    struct BoundarySegment {
        BoundaryPath path;
        geo::Coordinate endPoint;
        std::optional<geo::Coordinate> arcCenter;
        std::optional<core::Length> arcRadius;
    };

    bool seeded_{false};
    std::optional<std::string> name_;
    AirspaceType type_{AirspaceType::CTA};
    std::optional<AirspaceClass> classification_;
    std::optional<core::VerticalDistance> ceiling_;
    std::optional<core::VerticalDistance> floor_;
    std::optional<geo::Coordinate> startPoint_;
    std::vector<BoundarySegment> segments_;

    std::vector<geo::Coordinate> buildRing() const;
    std::vector<geo::Coordinate> buildCircle(const BoundarySegment& segment) const;
    std::vector<geo::Coordinate> interpolateArc(const geo::Coordinate& start,
                                                const BoundarySegment& segment,
                                                bool clockwise) const;
};

// 带符号扫过角（度）：顺时针为正，逆时针为负
[[nodiscard]] double calculateArcSweep(double startDegrees, double endDegrees, bool clockwise) noexcept;

[[nodiscard]] AirspaceType toAirspaceType(ControlledAirspaceType type) noexcept;

// 显式等级优先，其次由类型推断
[[nodiscard]] std::optional<AirspaceClass> toAirspaceClass(ControlledAirspaceType type,
                                                           std::optional<char> classification) noexcept;

[[nodiscard]] core::VerticalDistance toVerticalDistance(const AirspaceLimit& limit,
                                                        std::optional<UnitIndicator> unit) noexcept;

} // namespace efb::nd
