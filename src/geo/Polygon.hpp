#pragma once

#include "geo/Coordinate.hpp"
#include "geo/GeoBBox.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace efb::geo {

// 平面线段
struct Line {
    Point start;
    Point end;
};

// 线段相交于一点
struct SinglePoint {
    Point point;
};

// 共线重叠，给出重叠段两端
struct CollinearOverlap {
    Point start;
    Point end;
};

using LineIntersection = std::variant<SinglePoint, CollinearOverlap>;

// 线段求交（平面，含端点）
[[nodiscard]] std::optional<LineIntersection> lineIntersection(const Line& a, const Line& b) noexcept;

// point 在线段上投影位置的比例 [0, 1]
[[nodiscard]] double lineLocatePoint(const Line& line, const Point& point) noexcept;

// 单环多边形，外环首尾相同
class Polygon {
public:
    Polygon() = default;
    explicit Polygon(std::vector<Coordinate> exterior);

    const std::vector<Coordinate>& exterior() const noexcept { return exterior_; }
    bool empty() const noexcept { return exterior_.empty(); }

    [[nodiscard]] GeoBBox envelope() const noexcept { return envelope_; }

    // 严格内部；边界上的点不算包含
    [[nodiscard]] bool contains(const Coordinate& point) const noexcept;

    [[nodiscard]] std::vector<Line> lines() const;

    bool operator==(const Polygon& other) const noexcept { return exterior_ == other.exterior_; }

private:
    std::vector<Coordinate> exterior_;
    GeoBBox envelope_;
};

class LineString {
public:
    LineString() = default;
    explicit LineString(std::vector<Coordinate> points);

    const std::vector<Coordinate>& points() const noexcept { return points_; }
    bool empty() const noexcept { return points_.empty(); }

    [[nodiscard]] std::optional<GeoBBox> envelope() const noexcept;
    [[nodiscard]] std::vector<Line> lines() const;

    // 与多边形（含内部）是否有公共点
    [[nodiscard]] bool intersects(const Polygon& polygon) const;

private:
    std::vector<Coordinate> points_;
};

} // namespace efb::geo
