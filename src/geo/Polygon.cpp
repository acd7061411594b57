#include "geo/Polygon.hpp"
#include <algorithm>
#include <cmath>

namespace efb::geo {

namespace {

double cross(const Point& o, const Point& a, const Point& b) noexcept {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

int orientation(const Point& o, const Point& a, const Point& b) noexcept {
    const double value = cross(o, a, b);
    if (value > 0.0) return 1;
    if (value < 0.0) return -1;
    return 0;
}

// 已知共线时，p 是否落在线段包围盒内
bool onSegment(const Line& line, const Point& p) noexcept {
    return p.x >= std::min(line.start.x, line.end.x) && p.x <= std::max(line.start.x, line.end.x) &&
           p.y >= std::min(line.start.y, line.end.y) && p.y <= std::max(line.start.y, line.end.y);
}

// p 在 line 方向上的参数，要求 p 与 line 共线
double parameterOn(const Line& line, const Point& p) noexcept {
    const double dx = line.end.x - line.start.x;
    const double dy = line.end.y - line.start.y;
    if (std::abs(dx) >= std::abs(dy)) {
        return dx == 0.0 ? 0.0 : (p.x - line.start.x) / dx;
    }
    return (p.y - line.start.y) / dy;
}

std::optional<LineIntersection> collinearIntersection(const Line& a, const Line& b) noexcept {
    // 两段在 a 的参数空间中的重叠
    double t0 = parameterOn(a, b.start);
    double t1 = parameterOn(a, b.end);
    Point p0 = b.start;
    Point p1 = b.end;
    if (t0 > t1) {
        std::swap(t0, t1);
        std::swap(p0, p1);
    }

    const double lo = std::max(0.0, t0);
    const double hi = std::min(1.0, t1);
    if (lo > hi) {
        return std::nullopt;
    }

    const Point start = lo == t0 ? p0 : a.start;
    const Point end = hi == t1 ? p1 : a.end;
    if (start == end) {
        return SinglePoint{start};
    }
    return CollinearOverlap{start, end};
}

bool pointOnBoundary(const std::vector<Line>& lines, const Point& p) noexcept {
    return std::any_of(lines.begin(), lines.end(), [&](const Line& line) {
        return orientation(line.start, line.end, p) == 0 && onSegment(line, p);
    });
}

} // namespace

std::optional<LineIntersection> lineIntersection(const Line& a, const Line& b) noexcept {
    const int o1 = orientation(a.start, a.end, b.start);
    const int o2 = orientation(a.start, a.end, b.end);
    const int o3 = orientation(b.start, b.end, a.start);
    const int o4 = orientation(b.start, b.end, a.end);

    if (o1 == 0 && o2 == 0) {
        if (a.start == a.end) {
            // 退化线段
            if (onSegment(b, a.start)) {
                return SinglePoint{a.start};
            }
            return std::nullopt;
        }
        return collinearIntersection(a, b);
    }

    if (o1 * o2 > 0 || o3 * o4 > 0) {
        return std::nullopt;
    }

    // 端点接触时返回精确端点
    if (o1 == 0 && onSegment(a, b.start)) return SinglePoint{b.start};
    if (o2 == 0 && onSegment(a, b.end)) return SinglePoint{b.end};
    if (o3 == 0 && onSegment(b, a.start)) return SinglePoint{a.start};
    if (o4 == 0 && onSegment(b, a.end)) return SinglePoint{a.end};

    const double denom = (a.end.x - a.start.x) * (b.end.y - b.start.y) -
                         (a.end.y - a.start.y) * (b.end.x - b.start.x);
    if (denom == 0.0) {
        return std::nullopt;
    }
    const double t = ((b.start.x - a.start.x) * (b.end.y - b.start.y) -
                      (b.start.y - a.start.y) * (b.end.x - b.start.x)) / denom;

    return SinglePoint{Point{
        a.start.x + t * (a.end.x - a.start.x),
        a.start.y + t * (a.end.y - a.start.y)
    }};
}

double lineLocatePoint(const Line& line, const Point& point) noexcept {
    const double dx = line.end.x - line.start.x;
    const double dy = line.end.y - line.start.y;
    const double lengthSq = dx * dx + dy * dy;
    if (lengthSq == 0.0) {
        return 0.0;
    }
    const double t = ((point.x - line.start.x) * dx + (point.y - line.start.y) * dy) / lengthSq;
    return std::clamp(t, 0.0, 1.0);
}

Polygon::Polygon(std::vector<Coordinate> exterior)
    : exterior_(std::move(exterior)) {
    if (auto bounds = computeBounds(exterior_)) {
        envelope_ = *bounds;
    }
}

bool Polygon::contains(const Coordinate& coordinate) const noexcept {
    if (exterior_.size() < 4) {
        return false;
    }

    const Point p = coordinate.toPoint();
    if (!envelope_.contains(p.x, p.y)) {
        return false;
    }

    bool inside = false;
    for (std::size_t i = 0, j = exterior_.size() - 1; i < exterior_.size(); j = i++) {
        const Point a = exterior_[i].toPoint();
        const Point b = exterior_[j].toPoint();
        if (orientation(a, b, p) == 0 && onSegment(Line{a, b}, p)) {
            return false;
        }
        if ((a.y > p.y) != (b.y > p.y)) {
            const double x = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (p.x < x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

std::vector<Line> Polygon::lines() const {
    std::vector<Line> result;
    if (exterior_.size() < 2) {
        return result;
    }
    result.reserve(exterior_.size() - 1);
    for (std::size_t i = 1; i < exterior_.size(); ++i) {
        result.push_back(Line{exterior_[i - 1].toPoint(), exterior_[i].toPoint()});
    }
    return result;
}

LineString::LineString(std::vector<Coordinate> points)
    : points_(std::move(points)) {}

std::optional<GeoBBox> LineString::envelope() const noexcept {
    return computeBounds(points_);
}

std::vector<Line> LineString::lines() const {
    std::vector<Line> result;
    if (points_.size() < 2) {
        return result;
    }
    result.reserve(points_.size() - 1);
    for (std::size_t i = 1; i < points_.size(); ++i) {
        result.push_back(Line{points_[i - 1].toPoint(), points_[i].toPoint()});
    }
    return result;
}

bool LineString::intersects(const Polygon& polygon) const {
    const auto bounds = envelope();
    if (!bounds || polygon.empty() || !bounds->intersects(polygon.envelope())) {
        return false;
    }

    const auto boundary = polygon.lines();
    for (const auto& segment : lines()) {
        for (const auto& edge : boundary) {
            if (lineIntersection(segment, edge)) {
                return true;
            }
        }
    }

    // 完全位于内部
    return std::any_of(points_.begin(), points_.end(), [&](const Coordinate& c) {
        return polygon.contains(c) || pointOnBoundary(boundary, c.toPoint());
    });
}

} // namespace efb::geo
