#pragma once

#include "core/Measurements.hpp"
#include "geo/RTree.hpp"
#include "nd/Airspace.hpp"
#include "nd/NavAid.hpp"
#include <memory>
#include <vector>

namespace efb::nd {

using AirspacePtr = std::shared_ptr<const Airspace>;

// 空域包围盒索引；结果是候选集，需再做精确多边形判断
class AirspaceIndex {
public:
    AirspaceIndex() = default;
    explicit AirspaceIndex(const std::vector<AirspacePtr>& airspaces);

    [[nodiscard]] std::vector<AirspacePtr> candidatesAt(const geo::Coordinate& point) const;
    [[nodiscard]] std::vector<AirspacePtr> candidatesIntersecting(const geo::GeoBBox& envelope) const;

    std::size_t size() const noexcept { return tree_.size(); }

private:
    geo::RTree<AirspacePtr> tree_;
};

// 机场与航路点的点索引
class NavAidIndex {
public:
    NavAidIndex() = default;
    explicit NavAidIndex(const std::vector<NavAid>& navaids);

    // 先按近似经纬度范围筛选，再按大地线距离精确过滤
    [[nodiscard]] std::vector<NavAid> withinRadius(const geo::Coordinate& center, core::Length radius) const;

    // 半径对应的经纬度查询范围
    [[nodiscard]] static geo::GeoBBox searchEnvelope(const geo::Coordinate& center, core::Length radius) noexcept;

    std::size_t size() const noexcept { return tree_.size(); }

private:
    geo::RTree<NavAid> tree_;
};

} // namespace efb::nd
