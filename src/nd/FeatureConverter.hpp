#pragma once

#include "core/Error.hpp"
#include "nd/NavigationData.hpp"
#include "nd/Records.hpp"
#include <optional>
#include <string_view>
#include <utility>

namespace efb::nd {

// 要素 -> 实体
[[nodiscard]] core::Result<Airport> toAirport(const AirportHeliportFeature& feature);
[[nodiscard]] core::Result<Waypoint> toWaypoint(const DesignatedPointFeature& feature);
[[nodiscard]] core::Result<Waypoint> toWaypoint(const NavaidFeature& feature);
[[nodiscard]] Airspace toAirspace(const AirspaceFeature& feature);

// "GND"、"UNL"、"FL195" 或数值加单位与基准
[[nodiscard]] core::VerticalDistance verticalDistance(std::optional<std::string_view> value,
                                                      std::optional<std::string_view> uom,
                                                      std::optional<std::string_view> reference) noexcept;

[[nodiscard]] std::pair<AirspaceType, std::optional<AirspaceClass>>
airspaceCategory(std::optional<std::string_view> type) noexcept;

[[nodiscard]] RunwaySurface runwaySurface(std::optional<std::string_view> composition) noexcept;
[[nodiscard]] core::Length runwayLength(const std::optional<Measure>& length) noexcept;
[[nodiscard]] core::VerticalDistance fieldElevation(const std::optional<Measure>& elevation) noexcept;

// 读取整个要素流；跑道与跑道方向在所有机场读完后再按 UUID 关联
[[nodiscard]] NavigationData loadFeatures(IFeatureSource& source,
                                          NavigationDataBuilder builder = {});

} // namespace efb::nd
