#pragma once

#include "core/Error.hpp"
#include "geo/Coordinate.hpp"
#include "geo/GeoBBox.hpp"
#include "route/Route.hpp"
#include "route/VerticalProfile.hpp"
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>

namespace efb::io {

struct GeoJsonExportConfig {
    bool includeAirspaces{true};
    int indent{2};
};

// 航路与穿越空域导出为 GeoJSON FeatureCollection
class GeoJsonExporter {
public:
    explicit GeoJsonExporter(GeoJsonExportConfig config = {})
        : config_(config) {}

    [[nodiscard]] nlohmann::json build(const route::Route& route,
                                       const route::VerticalProfile& profile) const;

    // 航路折线，无航段时为 null
    [[nodiscard]] nlohmann::json buildRouteFeature(const route::Route& route) const;

    [[nodiscard]] nlohmann::json buildAirspaceFeature(const route::AirspaceIntersection& intersection) const;

    [[nodiscard]] core::Result<void> write(const nlohmann::json& document,
                                           const std::filesystem::path& path) const;

private:
    GeoJsonExportConfig config_;
};

// GeoJSON 坐标顺序为 [lon, lat]
[[nodiscard]] nlohmann::json toPosition(const geo::Coordinate& coordinate);
[[nodiscard]] nlohmann::json toBbox(const geo::GeoBBox& box);

} // namespace efb::io
