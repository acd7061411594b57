#include "io/GeoJsonExporter.hpp"
#include <fstream>
#include <iomanip>
#include <set>
#include <spdlog/spdlog.h>

namespace efb::io {

nlohmann::json toPosition(const geo::Coordinate& coordinate) {
    return nlohmann::json::array({coordinate.longitude, coordinate.latitude});
}

nlohmann::json toBbox(const geo::GeoBBox& box) {
    return nlohmann::json::array({box.minLon, box.minLat, box.maxLon, box.maxLat});
}

nlohmann::json GeoJsonExporter::buildRouteFeature(const route::Route& route) const {
    const auto& legs = route.legs();
    if (legs.empty()) {
        return nullptr;
    }

    std::vector<geo::Coordinate> points;
    points.push_back(legs.front().from().coordinate());
    for (const auto& leg : legs) {
        points.push_back(leg.to().coordinate());
    }

    nlohmann::json coordinates = nlohmann::json::array();
    for (const auto& point : points) {
        coordinates.push_back(toPosition(point));
    }

    nlohmann::json feature;
    feature["type"] = "Feature";
    feature["bbox"] = toBbox(*geo::computeBounds(points));
    feature["geometry"] = {
        {"type", "LineString"},
        {"coordinates", std::move(coordinates)}
    };
    feature["properties"] = {
        {"route", route.toString()},
        {"distanceNm", route.totalDistance().nauticalMiles()}
    };
    return feature;
}

nlohmann::json GeoJsonExporter::buildAirspaceFeature(const route::AirspaceIntersection& intersection) const {
    const auto& airspace = *intersection.airspace;

    nlohmann::json ring = nlohmann::json::array();
    for (const auto& point : airspace.polygon.exterior()) {
        ring.push_back(toPosition(point));
    }

    nlohmann::json properties = {
        {"name", airspace.name},
        {"type", std::string(nd::toString(airspace.type))},
        {"floor", airspace.floor.toString()},
        {"ceiling", airspace.ceiling.toString()},
        {"entryNm", intersection.entryDistance.nauticalMiles()},
        {"exitNm", intersection.exitDistance.nauticalMiles()}
    };
    properties["class"] = airspace.classification
        ? nlohmann::json(std::string(nd::toString(*airspace.classification)))
        : nlohmann::json(nullptr);

    nlohmann::json feature;
    feature["type"] = "Feature";
    feature["geometry"] = {
        {"type", "Polygon"},
        {"coordinates", nlohmann::json::array({std::move(ring)})}
    };
    feature["properties"] = std::move(properties);
    return feature;
}

nlohmann::json GeoJsonExporter::build(const route::Route& route,
                                      const route::VerticalProfile& profile) const {
    nlohmann::json features = nlohmann::json::array();

    if (auto routeFeature = buildRouteFeature(route); !routeFeature.is_null()) {
        features.push_back(std::move(routeFeature));
    }

    if (config_.includeAirspaces) {
        // 同一空域可能被多次穿越，只输出一次
        std::set<const nd::Airspace*> written;
        for (const auto& intersection : profile.intersections()) {
            if (written.insert(intersection.airspace.get()).second) {
                features.push_back(buildAirspaceFeature(intersection));
            }
        }
    }

    return {
        {"type", "FeatureCollection"},
        {"features", std::move(features)}
    };
}

core::Result<void> GeoJsonExporter::write(const nlohmann::json& document,
                                          const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return core::fail(core::ErrorCode::Io, fmt::format("cannot open {}", path.string()));
    }

    try {
        file << std::setw(config_.indent) << document << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return core::fail(core::ErrorCode::Io, e.what());
    }

    if (!file.good()) {
        return core::fail(core::ErrorCode::Io, fmt::format("failed writing {}", path.string()));
    }
    spdlog::info("GeoJSON written to {}", path.string());
    return {};
}

} // namespace efb::io
