#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/io/GeoJsonExporter.hpp"
#include "../src/route/Route.hpp"
#include "../src/route/VerticalProfile.hpp"
#include "NavDataFixture.hpp"
#include <filesystem>
#include <fstream>

using namespace efb;
using namespace efb::test;
using nlohmann::json;

TEST_CASE("GeoJSON positions", "[geojson]") {
    REQUIRE(io::toPosition(geo::Coordinate{53.6302, 9.9882}) == json::array({9.9882, 53.6302}));
    REQUIRE(io::toBbox(geo::GeoBBox{9.7, 53.5, 10.2, 53.8}) == json::array({9.7, 53.5, 10.2, 53.8}));
}

TEST_CASE("GeoJSON route export", "[geojson]") {
    const auto data = northGermany();
    route::Route route;
    REQUIRE(route.decode("EDDH N2 DCT EDHL", data).has_value());
    const auto profile = route::VerticalProfile::compute(route, data);

    SECTION("Route and crossed airspaces") {
        const io::GeoJsonExporter exporter;
        const auto document = exporter.build(route, profile);

        REQUIRE(document["type"] == "FeatureCollection");
        const auto& features = document["features"];
        REQUIRE(features.size() == 3);

        const auto& line = features[0];
        REQUIRE(line["geometry"]["type"] == "LineString");
        REQUIRE(line["geometry"]["coordinates"].size() == 3);
        REQUIRE(line["geometry"]["coordinates"][0] == json::array({9.9882, 53.6302}));
        REQUIRE(line["bbox"].size() == 4);
        REQUIRE(line["properties"]["route"] == "EDDH N2 DCT EDHL");
        REQUIRE(line["properties"]["distanceNm"].get<double>() ==
                Catch::Approx(route.totalDistance().nauticalMiles()));

        const auto& hamburg = features[1];
        REQUIRE(hamburg["geometry"]["type"] == "Polygon");
        REQUIRE(hamburg["geometry"]["coordinates"][0].size() == 5);
        REQUIRE(hamburg["properties"]["name"] == "HAMBURG");
        REQUIRE(hamburg["properties"]["type"] == "CTR");
        REQUIRE(hamburg["properties"]["class"] == "D");
        REQUIRE(hamburg["properties"]["floor"] == "GND");
        REQUIRE(hamburg["properties"]["ceiling"] == "2500 ALT");
        REQUIRE(hamburg["properties"]["entryNm"].get<double>() == 0.0);
    }

    SECTION("Without airspaces") {
        const io::GeoJsonExporter exporter(io::GeoJsonExportConfig{false, 0});
        REQUIRE(exporter.build(route, profile)["features"].size() == 1);
    }

    SECTION("Empty route") {
        const io::GeoJsonExporter exporter;
        REQUIRE(exporter.build(route::Route{}, route::VerticalProfile{})["features"].empty());
        REQUIRE(exporter.buildRouteFeature(route::Route{}).is_null());
    }

    SECTION("Written file can be read back") {
        const io::GeoJsonExporter exporter;
        const auto path = std::filesystem::temp_directory_path() / "efbnav_route_test.geojson";
        const auto document = exporter.build(route, profile);

        REQUIRE(exporter.write(document, path).has_value());
        std::ifstream file(path);
        REQUIRE(json::parse(file) == document);
        file.close();
        std::filesystem::remove(path);
    }

    SECTION("Unwritable path") {
        const io::GeoJsonExporter exporter;
        auto result = exporter.write(json::object(), "/nonexistent/dir/route.geojson");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == core::ErrorCode::Io);
    }
}
