#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/geo/RTree.hpp"
#include "../src/nd/SpatialIndex.hpp"
#include "NavDataFixture.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

using namespace efb;

TEST_CASE("RTree queries", "[rtree]") {
    SECTION("Empty tree") {
        geo::RTree<int> tree;
        REQUIRE(tree.empty());
        REQUIRE(tree.locateAt(0.0, 0.0).empty());
    }

    SECTION("Grid of point entries") {
        std::vector<geo::RTree<int>::Entry> entries;
        for (int i = 0; i < 20; ++i) {
            for (int j = 0; j < 20; ++j) {
                entries.push_back({geo::GeoBBox::fromPoint(i, j), i * 100 + j});
            }
        }
        geo::RTree<int> tree(std::move(entries), 4);
        REQUIRE(tree.size() == 400);

        auto found = tree.locateIntersecting(geo::GeoBBox(2.5, 2.5, 4.5, 3.5));
        std::sort(found.begin(), found.end());
        REQUIRE(found == std::vector<int>{303, 403});

        auto single = tree.locateAt(7.0, 11.0);
        REQUIRE(single == std::vector<int>{711});
    }

    SECTION("Overlapping boxes") {
        geo::RTree<char> tree({
            {geo::GeoBBox(0.0, 0.0, 2.0, 2.0), 'a'},
            {geo::GeoBBox(1.0, 1.0, 3.0, 3.0), 'b'},
            {geo::GeoBBox(5.0, 5.0, 6.0, 6.0), 'c'}
        });

        auto found = tree.locateAt(1.5, 1.5);
        std::sort(found.begin(), found.end());
        REQUIRE(found == std::vector<char>{'a', 'b'});
        REQUIRE(tree.locateAt(4.0, 4.0).empty());
    }
}

TEST_CASE("NavAid radius search", "[spatial-index]") {
    auto wp1 = std::make_shared<const nd::Waypoint>(test::makeWaypoint("WP1", 53.5, 9.5));
    auto wp2 = std::make_shared<const nd::Waypoint>(test::makeWaypoint("WP2", 53.6, 9.6));
    auto wp3 = std::make_shared<const nd::Waypoint>(test::makeWaypoint("WP3", 54.5, 10.5));

    nd::NavAidIndex index({nd::NavAid{wp1}, nd::NavAid{wp2}, nd::NavAid{wp3}});
    REQUIRE(index.size() == 3);

    SECTION("Two waypoints within 10 NM") {
        auto found = index.withinRadius({53.55, 9.55}, core::Length::nm(10.0));
        REQUIRE(found.size() == 2);
        for (const auto& navaid : found) {
            REQUIRE(navaid.ident() != "WP3");
        }
    }

    SECTION("Search envelope widens with latitude") {
        auto envelope = nd::NavAidIndex::searchEnvelope({53.55, 9.55}, core::Length::nm(10.0));
        REQUIRE(envelope.height() == Catch::Approx(20.0 / 60.0));
        REQUIRE(envelope.width() > envelope.height());
    }

    SECTION("Nothing nearby") {
        REQUIRE(index.withinRadius({50.0, 5.0}, core::Length::nm(10.0)).empty());
    }
}

TEST_CASE("Radius search confirms the geodesic distance", "[spatial-index]") {
    const geo::Coordinate center{53.0, 10.0};
    const double cosLat = std::cos(53.0 * std::numbers::pi / 180.0);

    // 东北方向偏移 offsetNm（纬向、经向各一份）
    const auto diagonal = [&](std::string ident, double offsetNm) {
        return std::make_shared<const nd::Waypoint>(test::makeWaypoint(
            std::move(ident), 53.0 + offsetNm / 60.0, 10.0 + offsetNm / 60.0 / cosLat));
    };
    auto inside = diagonal("IN", 6.9);
    auto justOutside = diagonal("EDGE", 7.2);
    auto corner = diagonal("CORNER", 9.5);

    const auto radius = core::Length::nm(10.0);
    const auto envelope = nd::NavAidIndex::searchEnvelope(center, radius);
    for (const auto& wp : {inside, justOutside, corner}) {
        REQUIRE(envelope.contains(wp->coordinate.longitude, wp->coordinate.latitude));
    }

    REQUIRE(center.dist(inside->coordinate).nauticalMiles() < 10.0);
    REQUIRE(center.dist(justOutside->coordinate).nauticalMiles() > 10.0);
    REQUIRE(center.dist(corner->coordinate).nauticalMiles() == Catch::Approx(13.4).margin(0.2));

    nd::NavAidIndex index({nd::NavAid{inside}, nd::NavAid{justOutside}, nd::NavAid{corner}});
    const auto found = index.withinRadius(center, radius);
    REQUIRE(found.size() == 1);
    REQUIRE(found.front().ident() == "IN");
}

TEST_CASE("Airspace candidate search", "[spatial-index]") {
    auto hamburg = std::make_shared<const nd::Airspace>(
        test::makeAirspace("HAMBURG", nd::AirspaceType::CTR, 53.5, 9.7, 53.8, 10.2));
    auto luebeck = std::make_shared<const nd::Airspace>(
        test::makeAirspace("LUEBECK", nd::AirspaceType::CTR, 53.7, 10.5, 53.95, 10.9));

    nd::AirspaceIndex index({hamburg, luebeck});

    REQUIRE(index.candidatesAt({53.6, 9.9}).size() == 1);
    REQUIRE(index.candidatesAt({53.6, 10.3}).empty());
    REQUIRE(index.candidatesIntersecting(geo::GeoBBox(9.9, 53.6, 10.7, 53.8)).size() == 2);
}
