#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/nd/AirspaceBuilder.hpp"
#include <stdexcept>

using namespace efb;
using namespace efb::nd;

namespace {

const geo::Coordinate CENTER{53.6302, 9.9882};

ControlledAirspaceRecord boundary(BoundaryPath path, std::optional<geo::Coordinate> point,
                                  bool returnToOrigin = false) {
    ControlledAirspaceRecord record;
    record.type = ControlledAirspaceType::ControlZone;
    record.classification = 'D';
    record.name = "HAMBURG CTR";
    record.via = BoundaryVia{path, returnToOrigin};
    if (point) {
        record.latitude = Field<double>{point->latitude};
        record.longitude = Field<double>{point->longitude};
    }
    return record;
}

ControlledAirspaceRecord arc(BoundaryPath path, const geo::Coordinate& end, double radiusNm) {
    auto record = boundary(path, end, true);
    record.arcOriginLatitude = Field<double>{CENTER.latitude};
    record.arcOriginLongitude = Field<double>{CENTER.longitude};
    record.arcDistance = Field<double>{radiusNm};
    return record;
}

} // namespace

TEST_CASE("Arc sweep", "[airspace-builder]") {
    SECTION("Clockwise is positive") {
        REQUIRE(calculateArcSweep(0.0, 90.0, true) == Catch::Approx(90.0));
        REQUIRE(calculateArcSweep(90.0, 0.0, true) == Catch::Approx(270.0));
        REQUIRE(calculateArcSweep(350.0, 10.0, true) == Catch::Approx(20.0));
    }

    SECTION("Counter-clockwise is negative") {
        REQUIRE(calculateArcSweep(90.0, 0.0, false) == Catch::Approx(-90.0));
        REQUIRE(calculateArcSweep(0.0, 90.0, false) == Catch::Approx(-270.0));
    }

    SECTION("Full turn for identical bearings") {
        REQUIRE(calculateArcSweep(45.0, 45.0, true) == Catch::Approx(360.0));
        REQUIRE(calculateArcSweep(45.0, 45.0, false) == Catch::Approx(-360.0));
    }
}

TEST_CASE("Airspace polygon from boundary records", "[airspace-builder]") {
    AirspaceBuilder builder;

    SECTION("Great circle segments are closed") {
        REQUIRE(builder.addRecord(boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.5, 9.7})).has_value());
        REQUIRE(builder.addRecord(boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.5, 10.2})).has_value());
        REQUIRE(builder.addRecord(boundary(BoundaryPath::RhumbLine, geo::Coordinate{53.8, 10.2})).has_value());
        REQUIRE(builder.addRecord(boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.8, 9.7}, true)).has_value());
        REQUIRE(builder.segmentCount() == 4);

        const auto airspace = builder.build();
        const auto& ring = airspace.polygon.exterior();
        REQUIRE(ring.size() == 5);
        REQUIRE(ring.front() == ring.back());
        REQUIRE(airspace.name == "HAMBURG CTR");
        REQUIRE(airspace.type == AirspaceType::CTR);
        REQUIRE(airspace.classification == AirspaceClass::D);
        REQUIRE(airspace.polygon.contains(CENTER));
    }

    SECTION("Missing limits default to ground and unlimited") {
        REQUIRE(builder.addRecord(boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.5, 9.7})).has_value());
        const auto airspace = builder.build();
        REQUIRE(airspace.floor == core::VerticalDistance::gnd());
        REQUIRE(airspace.ceiling == core::VerticalDistance::unlimited());
    }

    SECTION("Limits come from the first record") {
        auto first = boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.5, 9.7});
        first.lowerLimit = AirspaceLimit{AirspaceLimit::Kind::Ground, 0};
        first.upperLimit = AirspaceLimit{AirspaceLimit::Kind::Altitude, 2500};
        first.upperUnit = UnitIndicator::Msl;
        auto second = boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.5, 10.2}, true);
        second.upperLimit = AirspaceLimit{AirspaceLimit::Kind::FlightLevel, 100};
        second.name = "OTHER";

        REQUIRE(builder.addRecord(first).has_value());
        REQUIRE(builder.addRecord(second).has_value());

        const auto airspace = builder.build();
        REQUIRE(airspace.name == "HAMBURG CTR");
        REQUIRE(airspace.floor == core::VerticalDistance::gnd());
        REQUIRE(airspace.ceiling == core::VerticalDistance::msl(2500));
    }

    SECTION("Circle") {
        ControlledAirspaceRecord circle = boundary(BoundaryPath::Circle, std::nullopt, true);
        circle.arcOriginLatitude = Field<double>{CENTER.latitude};
        circle.arcOriginLongitude = Field<double>{CENTER.longitude};
        circle.arcDistance = Field<double>{5.0};
        REQUIRE(builder.addRecord(circle).has_value());

        const auto ring = builder.build().polygon.exterior();
        REQUIRE(ring.size() == ARC_POINTS_PER_QUADRANT * 4 + 1);
        REQUIRE(ring.front() == ring.back());
        for (const auto& point : ring) {
            REQUIRE(CENTER.dist(point).nauticalMiles() == Catch::Approx(5.0).margin(1e-3));
        }
    }

    SECTION("Clockwise quarter arc") {
        const auto north = CENTER.destination(core::Angle::trueNorth(0.0), core::Length::nm(5.0));
        const auto east = CENTER.destination(core::Angle::trueNorth(90.0), core::Length::nm(5.0));

        REQUIRE(builder.addRecord(boundary(BoundaryPath::GreatCircle, north)).has_value());
        REQUIRE(builder.addRecord(arc(BoundaryPath::ClockwiseArc, east, 5.0)).has_value());

        const auto ring = builder.build().polygon.exterior();
        // 起点 + 6 个插值点 + 闭合点
        REQUIRE(ring.size() == 8);
        for (std::size_t i = 1; i + 1 < ring.size(); ++i) {
            REQUIRE(CENTER.dist(ring[i]).nauticalMiles() == Catch::Approx(5.0).margin(1e-3));
            const auto bearing = CENTER.bearing(ring[i]).degrees();
            REQUIRE(bearing > 0.0);
            REQUIRE(bearing <= 90.0 + 1e-6);
        }
    }

    SECTION("Counter-clockwise arc goes the long way") {
        const auto north = CENTER.destination(core::Angle::trueNorth(0.0), core::Length::nm(5.0));
        const auto east = CENTER.destination(core::Angle::trueNorth(90.0), core::Length::nm(5.0));

        REQUIRE(builder.addRecord(boundary(BoundaryPath::GreatCircle, north)).has_value());
        REQUIRE(builder.addRecord(arc(BoundaryPath::CounterClockwiseArc, east, 5.0)).has_value());

        const auto ring = builder.build().polygon.exterior();
        REQUIRE(ring.size() == 1 + 18 + 1);
        const auto south = CENTER.bearing(ring[12]).degrees();
        REQUIRE(south == Catch::Approx(180.0).margin(1.0));
    }

    SECTION("Field errors leave the builder untouched") {
        auto broken = boundary(BoundaryPath::GreatCircle, geo::Coordinate{53.5, 9.7});
        broken.latitude = Field<double>{std::unexpected(core::Error{core::ErrorCode::InvalidValue, "latitude"})};

        auto result = builder.addRecord(broken);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == core::ErrorCode::InvalidValue);
        REQUIRE(builder.empty());
    }

    SECTION("Record without any position") {
        REQUIRE_THROWS_AS(builder.addRecord(boundary(BoundaryPath::GreatCircle, std::nullopt)), std::logic_error);
    }
}

TEST_CASE("Airspace classification", "[airspace-builder]") {
    REQUIRE(toAirspaceType(ControlledAirspaceType::ClassB) == AirspaceType::TMA);
    REQUIRE(toAirspaceType(ControlledAirspaceType::ControlZone) == AirspaceType::CTR);
    REQUIRE(toAirspaceType(ControlledAirspaceType::TransponderMandatoryZone) == AirspaceType::TMZ);

    REQUIRE(toAirspaceClass(ControlledAirspaceType::ClassC, std::nullopt) == AirspaceClass::C);
    REQUIRE(toAirspaceClass(ControlledAirspaceType::ControlZone, 'D') == AirspaceClass::D);
    REQUIRE(toAirspaceClass(ControlledAirspaceType::ClassB, 'E') == AirspaceClass::E);
    REQUIRE_FALSE(toAirspaceClass(ControlledAirspaceType::ControlZone, std::nullopt).has_value());
}

TEST_CASE("Airspace limits", "[airspace-builder]") {
    using core::VerticalDistance;
    using Kind = AirspaceLimit::Kind;

    REQUIRE(toVerticalDistance({Kind::Altitude, 1500}, UnitIndicator::Agl) == VerticalDistance::agl(1500));
    REQUIRE(toVerticalDistance({Kind::Altitude, 2500}, UnitIndicator::Msl) == VerticalDistance::msl(2500));
    REQUIRE(toVerticalDistance({Kind::Altitude, 2500}, std::nullopt) == VerticalDistance::msl(2500));
    REQUIRE(toVerticalDistance({Kind::FlightLevel, 65}, std::nullopt) == VerticalDistance::fl(65));
    REQUIRE(toVerticalDistance({Kind::Ground, 0}, std::nullopt) == VerticalDistance::gnd());
    REQUIRE(toVerticalDistance({Kind::MeanSeaLevel, 0}, std::nullopt) == VerticalDistance::msl(0));
    REQUIRE(toVerticalDistance({Kind::NotSpecified, 0}, std::nullopt) == VerticalDistance::unlimited());
    REQUIRE(toVerticalDistance({Kind::Notam, 0}, std::nullopt) == VerticalDistance::unlimited());
}
