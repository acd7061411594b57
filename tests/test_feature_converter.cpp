#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/nd/FeatureConverter.hpp"
#include <deque>

using namespace efb;
using namespace efb::nd;
using core::VerticalDistance;

namespace {

// 内存中的要素流
class VectorFeatureSource : public IFeatureSource {
public:
    explicit VectorFeatureSource(std::deque<core::Result<Feature>> items) : items_(std::move(items)) {}

    std::optional<core::Result<Feature>> next() override {
        if (items_.empty()) {
            return std::nullopt;
        }
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::deque<core::Result<Feature>> items_;
};

AirportHeliportFeature hamburg() {
    AirportHeliportFeature feature;
    feature.uuid = "ahp-eddh";
    feature.designator = "EDDH";
    feature.locationIndicatorIcao = "EDDH";
    feature.iataDesignator = "HAM";
    feature.name = "HAMBURG";
    feature.arp = geo::Coordinate{53.6302, 9.9882};
    feature.fieldElevation = Measure{16.0, "M"};
    return feature;
}

} // namespace

TEST_CASE("Feature vertical limits", "[feature-converter]") {
    REQUIRE(verticalDistance("GND", std::nullopt, std::nullopt) == VerticalDistance::gnd());
    REQUIRE(verticalDistance("UNL", std::nullopt, std::nullopt) == VerticalDistance::unlimited());
    REQUIRE(verticalDistance("FL195", std::nullopt, std::nullopt) == VerticalDistance::fl(195));
    REQUIRE(verticalDistance("65", "FL", "STD") == VerticalDistance::fl(65));
    REQUIRE(verticalDistance("2500", "FT", "MSL") == VerticalDistance::msl(2500));
    REQUIRE(verticalDistance("1500", "FT", "SFC") == VerticalDistance::agl(1500));
    REQUIRE(verticalDistance("762", "M", "MSL") == VerticalDistance::msl(2500));
    REQUIRE(verticalDistance(std::nullopt, std::nullopt, std::nullopt) == VerticalDistance::unlimited());
    REQUIRE(verticalDistance("abc", "FT", "MSL") == VerticalDistance::unlimited());
}

TEST_CASE("Feature airspace category", "[feature-converter]") {
    REQUIRE(airspaceCategory("CTR").first == AirspaceType::CTR);
    REQUIRE_FALSE(airspaceCategory("CTR").second.has_value());
    REQUIRE(airspaceCategory("TMZ").first == AirspaceType::TMZ);
    REQUIRE(airspaceCategory("P").first == AirspaceType::Prohibited);

    const auto classE = airspaceCategory("CLASS_E");
    REQUIRE(classE.first == AirspaceType::CTA);
    REQUIRE(classE.second == AirspaceClass::E);

    REQUIRE(airspaceCategory(std::nullopt).second == AirspaceClass::G);
    REQUIRE(airspaceCategory("SECTOR").second == AirspaceClass::G);
}

TEST_CASE("Feature measures", "[feature-converter]") {
    REQUIRE(runwaySurface("ASPH") == RunwaySurface::Asphalt);
    REQUIRE(runwaySurface("GRASS") == RunwaySurface::Grass);
    REQUIRE(runwaySurface(std::nullopt) == RunwaySurface::Unknown);

    REQUIRE(runwayLength(Measure{3250.0, "M"}).meters() == Catch::Approx(3250.0));
    REQUIRE(runwayLength(Measure{10000.0, "FT"}).meters() == Catch::Approx(3048.0));
    REQUIRE(runwayLength(std::nullopt).meters() == 0.0);

    REQUIRE(fieldElevation(Measure{53.0, "FT"}) == VerticalDistance::msl(53));
    REQUIRE(fieldElevation(Measure{16.0, "M"}) == VerticalDistance::msl(52));
    REQUIRE(fieldElevation(std::nullopt) == VerticalDistance::gnd());
}

TEST_CASE("Feature entities", "[feature-converter]") {
    SECTION("Airport") {
        auto airport = toAirport(hamburg());
        REQUIRE(airport.has_value());
        REQUIRE(airport->ident() == "EDDH");
        REQUIRE(airport->iataDesignator == "HAM");
    }

    SECTION("Airport without reference point") {
        auto feature = hamburg();
        feature.arp.reset();
        REQUIRE(toAirport(feature).error().code == core::ErrorCode::MissingField);
    }

    SECTION("Designated point") {
        DesignatedPointFeature feature{"dp-1", "DHN1", "ALPHA", geo::Coordinate{53.9, 9.5}};
        auto waypoint = toWaypoint(feature);
        REQUIRE(waypoint.has_value());
        REQUIRE(waypoint->ident() == "DHN1");
        REQUIRE(waypoint->terminalArea() == nullptr);
    }

    SECTION("Airspace takes the first volume and closes it") {
        AirspaceFeature feature;
        feature.uuid = "ase-1";
        feature.name = "HAMBURG";
        feature.type = "CTR";
        AirspaceVolume volume;
        volume.upperLimit = "2500";
        volume.upperLimitUom = "FT";
        volume.upperLimitReference = "MSL";
        volume.lowerLimit = "GND";
        volume.polygon = {{53.5, 9.7}, {53.5, 10.2}, {53.8, 10.2}, {53.8, 9.7}};
        feature.volumes.push_back(volume);

        const auto airspace = toAirspace(feature);
        REQUIRE(airspace.type == AirspaceType::CTR);
        REQUIRE(airspace.ceiling == VerticalDistance::msl(2500));
        REQUIRE(airspace.floor == VerticalDistance::gnd());
        REQUIRE(airspace.polygon.exterior().size() == 5);
        REQUIRE(airspace.polygon.contains(geo::Coordinate{53.6302, 9.9882}));
    }
}

TEST_CASE("Loading a feature stream", "[feature-converter]") {
    RunwayFeature runway;
    runway.uuid = "rwy-1";
    runway.designator = "05/23";
    runway.nominalLength = Measure{3250.0, "M"};
    runway.surfaceComposition = "ASPH";
    runway.associatedAirportUuid = "ahp-eddh";

    RunwayDirectionFeature rwy05;
    rwy05.uuid = "rdn-05";
    rwy05.designator = "05";
    rwy05.magneticBearing = 53.0;
    rwy05.usedRunwayUuid = "rwy-1";

    RunwayDirectionFeature orphan;
    orphan.uuid = "rdn-99";
    orphan.designator = "99";
    orphan.usedRunwayUuid = "rwy-unknown";

    // 跑道方向先于机场出现
    VectorFeatureSource source({
        Feature{rwy05},
        Feature{runway},
        Feature{hamburg()},
        Feature{orphan},
        std::unexpected(core::Error{core::ErrorCode::Parse, "broken feature"}),
    });

    const auto data = loadFeatures(source);

    const auto airport = data.find("EDDH")->airport();
    REQUIRE(airport->runways.size() == 1);
    const auto* rwy = airport->findRunway("05");
    REQUIRE(rwy != nullptr);
    REQUIRE(rwy->bearing.reference() == core::AngleReference::Magnetic);
    REQUIRE(rwy->surface == RunwaySurface::Asphalt);
    REQUIRE(rwy->length.meters() == Catch::Approx(3250.0));

    REQUIRE(data.errors().size() == 2);
}
