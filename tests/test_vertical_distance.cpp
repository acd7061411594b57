#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/core/VerticalDistance.hpp"
#include <stdexcept>

using namespace efb::core;

TEST_CASE("VerticalDistance parsing", "[vertical-distance]") {
    SECTION("Flight level") {
        auto vd = VerticalDistance::parse("F085");
        REQUIRE(vd.has_value());
        REQUIRE(*vd == VerticalDistance::fl(85));
    }

    SECTION("Metric flight level") {
        auto vd = VerticalDistance::parse("S1130");
        REQUIRE(vd.has_value());
        REQUIRE(*vd == VerticalDistance::fl(371));
    }

    SECTION("Altitude in hundreds of feet") {
        auto vd = VerticalDistance::parse("A025");
        REQUIRE(vd.has_value());
        REQUIRE(*vd == VerticalDistance::altitude(2500));
    }

    SECTION("Altitude beyond the feet range") {
        REQUIRE(*VerticalDistance::parse("A655") == VerticalDistance::altitude(65500));
        auto vd = VerticalDistance::parse("A999");
        REQUIRE_FALSE(vd.has_value());
        REQUIRE(vd.error().code == ErrorCode::UnexpectedString);
    }

    SECTION("Altitude in tens of metres") {
        auto vd = VerticalDistance::parse("M0762");
        REQUIRE(vd.has_value());
        REQUIRE(*vd == VerticalDistance::altitude(2500));
    }

    SECTION("Too short") {
        auto vd = VerticalDistance::parse("F08");
        REQUIRE_FALSE(vd.has_value());
        REQUIRE(vd.error().code == ErrorCode::UnexpectedString);
    }

    SECTION("Unknown prefix") {
        REQUIRE_FALSE(VerticalDistance::parse("X085").has_value());
        REQUIRE_FALSE(VerticalDistance::parse("").has_value());
    }
}

TEST_CASE("VerticalDistance display", "[vertical-distance]") {
    REQUIRE(VerticalDistance::gnd().toString() == "GND");
    REQUIRE(VerticalDistance::fl(85).toString() == "FL085");
    REQUIRE(VerticalDistance::agl(1500).toString() == "1500 AGL");
    REQUIRE(VerticalDistance::msl(2500).toString() == "2500 MSL");
    REQUIRE(VerticalDistance::altitude(3000).toString() == "3000 ALT");
    REQUIRE(VerticalDistance::pressureAltitude(4500).toString() == "PA 4500");
    REQUIRE(VerticalDistance::unlimited().toString() == "unlimited");
}

TEST_CASE("VerticalDistance ordering", "[vertical-distance]") {
    SECTION("Common datum") {
        REQUIRE(VerticalDistance::gnd() < VerticalDistance::msl(500));
        REQUIRE(VerticalDistance::altitude(2500) < VerticalDistance::fl(65));
        REQUIRE(VerticalDistance::fl(100) > VerticalDistance::msl(9000));
        REQUIRE(VerticalDistance::unlimited() > VerticalDistance::fl(660));
        REQUIRE((VerticalDistance::msl(2500) <=> VerticalDistance::altitude(2500)) ==
                std::partial_ordering::equivalent);
    }

    SECTION("Different datum is unordered") {
        const auto agl = VerticalDistance::agl(1500);
        const auto msl = VerticalDistance::msl(1500);
        REQUIRE_FALSE(agl < msl);
        REQUIRE_FALSE(agl > msl);
        REQUIRE_FALSE(agl.comparableWith(msl));
        REQUIRE(agl.comparableWith(VerticalDistance::agl(1000)));
        REQUIRE_FALSE(VerticalDistance::pressureAltitude(3000).comparableWith(VerticalDistance::fl(30)));
    }

    SECTION("Ground and unlimited bound everything") {
        REQUIRE(VerticalDistance::gnd() < VerticalDistance::agl(500));
        REQUIRE(VerticalDistance::unlimited() > VerticalDistance::pressureAltitude(30000));
    }
}

TEST_CASE("VerticalDistance conversion", "[vertical-distance]") {
    const auto elevation = Length::ft(53.0);

    SECTION("Ground and AGL use elevation") {
        REQUIRE(VerticalDistance::gnd().toMsl(STANDARD_PRESSURE_HPA, elevation)->feet() == Catch::Approx(53.0));
        REQUIRE(VerticalDistance::agl(1000).toMsl(STANDARD_PRESSURE_HPA, elevation)->feet() == Catch::Approx(1053.0));
    }

    SECTION("Flight level uses QNH") {
        auto msl = VerticalDistance::fl(50).toMsl(1023.25, elevation);
        REQUIRE(msl.has_value());
        REQUIRE(msl->feet() == Catch::Approx(5270.0));
    }

    SECTION("Unlimited has no altitude") {
        REQUIRE_FALSE(VerticalDistance::unlimited().toMsl(STANDARD_PRESSURE_HPA, elevation).has_value());
    }
}

TEST_CASE("VerticalDistance ratio", "[vertical-distance]") {
    REQUIRE(VerticalDistance::fl(100) / VerticalDistance::fl(50) == Catch::Approx(2.0));
    REQUIRE_THROWS_AS(VerticalDistance::fl(100) / VerticalDistance::msl(5000), std::logic_error);
}
