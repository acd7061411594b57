#include <catch2/catch_test_macros.hpp>
#include "../src/route/Token.hpp"
#include "NavDataFixture.hpp"

using namespace efb;
using namespace efb::test;
using namespace efb::route;

TEST_CASE("Lexer classifies words", "[route-tokens]") {
    const auto data = northGermany();

    SECTION("Speed, level, airports and direct") {
        auto words = Lexer::lex("N0107 A0250 EDDH D DCT EDHL07", data);
        REQUIRE(words.has_value());
        REQUIRE(words->size() == 6);

        REQUIRE(std::get<core::Speed>((*words)[0]) == core::Speed::kt(107.0));
        REQUIRE(std::get<core::VerticalDistance>((*words)[1]) == core::VerticalDistance::altitude(2500));
        REQUIRE(std::get<AirportRef>((*words)[2]).airport->ident() == "EDDH");
        REQUIRE(std::get<VfrWaypointCandidate>((*words)[3]).ident == "D");
        REQUIRE(std::get<VfrWaypointCandidate>((*words)[3]).match == nullptr);
        REQUIRE(std::holds_alternative<Via>((*words)[4]));

        const auto& edhl = std::get<AirportRef>((*words)[5]);
        REQUIRE(edhl.airport->ident() == "EDHL");
        REQUIRE(edhl.runway.has_value());
        REQUIRE(edhl.runway->designator == "07");
    }

    SECTION("Lower case input") {
        auto words = Lexer::lex("n0107 eddh dct edhl", data);
        REQUIRE(words.has_value());
        REQUIRE(words->size() == 4);
        REQUIRE(std::holds_alternative<AirportRef>(words->back()));
    }

    SECTION("Wind") {
        auto words = Lexer::lex("13509KT", data);
        REQUIRE(words.has_value());
        REQUIRE(std::get<core::Wind>(words->front()).speed == core::Speed::kt(9.0));
    }

    SECTION("Unknown runway") {
        auto words = Lexer::lex("EDDH DCT EDHL99", data);
        REQUIRE_FALSE(words.has_value());
        REQUIRE(words.error().code == core::ErrorCode::UnknownRunwayInRoute);
        REQUIRE(words.error().message == "99 at EDHL");
    }

    SECTION("Empty route") {
        auto words = Lexer::lex("   ", data);
        REQUIRE(words.has_value());
        REQUIRE(words->empty());
    }
}

TEST_CASE("Tokenizer resolves terminal waypoints", "[route-tokens]") {
    const auto data = northGermany();

    const auto tokenize = [&](std::string_view route) {
        auto words = Lexer::lex(route, data);
        REQUIRE(words.has_value());
        return Tokens::tokenize(*words, data);
    };

    SECTION("Waypoints follow the preceding airport") {
        auto tokens = tokenize("N0107 A0250 EDDH N2 N1 DCT EDHL W");
        REQUIRE(tokens.has_value());
        REQUIRE(tokens->size() == 7);
        REQUIRE(tokens->speed() == core::Speed::kt(107.0));
        REQUIRE(tokens->level() == core::VerticalDistance::altitude(2500));

        // EDHL 只限定 W 所在终端区
        const auto& w = std::get<nd::NavAid>(tokens->tokens()[6]);
        REQUIRE(w.ident() == "W");
        REQUIRE(*w.waypoint()->terminalArea() == "EDHL");
        REQUIRE(tokens->toString() == "N0107 2500 ALT EDDH N2 N1 DCT W");
    }

    SECTION("Waypoints before the next airport") {
        auto tokens = tokenize("EDDH DCT W EDAH");
        REQUIRE(tokens.has_value());
        REQUIRE(tokens->size() == 4);
        const auto& w = std::get<nd::NavAid>(tokens->tokens()[2]);
        REQUIRE(*w.waypoint()->terminalArea() == "EDAH");
        REQUIRE(std::holds_alternative<AirportRef>(tokens->tokens()[3]));
    }

    SECTION("Same ident in two terminal areas") {
        auto tokens = tokenize("EDAH W W EDHL");
        REQUIRE_FALSE(tokens.has_value());
        REQUIRE(tokens.error().code == core::ErrorCode::AmbiguousTerminalArea);
        REQUIRE(tokens.error().message == "W is defined in EDAH and EDHL");
    }

    SECTION("Unknown waypoint") {
        auto tokens = tokenize("EDDH XYZ");
        REQUIRE_FALSE(tokens.has_value());
        REQUIRE(tokens.error().code == core::ErrorCode::UnexpectedRouteToken);
        REQUIRE(tokens.error().message == "XYZ");
    }

    SECTION("Later speed and level do not replace the first") {
        auto tokens = tokenize("N0107 F065 EDDH N0120 F085");
        REQUIRE(tokens.has_value());
        REQUIRE(tokens->speed() == core::Speed::kt(107.0));
        REQUIRE(tokens->level() == core::VerticalDistance::fl(65));
        REQUIRE(tokens->size() == 5);
    }
}

TEST_CASE("Tokenizer falls back to enroute waypoints", "[route-tokens]") {
    nd::NavigationDataBuilder builder;
    builder.addAirport(makeAirport("EDDH", 53.6302, 9.9882));
    builder.addWaypoint(makeWaypoint("DHN1", 53.9, 9.5));
    builder.addWaypoint(makeWaypoint("HLZ", 52.1, 10.1, nd::Enroute{}, nd::WaypointUsage::Unknown));
    const auto data = builder.build();

    auto words = Lexer::lex("EDDH DHN1 HLZ", data);
    REQUIRE(words.has_value());
    REQUIRE(std::get<VfrWaypointCandidate>((*words)[1]).match != nullptr);
    REQUIRE(std::holds_alternative<nd::NavAid>((*words)[2]));

    auto tokens = Tokens::tokenize(*words, data);
    REQUIRE(tokens.has_value());
    REQUIRE(tokens->size() == 3);
    REQUIRE(std::get<nd::NavAid>(tokens->tokens()[1]).ident() == "DHN1");
}
