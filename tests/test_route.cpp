#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/route/Route.hpp"
#include "NavDataFixture.hpp"

using namespace efb;
using namespace efb::test;
using namespace efb::route;

TEST_CASE("Route decoding", "[route]") {
    const auto data = northGermany();
    Route route;

    SECTION("Legs through terminal areas") {
        REQUIRE(route.decode("N0107 A0250 EDDH N2 N1 DCT EDHL W DCT W EDAH", data).has_value());

        REQUIRE(route.tokens().size() == 10);
        REQUIRE(route.legs().size() == 5);
        REQUIRE(route.origin()->ident() == "EDDH");
        REQUIRE(route.destination()->ident() == "EDAH");
        REQUIRE(route.speed() == core::Speed::kt(107.0));
        REQUIRE(route.level() == core::VerticalDistance::altitude(2500));

        const auto& legs = route.legs();
        REQUIRE(legs.front().from().ident() == "EDDH");
        REQUIRE(legs.front().to().ident() == "N2");
        REQUIRE(*legs[3].from().waypoint()->terminalArea() == "EDHL");
        REQUIRE(*legs[3].to().waypoint()->terminalArea() == "EDAH");
        REQUIRE(legs.back().to().ident() == "EDAH");

        for (std::size_t i = 0; i + 1 < legs.size(); ++i) {
            REQUIRE(legs[i].to() == legs[i + 1].from());
        }
        for (const auto& leg : legs) {
            REQUIRE(leg.level() == core::VerticalDistance::altitude(2500));
            REQUIRE(leg.tas() == core::Speed::kt(107.0));
        }
    }

    SECTION("Origin without destination") {
        REQUIRE(route.decode("N0107 A0250 EDDH N2 N1 DCT EDHL W", data).has_value());
        REQUIRE(route.tokens().size() == 7);
        REQUIRE(route.legs().size() == 3);
        REQUIRE(route.origin()->ident() == "EDDH");
        REQUIRE(route.destination() == nullptr);
        REQUIRE(route.toString() == "N0107 2500 ALT EDDH N2 N1 DCT W");
    }

    SECTION("Runways") {
        REQUIRE(route.decode("EDHL25 DCT EDDH", data).has_value());
        REQUIRE(route.takeoffRunway()->designator == "25");
        REQUIRE_FALSE(route.landingRunway().has_value());
        REQUIRE(route.legs().size() == 1);
    }

    SECTION("Values apply to the legs that follow") {
        REQUIRE(route.decode("EDDH N2 N0107 A0250 N1", data).has_value());
        REQUIRE(route.legs().size() == 2);
        REQUIRE_FALSE(route.legs()[0].tas().has_value());
        REQUIRE(route.legs()[1].tas() == core::Speed::kt(107.0));
    }

    SECTION("Failed decode leaves an empty route") {
        REQUIRE(route.decode("EDDH N2 DCT EDHL", data).has_value());
        REQUIRE_FALSE(route.empty());

        auto result = route.decode("EDAH W W EDHL", data);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == core::ErrorCode::AmbiguousTerminalArea);
        REQUIRE(route.empty());
        REQUIRE(route.tokens().empty());
        REQUIRE(route.origin() == nullptr);
        REQUIRE_FALSE(route.speed().has_value());
    }

    SECTION("Empty input") {
        REQUIRE(route.decode("", data).has_value());
        REQUIRE(route.empty());
        REQUIRE_FALSE(route.totals().has_value());
        REQUIRE(route.totalDistance().meters() == 0.0);
    }
}

TEST_CASE("Route totals", "[route]") {
    const auto data = northGermany();
    Route route;

    SECTION("Distance without wind") {
        REQUIRE(route.decode("N0107 EDDH N2 N1", data).has_value());
        const auto accumulated = route.accumulateLegs();
        REQUIRE(accumulated.size() == 2);
        REQUIRE(accumulated[1].dist.meters() ==
                Catch::Approx((route.legs()[0].dist() + route.legs()[1].dist()).meters()));
        REQUIRE_FALSE(accumulated[1].ete.has_value());
        REQUIRE(route.totalDistance() == accumulated.back().dist);
    }

    SECTION("Time with wind") {
        REQUIRE(route.decode("N0107 27010KT EDDH N2 N1", data).has_value());
        const auto totals = route.totals();
        REQUIRE(totals.has_value());
        REQUIRE(totals->ete.has_value());
        REQUIRE(totals->ete->seconds() ==
                Catch::Approx(route.legs()[0].ete()->seconds() + route.legs()[1].ete()->seconds()));
    }
}

TEST_CASE("Route alternate", "[route]") {
    const auto data = northGermany();
    Route route;
    route.setAlternate(data.find("EDHL"));

    SECTION("Leg from the last waypoint") {
        REQUIRE(route.decode("N0107 A0250 EDDH N2 N1", data).has_value());
        const auto alternate = route.alternate();
        REQUIRE(alternate.has_value());
        REQUIRE(alternate->from().ident() == "N1");
        REQUIRE(alternate->to().ident() == "EDHL");
        REQUIRE(alternate->level() == core::VerticalDistance::altitude(2500));
    }

    SECTION("Kept across decodes") {
        REQUIRE(route.decode("EDDH N2", data).has_value());
        REQUIRE(route.decode("EDDH N1", data).has_value());
        REQUIRE(route.alternate()->from().ident() == "N1");
    }

    SECTION("Cleared with the route") {
        REQUIRE(route.decode("EDDH N2", data).has_value());
        route.clear();
        REQUIRE(route.empty());
        REQUIRE(route.decode("EDDH N2", data).has_value());
        REQUIRE_FALSE(route.alternate().has_value());
    }

    SECTION("No legs") {
        REQUIRE_FALSE(route.alternate().has_value());
    }
}
