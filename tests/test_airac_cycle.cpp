#include <catch2/catch_test_macros.hpp>
#include "../src/nd/AiracCycle.hpp"

using namespace efb;
using namespace std::chrono;

TEST_CASE("AIRAC cycle parsing", "[airac]") {
    SECTION("Valid cycle") {
        auto cycle = nd::AiracCycle::parse("2401");
        REQUIRE(cycle.has_value());
        REQUIRE(cycle->year() == 2024);
        REQUIRE(cycle->ordinal() == 1);
        REQUIRE(cycle->toString() == "2401");
    }

    SECTION("Ordinal out of range") {
        REQUIRE_FALSE(nd::AiracCycle::parse("2400").has_value());
        REQUIRE_FALSE(nd::AiracCycle::parse("2414").has_value());
        REQUIRE(nd::AiracCycle::parse("2414").error().code == core::ErrorCode::InvalidCycle);
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(nd::AiracCycle::parse("24").has_value());
        REQUIRE_FALSE(nd::AiracCycle::parse("24A1").has_value());
    }
}

TEST_CASE("AIRAC effective dates", "[airac]") {
    REQUIRE(nd::AiracCycle(2020, 1).effectiveDate() == sys_days{2020y / January / 2});
    REQUIRE(nd::AiracCycle(2023, 1).effectiveDate() == sys_days{2023y / January / 26});
    REQUIRE(nd::AiracCycle(2024, 1).effectiveDate() == sys_days{2024y / January / 25});
    REQUIRE(nd::AiracCycle(2024, 2).effectiveDate() == sys_days{2024y / February / 22});
    REQUIRE(nd::AiracCycle(2024, 1).expirationDate() == sys_days{2024y / February / 22});
}

TEST_CASE("AIRAC validity", "[airac]") {
    const nd::AiracCycle cycle(2024, 1);

    REQUIRE(cycle.validity(sys_days{2024y / January / 24}) == nd::CycleValidity::Future);
    REQUIRE(cycle.validity(sys_days{2024y / January / 25}) == nd::CycleValidity::Current);
    REQUIRE(cycle.validity(sys_days{2024y / February / 21}) == nd::CycleValidity::Current);
    REQUIRE(cycle.validity(sys_days{2024y / February / 22}) == nd::CycleValidity::Expired);

    REQUIRE(nd::AiracCycle(2023, 13) < cycle);
}
