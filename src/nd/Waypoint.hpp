#pragma once

#include "core/Measurements.hpp"
#include "geo/Coordinate.hpp"
#include "nd/AiracCycle.hpp"
#include <optional>
#include <string>
#include <variant>

namespace efb::nd {

enum class WaypointUsage { VfrOnly, Unknown };

struct Enroute {
    bool operator==(const Enroute&) const = default;
};

// 归属某机场终端区
struct TerminalArea {
    std::string airportIdent;

    bool operator==(const TerminalArea&) const = default;
};

using Region = std::variant<Enroute, TerminalArea>;

struct Waypoint {
    std::string fixIdent;
    std::string description;
    WaypointUsage usage{WaypointUsage::Unknown};
    geo::Coordinate coordinate;
    core::MagneticVariation magVar;
    Region region;
    std::optional<AiracCycle> cycle;

    const std::string& ident() const noexcept { return fixIdent; }

    // 终端区所属机场，航路点返回 nullptr
    const std::string* terminalArea() const noexcept {
        const auto* area = std::get_if<TerminalArea>(&region);
        return area ? &area->airportIdent : nullptr;
    }

    bool operator==(const Waypoint&) const = default;
};

} // namespace efb::nd
