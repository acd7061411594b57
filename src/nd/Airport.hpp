#pragma once

#include "core/Measurements.hpp"
#include "core/VerticalDistance.hpp"
#include "geo/Coordinate.hpp"
#include "nd/AiracCycle.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace efb::nd {

enum class RunwaySurface { Asphalt, Concrete, Grass, Unknown };

[[nodiscard]] std::string_view toString(RunwaySurface surface) noexcept;

struct Runway {
    std::string designator;                 // 例如 "07", "25L"
    core::Angle bearing;
    core::Length length;
    std::optional<core::Length> tora;
    std::optional<core::Length> toda;
    std::optional<core::Length> lda;
    RunwaySurface surface{RunwaySurface::Unknown};
    double slope{0.0};                      // 百分比
    core::VerticalDistance elevation;       // 入口标高

    bool operator==(const Runway&) const = default;
};

struct Airport {
    std::string icaoIdent;
    std::optional<std::string> iataDesignator;
    std::string name;
    geo::Coordinate coordinate;
    core::MagneticVariation magVar;
    core::VerticalDistance elevation;
    std::vector<Runway> runways;
    std::optional<AiracCycle> cycle;

    const std::string& ident() const noexcept { return icaoIdent; }

    // 按跑道号查找，忽略 "RW" 前缀
    [[nodiscard]] const Runway* findRunway(std::string_view designator) const noexcept;

    bool operator==(const Airport&) const = default;
};

} // namespace efb::nd
