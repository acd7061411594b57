#pragma once

#include "core/VerticalDistance.hpp"
#include "geo/Polygon.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace efb::nd {

enum class AirspaceType {
    CTA,
    CTR,
    TMA,
    Restricted,
    Danger,
    Prohibited,
    TMZ,
    RMZ,
    RadarZone
};

enum class AirspaceClass { A, B, C, D, E, F, G };

[[nodiscard]] std::string_view toString(AirspaceType type) noexcept;
[[nodiscard]] std::string_view toString(AirspaceClass classification) noexcept;

// 字母 A-G
[[nodiscard]] std::optional<AirspaceClass> airspaceClassFromChar(char c) noexcept;

// 空域；垂直边界保持原始基准
struct Airspace {
    std::string name;
    AirspaceType type{AirspaceType::CTA};
    std::optional<AirspaceClass> classification;
    core::VerticalDistance ceiling{core::VerticalDistance::unlimited()};
    core::VerticalDistance floor{core::VerticalDistance::gnd()};
    geo::Polygon polygon;

    bool operator==(const Airspace&) const = default;
};

} // namespace efb::nd
