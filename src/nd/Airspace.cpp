#include "nd/Airspace.hpp"

namespace efb::nd {

std::string_view toString(AirspaceType type) noexcept {
    switch (type) {
        case AirspaceType::CTA: return "CTA";
        case AirspaceType::CTR: return "CTR";
        case AirspaceType::TMA: return "TMA";
        case AirspaceType::Restricted: return "Restricted";
        case AirspaceType::Danger: return "Danger";
        case AirspaceType::Prohibited: return "Prohibited";
        case AirspaceType::TMZ: return "TMZ";
        case AirspaceType::RMZ: return "RMZ";
        case AirspaceType::RadarZone: return "RadarZone";
    }
    return "";
}

std::string_view toString(AirspaceClass classification) noexcept {
    switch (classification) {
        case AirspaceClass::A: return "A";
        case AirspaceClass::B: return "B";
        case AirspaceClass::C: return "C";
        case AirspaceClass::D: return "D";
        case AirspaceClass::E: return "E";
        case AirspaceClass::F: return "F";
        case AirspaceClass::G: return "G";
    }
    return "";
}

std::optional<AirspaceClass> airspaceClassFromChar(char c) noexcept {
    switch (c) {
        case 'A': return AirspaceClass::A;
        case 'B': return AirspaceClass::B;
        case 'C': return AirspaceClass::C;
        case 'D': return AirspaceClass::D;
        case 'E': return AirspaceClass::E;
        case 'F': return AirspaceClass::F;
        case 'G': return AirspaceClass::G;
        default: return std::nullopt;
    }
}

} // namespace efb::nd
