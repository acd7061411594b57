#include "nd/Airport.hpp"
#include <algorithm>

namespace efb::nd {

std::string_view toString(RunwaySurface surface) noexcept {
    switch (surface) {
        case RunwaySurface::Asphalt: return "asphalt";
        case RunwaySurface::Concrete: return "concrete";
        case RunwaySurface::Grass: return "grass";
        case RunwaySurface::Unknown: return "unknown";
    }
    return "unknown";
}

const Runway* Airport::findRunway(std::string_view designator) const noexcept {
    if (designator.starts_with("RW")) {
        designator.remove_prefix(2);
    }
    const auto it = std::find_if(runways.begin(), runways.end(), [&](const Runway& rwy) {
        return rwy.designator == designator;
    });
    return it != runways.end() ? &*it : nullptr;
}

} // namespace efb::nd
