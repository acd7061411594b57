#include "nd/FeatureConverter.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace efb::nd {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::optional<double> parseNumber(std::string_view s) noexcept {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::uint16_t toFeet(double value) noexcept {
    return static_cast<std::uint16_t>(std::clamp(std::lround(value), 0L, 0xFFFFL));
}

std::optional<std::string_view> view(const std::optional<std::string>& s) noexcept {
    if (!s) {
        return std::nullopt;
    }
    return std::string_view{*s};
}

// 闭合外环
std::vector<geo::Coordinate> closedRing(std::vector<geo::Coordinate> ring) {
    if (!ring.empty() && ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
    return ring;
}

struct RunwayInfo {
    std::optional<std::string> airportUuid;
    core::Length length;
    RunwaySurface surface{RunwaySurface::Unknown};
};

} // namespace

core::VerticalDistance verticalDistance(std::optional<std::string_view> value,
                                        std::optional<std::string_view> uom,
                                        std::optional<std::string_view> reference) noexcept {
    using core::VerticalDistance;

    if (!value) {
        return VerticalDistance::unlimited();
    }
    const auto v = trim(*value);

    if (v == "GND" || v == "SFC") {
        return VerticalDistance::gnd();
    }
    if (v == "UNL" || v == "UNLTD") {
        return VerticalDistance::unlimited();
    }
    if (v.starts_with("FL")) {
        if (auto level = parseNumber(v.substr(2))) {
            return VerticalDistance::fl(toFeet(*level));
        }
        return VerticalDistance::unlimited();
    }

    const auto number = parseNumber(v);
    if (!number) {
        return VerticalDistance::unlimited();
    }
    if (uom == "FL") {
        return VerticalDistance::fl(toFeet(*number));
    }

    const double feet = uom == "M" ? *number * core::FEET_PER_METER : *number;
    if (reference == "SFC" || reference == "GND") {
        return VerticalDistance::agl(toFeet(feet));
    }
    return VerticalDistance::msl(toFeet(feet));
}

std::pair<AirspaceType, std::optional<AirspaceClass>>
airspaceCategory(std::optional<std::string_view> type) noexcept {
    if (!type) {
        return {AirspaceType::CTA, AirspaceClass::G};
    }
    const auto t = trim(*type);

    if (t == "CTR") return {AirspaceType::CTR, std::nullopt};
    if (t == "CTA") return {AirspaceType::CTA, std::nullopt};
    if (t == "TMA") return {AirspaceType::TMA, std::nullopt};
    if (t == "RAS") return {AirspaceType::RadarZone, std::nullopt};
    if (t == "TMZ") return {AirspaceType::TMZ, std::nullopt};
    if (t == "RMZ") return {AirspaceType::RMZ, std::nullopt};
    if (t == "R" || t == "RESTRICT") return {AirspaceType::Restricted, std::nullopt};
    if (t == "D_OTHER" || t == "DA") return {AirspaceType::Danger, std::nullopt};
    if (t == "P" || t == "PROHIBIT") return {AirspaceType::Prohibited, std::nullopt};

    // 仅有等级的空域
    auto letter = t;
    if (letter.starts_with("CLASS_")) {
        letter.remove_prefix(6);
    }
    if (letter.size() == 1) {
        if (auto classification = airspaceClassFromChar(letter.front())) {
            return {AirspaceType::CTA, classification};
        }
    }
    return {AirspaceType::CTA, AirspaceClass::G};
}

RunwaySurface runwaySurface(std::optional<std::string_view> composition) noexcept {
    if (composition == "ASPH" || composition == "ASPHALT") return RunwaySurface::Asphalt;
    if (composition == "CONC" || composition == "CONCRETE") return RunwaySurface::Concrete;
    if (composition == "GRASS") return RunwaySurface::Grass;
    return RunwaySurface::Unknown;
}

core::Length runwayLength(const std::optional<Measure>& length) noexcept {
    if (!length) {
        return core::Length{};
    }
    if (length->uom == "FT") return core::Length::ft(length->value);
    if (length->uom == "KM") return core::Length::km(length->value);
    return core::Length::m(length->value);
}

core::VerticalDistance fieldElevation(const std::optional<Measure>& elevation) noexcept {
    if (!elevation) {
        return core::VerticalDistance::gnd();
    }
    const double feet = elevation->uom == "M" ? elevation->value * core::FEET_PER_METER : elevation->value;
    return core::VerticalDistance::msl(toFeet(feet));
}

core::Result<Airport> toAirport(const AirportHeliportFeature& feature) {
    if (!feature.arp) {
        return core::fail(core::ErrorCode::MissingField,
                          fmt::format("{}: ARP coordinates", feature.designator));
    }

    Airport airport;
    airport.icaoIdent = feature.locationIndicatorIcao.value_or(feature.designator);
    airport.iataDesignator = feature.iataDesignator;
    airport.name = feature.name;
    airport.coordinate = *feature.arp;
    airport.elevation = fieldElevation(feature.fieldElevation);
    return airport;
}

core::Result<Waypoint> toWaypoint(const DesignatedPointFeature& feature) {
    if (!feature.location) {
        return core::fail(core::ErrorCode::MissingField,
                          fmt::format("{}: location coordinates", feature.designator));
    }

    Waypoint waypoint;
    waypoint.fixIdent = feature.designator;
    waypoint.description = feature.name.value_or("");
    waypoint.coordinate = *feature.location;
    waypoint.region = Enroute{};
    return waypoint;
}

core::Result<Waypoint> toWaypoint(const NavaidFeature& feature) {
    if (!feature.location) {
        return core::fail(core::ErrorCode::MissingField,
                          fmt::format("{}: navaid location coordinates", feature.designator));
    }

    Waypoint waypoint;
    waypoint.fixIdent = feature.designator;
    waypoint.description = feature.name.value_or("");
    waypoint.coordinate = *feature.location;
    waypoint.region = Enroute{};
    return waypoint;
}

Airspace toAirspace(const AirspaceFeature& feature) {
    const auto [type, classification] = airspaceCategory(view(feature.type));

    Airspace airspace;
    airspace.name = feature.name.value_or(feature.designator.value_or(""));
    airspace.type = type;
    airspace.classification = classification;

    // 只取第一个体积
    if (!feature.volumes.empty()) {
        const auto& volume = feature.volumes.front();
        airspace.ceiling = verticalDistance(view(volume.upperLimit), view(volume.upperLimitUom),
                                            view(volume.upperLimitReference));
        airspace.floor = verticalDistance(view(volume.lowerLimit), view(volume.lowerLimitUom),
                                          view(volume.lowerLimitReference));
        airspace.polygon = geo::Polygon{closedRing(volume.polygon)};
    }
    return airspace;
}

NavigationData loadFeatures(IFeatureSource& source, NavigationDataBuilder builder) {
    std::unordered_map<std::string, std::string> airportIdents;   // uuid -> ident
    std::vector<RunwayFeature> runways;
    std::vector<RunwayDirectionFeature> directions;

    const auto reportError = [&builder](core::Error error) {
        spdlog::warn("Skipping feature: {}", error);
        builder.addError(std::move(error));
    };

    while (auto item = source.next()) {
        if (!*item) {
            reportError(item->error());
            continue;
        }

        std::visit([&](const auto& feature) {
            using T = std::decay_t<decltype(feature)>;

            if constexpr (std::is_same_v<T, AirportHeliportFeature>) {
                if (auto airport = toAirport(feature)) {
                    airportIdents.emplace(feature.uuid, airport->ident());
                    builder.addAirport(std::move(*airport));
                } else {
                    reportError(airport.error());
                }
            } else if constexpr (std::is_same_v<T, RunwayFeature>) {
                runways.push_back(feature);
            } else if constexpr (std::is_same_v<T, RunwayDirectionFeature>) {
                directions.push_back(feature);
            } else if constexpr (std::is_same_v<T, AirspaceFeature>) {
                builder.addAirspace(toAirspace(feature));
            } else {
                if (auto waypoint = toWaypoint(feature)) {
                    builder.addWaypoint(std::move(*waypoint));
                } else {
                    reportError(waypoint.error());
                }
            }
        }, **item);
    }

    std::unordered_map<std::string, RunwayInfo> runwayInfos;
    for (const auto& runway : runways) {
        runwayInfos.emplace(runway.uuid, RunwayInfo{
            runway.associatedAirportUuid,
            runwayLength(runway.nominalLength),
            runwaySurface(view(runway.surfaceComposition))
        });
    }

    for (const auto& direction : directions) {
        if (!direction.usedRunwayUuid) {
            reportError(core::Error{core::ErrorCode::MissingField,
                                    fmt::format("runway direction {}: used runway", direction.designator)});
            continue;
        }
        const auto info = runwayInfos.find(*direction.usedRunwayUuid);
        if (info == runwayInfos.end()) {
            reportError(core::Error{core::ErrorCode::InvalidRecord,
                                    fmt::format("runway direction {}: unknown runway {}",
                                                direction.designator, *direction.usedRunwayUuid)});
            continue;
        }
        const auto ident = info->second.airportUuid
            ? airportIdents.find(*info->second.airportUuid)
            : airportIdents.end();
        if (ident == airportIdents.end()) {
            reportError(core::Error{core::ErrorCode::InvalidRecord,
                                    fmt::format("runway direction {}: unknown airport", direction.designator)});
            continue;
        }

        Runway runway;
        runway.designator = direction.designator;
        if (direction.trueBearing) {
            runway.bearing = core::Angle::trueNorth(*direction.trueBearing);
        } else if (direction.magneticBearing) {
            runway.bearing = core::Angle::magnetic(*direction.magneticBearing);
        }
        runway.length = info->second.length;
        runway.tora = info->second.length;
        runway.toda = info->second.length;
        runway.lda = info->second.length;
        runway.surface = info->second.surface;
        runway.elevation = core::VerticalDistance::gnd();
        builder.addRunway(ident->second, std::move(runway));
    }

    return builder.build();
}

} // namespace efb::nd
