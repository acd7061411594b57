#include "nd/RecordConverter.hpp"
#include "nd/AirspaceBuilder.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace efb::nd {

namespace {

core::Result<std::optional<AiracCycle>> cycleOf(const std::optional<std::string>& cycle) {
    if (!cycle) {
        return std::nullopt;
    }
    auto parsed = AiracCycle::parse(*cycle);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return *parsed;
}

core::VerticalDistance feetMsl(std::optional<int> feet) {
    if (!feet) {
        return core::VerticalDistance::gnd();
    }
    return core::VerticalDistance::msl(static_cast<std::uint16_t>(std::clamp(*feet, 0, 0xFFFF)));
}

bool isAirportIdent(std::string_view s) {
    return s.size() == 4 && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isupper(c) || std::isdigit(c);
    });
}

} // namespace

core::Error withContext(core::Error error, std::string_view context) {
    error.message = error.message.empty()
        ? std::string(context)
        : fmt::format("{}: {}", context, error.message);
    return error;
}

core::Result<Airport> toAirport(const AirportRecord& record) {
    if (record.icaoIdent.empty()) {
        return core::fail(core::ErrorCode::MissingField, "airport ident");
    }
    if (!record.latitude) {
        return std::unexpected(withContext(record.latitude.error(), record.icaoIdent));
    }
    if (!record.longitude) {
        return std::unexpected(withContext(record.longitude.error(), record.icaoIdent));
    }
    const auto cycle = cycleOf(record.cycle);
    if (!cycle) {
        return std::unexpected(withContext(cycle.error(), record.icaoIdent));
    }

    Airport airport;
    airport.icaoIdent = record.icaoIdent;
    airport.iataDesignator = record.iataDesignator;
    airport.name = record.name;
    airport.coordinate = geo::Coordinate{*record.latitude, *record.longitude};
    airport.magVar = record.magVar.value_or(core::MagneticVariation::trueNorth());
    airport.elevation = feetMsl(record.elevation);
    airport.cycle = *cycle;
    return airport;
}

core::Result<Runway> toRunway(const RunwayRecord& record) {
    const auto context = fmt::format("{} {}", record.airportIdent, record.runwayId);
    std::string_view designator = record.runwayId;
    if (designator.starts_with("RW")) {
        designator.remove_prefix(2);
    }
    if (designator.empty()) {
        return core::fail(core::ErrorCode::MissingField, fmt::format("{}: runway designator", context));
    }
    if (!record.bearing) {
        return std::unexpected(withContext(record.bearing.error(), context));
    }

    const auto length = core::Length::ft(record.length.value_or(0));

    Runway runway;
    runway.designator = std::string(designator);
    runway.bearing = core::Angle::magnetic(*record.bearing);
    runway.length = length;
    runway.tora = length;
    runway.toda = length;
    runway.lda = length;
    runway.slope = record.gradient.value_or(0.0);
    runway.elevation = feetMsl(record.thresholdElevation);
    return runway;
}

core::Result<Waypoint> toWaypoint(const WaypointRecord& record) {
    if (record.fixIdent.empty()) {
        return core::fail(core::ErrorCode::MissingField, "waypoint ident");
    }
    if (!record.latitude) {
        return std::unexpected(withContext(record.latitude.error(), record.fixIdent));
    }
    if (!record.longitude) {
        return std::unexpected(withContext(record.longitude.error(), record.fixIdent));
    }
    const auto cycle = cycleOf(record.cycle);
    if (!cycle) {
        return std::unexpected(withContext(cycle.error(), record.fixIdent));
    }

    Region region;
    if (record.regionCode == "ENRT") {
        region = Enroute{};
    } else if (isAirportIdent(record.regionCode)) {
        region = TerminalArea{record.regionCode};
    } else {
        return core::fail(core::ErrorCode::InvalidValue,
                          fmt::format("{}: region code '{}'", record.fixIdent, record.regionCode));
    }

    Waypoint waypoint;
    waypoint.fixIdent = record.fixIdent;
    waypoint.description = record.name;
    waypoint.usage = record.waypointType.starts_with('V') ? WaypointUsage::VfrOnly : WaypointUsage::Unknown;
    waypoint.coordinate = geo::Coordinate{*record.latitude, *record.longitude};
    waypoint.magVar = record.magVar.value_or(core::MagneticVariation::trueNorth());
    waypoint.region = std::move(region);
    waypoint.cycle = *cycle;
    return waypoint;
}

NavigationData loadFixedRecords(IRecordSource& source, NavigationDataBuilder builder) {
    AirspaceBuilder airspace;
    bool discarding = false;
    std::size_t records = 0;

    const auto reportError = [&builder](core::Error error) {
        spdlog::warn("Skipping record: {}", error);
        builder.addError(std::move(error));
    };

    while (auto item = source.next()) {
        ++records;
        if (!*item) {
            reportError(item->error());
            continue;
        }

        std::visit([&](const auto& record) {
            using T = std::decay_t<decltype(record)>;

            if constexpr (std::is_same_v<T, AirportRecord>) {
                if (auto airport = toAirport(record)) {
                    builder.addAirport(std::move(*airport));
                } else {
                    reportError(airport.error());
                }
            } else if constexpr (std::is_same_v<T, RunwayRecord>) {
                if (auto runway = toRunway(record)) {
                    builder.addRunway(record.airportIdent, std::move(*runway));
                } else {
                    reportError(runway.error());
                }
            } else if constexpr (std::is_same_v<T, WaypointRecord>) {
                if (auto waypoint = toWaypoint(record)) {
                    builder.addWaypoint(std::move(*waypoint));
                } else {
                    reportError(waypoint.error());
                }
            } else if constexpr (std::is_same_v<T, ControlledAirspaceRecord>) {
                if (!discarding) {
                    if (auto added = airspace.addRecord(record); !added) {
                        // 丢弃整个边界序列
                        reportError(withContext(added.error(), record.name.value_or("airspace")));
                        discarding = true;
                    }
                }
                if (record.via.returnToOrigin) {
                    if (!discarding) {
                        builder.addAirspace(airspace.build());
                    }
                    airspace = AirspaceBuilder{};
                    discarding = false;
                }
            }
        }, **item);
    }

    if (!airspace.empty()) {
        reportError(core::Error{core::ErrorCode::InvalidRecord, "unterminated airspace boundary"});
    }

    auto nd = builder.build();
    spdlog::debug("Loaded {} records into partition {:#x} ({} errors)",
                  records, nd.partitionId(), nd.errors().size());
    return nd;
}

} // namespace efb::nd
