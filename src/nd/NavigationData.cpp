#include "nd/NavigationData.hpp"
#include <algorithm>
#include <functional>
#include <iterator>
#include <spdlog/spdlog.h>

namespace efb::nd {

NavigationData::NavigationData(Partition data)
    : own_(std::move(data)) {
    reindex();
}

Nearby NavigationData::at(const geo::Coordinate& point, core::Length radius) const {
    return Nearby{airspacesAt(point), navaidIndex_.withinRadius(point, radius)};
}

std::vector<AirspacePtr> NavigationData::airspacesAt(const geo::Coordinate& point) const {
    auto candidates = airspaceIndex_.candidatesAt(point);
    std::erase_if(candidates, [&](const AirspacePtr& airspace) {
        return !airspace->polygon.contains(point);
    });
    return candidates;
}

std::vector<AirspacePtr> NavigationData::candidateAirspaces(const geo::GeoBBox& envelope) const {
    return airspaceIndex_.candidatesIntersecting(envelope);
}

std::optional<NavAid> NavigationData::find(std::string_view ident) const {
    std::optional<NavAid> result;

    forEachWaypoint([&](const WaypointPtr& wp) {
        if (!result && wp->ident() == ident) {
            result = NavAid{wp};
        }
    });
    if (result) {
        return result;
    }

    forEachAirport([&](const AirportPtr& airport) {
        if (!result && airport->ident() == ident) {
            result = NavAid{airport};
        }
    });
    return result;
}

std::optional<NavAid> NavigationData::findTerminalWaypoint(std::string_view airportIdent,
                                                           std::string_view fixIdent) const {
    std::optional<NavAid> result;
    forEachPartition([&](const Partition& p) {
        if (result) {
            return;
        }
        const auto it = p.terminalWaypoints.find(std::string(airportIdent));
        if (it == p.terminalWaypoints.end()) {
            return;
        }
        const auto wp = std::find_if(it->second.begin(), it->second.end(), [&](const WaypointPtr& w) {
            return w->ident() == fixIdent;
        });
        if (wp != it->second.end()) {
            result = NavAid{*wp};
        }
    });
    return result;
}

void NavigationData::append(NavigationData other) {
    for (auto& [id, partition] : other.partitions_) {
        partitions_.insert_or_assign(id, std::move(partition));
    }
    const auto id = other.own_.id;
    partitions_.insert_or_assign(id, std::move(other.own_));
    spdlog::debug("Appended navigation data partition {:#x}", id);
    reindex();
}

void NavigationData::remove(std::uint64_t partitionId) {
    if (partitions_.erase(partitionId) > 0) {
        spdlog::debug("Removed navigation data partition {:#x}", partitionId);
    }
    reindex();
}

std::vector<std::uint64_t> NavigationData::expiredPartitions() const {
    return expiredPartitions(std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()));
}

std::vector<std::uint64_t> NavigationData::expiredPartitions(std::chrono::sys_days date) const {
    std::vector<std::uint64_t> expired;
    for (const auto& [id, partition] : partitions_) {
        if (partition.cycle && partition.cycle->validity(date) == CycleValidity::Expired) {
            expired.push_back(id);
        }
    }
    return expired;
}

std::vector<core::Error> NavigationData::errors() const {
    std::vector<core::Error> result;
    forEachPartition([&](const Partition& p) {
        result.insert(result.end(), p.errors.begin(), p.errors.end());
    });
    return result;
}

void NavigationData::reindex() {
    std::vector<AirspacePtr> airspaces;
    std::vector<NavAid> navaids;

    forEachPartition([&](const Partition& p) {
        airspaces.insert(airspaces.end(), p.airspaces.begin(), p.airspaces.end());
        for (const auto& airport : p.airports) navaids.emplace_back(airport);
        for (const auto& waypoint : p.waypoints) navaids.emplace_back(waypoint);
        for (const auto& [ident, waypoints] : p.terminalWaypoints) {
            for (const auto& waypoint : waypoints) navaids.emplace_back(waypoint);
        }
    });

    airspaceIndex_ = AirspaceIndex{airspaces};
    navaidIndex_ = NavAidIndex{navaids};

    spdlog::debug("Indexed {} airspaces and {} navaids", airspaceIndex_.size(), navaidIndex_.size());
}

void NavigationDataBuilder::trackCycle(const std::optional<AiracCycle>& cycle) {
    if (cycle) {
        cycle_ = cycle_ ? std::min(*cycle_, *cycle) : *cycle;
    }
}

void NavigationDataBuilder::addAirport(Airport airport) {
    trackCycle(airport.cycle);
    const auto it = airportIndex_.find(airport.ident());
    if (it != airportIndex_.end()) {
        // 同标识机场后者覆盖，已挂接的跑道保留
        auto runways = std::move(airports_[it->second].runways);
        airports_[it->second] = std::move(airport);
        airports_[it->second].runways.insert(airports_[it->second].runways.begin(),
                                             runways.begin(), runways.end());
        return;
    }
    airportIndex_.emplace(airport.ident(), airports_.size());
    airports_.push_back(std::move(airport));
}

void NavigationDataBuilder::addRunway(const std::string& airportIdent, Runway runway) {
    const auto it = airportIndex_.find(airportIdent);
    if (it != airportIndex_.end()) {
        airports_[it->second].runways.push_back(std::move(runway));
    } else {
        unassignedRunways_[airportIdent].push_back(std::move(runway));
    }
}

void NavigationDataBuilder::addAirspace(Airspace airspace) {
    airspaces_.push_back(std::move(airspace));
}

void NavigationDataBuilder::addWaypoint(Waypoint waypoint) {
    trackCycle(waypoint.cycle);
    if (const auto* area = waypoint.terminalArea()) {
        auto key = *area;
        terminalWaypoints_[key].push_back(std::make_shared<const Waypoint>(std::move(waypoint)));
    } else {
        waypoints_.push_back(std::make_shared<const Waypoint>(std::move(waypoint)));
    }
}

void NavigationDataBuilder::addError(core::Error error) {
    errors_.push_back(std::move(error));
}

NavigationDataBuilder& NavigationDataBuilder::withSource(std::string_view data) {
    partitionId_ = std::hash<std::string_view>{}(data);
    return *this;
}

NavigationData NavigationDataBuilder::build() {
    for (auto& [ident, runways] : unassignedRunways_) {
        const auto it = airportIndex_.find(ident);
        if (it == airportIndex_.end()) {
            spdlog::warn("Dropping {} runway(s) of unknown airport {}", runways.size(), ident);
            continue;
        }
        auto& target = airports_[it->second].runways;
        std::move(runways.begin(), runways.end(), std::back_inserter(target));
    }
    unassignedRunways_.clear();

    Partition partition;
    partition.id = partitionId_;
    partition.cycle = cycle_;
    partition.airports.reserve(airports_.size());
    for (auto& airport : airports_) {
        partition.airports.push_back(std::make_shared<const Airport>(std::move(airport)));
    }
    partition.airspaces.reserve(airspaces_.size());
    for (auto& airspace : airspaces_) {
        partition.airspaces.push_back(std::make_shared<const Airspace>(std::move(airspace)));
    }
    partition.waypoints = std::move(waypoints_);
    partition.terminalWaypoints = std::move(terminalWaypoints_);
    partition.errors = std::move(errors_);

    airports_.clear();
    airportIndex_.clear();
    airspaces_.clear();
    waypoints_.clear();
    terminalWaypoints_.clear();
    errors_.clear();

    return NavigationData{std::move(partition)};
}

} // namespace efb::nd
