#pragma once

#include "core/Error.hpp"
#include "nd/AiracCycle.hpp"
#include "nd/Airport.hpp"
#include "nd/Airspace.hpp"
#include "nd/NavAid.hpp"
#include "nd/SpatialIndex.hpp"
#include "nd/Waypoint.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace efb::nd {

using AirportPtr = std::shared_ptr<const Airport>;
using WaypointPtr = std::shared_ptr<const Waypoint>;

// 机场标识 -> 终端区航路点
using TerminalWaypoints = std::unordered_map<std::string, std::vector<WaypointPtr>>;

// 一次加载得到的数据集，整体追加或移除
struct Partition {
    std::uint64_t id{0};
    std::optional<AiracCycle> cycle;
    std::vector<AirportPtr> airports;
    std::vector<AirspacePtr> airspaces;
    std::vector<WaypointPtr> waypoints;
    TerminalWaypoints terminalWaypoints;
    std::vector<core::Error> errors;
};

// 某点附近的空域与导航点
struct Nearby {
    std::vector<AirspacePtr> airspaces;
    std::vector<NavAid> navaids;
};

class NavigationData {
public:
    NavigationData() = default;
    explicit NavigationData(Partition data);

    std::uint64_t partitionId() const noexcept { return own_.id; }
    const std::optional<AiracCycle>& cycle() const noexcept { return own_.cycle; }

    // 包含 point 的空域（不检查垂直范围）及半径内的导航点
    [[nodiscard]] Nearby at(const geo::Coordinate& point, core::Length radius) const;

    // 多边形严格包含 point 的空域
    [[nodiscard]] std::vector<AirspacePtr> airspacesAt(const geo::Coordinate& point) const;

    // 包围盒与 envelope 相交的空域候选
    [[nodiscard]] std::vector<AirspacePtr> candidateAirspaces(const geo::GeoBBox& envelope) const;

    // 先查航路点再查机场
    [[nodiscard]] std::optional<NavAid> find(std::string_view ident) const;

    [[nodiscard]] std::optional<NavAid> findTerminalWaypoint(std::string_view airportIdent,
                                                             std::string_view fixIdent) const;

    // 追加分区，同 ID 覆盖；完成后重建索引
    void append(NavigationData other);
    void remove(std::uint64_t partitionId);

    [[nodiscard]] std::vector<std::uint64_t> expiredPartitions() const;
    [[nodiscard]] std::vector<std::uint64_t> expiredPartitions(std::chrono::sys_days date) const;

    // 所有分区的转换错误
    [[nodiscard]] std::vector<core::Error> errors() const;

    std::size_t partitionCount() const noexcept { return partitions_.size(); }

    template<typename Visitor>
    void forEachPartition(Visitor&& visit) const {
        visit(own_);
        for (const auto& [id, partition] : partitions_) {
            visit(partition);
        }
    }

    template<typename Visitor>
    void forEachAirport(Visitor&& visit) const {
        forEachPartition([&](const Partition& p) {
            for (const auto& airport : p.airports) visit(airport);
        });
    }

    template<typename Visitor>
    void forEachWaypoint(Visitor&& visit) const {
        forEachPartition([&](const Partition& p) {
            for (const auto& waypoint : p.waypoints) visit(waypoint);
        });
    }

    template<typename Visitor>
    void forEachAirspace(Visitor&& visit) const {
        forEachPartition([&](const Partition& p) {
            for (const auto& airspace : p.airspaces) visit(airspace);
        });
    }

private:
    Partition own_;
    std::map<std::uint64_t, Partition> partitions_;

    AirspaceIndex airspaceIndex_;
    NavAidIndex navaidIndex_;

    void reindex();
};

// 逐条收集实体，build() 时生成不可变的 NavigationData
class NavigationDataBuilder {
public:
    NavigationDataBuilder() = default;

    void addAirport(Airport airport);
    // 机场尚未出现时暂存，build() 时挂接
    void addRunway(const std::string& airportIdent, Runway runway);
    void addAirspace(Airspace airspace);
    void addWaypoint(Waypoint waypoint);
    void addError(core::Error error);

    // 以源数据哈希作为分区 ID
    NavigationDataBuilder& withSource(std::string_view data);

    NavigationDataBuilder& withPartitionId(std::uint64_t id) {
        partitionId_ = id;
        return *this;
    }

    const std::vector<core::Error>& errors() const noexcept { return errors_; }

    [[nodiscard]] NavigationData build();

private:
    std::vector<Airport> airports_;
    std::unordered_map<std::string, std::size_t> airportIndex_;
    std::unordered_map<std::string, std::vector<Runway>> unassignedRunways_;
    std::vector<Airspace> airspaces_;
    std::vector<WaypointPtr> waypoints_;
    TerminalWaypoints terminalWaypoints_;
    std::optional<AiracCycle> cycle_;
    std::uint64_t partitionId_{0};
    std::vector<core::Error> errors_;

    void trackCycle(const std::optional<AiracCycle>& cycle);
};

} // namespace efb::nd
