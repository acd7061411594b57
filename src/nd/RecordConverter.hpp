#pragma once

#include "core/Error.hpp"
#include "nd/NavigationData.hpp"
#include "nd/Records.hpp"

namespace efb::nd {

// 定长记录 -> 实体
[[nodiscard]] core::Result<Airport> toAirport(const AirportRecord& record);
[[nodiscard]] core::Result<Runway> toRunway(const RunwayRecord& record);
[[nodiscard]] core::Result<Waypoint> toWaypoint(const WaypointRecord& record);

// 读取整个记录流；单条记录出错只记录错误，继续加载
//
// 连续的空域边界记录在 returnToOrigin 处结束并生成一个空域。
[[nodiscard]] NavigationData loadFixedRecords(IRecordSource& source,
                                              NavigationDataBuilder builder = {});

// 给错误附加上下文（记录标识）
[[nodiscard]] core::Error withContext(core::Error error, std::string_view context);

} // namespace efb::nd
