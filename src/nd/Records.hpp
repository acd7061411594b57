#pragma once

#include "core/Error.hpp"
#include "core/Measurements.hpp"
#include "geo/Coordinate.hpp"
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace efb::nd {

// 上游读取器已定型但可能解析失败的字段
template<typename T>
using Field = std::expected<T, core::Error>;

// ---------------------------------------------------------------------------
// 定长格式记录
// ---------------------------------------------------------------------------

struct AirportRecord {
    std::string icaoIdent;
    std::optional<std::string> iataDesignator;
    std::string name;
    Field<double> latitude{0.0};
    Field<double> longitude{0.0};
    std::optional<core::MagneticVariation> magVar;
    std::optional<int> elevation;           // 英尺
    std::optional<std::string> cycle;       // "YYCC"
};

struct RunwayRecord {
    std::string airportIdent;
    std::string runwayId;                   // "RW07"
    Field<double> bearing{0.0};             // 磁方位
    std::optional<int> length;              // 英尺
    std::optional<double> gradient;         // 百分比
    std::optional<int> thresholdElevation;  // 英尺
    std::optional<std::string> cycle;
};

struct WaypointRecord {
    std::string fixIdent;
    std::string name;
    std::string waypointType;               // 首字符 'V' 表示仅目视
    std::string regionCode;                 // "ENRT" 或机场标识
    Field<double> latitude{0.0};
    Field<double> longitude{0.0};
    std::optional<core::MagneticVariation> magVar;
    std::optional<std::string> cycle;
};

enum class ControlledAirspaceType {
    ClassB,
    ClassC,
    ControlArea,
    ControlZone,
    TerminalControlArea,
    RadarZone,
    RadioMandatoryZone,
    TransponderMandatoryZone
};

enum class BoundaryPath {
    Circle,
    GreatCircle,
    RhumbLine,
    CounterClockwiseArc,
    ClockwiseArc
};

struct BoundaryVia {
    BoundaryPath path{BoundaryPath::GreatCircle};
    bool returnToOrigin{false};
};

struct AirspaceLimit {
    enum class Kind {
        Altitude,
        FlightLevel,
        Ground,
        MeanSeaLevel,
        Unlimited,
        NotSpecified,
        Notam
    };

    Kind kind{Kind::NotSpecified};
    int value{0};
};

enum class UnitIndicator { Agl, Msl };

// 空域边界的一段：本点与前一点之间的路径
struct ControlledAirspaceRecord {
    ControlledAirspaceType type{ControlledAirspaceType::ControlArea};
    std::optional<char> classification;
    std::optional<std::string> name;
    BoundaryVia via;
    std::optional<Field<double>> latitude;
    std::optional<Field<double>> longitude;
    std::optional<Field<double>> arcOriginLatitude;
    std::optional<Field<double>> arcOriginLongitude;
    std::optional<Field<double>> arcDistance;   // 海里
    std::optional<AirspaceLimit> lowerLimit;
    std::optional<UnitIndicator> lowerUnit;
    std::optional<AirspaceLimit> upperLimit;
    std::optional<UnitIndicator> upperUnit;
    std::optional<std::string> cycle;
};

using FixedRecord = std::variant<AirportRecord, RunwayRecord, WaypointRecord, ControlledAirspaceRecord>;

// 定长记录流；返回 nullopt 表示结束
class IRecordSource {
public:
    virtual ~IRecordSource() = default;

    virtual std::optional<core::Result<FixedRecord>> next() = 0;
};

// ---------------------------------------------------------------------------
// 要素（XML 数据源）
// ---------------------------------------------------------------------------

struct Measure {
    double value{0.0};
    std::string uom;
};

struct AirportHeliportFeature {
    std::string uuid;
    std::string designator;
    std::optional<std::string> locationIndicatorIcao;
    std::optional<std::string> iataDesignator;
    std::string name;
    std::optional<geo::Coordinate> arp;
    std::optional<Measure> fieldElevation;
};

struct RunwayFeature {
    std::string uuid;
    std::string designator;                 // "09L/27R"
    std::optional<Measure> nominalLength;
    std::optional<std::string> surfaceComposition;
    std::optional<std::string> associatedAirportUuid;
};

struct RunwayDirectionFeature {
    std::string uuid;
    std::string designator;
    std::optional<double> trueBearing;
    std::optional<double> magneticBearing;
    std::optional<std::string> usedRunwayUuid;
};

struct DesignatedPointFeature {
    std::string uuid;
    std::string designator;
    std::optional<std::string> name;
    std::optional<geo::Coordinate> location;
};

struct NavaidFeature {
    std::string uuid;
    std::string designator;
    std::optional<std::string> name;
    std::optional<geo::Coordinate> location;
};

struct AirspaceVolume {
    std::optional<std::string> upperLimit;
    std::optional<std::string> upperLimitUom;
    std::optional<std::string> upperLimitReference;
    std::optional<std::string> lowerLimit;
    std::optional<std::string> lowerLimitUom;
    std::optional<std::string> lowerLimitReference;
    std::vector<geo::Coordinate> polygon;
};

struct AirspaceFeature {
    std::string uuid;
    std::optional<std::string> designator;
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::vector<AirspaceVolume> volumes;
};

using Feature = std::variant<AirportHeliportFeature, RunwayFeature, RunwayDirectionFeature,
                             DesignatedPointFeature, NavaidFeature, AirspaceFeature>;

// 要素流；返回 nullopt 表示结束
class IFeatureSource {
public:
    virtual ~IFeatureSource() = default;

    virtual std::optional<core::Result<Feature>> next() = 0;
};

} // namespace efb::nd
