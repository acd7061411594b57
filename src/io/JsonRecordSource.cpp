#include "io/JsonRecordSource.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <spdlog/spdlog.h>

namespace efb::io {

using nlohmann::json;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool allDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

core::Result<std::string> requiredString(const json& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end()) {
        return core::fail(core::ErrorCode::MissingField, key);
    }
    if (!it->is_string()) {
        return core::fail(core::ErrorCode::InvalidValue, key);
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<int> optionalInt(const json& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<int>();
}

std::optional<double> optionalDouble(const json& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

// 字段错误只影响该字段，由转换器决定是否跳过记录
nd::Field<double> numberField(const json& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end()) {
        return core::fail(core::ErrorCode::MissingField, key);
    }
    if (!it->is_number()) {
        return core::fail(core::ErrorCode::InvalidValue, fmt::format("{}: {}", key, it->dump()));
    }
    return it->get<double>();
}

std::optional<nd::Field<double>> optionalNumberField(const json& record, const char* key) {
    if (!record.contains(key)) {
        return std::nullopt;
    }
    return numberField(record, key);
}

core::Result<std::optional<core::MagneticVariation>> optionalMagVar(const json& record) {
    auto code = optionalString(record, "magVar");
    if (!code) {
        return std::nullopt;
    }
    auto magVar = parseMagVar(*code);
    if (!magVar) {
        return std::unexpected(magVar.error());
    }
    return *magVar;
}

core::Result<nd::UnitIndicator> parseUnit(std::string_view code) {
    if (code == "A") return nd::UnitIndicator::Agl;
    if (code == "M") return nd::UnitIndicator::Msl;
    return core::fail(core::ErrorCode::InvalidValue, fmt::format("unit indicator '{}'", code));
}

core::Result<nd::FixedRecord> parseAirport(const json& record) {
    auto ident = requiredString(record, "ident");
    if (!ident) return std::unexpected(ident.error());
    auto magVar = optionalMagVar(record);
    if (!magVar) return std::unexpected(magVar.error());

    nd::AirportRecord airport;
    airport.icaoIdent = std::move(*ident);
    airport.iataDesignator = optionalString(record, "iata");
    airport.name = optionalString(record, "name").value_or("");
    airport.latitude = numberField(record, "lat");
    airport.longitude = numberField(record, "lon");
    airport.magVar = *magVar;
    airport.elevation = optionalInt(record, "elevation");
    airport.cycle = optionalString(record, "cycle");
    return airport;
}

core::Result<nd::FixedRecord> parseRunway(const json& record) {
    auto airportIdent = requiredString(record, "airport");
    if (!airportIdent) return std::unexpected(airportIdent.error());
    auto runwayId = requiredString(record, "id");
    if (!runwayId) return std::unexpected(runwayId.error());

    nd::RunwayRecord runway;
    runway.airportIdent = std::move(*airportIdent);
    runway.runwayId = std::move(*runwayId);
    runway.bearing = numberField(record, "bearing");
    runway.length = optionalInt(record, "length");
    runway.gradient = optionalDouble(record, "gradient");
    runway.thresholdElevation = optionalInt(record, "elevation");
    runway.cycle = optionalString(record, "cycle");
    return runway;
}

core::Result<nd::FixedRecord> parseWaypoint(const json& record) {
    auto ident = requiredString(record, "ident");
    if (!ident) return std::unexpected(ident.error());
    auto region = requiredString(record, "region");
    if (!region) return std::unexpected(region.error());
    auto magVar = optionalMagVar(record);
    if (!magVar) return std::unexpected(magVar.error());

    nd::WaypointRecord waypoint;
    waypoint.fixIdent = std::move(*ident);
    waypoint.name = optionalString(record, "name").value_or("");
    waypoint.waypointType = optionalString(record, "waypointType").value_or("");
    waypoint.regionCode = std::move(*region);
    waypoint.latitude = numberField(record, "lat");
    waypoint.longitude = numberField(record, "lon");
    waypoint.magVar = *magVar;
    waypoint.cycle = optionalString(record, "cycle");
    return waypoint;
}

core::Result<nd::FixedRecord> parseAirspace(const json& record) {
    auto typeCode = requiredString(record, "airspaceType");
    if (!typeCode) return std::unexpected(typeCode.error());
    auto type = parseControlledAirspaceType(*typeCode);
    if (!type) return std::unexpected(type.error());
    auto viaCode = requiredString(record, "via");
    if (!viaCode) return std::unexpected(viaCode.error());
    auto via = parseBoundaryVia(*viaCode);
    if (!via) return std::unexpected(via.error());

    nd::ControlledAirspaceRecord airspace;
    airspace.type = *type;
    airspace.via = *via;
    airspace.name = optionalString(record, "name");
    if (auto classification = optionalString(record, "class"); classification && !classification->empty()) {
        airspace.classification = classification->front();
    }
    airspace.latitude = optionalNumberField(record, "lat");
    airspace.longitude = optionalNumberField(record, "lon");
    airspace.arcOriginLatitude = optionalNumberField(record, "arcLat");
    airspace.arcOriginLongitude = optionalNumberField(record, "arcLon");
    airspace.arcDistance = optionalNumberField(record, "arcDist");
    // 边界点至少要有坐标或圆弧中心之一
    const bool hasPosition = airspace.latitude && airspace.longitude;
    const bool hasArcCenter = airspace.arcOriginLatitude && airspace.arcOriginLongitude;
    if (!hasPosition && !hasArcCenter) {
        return core::fail(core::ErrorCode::MissingField, "airspace position");
    }
    airspace.cycle = optionalString(record, "cycle");

    // 上下限及其单位
    const std::pair<const char*, const char*> keys[] = {{"lower", "lowerUnit"}, {"upper", "upperUnit"}};
    for (const auto& [limitKey, unitKey] : keys) {
        const bool lower = std::string_view(limitKey) == "lower";
        if (auto code = optionalString(record, limitKey)) {
            auto limit = parseAirspaceLimit(*code);
            if (!limit) return std::unexpected(limit.error());
            (lower ? airspace.lowerLimit : airspace.upperLimit) = *limit;
        }
        if (auto code = optionalString(record, unitKey)) {
            auto unit = parseUnit(*code);
            if (!unit) return std::unexpected(unit.error());
            (lower ? airspace.lowerUnit : airspace.upperUnit) = *unit;
        }
    }
    return airspace;
}

} // namespace

JsonRecordSource::JsonRecordSource(json records)
    : records_(std::move(records)) {
    if (!records_.is_array()) {
        spdlog::warn("Record document is not an array, treating it as empty");
        records_ = json::array();
    }
}

core::Result<JsonRecordSource> JsonRecordSource::fromString(std::string_view text) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return core::fail(core::ErrorCode::Parse, "record document is not valid JSON");
    }
    if (!document.is_array()) {
        return core::fail(core::ErrorCode::Parse, "record document must be an array");
    }
    return JsonRecordSource(std::move(document));
}

core::Result<JsonRecordSource> JsonRecordSource::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::fail(core::ErrorCode::Io, fmt::format("cannot open {}", path.string()));
    }

    auto document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return core::fail(core::ErrorCode::Parse, fmt::format("{} is not valid JSON", path.string()));
    }
    if (!document.is_array()) {
        return core::fail(core::ErrorCode::Parse, fmt::format("{} must contain an array", path.string()));
    }
    spdlog::debug("Read {} record(s) from {}", document.size(), path.string());
    return JsonRecordSource(std::move(document));
}

std::optional<core::Result<nd::FixedRecord>> JsonRecordSource::next() {
    if (position_ >= records_.size()) {
        return std::nullopt;
    }
    auto result = parseRecord(records_[position_]);
    if (!result) {
        result = std::unexpected(core::Error{
            result.error().code,
            fmt::format("record {}: {}", position_, result.error().message)});
    }
    ++position_;
    return result;
}

core::Result<nd::FixedRecord> parseRecord(const json& record) {
    if (!record.is_object()) {
        return core::fail(core::ErrorCode::InvalidRecord, "record must be an object");
    }
    auto type = requiredString(record, "type");
    if (!type) {
        return std::unexpected(type.error());
    }

    if (*type == "airport") return parseAirport(record);
    if (*type == "runway") return parseRunway(record);
    if (*type == "waypoint") return parseWaypoint(record);
    if (*type == "airspace") return parseAirspace(record);
    return core::fail(core::ErrorCode::InvalidRecord, fmt::format("unknown record type '{}'", *type));
}

core::Result<core::MagneticVariation> parseMagVar(std::string_view code) {
    code = trim(code);
    if (code == "T") {
        return core::MagneticVariation::trueNorth();
    }
    // E0140 表示东偏 1.4 度
    if (code.size() != 5 || !allDigits(code.substr(1))) {
        return core::fail(core::ErrorCode::InvalidValue, fmt::format("magnetic variation '{}'", code));
    }
    int centidegrees = 0;
    std::from_chars(code.data() + 1, code.data() + code.size(), centidegrees);
    const double degrees = centidegrees / 100.0;

    switch (code.front()) {
        case 'E': return core::MagneticVariation::east(degrees);
        case 'W': return core::MagneticVariation::west(degrees);
        case 'T': return core::MagneticVariation::trueNorth();
        default:
            return core::fail(core::ErrorCode::InvalidValue, fmt::format("magnetic variation '{}'", code));
    }
}

core::Result<nd::BoundaryVia> parseBoundaryVia(std::string_view code) {
    code = trim(code);
    if (code.empty() || code.size() > 2) {
        return core::fail(core::ErrorCode::InvalidValue, fmt::format("boundary via '{}'", code));
    }

    nd::BoundaryVia via;
    switch (code.front()) {
        case 'C': via.path = nd::BoundaryPath::Circle; break;
        case 'G': via.path = nd::BoundaryPath::GreatCircle; break;
        case 'H': via.path = nd::BoundaryPath::RhumbLine; break;
        case 'L': via.path = nd::BoundaryPath::CounterClockwiseArc; break;
        case 'R': via.path = nd::BoundaryPath::ClockwiseArc; break;
        default:
            return core::fail(core::ErrorCode::InvalidValue, fmt::format("boundary via '{}'", code));
    }
    via.returnToOrigin = code.size() == 2 && code[1] == 'E';
    return via;
}

core::Result<nd::AirspaceLimit> parseAirspaceLimit(std::string_view code) {
    using Kind = nd::AirspaceLimit::Kind;

    code = trim(code);
    if (code == "GND") return nd::AirspaceLimit{Kind::Ground, 0};
    if (code == "MSL") return nd::AirspaceLimit{Kind::MeanSeaLevel, 0};
    if (code == "UNLTD") return nd::AirspaceLimit{Kind::Unlimited, 0};
    if (code == "NOTSP") return nd::AirspaceLimit{Kind::NotSpecified, 0};
    if (code == "NOTAM") return nd::AirspaceLimit{Kind::Notam, 0};

    int value = 0;
    if (code.starts_with("FL") && allDigits(code.substr(2))) {
        std::from_chars(code.data() + 2, code.data() + code.size(), value);
        return nd::AirspaceLimit{Kind::FlightLevel, value};
    }
    if (allDigits(code)) {
        std::from_chars(code.data(), code.data() + code.size(), value);
        return nd::AirspaceLimit{Kind::Altitude, value};
    }
    return core::fail(core::ErrorCode::InvalidValue, fmt::format("airspace limit '{}'", code));
}

core::Result<nd::ControlledAirspaceType> parseControlledAirspaceType(std::string_view code) {
    using Type = nd::ControlledAirspaceType;

    code = trim(code);
    if (code.size() == 1) {
        switch (code.front()) {
            case 'A': return Type::ClassC;
            case 'C': return Type::ControlArea;
            case 'M': return Type::TerminalControlArea;
            case 'R': return Type::RadarZone;
            case 'T': return Type::ClassB;
            case 'U': return Type::RadioMandatoryZone;
            case 'V': return Type::TransponderMandatoryZone;
            case 'Z': return Type::ControlZone;
            default: break;
        }
    }
    return core::fail(core::ErrorCode::InvalidValue, fmt::format("controlled airspace type '{}'", code));
}

} // namespace efb::io
