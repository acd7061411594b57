#pragma once

#include "core/Error.hpp"
#include "nd/Records.hpp"
#include <cstddef>
#include <filesystem>
#include <string_view>
#include <nlohmann/json.hpp>

namespace efb::io {

// JSON 数组形式的定长记录，每个元素以 "type" 区分:
//   airport, runway, waypoint, airspace
// 空域段沿用定长格式的代码（via "G"/"C"/"H"/"L"/"R"，后缀 "E" 表示回到起点）
class JsonRecordSource : public nd::IRecordSource {
public:
    explicit JsonRecordSource(nlohmann::json records);

    [[nodiscard]] static core::Result<JsonRecordSource> fromString(std::string_view text);
    [[nodiscard]] static core::Result<JsonRecordSource> fromFile(const std::filesystem::path& path);

    std::optional<core::Result<nd::FixedRecord>> next() override;

    std::size_t size() const noexcept { return records_.size(); }

private:
    nlohmann::json records_;
    std::size_t position_{0};
};

// 单条 JSON 记录转为定长记录
[[nodiscard]] core::Result<nd::FixedRecord> parseRecord(const nlohmann::json& record);

[[nodiscard]] core::Result<core::MagneticVariation> parseMagVar(std::string_view code);
[[nodiscard]] core::Result<nd::BoundaryVia> parseBoundaryVia(std::string_view code);
[[nodiscard]] core::Result<nd::AirspaceLimit> parseAirspaceLimit(std::string_view code);
[[nodiscard]] core::Result<nd::ControlledAirspaceType> parseControlledAirspaceType(std::string_view code);

} // namespace efb::io
