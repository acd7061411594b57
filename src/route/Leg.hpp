#pragma once

#include "core/Measurements.hpp"
#include "core/VerticalDistance.hpp"
#include "nd/NavAid.hpp"
#include <optional>

namespace efb::route {

// from -> to 的一段航线，所有派生量在构造时计算一次
class Leg {
public:
    Leg(nd::NavAid from,
        nd::NavAid to,
        std::optional<core::VerticalDistance> level = std::nullopt,
        std::optional<core::Speed> tas = std::nullopt,
        std::optional<core::Wind> wind = std::nullopt);

    const nd::NavAid& from() const noexcept { return from_; }
    const nd::NavAid& to() const noexcept { return to_; }
    const std::optional<core::VerticalDistance>& level() const noexcept { return level_; }
    const std::optional<core::Speed>& tas() const noexcept { return tas_; }
    const std::optional<core::Wind>& wind() const noexcept { return wind_; }

    // 真航迹
    const core::Angle& bearing() const noexcept { return bearing_; }
    // 磁航线
    const core::Angle& mc() const noexcept { return mc_; }
    // 海里
    core::Length dist() const noexcept { return dist_; }

    // 以下需要真空速和风
    const std::optional<core::Angle>& wca() const noexcept { return wca_; }
    const std::optional<core::Speed>& gs() const noexcept { return gs_; }
    const std::optional<core::Angle>& heading() const noexcept { return heading_; }
    const std::optional<core::Angle>& mh() const noexcept { return mh_; }
    const std::optional<core::Duration>& ete() const noexcept { return ete_; }

private:
    nd::NavAid from_;
    nd::NavAid to_;
    std::optional<core::VerticalDistance> level_;
    std::optional<core::Speed> tas_;
    std::optional<core::Wind> wind_;

    core::Angle bearing_;
    core::Angle mc_;
    core::Length dist_;
    std::optional<core::Angle> wca_;
    std::optional<core::Speed> gs_;
    std::optional<core::Angle> heading_;
    std::optional<core::Angle> mh_;
    std::optional<core::Duration> ete_;
};

// 正弦定理: sin(wca) / ws = sin(风角) / tas
[[nodiscard]] core::Angle windCorrectionAngle(const core::Wind& wind,
                                              const core::Speed& tas,
                                              const core::Angle& bearing) noexcept;

// 余弦定理求地速，单位与 tas 相同
[[nodiscard]] core::Speed groundSpeed(const core::Speed& tas,
                                      const core::Wind& wind,
                                      const core::Angle& wca,
                                      const core::Angle& bearing) noexcept;

} // namespace efb::route
