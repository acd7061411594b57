#pragma once

#include "core/Error.hpp"
#include "route/Leg.hpp"
#include "route/Token.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace efb::route {

// 截至某航段的累计值
struct TotalsToLeg {
    core::Length dist;
    // 任一航段缺少 ete 时为空
    std::optional<core::Duration> ete;
};

class Route {
public:
    Route() = default;

    // 解码航路字符串，失败时航路保持清空状态；备降场保留
    [[nodiscard]] core::Result<void> decode(std::string_view route, const nd::NavigationData& nd);

    // 同时清除备降场
    void clear();

    const std::vector<Token>& tokens() const noexcept { return tokens_.tokens(); }
    const std::vector<Leg>& legs() const noexcept { return legs_; }
    bool empty() const noexcept { return legs_.empty(); }

    const nd::AirportPtr& origin() const noexcept { return origin_; }
    const nd::AirportPtr& destination() const noexcept { return destination_; }
    const std::optional<nd::Runway>& takeoffRunway() const noexcept { return takeoffRunway_; }
    const std::optional<nd::Runway>& landingRunway() const noexcept { return landingRunway_; }

    // 巡航速度与高度，取首次出现的值
    const std::optional<core::Speed>& speed() const noexcept { return speed_; }
    const std::optional<core::VerticalDistance>& level() const noexcept { return level_; }

    void setAlternate(std::optional<nd::NavAid> alternate) { alternate_ = std::move(alternate); }
    // 从最后一段的终点飞往备降场
    [[nodiscard]] std::optional<Leg> alternate() const;

    [[nodiscard]] std::vector<TotalsToLeg> accumulateLegs() const;
    [[nodiscard]] std::optional<TotalsToLeg> totals() const;
    [[nodiscard]] core::Length totalDistance() const;

    [[nodiscard]] std::string toString() const { return tokens_.toString(); }

private:
    void reset();
    void commit(Tokens tokens);

    Tokens tokens_;
    std::vector<Leg> legs_;
    std::optional<core::Speed> speed_;
    std::optional<core::VerticalDistance> level_;
    nd::AirportPtr origin_;
    std::optional<nd::Runway> takeoffRunway_;
    nd::AirportPtr destination_;
    std::optional<nd::Runway> landingRunway_;
    std::optional<nd::NavAid> alternate_;
};

} // namespace efb::route
