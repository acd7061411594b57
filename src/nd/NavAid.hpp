#pragma once

#include "nd/Airport.hpp"
#include "nd/Waypoint.hpp"
#include <memory>
#include <string>
#include <variant>

namespace efb::nd {

// 机场或航路点，凡需要“定位点”的地方统一使用
class NavAid {
public:
    using Value = std::variant<std::shared_ptr<const Airport>, std::shared_ptr<const Waypoint>>;

    NavAid(std::shared_ptr<const Airport> airport) : value_(std::move(airport)) {}
    NavAid(std::shared_ptr<const Waypoint> waypoint) : value_(std::move(waypoint)) {}

    [[nodiscard]] const std::string& ident() const noexcept;
    [[nodiscard]] geo::Coordinate coordinate() const noexcept;
    [[nodiscard]] core::MagneticVariation magVar() const noexcept;

    // 不是对应类型时返回 nullptr
    [[nodiscard]] std::shared_ptr<const Airport> airport() const noexcept;
    [[nodiscard]] std::shared_ptr<const Waypoint> waypoint() const noexcept;

    const Value& value() const noexcept { return value_; }

    // 类型相同且指向同一对象或内容相同
    bool operator==(const NavAid& other) const noexcept;

private:
    Value value_;
};

} // namespace efb::nd
