#pragma once

#include "core/Error.hpp"
#include "core/Measurements.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace efb::core {

// 标准大气压 (hPa)
inline constexpr double STANDARD_PRESSURE_HPA = 1013.25;

// 保留原始基准的垂直距离，不统一换算
class VerticalDistance {
public:
    enum class Kind {
        Agl,
        Altitude,
        PressureAltitude,
        Fl,
        Gnd,
        Msl,
        Unlimited
    };

    constexpr VerticalDistance() = default;

    static constexpr VerticalDistance agl(std::uint16_t ft) noexcept { return {Kind::Agl, ft}; }
    static constexpr VerticalDistance altitude(std::uint16_t ft) noexcept { return {Kind::Altitude, ft}; }
    static constexpr VerticalDistance pressureAltitude(std::int16_t ft) noexcept { return {Kind::PressureAltitude, ft}; }
    static constexpr VerticalDistance fl(std::uint16_t level) noexcept { return {Kind::Fl, level}; }
    static constexpr VerticalDistance gnd() noexcept { return {Kind::Gnd, 0}; }
    static constexpr VerticalDistance msl(std::uint16_t ft) noexcept { return {Kind::Msl, ft}; }
    static constexpr VerticalDistance unlimited() noexcept { return {Kind::Unlimited, 0}; }

    // ICAO 高度组: F085, S1130, A025, M0762
    [[nodiscard]] static Result<VerticalDistance> parse(std::string_view s);

    constexpr Kind kind() const noexcept { return kind_; }
    constexpr int value() const noexcept { return value_; }

    // 是否与 other 处于可比较的共同基准
    [[nodiscard]] bool comparableWith(const VerticalDistance& other) const noexcept;

    // 高于海平面的英尺数，AGL 与 PA 需要场高和 QNH
    [[nodiscard]] std::optional<Length> toMsl(double qnhHpa, Length elevation) const noexcept;

    [[nodiscard]] std::string toString() const;

    bool operator==(const VerticalDistance&) const = default;

    // 不同基准之间为 unordered
    std::partial_ordering operator<=>(const VerticalDistance& other) const noexcept;

    // 同基准之比；基准不同时抛出 std::logic_error
    double operator/(const VerticalDistance& other) const;

private:
    constexpr VerticalDistance(Kind kind, int value) : kind_(kind), value_(value) {}

    Kind kind_{Kind::Gnd};
    int value_{0};
};

} // namespace efb::core

template<>
struct fmt::formatter<efb::core::VerticalDistance> : fmt::formatter<std::string> {
    auto format(const efb::core::VerticalDistance& vd, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(vd.toString(), ctx);
    }
};
