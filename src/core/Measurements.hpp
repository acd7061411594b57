#pragma once

#include "core/Error.hpp"
#include <compare>
#include <string>
#include <string_view>

namespace efb::core {

inline constexpr double METERS_PER_NAUTICAL_MILE = 1852.0;
inline constexpr double METERS_PER_FOOT = 0.3048;
inline constexpr double FEET_PER_METER = 3.28084;
inline constexpr double KNOTS_PER_METER_PER_SECOND = 1.943844;
// ISA 海平面声速 (m/s)
inline constexpr double SPEED_OF_SOUND = 340.294;

// 长度，内部以米为单位
class Length {
public:
    constexpr Length() = default;

    static constexpr Length m(double value) noexcept { return Length{value}; }
    static constexpr Length km(double value) noexcept { return Length{value * 1000.0}; }
    static constexpr Length nm(double value) noexcept { return Length{value * METERS_PER_NAUTICAL_MILE}; }
    static constexpr Length ft(double value) noexcept { return Length{value * METERS_PER_FOOT}; }

    constexpr double meters() const noexcept { return meters_; }
    constexpr double nauticalMiles() const noexcept { return meters_ / METERS_PER_NAUTICAL_MILE; }
    constexpr double feet() const noexcept { return meters_ / METERS_PER_FOOT; }

    constexpr Length operator+(Length other) const noexcept { return Length{meters_ + other.meters_}; }
    constexpr Length operator-(Length other) const noexcept { return Length{meters_ - other.meters_}; }
    constexpr Length operator*(double factor) const noexcept { return Length{meters_ * factor}; }
    constexpr Length& operator+=(Length other) noexcept {
        meters_ += other.meters_;
        return *this;
    }

    constexpr auto operator<=>(const Length&) const = default;

private:
    explicit constexpr Length(double meters) : meters_(meters) {}

    double meters_{0.0};
};

// 时长，内部以秒为单位
class Duration {
public:
    constexpr Duration() = default;

    static constexpr Duration s(double seconds) noexcept { return Duration{seconds}; }
    static constexpr Duration h(double hours) noexcept { return Duration{hours * 3600.0}; }

    constexpr double seconds() const noexcept { return seconds_; }
    constexpr double hours() const noexcept { return seconds_ / 3600.0; }

    constexpr Duration operator+(Duration other) const noexcept { return Duration{seconds_ + other.seconds_}; }
    constexpr Duration& operator+=(Duration other) noexcept {
        seconds_ += other.seconds_;
        return *this;
    }

    constexpr auto operator<=>(const Duration&) const = default;

    // HH:MM
    [[nodiscard]] std::string toString() const;

private:
    explicit constexpr Duration(double seconds) : seconds_(seconds) {}

    double seconds_{0.0};
};

enum class SpeedUnit { Knots, KilometersPerHour, MetersPerSecond, Mach };

class Speed {
public:
    constexpr Speed() = default;

    static constexpr Speed kt(double value) noexcept { return Speed{value, SpeedUnit::Knots}; }
    static constexpr Speed kph(double value) noexcept { return Speed{value, SpeedUnit::KilometersPerHour}; }
    static constexpr Speed mps(double value) noexcept { return Speed{value, SpeedUnit::MetersPerSecond}; }
    static constexpr Speed mach(double value) noexcept { return Speed{value, SpeedUnit::Mach}; }

    // 将 m/s 换算为指定单位
    [[nodiscard]] static Speed fromMetersPerSecond(double mps, SpeedUnit unit) noexcept;

    // ICAO 速度组: N0107, K0200, M082
    [[nodiscard]] static Result<Speed> parse(std::string_view s);

    constexpr double value() const noexcept { return value_; }
    constexpr SpeedUnit unit() const noexcept { return unit_; }

    [[nodiscard]] double metersPerSecond() const noexcept;
    [[nodiscard]] double knots() const noexcept { return metersPerSecond() * KNOTS_PER_METER_PER_SECOND; }

    [[nodiscard]] std::string toString() const;

    bool operator==(const Speed&) const = default;

private:
    constexpr Speed(double value, SpeedUnit unit) : value_(value), unit_(unit) {}

    double value_{0.0};
    SpeedUnit unit_{SpeedUnit::Knots};
};

// 距离 / 速度
[[nodiscard]] Duration operator/(Length length, const Speed& speed) noexcept;

struct MagneticVariation {
    enum class Kind { East, West, OrientedToTrueNorth };

    Kind kind{Kind::OrientedToTrueNorth};
    double degrees{0.0};

    static constexpr MagneticVariation east(double deg) noexcept { return {Kind::East, deg}; }
    static constexpr MagneticVariation west(double deg) noexcept { return {Kind::West, deg}; }
    static constexpr MagneticVariation trueNorth() noexcept { return {}; }

    bool operator==(const MagneticVariation&) const = default;
};

enum class AngleReference { True, Magnetic };

// 方位角，归一化到 [0, 360)
class Angle {
public:
    constexpr Angle() = default;

    [[nodiscard]] static Angle trueNorth(double degrees) noexcept;
    [[nodiscard]] static Angle magnetic(double degrees) noexcept;

    constexpr double degrees() const noexcept { return degrees_; }
    [[nodiscard]] double radians() const noexcept;
    constexpr AngleReference reference() const noexcept { return reference_; }

    [[nodiscard]] Angle operator+(const Angle& other) const noexcept;
    [[nodiscard]] Angle operator-(const Angle& other) const noexcept;

    // 东磁差为减，西磁差为加
    [[nodiscard]] Angle toMagnetic(const MagneticVariation& variation) const noexcept;

    bool operator==(const Angle&) const = default;

private:
    Angle(double degrees, AngleReference reference) noexcept;

    double degrees_{0.0};
    AngleReference reference_{AngleReference::True};
};

struct Wind {
    Angle direction;
    Speed speed;

    // 13509KT, 09005MPS, 27020KMH
    [[nodiscard]] static Result<Wind> parse(std::string_view s);

    [[nodiscard]] std::string toString() const;

    bool operator==(const Wind&) const = default;
};

} // namespace efb::core
