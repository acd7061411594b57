#include "core/Measurements.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <numbers>
#include <optional>

namespace efb::core {

namespace {

bool allDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::optional<int> parseDigits(std::string_view s) {
    if (!allDigits(s)) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

double normalizeDegrees(double degrees) noexcept {
    double d = std::fmod(degrees, 360.0);
    if (d < 0.0) {
        d += 360.0;
    }
    // fmod 的舍入可能得到 360
    return d >= 360.0 ? 0.0 : d;
}

} // namespace

std::string Duration::toString() const {
    const auto totalMinutes = static_cast<long>(std::lround(seconds_ / 60.0));
    return fmt::format("{:02}:{:02}", totalMinutes / 60, totalMinutes % 60);
}

Result<Speed> Speed::parse(std::string_view s) {
    if (s.size() == 5 && (s[0] == 'N' || s[0] == 'K')) {
        if (auto value = parseDigits(s.substr(1))) {
            return s[0] == 'N' ? Speed::kt(*value) : Speed::kph(*value);
        }
    } else if (s.size() == 4 && s[0] == 'M') {
        if (auto value = parseDigits(s.substr(1))) {
            return Speed::mach(*value / 100.0);
        }
    }
    return fail(ErrorCode::UnexpectedString, std::string(s));
}

Speed Speed::fromMetersPerSecond(double mps, SpeedUnit unit) noexcept {
    switch (unit) {
        case SpeedUnit::Knots: return Speed::kt(mps * KNOTS_PER_METER_PER_SECOND);
        case SpeedUnit::KilometersPerHour: return Speed::kph(mps * 3.6);
        case SpeedUnit::MetersPerSecond: return Speed::mps(mps);
        case SpeedUnit::Mach: return Speed::mach(mps / SPEED_OF_SOUND);
    }
    return Speed::mps(mps);
}

double Speed::metersPerSecond() const noexcept {
    switch (unit_) {
        case SpeedUnit::Knots: return value_ / KNOTS_PER_METER_PER_SECOND;
        case SpeedUnit::KilometersPerHour: return value_ / 3.6;
        case SpeedUnit::MetersPerSecond: return value_;
        case SpeedUnit::Mach: return value_ * SPEED_OF_SOUND;
    }
    return value_;
}

std::string Speed::toString() const {
    switch (unit_) {
        case SpeedUnit::Knots: return fmt::format("N{:04}", std::lround(value_));
        case SpeedUnit::KilometersPerHour: return fmt::format("K{:04}", std::lround(value_));
        case SpeedUnit::MetersPerSecond: return fmt::format("{:.0f}m/s", value_);
        case SpeedUnit::Mach: return fmt::format("M{:03}", std::lround(value_ * 100.0));
    }
    return {};
}

Duration operator/(Length length, const Speed& speed) noexcept {
    const double mps = speed.metersPerSecond();
    if (mps <= 0.0) {
        return Duration{};
    }
    return Duration::s(length.meters() / mps);
}

Angle::Angle(double degrees, AngleReference reference) noexcept
    : degrees_(normalizeDegrees(degrees)), reference_(reference) {}

Angle Angle::trueNorth(double degrees) noexcept {
    return Angle{degrees, AngleReference::True};
}

Angle Angle::magnetic(double degrees) noexcept {
    return Angle{degrees, AngleReference::Magnetic};
}

double Angle::radians() const noexcept {
    return degrees_ * std::numbers::pi / 180.0;
}

Angle Angle::operator+(const Angle& other) const noexcept {
    return Angle{degrees_ + other.degrees_, reference_};
}

Angle Angle::operator-(const Angle& other) const noexcept {
    return Angle{degrees_ - other.degrees_, reference_};
}

Angle Angle::toMagnetic(const MagneticVariation& variation) const noexcept {
    switch (variation.kind) {
        case MagneticVariation::Kind::East:
            return Angle{degrees_ - variation.degrees, AngleReference::Magnetic};
        case MagneticVariation::Kind::West:
            return Angle{degrees_ + variation.degrees, AngleReference::Magnetic};
        case MagneticVariation::Kind::OrientedToTrueNorth:
            break;
    }
    return Angle{degrees_, AngleReference::Magnetic};
}

Result<Wind> Wind::parse(std::string_view s) {
    auto unitPos = s.find_first_not_of("0123456789");
    if (unitPos == std::string_view::npos || unitPos < 5) {
        return fail(ErrorCode::UnexpectedString, std::string(s));
    }

    const auto direction = parseDigits(s.substr(0, 3));
    const auto value = parseDigits(s.substr(3, unitPos - 3));
    if (!direction || !value || *direction > 360) {
        return fail(ErrorCode::UnexpectedString, std::string(s));
    }

    const auto unit = s.substr(unitPos);
    Speed speed;
    if (unit == "KT") {
        speed = Speed::kt(*value);
    } else if (unit == "MPS") {
        speed = Speed::mps(*value);
    } else if (unit == "KMH") {
        speed = Speed::kph(*value);
    } else {
        return fail(ErrorCode::UnexpectedString, std::string(s));
    }

    return Wind{Angle::trueNorth(*direction), speed};
}

std::string Wind::toString() const {
    return fmt::format("{:03}{:02}KT", std::lround(direction.degrees()), std::lround(speed.knots()));
}

} // namespace efb::core
