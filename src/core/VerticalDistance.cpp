#include "core/VerticalDistance.hpp"
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace efb::core {

namespace {

// 读取 s[first, last) 的无符号整数
std::optional<int> digitsAt(std::string_view s, std::size_t first, std::size_t last) {
    if (s.size() < last) {
        return std::nullopt;
    }
    const auto digits = s.substr(first, last - first);
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || value > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

// 共同基准下的英尺值
std::optional<int> commonDatumFeet(const VerticalDistance& vd) noexcept {
    switch (vd.kind()) {
        case VerticalDistance::Kind::Fl: return vd.value() * 100;
        case VerticalDistance::Kind::Msl:
        case VerticalDistance::Kind::Altitude: return vd.value();
        default: return std::nullopt;
    }
}

} // namespace

Result<VerticalDistance> VerticalDistance::parse(std::string_view s) {
    if (s.empty()) {
        return fail(ErrorCode::UnexpectedString, std::string(s));
    }

    std::optional<VerticalDistance> result;
    switch (s.front()) {
        case 'F':
            if (auto v = digitsAt(s, 1, 4)) {
                result = fl(static_cast<std::uint16_t>(*v));
            }
            break;
        case 'S':
            // 十米
            if (auto v = digitsAt(s, 1, 5)) {
                result = fl(static_cast<std::uint16_t>(std::lround(*v * FEET_PER_METER / 10.0)));
            }
            break;
        case 'A':
            // 百英尺
            // A656 及以上超出英尺取值范围
            if (auto v = digitsAt(s, 1, 4); v && *v * 100 <= 0xFFFF) {
                result = altitude(static_cast<std::uint16_t>(*v * 100));
            }
            break;
        case 'M':
            // 十米
            if (auto v = digitsAt(s, 1, 5)) {
                result = altitude(static_cast<std::uint16_t>(std::lround(*v * FEET_PER_METER)));
            }
            break;
        default:
            break;
    }

    if (!result) {
        return fail(ErrorCode::UnexpectedString, std::string(s));
    }
    return *result;
}

bool VerticalDistance::comparableWith(const VerticalDistance& other) const noexcept {
    return (*this <=> other) != std::partial_ordering::unordered;
}

std::optional<Length> VerticalDistance::toMsl(double qnhHpa, Length elevation) const noexcept {
    // 27 ft/hPa
    const double qnhCorrectionFt = (qnhHpa - STANDARD_PRESSURE_HPA) * 27.0;
    const double groundFt = elevation.feet();

    switch (kind_) {
        case Kind::Gnd: return Length::ft(groundFt);
        case Kind::Agl: return Length::ft(groundFt + value_);
        case Kind::Msl:
        case Kind::Altitude: return Length::ft(value_);
        case Kind::Fl: return Length::ft(value_ * 100.0 + qnhCorrectionFt);
        case Kind::PressureAltitude: return Length::ft(value_ + qnhCorrectionFt);
        case Kind::Unlimited: return std::nullopt;
    }
    return std::nullopt;
}

std::string VerticalDistance::toString() const {
    switch (kind_) {
        case Kind::Gnd: return "GND";
        case Kind::Fl: return fmt::format("FL{:03}", value_);
        case Kind::Agl: return fmt::format("{} AGL", value_);
        case Kind::Msl: return fmt::format("{} MSL", value_);
        case Kind::Altitude: return fmt::format("{} ALT", value_);
        case Kind::PressureAltitude: return fmt::format("PA {}", value_);
        case Kind::Unlimited: return "unlimited";
    }
    return {};
}

std::partial_ordering VerticalDistance::operator<=>(const VerticalDistance& other) const noexcept {
    if (kind_ == Kind::Gnd || other.kind_ == Kind::Gnd) {
        if (kind_ == other.kind_) {
            return std::partial_ordering::equivalent;
        }
        return kind_ == Kind::Gnd ? std::partial_ordering::less : std::partial_ordering::greater;
    }

    if (kind_ == Kind::Unlimited || other.kind_ == Kind::Unlimited) {
        if (kind_ == other.kind_) {
            return std::partial_ordering::equivalent;
        }
        return kind_ == Kind::Unlimited ? std::partial_ordering::greater : std::partial_ordering::less;
    }

    if (kind_ == Kind::Agl || kind_ == Kind::PressureAltitude ||
        other.kind_ == Kind::Agl || other.kind_ == Kind::PressureAltitude) {
        if (kind_ != other.kind_) {
            return std::partial_ordering::unordered;
        }
        return value_ <=> other.value_;
    }

    const auto lhs = commonDatumFeet(*this);
    const auto rhs = commonDatumFeet(other);
    if (!lhs || !rhs) {
        return std::partial_ordering::unordered;
    }
    return *lhs <=> *rhs;
}

double VerticalDistance::operator/(const VerticalDistance& other) const {
    if (kind_ != other.kind_) {
        throw std::logic_error(fmt::format(
            "cannot divide vertical distances of different reference: {} / {}",
            toString(), other.toString()));
    }
    if (kind_ == Kind::Gnd || kind_ == Kind::Unlimited) {
        return 1.0;
    }
    return static_cast<double>(value_) / static_cast<double>(other.value_);
}

} // namespace efb::core
