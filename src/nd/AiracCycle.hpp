#pragma once

#include "core/Error.hpp"
#include <chrono>
#include <compare>
#include <string>
#include <string_view>

namespace efb::nd {

enum class CycleValidity { Expired, Current, Future };

// AIRAC 周期，28 天一期
class AiracCycle {
public:
    static constexpr int DAYS_PER_CYCLE = 28;

    constexpr AiracCycle(int year, int ordinal) : year_(year), ordinal_(ordinal) {}

    // 校验年份内序号后构造
    [[nodiscard]] static core::Result<AiracCycle> create(int year, int ordinal);

    // "YYCC"，例如 2409
    [[nodiscard]] static core::Result<AiracCycle> parse(std::string_view s);

    constexpr int year() const noexcept { return year_; }
    constexpr int ordinal() const noexcept { return ordinal_; }

    [[nodiscard]] std::chrono::sys_days effectiveDate() const;
    [[nodiscard]] std::chrono::sys_days expirationDate() const;

    [[nodiscard]] CycleValidity validity(std::chrono::sys_days date) const;
    [[nodiscard]] CycleValidity nowValid() const;

    [[nodiscard]] std::string toString() const;

    constexpr auto operator<=>(const AiracCycle&) const = default;

private:
    int year_;
    int ordinal_;
};

} // namespace efb::nd
