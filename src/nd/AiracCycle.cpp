#include "nd/AiracCycle.hpp"
#include <charconv>
#include <spdlog/fmt/fmt.h>

namespace efb::nd {

using namespace std::chrono;

namespace {

// 周期 2001 的生效日
constexpr sys_days REFERENCE_DATE = sys_days{year{2020} / January / 2};

sys_days firstEffectiveDateOfYear(int y) {
    const auto januaryFirst = sys_days{year{y} / January / 1};
    const auto offset = (januaryFirst - REFERENCE_DATE).count();
    // 向上取整的整除，兼容负数
    auto k = offset / AiracCycle::DAYS_PER_CYCLE;
    if (offset > 0 && offset % AiracCycle::DAYS_PER_CYCLE != 0) {
        ++k;
    }
    return REFERENCE_DATE + days{k * AiracCycle::DAYS_PER_CYCLE};
}

} // namespace

core::Result<AiracCycle> AiracCycle::create(int y, int ordinal) {
    if (ordinal < 1) {
        return core::fail(core::ErrorCode::InvalidCycle, fmt::format("{} cycle {}", y, ordinal));
    }
    const AiracCycle cycle{y, ordinal};
    if (static_cast<int>(year_month_day{cycle.effectiveDate()}.year()) != y) {
        return core::fail(core::ErrorCode::InvalidCycle, fmt::format("{} has no cycle {}", y, ordinal));
    }
    return cycle;
}

core::Result<AiracCycle> AiracCycle::parse(std::string_view s) {
    int yy = 0;
    int cc = 0;
    if (s.size() != 4 ||
        std::from_chars(s.data(), s.data() + 2, yy).ptr != s.data() + 2 ||
        std::from_chars(s.data() + 2, s.data() + 4, cc).ptr != s.data() + 4) {
        return core::fail(core::ErrorCode::InvalidCycle, std::string(s));
    }
    return create(2000 + yy, cc);
}

sys_days AiracCycle::effectiveDate() const {
    return firstEffectiveDateOfYear(year_) + days{(ordinal_ - 1) * DAYS_PER_CYCLE};
}

sys_days AiracCycle::expirationDate() const {
    return effectiveDate() + days{DAYS_PER_CYCLE};
}

CycleValidity AiracCycle::validity(sys_days date) const {
    if (date < effectiveDate()) {
        return CycleValidity::Future;
    }
    if (date >= expirationDate()) {
        return CycleValidity::Expired;
    }
    return CycleValidity::Current;
}

CycleValidity AiracCycle::nowValid() const {
    return validity(floor<days>(system_clock::now()));
}

std::string AiracCycle::toString() const {
    return fmt::format("{:02}{:02}", year_ % 100, ordinal_);
}

} // namespace efb::nd
