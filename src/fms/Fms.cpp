#include "fms/Fms.hpp"
#include <array>
#include <spdlog/spdlog.h>

namespace efb::fms {

namespace {

constexpr std::array STAGES = {EvalStage::Route, EvalStage::Alternate, EvalStage::Profile};

const char* stageName(EvalStage stage) noexcept {
    switch (stage) {
        case EvalStage::Route: return "route";
        case EvalStage::Alternate: return "alternate";
        case EvalStage::Profile: return "profile";
    }
    return "unknown";
}

} // namespace

core::Result<void> Fms::decode(std::string route) {
    routeText_ = std::move(route);
    return evaluateFrom(EvalStage::Route);
}

core::Result<void> Fms::modifyNd(const std::function<void(nd::NavigationData&)>& modify) {
    modify(nd_);
    spdlog::debug("Navigation data changed, re-evaluating route");
    return evaluateFrom(EvalStage::Route);
}

core::Result<void> Fms::setAlternate(std::string_view ident) {
    if (!nd_.find(ident)) {
        return core::fail(core::ErrorCode::UnknownIdent, std::string(ident));
    }
    alternateIdent_ = ident;
    return evaluateFrom(EvalStage::Alternate);
}

// 航路失败则清空并停止；备降场失败只丢弃备降场，剖面照常计算
core::Result<void> Fms::evaluateFrom(EvalStage first) {
    core::Result<void> outcome;
    for (const auto stage : STAGES) {
        if (stage < first) {
            continue;
        }
        spdlog::trace("Evaluating {} stage", stageName(stage));
        auto result = evaluate(stage);
        if (result) {
            continue;
        }
        spdlog::debug("{} stage failed: {}", stageName(stage), result.error());
        if (stage == EvalStage::Route) {
            route_.clear();
            profile_ = route::VerticalProfile{};
            return result;
        }
        if (outcome) {
            outcome = std::move(result);
        }
    }
    return outcome;
}

core::Result<void> Fms::evaluate(EvalStage stage) {
    switch (stage) {
        case EvalStage::Route:
            return route_.decode(routeText_, nd_);

        case EvalStage::Alternate: {
            if (alternateIdent_.empty()) {
                route_.setAlternate(std::nullopt);
                return {};
            }
            auto alternate = nd_.find(alternateIdent_);
            if (!alternate) {
                auto error = core::fail(core::ErrorCode::UnknownIdent, alternateIdent_);
                alternateIdent_.clear();
                route_.setAlternate(std::nullopt);
                return error;
            }
            route_.setAlternate(std::move(alternate));
            return {};
        }

        case EvalStage::Profile:
            profile_ = route::VerticalProfile::compute(route_, nd_);
            return {};
    }
    return {};
}

} // namespace efb::fms
