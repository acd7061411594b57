#pragma once

#include "core/Error.hpp"
#include "nd/NavigationData.hpp"
#include "route/Route.hpp"
#include "route/VerticalProfile.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace efb::fms {

// 求值阶段，按顺序执行
enum class EvalStage {
    Route,
    Alternate,
    Profile
};

// 导航数据与航路的组合；数据变化后重新解码已保存的航路
class Fms {
public:
    Fms() = default;
    explicit Fms(nd::NavigationData nd) : nd_(std::move(nd)) {}

    const nd::NavigationData& nd() const noexcept { return nd_; }
    const route::Route& route() const noexcept { return route_; }
    const std::string& routeText() const noexcept { return routeText_; }

    [[nodiscard]] core::Result<void> decode(std::string route);

    // 修改导航数据；重新解码失败时清空航路
    [[nodiscard]] core::Result<void> modifyNd(const std::function<void(nd::NavigationData&)>& modify);

    [[nodiscard]] core::Result<void> setAlternate(std::string_view ident);

    // 最近一次求值的垂直剖面
    const route::VerticalProfile& profile() const noexcept { return profile_; }

private:
    core::Result<void> evaluate(EvalStage stage);
    core::Result<void> evaluateFrom(EvalStage first);

    nd::NavigationData nd_;
    route::Route route_;
    std::string routeText_;
    std::string alternateIdent_;
    route::VerticalProfile profile_;
};

} // namespace efb::fms
