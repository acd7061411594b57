#include "route/Route.hpp"
#include <type_traits>
#include <spdlog/spdlog.h>

namespace efb::route {

core::Result<void> Route::decode(std::string_view route, const nd::NavigationData& nd) {
    spdlog::debug("Decoding route '{}'", route);
    reset();

    auto words = Lexer::lex(route, nd);
    if (!words) {
        spdlog::warn("Route lexing failed: {}", words.error());
        return std::unexpected(words.error());
    }

    auto tokens = Tokens::tokenize(*words, nd);
    if (!tokens) {
        spdlog::warn("Route tokenizing failed: {}", tokens.error());
        return std::unexpected(tokens.error());
    }

    commit(std::move(*tokens));
    spdlog::debug("Route decoded: {} leg(s)", legs_.size());
    return {};
}

void Route::commit(Tokens tokens) {
    std::optional<core::VerticalDistance> level;
    std::optional<core::Speed> tas;
    std::optional<core::Wind> wind;
    std::optional<nd::NavAid> from;
    std::optional<nd::NavAid> to;

    for (const auto& token : tokens) {
        std::visit([&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, core::Speed>) {
                tas = value;
            } else if constexpr (std::is_same_v<T, core::VerticalDistance>) {
                level = value;
            } else if constexpr (std::is_same_v<T, core::Wind>) {
                wind = value;
            } else if constexpr (std::is_same_v<T, AirportRef>) {
                nd::NavAid navaid{value.airport};
                if (!from) {
                    from = navaid;
                } else if (!to) {
                    to = navaid;
                }

                if (!origin_) {
                    origin_ = value.airport;
                    takeoffRunway_ = value.runway;
                    spdlog::debug("Origin set to {}", value.airport->ident());
                } else {
                    destination_ = value.airport;
                    landingRunway_ = value.runway;
                    spdlog::debug("Destination set to {}", value.airport->ident());
                }
            } else if constexpr (std::is_same_v<T, nd::NavAid>) {
                if (!from) {
                    from = value;
                } else if (!to) {
                    to = value;
                }
            }
        }, token);

        if (from && to) {
            spdlog::trace("Leg {} -> {}", from->ident(), to->ident());
            legs_.emplace_back(*from, *to, level, tas, wind);
            from = std::move(to);
            to.reset();
        }
    }

    speed_ = tokens.speed();
    level_ = tokens.level();
    tokens_ = std::move(tokens);
}

void Route::clear() {
    reset();
    alternate_.reset();
}

void Route::reset() {
    tokens_ = Tokens{};
    legs_.clear();
    speed_.reset();
    level_.reset();
    origin_.reset();
    takeoffRunway_.reset();
    destination_.reset();
    landingRunway_.reset();
}

std::optional<Leg> Route::alternate() const {
    if (!alternate_ || legs_.empty()) {
        return std::nullopt;
    }
    const auto& last = legs_.back();
    return Leg(last.to(), *alternate_, last.level(), last.tas(), last.wind());
}

std::vector<TotalsToLeg> Route::accumulateLegs() const {
    std::vector<TotalsToLeg> result;
    result.reserve(legs_.size());

    TotalsToLeg totals{core::Length::m(0.0), core::Duration::s(0.0)};
    for (const auto& leg : legs_) {
        totals.dist += leg.dist();
        if (totals.ete && leg.ete()) {
            *totals.ete += *leg.ete();
        } else {
            totals.ete.reset();
        }
        result.push_back(totals);
    }
    return result;
}

std::optional<TotalsToLeg> Route::totals() const {
    auto accumulated = accumulateLegs();
    if (accumulated.empty()) {
        return std::nullopt;
    }
    return accumulated.back();
}

core::Length Route::totalDistance() const {
    const auto sum = totals();
    return sum ? sum->dist : core::Length::m(0.0);
}

} // namespace efb::route
