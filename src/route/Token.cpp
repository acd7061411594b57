#include "route/Token.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace efb::route {

namespace {

std::string toUpper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

// 向后查找下一个机场，遇到 DCT 停止
std::optional<std::string> lookaheadAirport(const std::vector<Word>& words, std::size_t index) {
    for (std::size_t i = index + 1; i < words.size(); ++i) {
        if (std::holds_alternative<Via>(words[i])) {
            return std::nullopt;
        }
        if (const auto* airport = std::get_if<AirportRef>(&words[i])) {
            return airport->airport->ident();
        }
    }
    return std::nullopt;
}

std::optional<nd::NavAid> findInScope(const nd::NavigationData& nd,
                                      const std::optional<std::string>& scope,
                                      const std::string& ident) {
    if (!scope) {
        return std::nullopt;
    }
    return nd.findTerminalWaypoint(*scope, ident);
}

} // namespace

std::string toString(const Token& token) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Via>) {
            return std::string(DIRECT_KEYWORD);
        } else if constexpr (std::is_same_v<T, AirportRef>) {
            auto ident = value.airport->ident();
            if (value.runway) {
                ident += value.runway->designator;
            }
            return ident;
        } else if constexpr (std::is_same_v<T, nd::NavAid>) {
            return value.ident();
        } else {
            return value.toString();
        }
    }, token);
}

core::Result<std::vector<Word>> Lexer::lex(std::string_view route, const nd::NavigationData& nd) {
    std::istringstream stream(toUpper(route));
    std::vector<Word> words;
    std::string word;

    while (stream >> word) {
        auto classified = classify(word, nd);
        if (!classified) {
            return std::unexpected(classified.error());
        }
        words.push_back(std::move(*classified));
    }
    return words;
}

core::Result<Word> Lexer::classify(const std::string& word, const nd::NavigationData& nd) {
    if (word == DIRECT_KEYWORD) {
        return Via::Direct;
    }

    if (auto navaid = nd.find(word)) {
        if (auto waypoint = navaid->waypoint(); waypoint && waypoint->usage == nd::WaypointUsage::VfrOnly) {
            return VfrWaypointCandidate{word, waypoint};
        }
        if (auto airport = navaid->airport()) {
            return AirportRef{airport, std::nullopt};
        }
        return *navaid;
    }

    if (auto speed = core::Speed::parse(word)) {
        return *speed;
    }
    if (auto level = core::VerticalDistance::parse(word)) {
        return *level;
    }
    if (auto wind = core::Wind::parse(word)) {
        return *wind;
    }

    // 机场加跑道，例如 EDHL07
    if (word.size() > 4) {
        if (auto navaid = nd.find(word.substr(0, 4))) {
            if (auto airport = navaid->airport()) {
                const auto designator = word.substr(4);
                const auto* runway = airport->findRunway(designator);
                if (!runway) {
                    return core::fail(core::ErrorCode::UnknownRunwayInRoute,
                                      fmt::format("{} at {}", designator, airport->ident()));
                }
                return AirportRef{airport, *runway};
            }
        }
    }

    return VfrWaypointCandidate{word, nullptr};
}

core::Result<Tokens> Tokens::tokenize(const std::vector<Word>& words, const nd::NavigationData& nd) {
    Tokens result;
    std::optional<std::string> terminal;
    bool originSeen = false;

    for (std::size_t i = 0; i < words.size(); ++i) {
        const auto& word = words[i];

        if (std::holds_alternative<Via>(word)) {
            // 直飞离开终端区
            terminal.reset();
            result.tokens_.emplace_back(Via::Direct);
        } else if (const auto* speed = std::get_if<core::Speed>(&word)) {
            if (!result.speed_) {
                result.speed_ = *speed;
            }
            result.tokens_.emplace_back(*speed);
        } else if (const auto* level = std::get_if<core::VerticalDistance>(&word)) {
            if (!result.level_) {
                result.level_ = *level;
            }
            result.tokens_.emplace_back(*level);
        } else if (const auto* wind = std::get_if<core::Wind>(&word)) {
            result.tokens_.emplace_back(*wind);
        } else if (const auto* navaid = std::get_if<nd::NavAid>(&word)) {
            result.tokens_.emplace_back(*navaid);
        } else if (const auto* airport = std::get_if<AirportRef>(&word)) {
            terminal = airport->airport->ident();

            const bool afterDirect = i > 0 && std::holds_alternative<Via>(words[i - 1]);
            const bool beforeVfr = i + 1 < words.size() &&
                                   std::holds_alternative<VfrWaypointCandidate>(words[i + 1]);
            if (originSeen && afterDirect && beforeVfr) {
                // 机场只用于确定后续目视报告点的终端区
                spdlog::trace("Airport {} only scopes the following waypoint", *terminal);
                continue;
            }
            originSeen = true;
            result.tokens_.emplace_back(*airport);
        } else if (const auto* candidate = std::get_if<VfrWaypointCandidate>(&word)) {
            const auto ahead = lookaheadAirport(words, i);
            const auto inCurrent = findInScope(nd, terminal, candidate->ident);
            const auto inAhead = findInScope(nd, ahead, candidate->ident);

            if (inCurrent && inAhead) {
                if (!(*inCurrent == *inAhead)) {
                    return core::fail(core::ErrorCode::AmbiguousTerminalArea,
                                      fmt::format("{} is defined in {} and {}",
                                                  candidate->ident, *terminal, *ahead));
                }
                result.tokens_.emplace_back(*inCurrent);
            } else if (inCurrent) {
                result.tokens_.emplace_back(*inCurrent);
            } else if (inAhead) {
                result.tokens_.emplace_back(*inAhead);
            } else if (candidate->match) {
                // 任意位置的同名点，可能不准确
                spdlog::debug("Using best-effort match for {}", candidate->ident);
                result.tokens_.emplace_back(nd::NavAid{candidate->match});
            } else {
                return core::fail(core::ErrorCode::UnexpectedRouteToken, candidate->ident);
            }
        }
    }

    return result;
}

std::string Tokens::toString() const {
    std::string result;
    for (const auto& token : tokens_) {
        if (!result.empty()) {
            result += ' ';
        }
        result += route::toString(token);
    }
    return result;
}

} // namespace efb::route
