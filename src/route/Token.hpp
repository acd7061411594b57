#pragma once

#include "core/Error.hpp"
#include "core/Measurements.hpp"
#include "core/VerticalDistance.hpp"
#include "nd/NavigationData.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace efb::route {

inline constexpr std::string_view DIRECT_KEYWORD = "DCT";

enum class Via { Direct };

// 机场，可带起降跑道
struct AirportRef {
    nd::AirportPtr airport;
    std::optional<nd::Runway> runway;

    bool operator==(const AirportRef&) const = default;
};

// 尚未解析的目视报告点；match 为精确查找得到的航路点（可能为空）
struct VfrWaypointCandidate {
    std::string ident;
    nd::WaypointPtr match;

    bool operator==(const VfrWaypointCandidate&) const = default;
};

// 词法阶段的结果，不依赖上下文
using Word = std::variant<Via, core::Speed, core::VerticalDistance, core::Wind,
                          AirportRef, nd::NavAid, VfrWaypointCandidate>;

// 解析完成的航路元素
using Token = std::variant<Via, core::Speed, core::VerticalDistance, core::Wind,
                           AirportRef, nd::NavAid>;

[[nodiscard]] std::string toString(const Token& token);

class Lexer {
public:
    // 按空白切分并逐词分类
    [[nodiscard]] static core::Result<std::vector<Word>> lex(std::string_view route,
                                                             const nd::NavigationData& nd);

private:
    static core::Result<Word> classify(const std::string& word, const nd::NavigationData& nd);
};

// 根据终端区上下文解析词序列
class Tokens {
public:
    Tokens() = default;

    [[nodiscard]] static core::Result<Tokens> tokenize(const std::vector<Word>& words,
                                                       const nd::NavigationData& nd);

    const std::vector<Token>& tokens() const noexcept { return tokens_; }
    // 首次出现的速度与高度
    const std::optional<core::Speed>& speed() const noexcept { return speed_; }
    const std::optional<core::VerticalDistance>& level() const noexcept { return level_; }

    std::size_t size() const noexcept { return tokens_.size(); }
    bool empty() const noexcept { return tokens_.empty(); }
    auto begin() const noexcept { return tokens_.begin(); }
    auto end() const noexcept { return tokens_.end(); }

    [[nodiscard]] std::string toString() const;

private:
    std::vector<Token> tokens_;
    std::optional<core::Speed> speed_;
    std::optional<core::VerticalDistance> level_;
};

} // namespace efb::route
