#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace efb::core {

enum class ErrorCode {
    // route decoding
    UnknownRunwayInRoute,
    AmbiguousTerminalArea,
    UnexpectedRouteToken,
    UnknownIdent,
    // record conversion
    InvalidRecord,
    MissingField,
    InvalidValue,
    UnexpectedString,
    InvalidCycle,
    // io
    Io,
    Parse
};

struct Error {
    ErrorCode code{ErrorCode::InvalidRecord};
    std::string message;

    bool operator==(const Error&) const = default;
};

template<typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;
[[nodiscard]] std::string toString(const Error& error);

// 构造错误
[[nodiscard]] inline std::unexpected<Error> fail(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace efb::core

template<>
struct fmt::formatter<efb::core::Error> : fmt::formatter<std::string> {
    auto format(const efb::core::Error& error, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(efb::core::toString(error), ctx);
    }
};
