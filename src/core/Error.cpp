#include "core/Error.hpp"

namespace efb::core {

std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnknownRunwayInRoute: return "unknown runway in route";
        case ErrorCode::AmbiguousTerminalArea: return "ambiguous terminal area";
        case ErrorCode::UnexpectedRouteToken: return "unexpected route token";
        case ErrorCode::UnknownIdent: return "unknown ident";
        case ErrorCode::InvalidRecord: return "invalid record";
        case ErrorCode::MissingField: return "missing field";
        case ErrorCode::InvalidValue: return "invalid value";
        case ErrorCode::UnexpectedString: return "unexpected string";
        case ErrorCode::InvalidCycle: return "invalid AIRAC cycle";
        case ErrorCode::Io: return "io error";
        case ErrorCode::Parse: return "parse error";
    }
    return "unknown error";
}

std::string toString(const Error& error) {
    if (error.message.empty()) {
        return std::string(toString(error.code));
    }
    return fmt::format("{}: {}", toString(error.code), error.message);
}

} // namespace efb::core
