#include "nd/NavAid.hpp"

namespace efb::nd {

const std::string& NavAid::ident() const noexcept {
    return std::visit([](const auto& ptr) -> const std::string& { return ptr->ident(); }, value_);
}

geo::Coordinate NavAid::coordinate() const noexcept {
    return std::visit([](const auto& ptr) { return ptr->coordinate; }, value_);
}

core::MagneticVariation NavAid::magVar() const noexcept {
    return std::visit([](const auto& ptr) { return ptr->magVar; }, value_);
}

std::shared_ptr<const Airport> NavAid::airport() const noexcept {
    if (const auto* ptr = std::get_if<std::shared_ptr<const Airport>>(&value_)) {
        return *ptr;
    }
    return nullptr;
}

std::shared_ptr<const Waypoint> NavAid::waypoint() const noexcept {
    if (const auto* ptr = std::get_if<std::shared_ptr<const Waypoint>>(&value_)) {
        return *ptr;
    }
    return nullptr;
}

bool NavAid::operator==(const NavAid& other) const noexcept {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    return std::visit([&](const auto& lhs) {
        using Ptr = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<Ptr>(other.value_);
        return lhs == rhs || (lhs && rhs && *lhs == *rhs);
    }, value_);
}

} // namespace efb::nd
