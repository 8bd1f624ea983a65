// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Unit Value                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstddef>
#include <functional>
#include <ostream>

namespace conduit {

/// Zero-information value standing in for "no result".
/// Lets commands travel through the same result-typed pipeline as queries.
struct Unit {
    [[nodiscard]] constexpr bool operator==(const Unit&) const noexcept { return true; }
    [[nodiscard]] constexpr bool operator!=(const Unit&) const noexcept { return false; }
};

/// The single Unit value
inline constexpr Unit unit{};

inline std::ostream& operator<<(std::ostream& os, const Unit&) {
    return os << "()";
}

} // namespace conduit

template<>
struct std::hash<conduit::Unit> {
    std::size_t operator()(const conduit::Unit&) const noexcept { return 0; }
};
