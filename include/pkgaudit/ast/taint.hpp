#pragma once

/**
 * @file taint.hpp
 * @brief Three-value provenance lattice attached to tree nodes
 */

#include <string_view>

namespace pkgaudit::ast {

enum class Taint {
    kSafe,     ///< Constant or otherwise trusted value
    kUnknown,  ///< Provenance not established (default)
    kTainted   ///< Derived from untrusted input
};

/**
 * Join of two classifications: Tainted absorbs everything, Unknown absorbs Safe.
 * Associative and commutative.
 */
[[nodiscard]] constexpr Taint combine(Taint lhs, Taint rhs) noexcept
{
    if (lhs == Taint::kTainted || rhs == Taint::kTainted) {
        return Taint::kTainted;
    }
    if (lhs == Taint::kUnknown || rhs == Taint::kUnknown) {
        return Taint::kUnknown;
    }
    return Taint::kSafe;
}

[[nodiscard]] constexpr std::string_view to_string(Taint taint) noexcept
{
    switch (taint) {
        case Taint::kSafe:
            return "SAFE";
        case Taint::kUnknown:
            return "UNKNOWN";
        case Taint::kTainted:
            return "TAINTED";
    }
    return "UNKNOWN";
}

}  // namespace pkgaudit::ast
