/**
 * @file array_table.hpp
 * @brief Size formulas for post-processor arrays.
 *
 * The dump format does not record how long a post-processor array is. The
 * length follows from the array's name and the zone count NZONE, e.g.
 * node-centred arrays carry NZONE + 1 values and zone-centred arrays carry
 * NZONE. Only the names listed here can be decoded.
 *
 * | Name   | Values    | Mesh range      |
 * |--------|-----------|-----------------|
 * | R      | NZONE + 1 | [1, nmesh + 1]  |
 * | RCM    | NZONE + 2 | [0, nmesh + 1]  |
 * | U      | NZONE + 1 | [1, nmesh + 1]  |
 * | PRES   | NZONE     | [1, nzone]      |
 * | RHO    | NZONE     | [1, nzone]      |
 * | TE     | NZONE     | [1, nzone]      |
 * | TI     | NZONE     | [1, nzone]      |
 * | QTOT   | NZONE     | [1, nzone]      |
 * | STRTOT | NZONE + 2 | [0, nzone + 1]  |
 */

#ifndef PPF_ARRAY_TABLE_HPP
#define PPF_ARRAY_TABLE_HPP

#include "config.hpp"

#include <array>
#include <string_view>
#include <variant>

namespace ppf {

/**
 * @brief Array with a known size formula: NZONE + zone_offset values.
 */
struct KnownArray {
    std::size_t zone_offset = 0;

    [[nodiscard]] constexpr std::size_t element_count(std::size_t nzone) const noexcept {
        return nzone + zone_offset;
    }

    [[nodiscard]] constexpr std::size_t packet_count(std::size_t nzone) const noexcept {
        return element_count(nzone) * 2U;
    }

    bool operator==(const KnownArray&) const = default;
};

/**
 * @brief Array whose name has no size formula.
 */
struct UnsupportedArray {
    bool operator==(const UnsupportedArray&) const = default;
};

/// Result of a name lookup
using ArrayLayout = std::variant<KnownArray, UnsupportedArray>;

namespace detail {

struct ArrayFormula {
    std::string_view name;
    std::size_t zone_offset;
};

inline constexpr std::array<ArrayFormula, 9> ARRAY_FORMULAS = {{
    {"R", 1U},
    {"RCM", 2U},
    {"U", 1U},
    {"PRES", 0U},
    {"RHO", 0U},
    {"TE", 0U},
    {"TI", 0U},
    {"QTOT", 0U},
    {"STRTOT", 2U},
}};

} // namespace detail

/**
 * @brief Look up the layout of a post-processor array by name.
 *
 * Names are matched exactly (case-sensitive, no trimming).
 *
 * @param name Array name as declared in the dump header
 * @return KnownArray with the size formula, or UnsupportedArray
 */
constexpr ArrayLayout lookup_array(std::string_view name) noexcept {
    for (const auto& formula : detail::ARRAY_FORMULAS) {
        if (formula.name == name) {
            return KnownArray{formula.zone_offset};
        }
    }
    return UnsupportedArray{};
}

/**
 * @brief Check whether an array name can be decoded.
 */
constexpr bool is_supported_array(std::string_view name) noexcept {
    return std::holds_alternative<KnownArray>(lookup_array(name));
}

} // namespace ppf

#endif // PPF_ARRAY_TABLE_HPP
