/**
 * @file dump.hpp
 * @brief Decoded contents of one Hyades dump.
 *
 * Field names in comments refer to the variable names used by Hyades in
 * Appendix IV of the User's Guide.
 */

#ifndef PPF_DUMP_HPP
#define PPF_DUMP_HPP

#include "config.hpp"

#include <algorithm>
#include <bit>
#include <map>
#include <string>
#include <vector>

namespace ppf {

namespace detail {

// Decoded values are compared by bit pattern so that a NaN read twice from
// the same bytes compares equal.
inline bool same_bits(double a, double b) noexcept {
    return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

inline bool same_bits(float a, float b) noexcept {
    return std::bit_cast<std::uint32_t>(a) == std::bit_cast<std::uint32_t>(b);
}

template <typename T>
bool same_bits(const std::vector<T>& a, const std::vector<T>& b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](T x, T y) { return same_bits(x, y); });
}

} // namespace detail

/**
 * @brief Dimensioning limits the run was compiled with.
 */
struct Bounds {
    std::uint32_t max_groups = 0;              ///< NGRPMXX, photon groups
    std::uint32_t max_ion_types = 0;           ///< NIONMXX
    std::uint32_t max_levels = 0;              ///< NLVLMXX, atomic levels
    std::uint32_t max_materials = 0;           ///< NMATMXX, elements per region
    std::uint32_t max_arrays = 0;              ///< NPPARMXX, post-processor arrays
    std::uint32_t max_transport_particles = 0; ///< NTNPARTMXX
    std::uint32_t max_transport_reactions = 0; ///< NTNREACMXX
    std::uint32_t max_regions = 0;             ///< NRMAXX
    std::uint32_t max_zones = 0;               ///< NZMAXX

    bool operator==(const Bounds&) const = default;
};

/**
 * @brief Per-dump header record.
 *
 * String fields keep the blank padding of their fixed-width slots.
 */
struct Header {
    std::string name;         ///< NAMEP, problem name (32 characters)
    std::string time_buffer;  ///< TBUF, wall-clock time of the run
    std::string date_buffer;  ///< DBUF, date of the run
    std::string version1;     ///< IVER1
    std::string version2;     ///< IVER2
    std::string machine;      ///< MACHNE
    double time = 0.0;        ///< TIME, simulation time of the dump
    std::uint32_t cycle = 0;  ///< NCYCL
    std::uint32_t alpha = 0;  ///< IALPHA, geometry flag
    std::uint32_t nreg = 0;   ///< NREG, number of regions
    std::uint32_t nzone = 0;  ///< NZONE, number of zones
    std::uint32_t ngroup = 0; ///< NGROUP, number of photon groups
    std::uint32_t nppary = 0; ///< NPPARY, number of dumped arrays

    std::vector<std::string> array_names; ///< CPPBUF split into NPPARY names
    std::vector<float> group_bounds;      ///< PHGRPBND, NGRPMXX values
    std::vector<float> group_centers;     ///< PHGRPCEN, NGRPMXX values

    bool operator==(const Header& other) const noexcept {
        return name == other.name && time_buffer == other.time_buffer &&
               date_buffer == other.date_buffer && version1 == other.version1 &&
               version2 == other.version2 && machine == other.machine &&
               detail::same_bits(time, other.time) && cycle == other.cycle &&
               alpha == other.alpha && nreg == other.nreg && nzone == other.nzone &&
               ngroup == other.ngroup && nppary == other.nppary &&
               array_names == other.array_names &&
               detail::same_bits(group_bounds, other.group_bounds) &&
               detail::same_bits(group_centers, other.group_centers);
    }
};

/**
 * @brief One element of a region's material.
 */
struct Element {
    double atomic_fraction = 0.0; ///< ATMFRC
    double atomic_number = 0.0;   ///< ATMNUM
    double atomic_weight = 0.0;   ///< ATMWGT

    bool operator==(const Element& other) const noexcept {
        return detail::same_bits(atomic_fraction, other.atomic_fraction) &&
               detail::same_bits(atomic_number, other.atomic_number) &&
               detail::same_bits(atomic_weight, other.atomic_weight);
    }
};

/// Elements of one region, in file order
using Material = std::vector<Element>;

/**
 * @brief One decoded dump.
 *
 * Built once by decode_dump() and never tied to the buffer it came from.
 */
struct Dump {
    Bounds bounds;
    Header header;

    /// Region number of every zone (IREG), NZONE entries
    std::vector<std::uint32_t> ireg;

    /// Material of region r at index r - 1, NREG entries
    std::vector<Material> materials;

    /// Global variables in Appendix IV order, uninterpreted
    std::vector<double> globals;

    /// Decoded post-processor arrays by name
    std::map<std::string, std::vector<double>> arrays;

    [[nodiscard]] double time() const noexcept {
        return header.time;
    }

    [[nodiscard]] std::size_t zone_count() const noexcept {
        return header.nzone;
    }

    [[nodiscard]] std::size_t region_count() const noexcept {
        return header.nreg;
    }

    /**
     * @brief Field-wise equality, floating-point values by bit pattern.
     */
    bool operator==(const Dump& other) const noexcept {
        return bounds == other.bounds && header == other.header && ireg == other.ireg &&
               materials == other.materials && detail::same_bits(globals, other.globals) &&
               std::equal(arrays.begin(), arrays.end(), other.arrays.begin(),
                          other.arrays.end(), [](const auto& a, const auto& b) {
                              return a.first == b.first && detail::same_bits(a.second, b.second);
                          });
    }
};

} // namespace ppf

#endif // PPF_DUMP_HPP
