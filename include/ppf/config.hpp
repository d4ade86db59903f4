/**
 * @file config.hpp
 * @brief ppf compile-time configuration.
 *
 * Constants of the Hyades post-processor dump format (PP.11.xx) and of
 * the library itself.
 *
 * @see Hyades User's Guide Version PP.11.xx, Appendix IV
 */

#ifndef PPF_CONFIG_HPP
#define PPF_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace ppf {

/**
 * @defgroup version Version Information
 * @{
 */
#define PPF_VERSION_MAJOR 1
#define PPF_VERSION_MINOR 0
#define PPF_VERSION_PATCH 0

#define PPF_STRINGIFY_IMPL(x) #x
#define PPF_STRINGIFY(x) PPF_STRINGIFY_IMPL(x)

/// "MAJOR.MINOR.PATCH"
#define PPF_VERSION_STRING                                                                   \
    PPF_STRINGIFY(PPF_VERSION_MAJOR)                                                         \
    "." PPF_STRINGIFY(PPF_VERSION_MINOR) "." PPF_STRINGIFY(PPF_VERSION_PATCH)

inline constexpr int VERSION_MAJOR = PPF_VERSION_MAJOR;
inline constexpr int VERSION_MINOR = PPF_VERSION_MINOR;
inline constexpr int VERSION_PATCH = PPF_VERSION_PATCH;
/** @} */

/**
 * @defgroup format Dump Format Constants
 * @{
 */

/// Size of the format's atomic addressing unit
inline constexpr std::size_t BYTES_PER_PACKET = 4U;

/// Bytes skipped between two consecutive dumps
inline constexpr std::size_t DUMP_SEPARATOR_BYTES = 4U;

/// Record-length word that opens every dump
inline constexpr std::size_t DUMP_LEAD_MARKER_PACKETS = 1U;

/// Block following the bounds integers (record trailer + next header)
inline constexpr std::size_t BOUNDS_TRAILER_PACKETS = 2U;

/// Global variable block: 48 doubles, two packets each
inline constexpr std::size_t GLOBAL_BLOCK_PACKETS = 96U;
inline constexpr std::size_t GLOBAL_SCALAR_COUNT = 48U;

/// Packets per name slot in the post-processor array name buffer
inline constexpr std::size_t PACKETS_PER_ARRAY_NAME = 2U;

/** @} */

/**
 * @defgroup logging Logging Configuration
 *
 * Define PPF_LOGGER_NAME to register the library logger under another name.
 * @{
 */
#ifndef PPF_LOGGER_NAME
#define PPF_LOGGER_NAME "ppf"
#endif

inline constexpr const char* LOGGER_NAME = PPF_LOGGER_NAME;
/** @} */

} // namespace ppf

#endif // PPF_CONFIG_HPP
