/**
 * @file ppf.hpp
 * @brief High-level ppf API.
 *
 * Reads Hyades post-processor (.ppf) dump files, dump format PP.11.xx.
 *
 * @code
 * ppf::DumpCollection dumps;
 * if (ppf::DumpCollection::load("run.ppf", dumps) == ppf::Error::Ok) {
 *     ppf::Grid pres;
 *     dumps.collect("PRES", pres); // pres(zone, dump)
 * }
 * @endcode
 *
 * @see Hyades User's Guide Version PP.11.xx, Appendix IV
 */

#ifndef PPF_HPP
#define PPF_HPP

#include "array_table.hpp"
#include "config.hpp"
#include "dump.hpp"
#include "dump_collection.hpp"
#include "dump_decoder.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "log.hpp"
#include "packet_reader.hpp"

namespace ppf {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return PPF_VERSION_STRING;
}

} // namespace ppf

#endif // PPF_HPP
