/**
 * @file dump_decoder.hpp
 * @brief Decoding of one dump record.
 *
 * A dump is written as five consecutive records (Appendix IV, steps 1-5):
 * - Array bounds
 * - Header
 * - Material composition
 * - Global variables
 * - Post-processor arrays
 *
 * Nothing in the stream describes its own layout: every field's offset
 * follows from values read before it, so the phases must run in order and
 * each one must consume exactly the bytes the producer wrote, padding
 * included.
 *
 * @see Hyades User's Guide Version PP.11.xx, Appendix IV
 */

#ifndef PPF_DUMP_DECODER_HPP
#define PPF_DUMP_DECODER_HPP

#include "dump.hpp"
#include "error.hpp"
#include "packet_reader.hpp"

namespace ppf {

/**
 * @brief Decode the array bounds record (step 1).
 *
 * @param reader Reader positioned at the start of a dump
 * @param[out] bounds Decoded bounds
 * @return Error::Ok on success
 */
Error decode_bounds(PacketReader& reader, Bounds& bounds);

/**
 * @brief Decode the header record (step 2).
 *
 * Splits the array name buffer into Header::array_names and checks that
 * it holds exactly NPPARY names.
 *
 * @param reader Reader positioned after the bounds record
 * @param bounds Bounds of the same dump
 * @param[out] header Decoded header
 * @return Error::Ok on success, Error::ArrayNameCountMismatch if the name
 *         buffer does not split into NPPARY names,
 *         Error::MalformedPacketCount if NPPARY exceeds NPPARMXX
 */
Error decode_header(PacketReader& reader, const Bounds& bounds, Header& header);

/**
 * @brief Decode the material composition record (step 3).
 *
 * @param reader Reader positioned after the header record
 * @param header Header of the same dump (NZONE, NREG)
 * @param[out] ireg Region number of each zone
 * @param[out] materials Elements of each region
 * @return Error::Ok on success
 */
Error decode_materials(PacketReader& reader, const Header& header,
                       std::vector<std::uint32_t>& ireg, std::vector<Material>& materials);

/**
 * @brief Decode the global variable record (step 4).
 *
 * @param reader Reader positioned after the material record
 * @param[out] globals GLOBAL_SCALAR_COUNT values
 * @return Error::Ok on success
 */
Error decode_globals(PacketReader& reader, std::vector<double>& globals);

/**
 * @brief Decode the post-processor array records (step 5).
 *
 * An array whose name has no size formula cannot be stepped over, because
 * the stream does not say how long it is. It is logged and decoding stops
 * with Error::UnsupportedArrayName; @p arrays then holds the arrays that
 * precede it.
 *
 * @param reader Reader positioned after the global variable record
 * @param header Header of the same dump (NZONE, array names)
 * @param[out] arrays Decoded arrays by name
 * @return Error::Ok on success
 */
Error decode_arrays(PacketReader& reader, const Header& header,
                    std::map<std::string, std::vector<double>>& arrays);

/**
 * @brief Decode one complete dump.
 *
 * The reader is only borrowed for the duration of the call. On failure
 * the reader stays at the start of the read that failed and @p dump is
 * left untouched, except for Error::UnsupportedArrayName: the dump is then
 * complete up to the unsupported array, which is absent from
 * Dump::arrays along with every array after it. The reader cannot be
 * trusted past that point.
 *
 * @param reader Reader positioned at the start of a dump
 * @param[out] dump Decoded dump
 * @return Error::Ok on success, or the first error of any phase
 */
Error decode_dump(PacketReader& reader, Dump& dump);

} // namespace ppf

#endif // PPF_DUMP_DECODER_HPP
