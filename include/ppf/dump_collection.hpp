/**
 * @file dump_collection.hpp
 * @brief All dumps of a post-processor file.
 *
 * A .ppf file is a sequence of dumps separated by a 4-byte marker, written
 * in simulation time order. DumpCollection decodes the file once and then
 * answers read-only queries over the sequence.
 *
 * @see Hyades User's Guide Version PP.11.xx, Appendix IV
 */

#ifndef PPF_DUMP_COLLECTION_HPP
#define PPF_DUMP_COLLECTION_HPP

#include "config.hpp"
#include "dump.hpp"
#include "error.hpp"
#include "grid.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ppf {

/**
 * @brief Options for DumpCollection::load().
 */
struct LoadOptions {
    /// Return the first decode error instead of keeping the dumps read so far
    bool strict = false;
};

/**
 * @brief How far a load got.
 */
struct LoadReport {
    std::size_t bytes_consumed = 0; ///< Position where decoding stopped
    std::size_t bytes_total = 0;    ///< Size of the source
    Error stop_reason = Error::Ok;  ///< Error that ended the load, Ok if none

    [[nodiscard]] bool complete() const noexcept {
        return stop_reason == Error::Ok;
    }
};

/**
 * @brief Immutable, time-ordered sequence of decoded dumps.
 *
 * All dumps of a run share the same zone and region layout; accessors that
 * describe the mesh answer from the first dump.
 */
class DumpCollection {
public:
    /**
     * @brief Construct an empty collection.
     */
    DumpCollection() = default;

    /**
     * @brief Decode every dump of a .ppf file.
     *
     * The file is held open only for the duration of the call.
     *
     * @param path Path of the .ppf file
     * @param[out] collection Decoded collection
     * @param options Load options
     * @return Error::Ok on success (including a partial, non-strict load),
     *         Error::IoError if the file cannot be read, or in strict mode
     *         the decode error that stopped the load
     */
    static Error load(const std::string& path, DumpCollection& collection,
                      const LoadOptions& options = {});

    /**
     * @brief Decode every dump of an in-memory buffer.
     *
     * Decoding stops at the first dump that fails. Without
     * LoadOptions::strict the dumps decoded before it are kept, a warning
     * with the stopping offset is logged and Error::Ok is returned; with it,
     * the error is returned and @p collection is not modified. A dump that
     * stops at an unsupported array is kept without that array.
     *
     * @param data Source bytes
     * @param size Number of source bytes
     * @param[out] collection Decoded collection
     * @param options Load options
     * @return Error::Ok on success
     */
    static Error load(const std::uint8_t* data, std::size_t size, DumpCollection& collection,
                      const LoadOptions& options = {});

    /**
     * @brief Check the decoded dumps for known import problems.
     *
     * Reports every dump whose IREG holds a different number of distinct
     * region numbers than NREG. Messages are deduplicated, so a problem
     * shared by many dumps is reported once. Each message is also logged.
     *
     * @return Distinct diagnostic messages, empty when nothing was found
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    /**
     * @brief Number of dumps.
     */
    [[nodiscard]] std::size_t count() const noexcept {
        return dumps_.size();
    }

    /**
     * @brief Number of zones in the problem (0 when empty).
     */
    [[nodiscard]] std::size_t zone_count() const noexcept;

    /**
     * @brief Names of the dumped arrays, in declared order.
     */
    [[nodiscard]] const std::vector<std::string>& array_names() const noexcept;

    /**
     * @brief Region number of every zone (IREG).
     */
    [[nodiscard]] const std::vector<std::uint32_t>& region_mask() const noexcept;

    /**
     * @brief Zero-based indices of the zones belonging to a region.
     *
     * @param region Region number as stored in IREG (1-based)
     */
    [[nodiscard]] std::vector<std::size_t> zones_in_region(std::uint32_t region) const;

    /**
     * @brief Material of every region, region r at index r - 1.
     */
    [[nodiscard]] const std::vector<Material>& material_table() const noexcept;

    /**
     * @brief Simulation time of every dump, in collection order.
     */
    [[nodiscard]] std::vector<double> times() const;

    /**
     * @brief Find the dump closest in time to @p t.
     *
     * @param t Simulation time
     * @param[out] index Index of the dump with the smallest |time - t|; on
     *             a tie the lower index
     * @return Error::Ok on success, Error::EmptyCollection if there are no
     *         dumps
     */
    Error nearest_index(double t, std::size_t& index) const noexcept;

    /**
     * @brief nearest_index() for each of several times.
     */
    Error nearest_indices(const std::vector<double>& ts, std::vector<std::size_t>& indices) const;

    /**
     * @brief Gather one array across all dumps.
     *
     * @param array_name Name of the array, e.g. "PRES"
     * @param[out] grid Grid of shape [array length, count()]
     * @return Error::Ok on success, Error::ArrayNotFound if a dump does not
     *         hold the array, Error::InconsistentDimensions if dumps disagree
     *         on its length, Error::EmptyCollection if there are no dumps
     */
    Error collect(const std::string& array_name, Grid& grid) const;

    /**
     * @brief Human-readable description of the run.
     */
    [[nodiscard]] std::string summary() const;

    /**
     * @brief Access one dump.
     *
     * @param index Dump index, must be less than count()
     */
    [[nodiscard]] const Dump& dump(std::size_t index) const {
        return dumps_.at(index);
    }

    [[nodiscard]] const std::vector<Dump>& dumps() const noexcept {
        return dumps_;
    }

    [[nodiscard]] const LoadReport& load_report() const noexcept {
        return report_;
    }

private:
    DumpCollection(std::vector<Dump> dumps, const LoadReport& report)
        : dumps_(std::move(dumps)), report_(report) {}

    std::vector<Dump> dumps_;
    LoadReport report_;
};

} // namespace ppf

#endif // PPF_DUMP_COLLECTION_HPP
