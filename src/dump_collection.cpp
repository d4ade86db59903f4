/**
 * @file dump_collection.cpp
 * @brief Whole-file decoding and queries over the decoded dumps.
 */

#include <ppf/dump_collection.hpp>
#include <ppf/dump_decoder.hpp>
#include <ppf/log.hpp>
#include <ppf/packet_reader.hpp>

#include <cmath>
#include <fstream>
#include <set>

#include <fmt/format.h>

namespace ppf {

namespace {

const std::vector<std::string> NO_NAMES;
const std::vector<std::uint32_t> NO_REGIONS;
const std::vector<Material> NO_MATERIALS;

constexpr const char* REGION_MISMATCH_MESSAGE =
    "zone regions were imported incorrectly: IREG does not hold NREG distinct regions "
    "(known to happen with ionization models)";

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return false;
    }

    return true;
}

} // namespace

Error DumpCollection::load(const std::string& path, DumpCollection& collection,
                           const LoadOptions& options) {
    std::vector<std::uint8_t> buffer;
    if (!read_file(path, buffer)) {
        logger()->error("cannot read dump file {}", path);
        return Error::IoError;
    }

    logger()->info("reading {} ({} bytes)", path, buffer.size());
    return load(buffer.data(), buffer.size(), collection, options);
}

Error DumpCollection::load(const std::uint8_t* data, std::size_t size, DumpCollection& collection,
                           const LoadOptions& options) {
    PacketReader reader(data, size);
    std::vector<Dump> dumps;
    LoadReport report;
    report.bytes_total = size;

    while (reader.remaining() > 0) {
        Dump dump;
        auto status = decode_dump(reader, dump);
        if (status != Error::Ok) {
            report.bytes_consumed = reader.position();
            report.stop_reason = status;

            if (options.strict) {
                logger()->error("failed to decode dump {} at {}/{} bytes: {}", dumps.size(),
                                reader.position(), size, error_string(status));
                return status;
            }

            std::size_t failed = dumps.size();

            // The arrays read before an unsupported one are still usable
            if (status == Error::UnsupportedArrayName) {
                dumps.push_back(std::move(dump));
            }

            logger()->warn("failed to decode dump {}, stopping at {}/{} bytes: {}; keeping {} "
                           "dumps (load strictly to fail instead)",
                           failed, reader.position(), size, error_string(status), dumps.size());
            break;
        }

        dumps.push_back(std::move(dump));

        // Fast forward to the next dump
        reader.skip_bytes(DUMP_SEPARATOR_BYTES);
    }

    if (report.complete()) {
        report.bytes_consumed = reader.position();
    }

    logger()->info("decoded {} dumps", dumps.size());
    collection = DumpCollection(std::move(dumps), report);
    return Error::Ok;
}

std::vector<std::string> DumpCollection::validate() const {
    std::set<std::string> errors;

    for (const auto& dump : dumps_) {
        std::set<std::uint32_t> regions(dump.ireg.begin(), dump.ireg.end());
        if (regions.size() != dump.header.nreg) {
            errors.insert(REGION_MISMATCH_MESSAGE);
        }
    }

    for (const auto& error : errors) {
        logger()->warn("{}", error);
    }

    return std::vector<std::string>(errors.begin(), errors.end());
}

std::size_t DumpCollection::zone_count() const noexcept {
    return dumps_.empty() ? 0 : dumps_.front().zone_count();
}

const std::vector<std::string>& DumpCollection::array_names() const noexcept {
    return dumps_.empty() ? NO_NAMES : dumps_.front().header.array_names;
}

const std::vector<std::uint32_t>& DumpCollection::region_mask() const noexcept {
    return dumps_.empty() ? NO_REGIONS : dumps_.front().ireg;
}

std::vector<std::size_t> DumpCollection::zones_in_region(std::uint32_t region) const {
    const auto& ireg = region_mask();
    std::vector<std::size_t> zones;
    for (std::size_t zone = 0; zone < ireg.size(); ++zone) {
        if (ireg[zone] == region) {
            zones.push_back(zone);
        }
    }
    return zones;
}

const std::vector<Material>& DumpCollection::material_table() const noexcept {
    return dumps_.empty() ? NO_MATERIALS : dumps_.front().materials;
}

std::vector<double> DumpCollection::times() const {
    std::vector<double> values;
    values.reserve(dumps_.size());
    for (const auto& dump : dumps_) {
        values.push_back(dump.time());
    }
    return values;
}

Error DumpCollection::nearest_index(double t, std::size_t& index) const noexcept {
    if (dumps_.empty()) {
        return Error::EmptyCollection;
    }

    std::size_t best = 0;
    double best_distance = std::abs(dumps_[0].time() - t);
    for (std::size_t i = 1; i < dumps_.size(); ++i) {
        double distance = std::abs(dumps_[i].time() - t);
        // Strict comparison keeps the lower index on ties
        if (distance < best_distance) {
            best = i;
            best_distance = distance;
        }
    }

    index = best;
    return Error::Ok;
}

Error DumpCollection::nearest_indices(const std::vector<double>& ts,
                                      std::vector<std::size_t>& indices) const {
    std::vector<std::size_t> result(ts.size());
    for (std::size_t i = 0; i < ts.size(); ++i) {
        auto status = nearest_index(ts[i], result[i]);
        if (status != Error::Ok) {
            return status;
        }
    }
    indices = std::move(result);
    return Error::Ok;
}

Error DumpCollection::collect(const std::string& array_name, Grid& grid) const {
    if (dumps_.empty()) {
        return Error::EmptyCollection;
    }

    std::size_t rows = 0;
    for (std::size_t d = 0; d < dumps_.size(); ++d) {
        auto it = dumps_[d].arrays.find(array_name);
        if (it == dumps_[d].arrays.end()) {
            logger()->warn("array '{}' not found in dump {}", array_name, d);
            return Error::ArrayNotFound;
        }
        if (d == 0) {
            rows = it->second.size();
        } else if (it->second.size() != rows) {
            return Error::InconsistentDimensions;
        }
    }

    Grid result(rows, dumps_.size());
    for (std::size_t d = 0; d < dumps_.size(); ++d) {
        const auto& values = dumps_[d].arrays.at(array_name);
        for (std::size_t r = 0; r < rows; ++r) {
            result(r, d) = values[r];
        }
    }

    grid = std::move(result);
    return Error::Ok;
}

std::string DumpCollection::summary() const {
    if (dumps_.empty()) {
        return "no dumps\n";
    }

    const Header& header = dumps_.front().header;
    std::string names;
    for (const auto& name : header.array_names) {
        names += names.empty() ? name : " " + name;
    }

    std::string text;
    text += fmt::format("Problem:  {}\n", trim(header.name));
    text += fmt::format("Run:      {} {} on {}\n", trim(header.date_buffer),
                        trim(header.time_buffer), trim(header.machine));
    text += fmt::format("Version:  {} {}\n", trim(header.version1), trim(header.version2));
    text += fmt::format("Dumps:    {}\n", dumps_.size());
    text += fmt::format("Time:     {:g} .. {:g}\n", dumps_.front().time(), dumps_.back().time());
    text += fmt::format("Cycles:   {} .. {}\n", header.cycle, dumps_.back().header.cycle);
    text += fmt::format("Zones:    {}\n", header.nzone);
    text += fmt::format("Regions:  {}\n", header.nreg);
    text += fmt::format("Groups:   {}\n", header.ngroup);
    text += fmt::format("Arrays:   {}\n", names);
    return text;
}

} // namespace ppf
