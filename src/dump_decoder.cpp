/**
 * @file dump_decoder.cpp
 * @brief Dump record decoding.
 *
 * The skips below reproduce padding of the dump format whose meaning is
 * not documented. Their sizes and positions must not change.
 */

#include <ppf/array_table.hpp>
#include <ppf/dump_decoder.hpp>
#include <ppf/log.hpp>

#include <cctype>
#include <utility>
#include <variant>

namespace ppf {

namespace {

// Unexplained padding, in packets
constexpr std::size_t HEADER_PAD_AFTER_DBUF = 1U;
constexpr std::size_t HEADER_PAD_AFTER_NGROUP = 5U;
constexpr std::size_t HEADER_PAD_AFTER_NPPARY = 8U;
constexpr std::size_t MATERIAL_LEAD_PAD = 3U;
constexpr std::size_t MATERIAL_PAD_AFTER_IREG = 1U;
constexpr std::size_t ARRAYS_LEAD_PAD = 2U;
constexpr std::size_t ARRAY_PAD = 2U;

std::vector<std::string> split_names(const std::string& buffer) {
    std::vector<std::string> names;
    std::string current;
    for (char c : buffer) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!current.empty()) {
                names.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        names.push_back(std::move(current));
    }
    return names;
}

Error read_element(PacketReader& reader, Element& element) noexcept {
    auto status = reader.read(2, element.atomic_fraction);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read(2, element.atomic_number);
    if (status != Error::Ok) {
        return status;
    }
    return reader.read(2, element.atomic_weight);
}

} // namespace

Error decode_bounds(PacketReader& reader, Bounds& bounds) {
    auto status = reader.skip(DUMP_LEAD_MARKER_PACKETS);
    if (status != Error::Ok) {
        return status;
    }

    // Fixed order: NGRPMXX NIONMXX NLVLMXX NMATMXX NPPARMXX
    //              NTNPARTMXX NTNREACMXX NRMAXX NZMAXX
    std::uint32_t* fields[] = {
        &bounds.max_groups,
        &bounds.max_ion_types,
        &bounds.max_levels,
        &bounds.max_materials,
        &bounds.max_arrays,
        &bounds.max_transport_particles,
        &bounds.max_transport_reactions,
        &bounds.max_regions,
        &bounds.max_zones,
    };
    for (std::uint32_t* field : fields) {
        status = reader.read(1, *field);
        if (status != Error::Ok) {
            return status;
        }
    }

    return reader.skip(BOUNDS_TRAILER_PACKETS);
}

Error decode_header(PacketReader& reader, const Bounds& bounds, Header& header) {
    auto status = reader.read_string(8, header.name);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read_string(2, header.time_buffer);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read_string(2, header.date_buffer);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.skip(HEADER_PAD_AFTER_DBUF);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read_string(2, header.version1);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read_string(2, header.version2);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read_string(2, header.machine);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read(2, header.time);
    if (status != Error::Ok) {
        return status;
    }

    std::uint32_t* counts[] = {
        &header.cycle, &header.alpha, &header.nreg, &header.nzone, &header.ngroup,
    };
    for (std::uint32_t* count : counts) {
        status = reader.read(1, *count);
        if (status != Error::Ok) {
            return status;
        }
    }

    status = reader.skip(HEADER_PAD_AFTER_NGROUP);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read(1, header.nppary);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.skip(HEADER_PAD_AFTER_NPPARY);
    if (status != Error::Ok) {
        return status;
    }

    // CPPBUF holds NPPARY names of PACKETS_PER_ARRAY_NAME packets each, the
    // remaining NPPARMXX - NPPARY slots follow as blank padding
    if (header.nppary > bounds.max_arrays) {
        return Error::MalformedPacketCount;
    }

    std::string names;
    status = reader.read_string(PACKETS_PER_ARRAY_NAME * header.nppary, names);
    if (status != Error::Ok) {
        return status;
    }
    header.array_names = split_names(names);
    if (header.array_names.size() != header.nppary) {
        return Error::ArrayNameCountMismatch;
    }

    status = reader.skip(PACKETS_PER_ARRAY_NAME * (bounds.max_arrays - header.nppary));
    if (status != Error::Ok) {
        return status;
    }

    status = reader.read_array(bounds.max_groups, header.group_bounds);
    if (status != Error::Ok) {
        return status;
    }
    return reader.read_array(bounds.max_groups, header.group_centers);
}

Error decode_materials(PacketReader& reader, const Header& header,
                       std::vector<std::uint32_t>& ireg, std::vector<Material>& materials) {
    auto status = reader.skip(MATERIAL_LEAD_PAD);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.read_array(header.nzone, ireg);
    if (status != Error::Ok) {
        return status;
    }
    status = reader.skip(MATERIAL_PAD_AFTER_IREG);
    if (status != Error::Ok) {
        return status;
    }

    materials.clear();
    for (std::uint32_t region = 1; region <= header.nreg; ++region) {
        std::uint32_t elements = 0;
        status = reader.read(1, elements);
        if (status != Error::Ok) {
            return status;
        }

        // A corrupt count cannot describe more elements than bytes remain
        if (elements > reader.remaining() / (6U * BYTES_PER_PACKET)) {
            return Error::StreamExhausted;
        }

        Material material(elements);
        for (auto& element : material) {
            status = read_element(reader, element);
            if (status != Error::Ok) {
                return status;
            }
        }
        materials.push_back(std::move(material));
    }

    return Error::Ok;
}

Error decode_globals(PacketReader& reader, std::vector<double>& globals) {
    return reader.read_array(GLOBAL_BLOCK_PACKETS, globals);
}

Error decode_arrays(PacketReader& reader, const Header& header,
                    std::map<std::string, std::vector<double>>& arrays) {
    auto status = reader.skip(ARRAYS_LEAD_PAD);
    if (status != Error::Ok) {
        return status;
    }

    arrays.clear();
    for (const auto& name : header.array_names) {
        status = reader.skip(ARRAY_PAD);
        if (status != Error::Ok) {
            return status;
        }

        ArrayLayout layout = lookup_array(name);
        const auto* known = std::get_if<KnownArray>(&layout);
        if (known == nullptr) {
            logger()->warn("no size formula for array '{}' at offset {}; cannot locate the "
                           "rest of the dump",
                           name, reader.position());
            return Error::UnsupportedArrayName;
        }

        std::vector<double> values;
        status = reader.read_array(known->packet_count(header.nzone), values);
        if (status != Error::Ok) {
            return status;
        }
        arrays[name] = std::move(values);
    }

    return Error::Ok;
}

Error decode_dump(PacketReader& reader, Dump& dump) {
    Dump decoded;

    auto status = decode_bounds(reader, decoded.bounds);
    if (status != Error::Ok) {
        return status;
    }
    status = decode_header(reader, decoded.bounds, decoded.header);
    if (status != Error::Ok) {
        return status;
    }
    status = decode_materials(reader, decoded.header, decoded.ireg, decoded.materials);
    if (status != Error::Ok) {
        return status;
    }
    status = decode_globals(reader, decoded.globals);
    if (status != Error::Ok) {
        return status;
    }
    status = decode_arrays(reader, decoded.header, decoded.arrays);
    if (status == Error::UnsupportedArrayName) {
        // Everything before the unsupported array is intact
        logger()->debug("partial dump: cycle {} time {:g} ({} of {} arrays)",
                        decoded.header.cycle, decoded.header.time, decoded.arrays.size(),
                        decoded.header.nppary);
        dump = std::move(decoded);
        return status;
    }
    if (status != Error::Ok) {
        return status;
    }

    logger()->debug("decoded dump: cycle {} time {:g} ({} arrays)", decoded.header.cycle,
                    decoded.header.time, decoded.arrays.size());

    dump = std::move(decoded);
    return Error::Ok;
}

} // namespace ppf
