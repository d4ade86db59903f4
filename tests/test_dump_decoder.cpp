/**
 * @file test_dump_decoder.cpp
 * @brief Unit tests for single-dump decoding.
 */

#include <catch2/catch_test_macros.hpp>
#include <ppf/array_table.hpp>
#include <ppf/dump_decoder.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>

#include "fixture_writer.hpp"

using namespace ppf;
using fixture::DumpRecipe;
using fixture::FixtureWriter;

static std::vector<std::uint8_t> encode(const DumpRecipe& recipe) {
    FixtureWriter writer;
    writer.put_dump(recipe);
    return writer.bytes();
}

TEST_CASE("Decode bounds record", "[decoder]") {
    DumpRecipe recipe;
    recipe.bounds = Bounds{20, 3, 40, 5, 6, 7, 8, 9, 1000};
    recipe.group_bounds.resize(20, 1.0F);
    recipe.group_centers.resize(20, 0.5F);
    auto bytes = encode(recipe);

    PacketReader reader(bytes.data(), bytes.size());
    Bounds bounds;
    REQUIRE(decode_bounds(reader, bounds) == Error::Ok);

    REQUIRE(bounds.max_groups == 20);
    REQUIRE(bounds.max_ion_types == 3);
    REQUIRE(bounds.max_levels == 40);
    REQUIRE(bounds.max_materials == 5);
    REQUIRE(bounds.max_arrays == 6);
    REQUIRE(bounds.max_transport_particles == 7);
    REQUIRE(bounds.max_transport_reactions == 8);
    REQUIRE(bounds.max_regions == 9);
    REQUIRE(bounds.max_zones == 1000);

    // Lead marker, 9 integers and the 2-packet trailer
    REQUIRE(reader.position() == (1 + 9 + 2) * BYTES_PER_PACKET);
}

TEST_CASE("Decode header record", "[decoder]") {
    DumpRecipe recipe = fixture::make_dump(2.5e-9, 420);
    recipe.array_names = {"R", "RCM", "TE"};
    auto bytes = encode(recipe);

    PacketReader reader(bytes.data(), bytes.size());
    Bounds bounds;
    Header header;
    REQUIRE(decode_bounds(reader, bounds) == Error::Ok);
    REQUIRE(decode_header(reader, bounds, header) == Error::Ok);

    SECTION("fixed-width strings keep their padding") {
        REQUIRE(header.name.size() == 32);
        REQUIRE(header.name.rfind("fixture problem", 0) == 0);
        REQUIRE(header.time_buffer == "12:34:56");
        REQUIRE(header.date_buffer == "01/02/26");
        REQUIRE(header.version1 == "PP.11.02");
        REQUIRE(header.version2 == "linux64 ");
        REQUIRE(header.machine == "testhost");
    }

    SECTION("scalars") {
        REQUIRE(header.time == 2.5e-9);
        REQUIRE(header.cycle == 420);
        REQUIRE(header.alpha == 1);
        REQUIRE(header.nreg == 2);
        REQUIRE(header.nzone == 3);
        REQUIRE(header.ngroup == 2);
        REQUIRE(header.nppary == 3);
    }

    SECTION("array names") {
        REQUIRE(header.array_names == std::vector<std::string>{"R", "RCM", "TE"});
    }

    SECTION("photon groups") {
        REQUIRE(header.group_bounds == std::vector<float>{0.1F, 1.0F});
        REQUIRE(header.group_centers == std::vector<float>{0.05F, 0.55F});
    }
}

TEST_CASE("Decode header rejects inconsistent name counts", "[decoder]") {
    DumpRecipe recipe;
    Bounds bounds;
    Header header;

    SECTION("fewer names than declared") {
        recipe.array_names = {"RCM", "PRES"};
        recipe.nppary = 3;
        // The third slot is read from the blank padding
        auto bytes = encode(recipe);
        PacketReader reader(bytes.data(), bytes.size());
        REQUIRE(decode_bounds(reader, bounds) == Error::Ok);
        REQUIRE(decode_header(reader, bounds, header) == Error::ArrayNameCountMismatch);
    }

    SECTION("more declared names than slots") {
        recipe.bounds.max_arrays = 2;
        recipe.nppary = 3;
        auto bytes = encode(recipe);
        PacketReader reader(bytes.data(), bytes.size());
        REQUIRE(decode_bounds(reader, bounds) == Error::Ok);
        REQUIRE(decode_header(reader, bounds, header) == Error::MalformedPacketCount);
    }
}

TEST_CASE("Decode material record", "[decoder]") {
    DumpRecipe recipe;
    recipe.ireg = {1, 1, 2, 2, 3};
    recipe.nreg = 3;
    recipe.materials = {
        {{1.0, 1.0, 1.008}},
        {{0.4, 6.0, 12.011}, {0.6, 1.0, 1.008}},
        {},
    };
    auto bytes = encode(recipe);

    PacketReader reader(bytes.data(), bytes.size());
    Bounds bounds;
    Header header;
    REQUIRE(decode_bounds(reader, bounds) == Error::Ok);
    REQUIRE(decode_header(reader, bounds, header) == Error::Ok);

    std::vector<std::uint32_t> ireg;
    std::vector<Material> materials;
    REQUIRE(decode_materials(reader, header, ireg, materials) == Error::Ok);

    REQUIRE(ireg == std::vector<std::uint32_t>{1, 1, 2, 2, 3});
    REQUIRE(materials.size() == 3);
    REQUIRE(materials[0] == Material{{1.0, 1.0, 1.008}});
    REQUIRE(materials[1].size() == 2);
    REQUIRE(materials[1][0].atomic_fraction == 0.4);
    REQUIRE(materials[1][0].atomic_number == 6.0);
    REQUIRE(materials[1][0].atomic_weight == 12.011);
    REQUIRE(materials[1][1].atomic_fraction == 0.6);
    REQUIRE(materials[2].empty());
}

TEST_CASE("Decode complete dump", "[decoder]") {
    DumpRecipe recipe = fixture::make_dump(1.0e-9, 100);
    recipe.array_names = {"R", "RCM", "U", "PRES", "RHO", "TE"};
    auto bytes = encode(recipe);

    PacketReader reader(bytes.data(), bytes.size());
    Dump dump;
    REQUIRE(decode_dump(reader, dump) == Error::Ok);
    REQUIRE(reader.remaining() == 0);

    SECTION("one name per declared array") {
        REQUIRE(dump.header.array_names.size() == dump.header.nppary);
        REQUIRE(dump.arrays.size() == 6);
    }

    SECTION("array lengths follow their formula") {
        for (const auto& [name, values] : dump.arrays) {
            ArrayLayout layout = lookup_array(name);
            REQUIRE(values.size() == std::get<KnownArray>(layout).element_count(3));
        }
        REQUIRE(dump.arrays.at("RCM").size() == 5);
        REQUIRE(dump.arrays.at("PRES").size() == 3);
    }

    SECTION("array contents") {
        REQUIRE(dump.arrays.at("TE") == fixture::generated_array("TE", 3, 1.0e-9));
        REQUIRE(dump.arrays.at("R") == fixture::generated_array("R", 3, 1.0e-9));
    }

    SECTION("global variables are kept in order") {
        REQUIRE(dump.globals.size() == GLOBAL_SCALAR_COUNT);
        REQUIRE(dump.globals.front() == 1.0e-9);
        REQUIRE(dump.globals.back() == 1.0e-9 + 47.0);
    }

    SECTION("convenience accessors") {
        REQUIRE(dump.time() == 1.0e-9);
        REQUIRE(dump.zone_count() == 3);
        REQUIRE(dump.region_count() == 2);
    }
}

TEST_CASE("Decoding is deterministic", "[decoder]") {
    auto bytes = encode(fixture::make_dump(3.0e-9, 7));

    PacketReader first_reader(bytes.data(), bytes.size());
    PacketReader second_reader(bytes.data(), bytes.size());
    Dump first;
    Dump second;
    REQUIRE(decode_dump(first_reader, first) == Error::Ok);
    REQUIRE(decode_dump(second_reader, second) == Error::Ok);

    REQUIRE(first == second);
    REQUIRE(first_reader.position() == second_reader.position());
}

TEST_CASE("Decoded dump does not depend on the buffer", "[decoder]") {
    auto bytes = encode(fixture::make_dump(4.0e-9));

    Dump dump;
    {
        PacketReader reader(bytes.data(), bytes.size());
        REQUIRE(decode_dump(reader, dump) == Error::Ok);
    }
    Dump copy = dump;
    std::fill(bytes.begin(), bytes.end(), std::uint8_t{0});

    REQUIRE(dump == copy);
    REQUIRE(dump.time() == 4.0e-9);
}

TEST_CASE("Unsupported array stops the dump", "[decoder]") {
    DumpRecipe recipe = fixture::make_dump(5.0, 12);
    recipe.array_names = {"PRES", "TR", "RHO"};
    recipe.arrays["TR"] = {1.0, 2.0, 3.0};
    auto bytes = encode(recipe);

    PacketReader reader(bytes.data(), bytes.size());
    Dump dump;
    REQUIRE(decode_dump(reader, dump) == Error::UnsupportedArrayName);

    SECTION("records before the array are kept") {
        REQUIRE(dump.header.cycle == 12);
        REQUIRE(dump.header.array_names == std::vector<std::string>{"PRES", "TR", "RHO"});
        REQUIRE(dump.ireg == std::vector<std::uint32_t>{1, 1, 2});
        REQUIRE(dump.globals.size() == GLOBAL_SCALAR_COUNT);
    }

    SECTION("arrays before the unsupported one are kept") {
        REQUIRE(dump.arrays.size() == 1);
        REQUIRE(dump.arrays.at("PRES") == fixture::generated_array("PRES", 3, 5.0));
        REQUIRE(dump.arrays.count("TR") == 0);
        REQUIRE(dump.arrays.count("RHO") == 0);
    }
}

TEST_CASE("Failed dump leaves the output untouched", "[decoder]") {
    auto bytes = encode(fixture::make_dump(1.0, 3));

    PacketReader reader(bytes.data(), bytes.size() - 8);
    Dump dump;
    dump.header.cycle = 99;
    REQUIRE(decode_dump(reader, dump) == Error::StreamExhausted);
    REQUIRE(dump.header.cycle == 99);
    REQUIRE(dump.arrays.empty());
}

TEST_CASE("Decoding is deterministic with NaN values", "[decoder]") {
    DumpRecipe recipe = fixture::make_dump(1.0);
    recipe.globals[0] = std::numeric_limits<double>::quiet_NaN();
    recipe.arrays["PRES"] = {1.0, std::numeric_limits<double>::quiet_NaN(), 3.0};
    auto bytes = encode(recipe);

    PacketReader first_reader(bytes.data(), bytes.size());
    PacketReader second_reader(bytes.data(), bytes.size());
    Dump first;
    Dump second;
    REQUIRE(decode_dump(first_reader, first) == Error::Ok);
    REQUIRE(decode_dump(second_reader, second) == Error::Ok);
    REQUIRE(std::isnan(first.globals[0]));

    REQUIRE(first == second);

    SECTION("a different bit pattern is not equal") {
        second.globals[0] = -second.globals[0];
        REQUIRE_FALSE(first == second);
    }
}

TEST_CASE("Truncated dump reports stream exhausted", "[decoder]") {
    auto bytes = encode(fixture::make_dump(1.0));

    for (std::size_t cut : {std::size_t{0}, std::size_t{3}, std::size_t{40}, bytes.size() / 2,
                            bytes.size() - 1}) {
        PacketReader reader(bytes.data(), cut);
        Dump dump;
        REQUIRE(decode_dump(reader, dump) == Error::StreamExhausted);
    }
}
