/**
 * @file array_table.cpp
 * @brief Array table compilation unit.
 *
 * The name table and lookup are constexpr and live in the header.
 *
 * @see include/ppf/array_table.hpp for the full implementation
 */

#include <ppf/array_table.hpp>

namespace ppf {

static_assert(std::get<KnownArray>(lookup_array("RCM")).element_count(10) == 12);
static_assert(std::holds_alternative<UnsupportedArray>(lookup_array("ZZZ")));

} // namespace ppf
