/**
 * @file packet_reader.cpp
 * @brief PacketReader compilation unit.
 *
 * PacketReader is implemented in the header so its typed reads can be
 * inlined into the decoder. This unit checks that the header compiles on
 * its own.
 *
 * @see include/ppf/packet_reader.hpp for the full implementation
 */

#include <ppf/packet_reader.hpp>

// All implementation is in the header (inline and template functions)
