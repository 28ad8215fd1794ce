#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <ostream>
#include "binary_format.hpp"
#include "scalar.hpp"

namespace qcsr {

// =============================================================================
// File header (32-byte prologue)
// =============================================================================

struct header_t {
    std::array<uint8_t, 8> magic = {};
    uint32_t version = 0;

    bool operator==(const header_t&) const = default;
};

// Writes magic, version and zeroed reserved fields; returns the byte count (32)
auto encode_header(std::ostream& os) -> uint64_t;

// Reads the 32-byte prologue. Reserved fields are consumed but not
// interpreted, so values placed there by a newer writer are tolerated.
auto decode_header(std::istream& is) -> header_t;

// Throws format_error on bad magic, type_mismatch_error if dtype is not the
// tag of `expected`, and version_error if the version is newer than ours.
void check_header(
    scalar_kind expected,
    const std::array<uint8_t, 8>& magic,
    uint32_t version,
    uint8_t dtype);

// Magic and version checks only
void check_header(const header_t& header);

} // namespace qcsr
