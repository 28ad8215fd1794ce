#pragma once

// Wire-format constants for QCSR streams.

#include <array>
#include <cstddef>
#include <cstdint>

namespace qcsr {

// =============================================================================
// Binary format constants
// =============================================================================
//
// File layout, little-endian throughout:
// - Header (32 bytes): magic (8) + uint32 version + uint32 reserved + 16 reserved
// - Chunks, repeated until end of stream:
//   uint64 mask length L + uint8 type tag + 7 pad bytes + L mask bytes + value
//
// Reserved and pad bytes are written as zero and never interpreted on read.
//
// =============================================================================

namespace binary_format {

constexpr std::array<uint8_t, 8> MAGIC = {0x51, 0x43, 0x53, 0x52, 0x00, 0x00, 0x00, 0x00};  // "QCSR"
constexpr uint32_t VERSION = 1;

constexpr std::size_t HEADER_SIZE = 32;
constexpr std::size_t HEADER_RESERVED_WORD = 4;
constexpr std::size_t HEADER_RESERVED_BYTES = 16;

constexpr std::size_t CHUNK_TAG_PADDING = 7;
constexpr std::size_t CHUNK_PROLOGUE_SIZE = 8 + 1 + CHUNK_TAG_PADDING;

constexpr uint8_t MASK_FALSE = 0x00;
constexpr uint8_t MASK_TRUE  = 0x01;

constexpr const char* EXTENSION = ".qcsr";

static_assert(MAGIC.size() + 4 + HEADER_RESERVED_WORD + HEADER_RESERVED_BYTES == HEADER_SIZE);
static_assert(CHUNK_PROLOGUE_SIZE == 16);

} // namespace binary_format

} // namespace qcsr
