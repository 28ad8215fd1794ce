#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <utility>
#include <variant>
#include <vector>
#include "binary_reader.hpp"
#include "binary_writer.hpp"
#include "scalar.hpp"

namespace qcsr {

// =============================================================================
// Chunk types
// =============================================================================

using bitmask_t = std::vector<bool>;

// One (mask, value) record of any scalar kind
struct chunk_t {
    bitmask_t mask;
    scalar_t value;

    auto kind() const -> scalar_kind { return kind_of_value(value); }

    bool operator==(const chunk_t&) const = default;
};

// A chunk whose scalar kind is known at compile time
template<Scalar T>
struct typed_chunk_t {
    bitmask_t mask;
    T value{};

    operator chunk_t() const {
        return chunk_t{mask, scalar_t(std::in_place_type<T>, value)};
    }

    bool operator==(const typed_chunk_t&) const = default;
};

template<Scalar T>
auto make_chunk(bitmask_t mask, const T& value) -> chunk_t {
    return chunk_t{std::move(mask), scalar_t(std::in_place_type<T>, value)};
}

// Bytes encode_chunk produces for this chunk
auto encoded_size(const chunk_t& chunk) -> uint64_t;

// =============================================================================
// Chunk codec
// =============================================================================
//
// Per chunk: uint64 mask length L, uint8 type tag, 7 pad bytes, L mask bytes
// (0x00/0x01, one per element), then the value in its fixed-width
// little-endian layout. Total: 16 + L + width bytes.
//
// =============================================================================

namespace detail {

struct prologue_t {
    uint64_t length;
    scalar_kind kind;
};

auto encode_prologue(std::ostream& os, const bitmask_t& mask, scalar_kind kind) -> uint64_t;
auto decode_prologue(std::istream& is) -> prologue_t;
auto decode_mask(std::istream& is, uint64_t length) -> bitmask_t;
auto decode_value(std::istream& is, scalar_kind kind) -> scalar_t;
void expect_kind(scalar_kind expected, scalar_kind found);

} // namespace detail

template<Scalar T>
auto encode_chunk(std::ostream& os, const bitmask_t& mask, const T& value) -> uint64_t {
    auto total = detail::encode_prologue(os, mask, kind_of_type<T>());
    total += binary_writer::write_scalar(os, value);
    return total;
}

auto encode_chunk(std::ostream& os, const chunk_t& chunk) -> uint64_t;

// Reads one chunk of whatever kind the tag names
auto decode_chunk(std::istream& is) -> chunk_t;

// Throws type_mismatch_error if the stored kind is not `expected`
auto decode_chunk(std::istream& is, scalar_kind expected) -> chunk_t;

template<Scalar T>
auto decode_chunk_as(std::istream& is) -> typed_chunk_t<T> {
    auto prologue = detail::decode_prologue(is);
    detail::expect_kind(kind_of_type<T>(), prologue.kind);
    auto result = typed_chunk_t<T>{};
    result.mask = detail::decode_mask(is, prologue.length);
    result.value = binary_reader::read_scalar<T>(is);
    return result;
}

} // namespace qcsr
