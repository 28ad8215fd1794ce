#include <algorithm>
#include "qcsr/binary_format.hpp"
#include "qcsr/chunk.hpp"
#include "qcsr/error.hpp"

namespace qcsr {

namespace {

constexpr std::size_t mask_block_size = 4096;

template<std::size_t I = 0>
auto read_alternative(std::istream& is, std::size_t index) -> scalar_t {
    if constexpr (I < std::variant_size_v<scalar_t>) {
        if (index == I) {
            using value_t = std::variant_alternative_t<I, scalar_t>;
            return scalar_t(std::in_place_index<I>, binary_reader::read_scalar<value_t>(is));
        }
        return read_alternative<I + 1>(is, index);
    } else {
        throw argument_error("No scalar alternative for kind index " + std::to_string(index));
    }
}

} // anonymous namespace

namespace detail {

auto encode_prologue(std::ostream& os, const bitmask_t& mask, scalar_kind kind) -> uint64_t {
    binary_writer::write_raw<uint64_t>(os, mask.size());
    binary_writer::write_raw<uint8_t>(os, tag_of(kind));
    binary_writer::write_zeros(os, binary_format::CHUNK_TAG_PADDING);

    char buffer[mask_block_size];
    std::size_t filled = 0;
    for (bool bit : mask) {
        buffer[filled++] = static_cast<char>(bit ? binary_format::MASK_TRUE : binary_format::MASK_FALSE);
        if (filled == mask_block_size) {
            binary_writer::write_bytes(os, buffer, filled);
            filled = 0;
        }
    }
    binary_writer::write_bytes(os, buffer, filled);

    return binary_format::CHUNK_PROLOGUE_SIZE + mask.size();
}

auto decode_prologue(std::istream& is) -> prologue_t {
    auto length = binary_reader::read_raw<uint64_t>(is);
    auto kind = kind_of(binary_reader::read_raw<uint8_t>(is));
    binary_reader::skip_bytes(is, binary_format::CHUNK_TAG_PADDING);
    return {length, kind};
}

// Reads in bounded blocks: a corrupt length field ends in a short read
// rather than one enormous allocation.
auto decode_mask(std::istream& is, uint64_t length) -> bitmask_t {
    auto mask = bitmask_t{};
    char buffer[mask_block_size];
    auto remaining = length;
    while (remaining > 0) {
        auto n = static_cast<std::size_t>(std::min<uint64_t>(remaining, mask_block_size));
        binary_reader::read_bytes(is, buffer, n);
        for (std::size_t i = 0; i < n; ++i) {
            mask.push_back(buffer[i] != 0);
        }
        remaining -= n;
    }
    return mask;
}

auto decode_value(std::istream& is, scalar_kind kind) -> scalar_t {
    return read_alternative(is, static_cast<std::size_t>(kind));
}

void expect_kind(scalar_kind expected, scalar_kind found) {
    if (expected != found) {
        throw type_mismatch_error(
            std::string("Incompatible data type: expected ") + to_string(expected) +
            ", found " + to_string(found));
    }
}

} // namespace detail

auto encoded_size(const chunk_t& chunk) -> uint64_t {
    return binary_format::CHUNK_PROLOGUE_SIZE + chunk.mask.size() + width_of(chunk.kind());
}

auto encode_chunk(std::ostream& os, const chunk_t& chunk) -> uint64_t {
    return std::visit([&](const auto& value) {
        return encode_chunk(os, chunk.mask, value);
    }, chunk.value);
}

auto decode_chunk(std::istream& is) -> chunk_t {
    auto prologue = detail::decode_prologue(is);
    auto result = chunk_t{};
    result.mask = detail::decode_mask(is, prologue.length);
    result.value = detail::decode_value(is, prologue.kind);
    return result;
}

auto decode_chunk(std::istream& is, scalar_kind expected) -> chunk_t {
    auto prologue = detail::decode_prologue(is);
    detail::expect_kind(expected, prologue.kind);
    auto result = chunk_t{};
    result.mask = detail::decode_mask(is, prologue.length);
    result.value = detail::decode_value(is, prologue.kind);
    return result;
}

} // namespace qcsr
