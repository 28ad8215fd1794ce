#include <array>
#include <utility>
#include <variant>
#include "qcsr/error.hpp"
#include "qcsr/scalar.hpp"

namespace qcsr {

namespace {

struct kind_info_t {
    scalar_kind kind;
    uint8_t tag;
    std::size_t width;
    const char* name;
};

// Indexed by scalar_kind; the tag column is the on-disk byte
constexpr std::array<kind_info_t, scalar_kind_count> kind_table = {{
    {scalar_kind::boolean,     1,  1, "bool"},
    {scalar_kind::character,   2,  1, "char"},
    {scalar_kind::uint8,       3,  1, "uint8"},
    {scalar_kind::uint16,      4,  2, "uint16"},
    {scalar_kind::uint32,      5,  4, "uint32"},
    {scalar_kind::uint64,      6,  8, "uint64"},
    {scalar_kind::int8,        7,  1, "int8"},
    {scalar_kind::int16,       8,  2, "int16"},
    {scalar_kind::int32,       9,  4, "int32"},
    {scalar_kind::int64,      10,  8, "int64"},
    {scalar_kind::float32,    11,  4, "float32"},
    {scalar_kind::float64,    12,  8, "float64"},
    {scalar_kind::complex64,  13,  8, "complex64"},
    {scalar_kind::complex128, 14, 16, "complex128"},
}};

// Indexed by tag - 1
constexpr std::array<scalar_kind, scalar_kind_count> tag_table = {
    scalar_kind::boolean,
    scalar_kind::character,
    scalar_kind::uint8,
    scalar_kind::uint16,
    scalar_kind::uint32,
    scalar_kind::uint64,
    scalar_kind::int8,
    scalar_kind::int16,
    scalar_kind::int32,
    scalar_kind::int64,
    scalar_kind::float32,
    scalar_kind::float64,
    scalar_kind::complex64,
    scalar_kind::complex128,
};

constexpr auto tables_agree() -> bool {
    for (std::size_t i = 0; i < scalar_kind_count; ++i) {
        const auto& info = kind_table[i];
        if (static_cast<std::size_t>(info.kind) != i) return false;
        if (tag_table[info.tag - 1] != info.kind) return false;
    }
    return true;
}

static_assert(tables_agree(), "kind and tag tables must be inverse");

template<std::size_t... I>
constexpr auto traits_agree(std::index_sequence<I...>) -> bool {
    return ((static_cast<std::size_t>(scalar_traits<std::variant_alternative_t<I, scalar_t>>::kind) == I &&
             scalar_traits<std::variant_alternative_t<I, scalar_t>>::width == kind_table[I].width) && ...);
}

static_assert(traits_agree(std::make_index_sequence<scalar_kind_count>{}),
              "scalar_t alternatives must follow scalar_kind order and on-disk widths");

auto info_of(scalar_kind kind) -> const kind_info_t& {
    auto index = static_cast<std::size_t>(kind);
    if (index >= scalar_kind_count) {
        throw argument_error(
            "Bad conversion: scalar kind " + std::to_string(index) +
            " does not correspond to any QCSR data type");
    }
    return kind_table[index];
}

} // anonymous namespace

auto tag_of(scalar_kind kind) -> uint8_t {
    return info_of(kind).tag;
}

auto kind_of(uint8_t tag) -> scalar_kind {
    if (tag < 1 || tag > scalar_kind_count) {
        throw type_mismatch_error("Unknown QCSR data type tag " + std::to_string(tag));
    }
    return tag_table[tag - 1];
}

auto width_of(scalar_kind kind) -> std::size_t {
    return info_of(kind).width;
}

auto to_string(scalar_kind kind) -> const char* {
    auto index = static_cast<std::size_t>(kind);
    if (index >= scalar_kind_count) {
        return "unknown";
    }
    return kind_table[index].name;
}

auto from_string(std::type_identity<scalar_kind>, const std::string& s) -> scalar_kind {
    for (const auto& info : kind_table) {
        if (s == info.name) {
            return info.kind;
        }
    }
    throw argument_error("unknown scalar kind: " + s);
}

} // namespace qcsr
