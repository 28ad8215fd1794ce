#pragma once

#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace qcsr {

// =============================================================================
// Scalar kinds
// =============================================================================
//
// The closed set of value types a chunk may carry. Enumerator order is the
// order of the alternatives in scalar_t, and of the on-disk tags 1..14.
//
// =============================================================================

enum class scalar_kind : uint8_t {
    boolean,
    character,
    uint8,
    uint16,
    uint32,
    uint64,
    int8,
    int16,
    int32,
    int64,
    float32,
    float64,
    complex64,
    complex128,
};

constexpr std::size_t scalar_kind_count = 14;

// =============================================================================
// Type tag registry
// =============================================================================

// Throws argument_error for an enumerator outside the 14 kinds
auto tag_of(scalar_kind kind) -> uint8_t;

// Throws type_mismatch_error for any byte outside 1..14
auto kind_of(uint8_t tag) -> scalar_kind;

// On-disk width in bytes; pinned by the format, independent of sizeof
auto width_of(scalar_kind kind) -> std::size_t;

auto to_string(scalar_kind kind) -> const char*;
auto from_string(std::type_identity<scalar_kind>, const std::string& s) -> scalar_kind;

// =============================================================================
// Compile-time mapping from C++ types to kinds
// =============================================================================

// Only the 14 supported types carry a kind
template<typename T>
struct scalar_traits {};

template<> struct scalar_traits<bool> {
    static constexpr auto kind = scalar_kind::boolean;
    static constexpr std::size_t width = 1;
};

template<> struct scalar_traits<char> {
    static constexpr auto kind = scalar_kind::character;
    static constexpr std::size_t width = 1;
};

template<> struct scalar_traits<uint8_t> {
    static constexpr auto kind = scalar_kind::uint8;
    static constexpr std::size_t width = 1;
};

template<> struct scalar_traits<uint16_t> {
    static constexpr auto kind = scalar_kind::uint16;
    static constexpr std::size_t width = 2;
};

template<> struct scalar_traits<uint32_t> {
    static constexpr auto kind = scalar_kind::uint32;
    static constexpr std::size_t width = 4;
};

template<> struct scalar_traits<uint64_t> {
    static constexpr auto kind = scalar_kind::uint64;
    static constexpr std::size_t width = 8;
};

template<> struct scalar_traits<int8_t> {
    static constexpr auto kind = scalar_kind::int8;
    static constexpr std::size_t width = 1;
};

template<> struct scalar_traits<int16_t> {
    static constexpr auto kind = scalar_kind::int16;
    static constexpr std::size_t width = 2;
};

template<> struct scalar_traits<int32_t> {
    static constexpr auto kind = scalar_kind::int32;
    static constexpr std::size_t width = 4;
};

template<> struct scalar_traits<int64_t> {
    static constexpr auto kind = scalar_kind::int64;
    static constexpr std::size_t width = 8;
};

template<> struct scalar_traits<float> {
    static constexpr auto kind = scalar_kind::float32;
    static constexpr std::size_t width = 4;
};

template<> struct scalar_traits<double> {
    static constexpr auto kind = scalar_kind::float64;
    static constexpr std::size_t width = 8;
};

template<> struct scalar_traits<std::complex<float>> {
    static constexpr auto kind = scalar_kind::complex64;
    static constexpr std::size_t width = 8;
};

template<> struct scalar_traits<std::complex<double>> {
    static constexpr auto kind = scalar_kind::complex128;
    static constexpr std::size_t width = 16;
};

template<typename T>
concept Scalar = requires {
    { scalar_traits<T>::kind } -> std::convertible_to<scalar_kind>;
};

template<Scalar T>
constexpr auto kind_of_type() -> scalar_kind {
    return scalar_traits<T>::kind;
}

// =============================================================================
// scalar_t - a value of any supported kind
// =============================================================================

using scalar_t = std::variant<
    bool,
    char,
    uint8_t,
    uint16_t,
    uint32_t,
    uint64_t,
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    float,
    double,
    std::complex<float>,
    std::complex<double>>;

static_assert(std::variant_size_v<scalar_t> == scalar_kind_count);

inline auto kind_of_value(const scalar_t& value) -> scalar_kind {
    return std::visit([](const auto& v) {
        return kind_of_type<std::decay_t<decltype(v)>>();
    }, value);
}

} // namespace qcsr
