#pragma once

#include <bit>
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <type_traits>
#include "error.hpp"
#include "scalar.hpp"

namespace qcsr {

// =============================================================================
// Little-endian primitives (read side)
// =============================================================================
//
// A read that returns fewer bytes than requested is a short read and raises
// io_error; the stream is left in its failed state for the caller to inspect.
//
// =============================================================================

namespace binary_reader {

inline void read_bytes(std::istream& is, char* data, std::size_t count) {
    if (count == 0) {
        return;
    }
    is.read(data, static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(is.gcount()) != count) {
        throw io_error(
            "Unexpected end of stream: wanted " + std::to_string(count) +
            " bytes, got " + std::to_string(is.gcount()));
    }
}

// Consumes bytes without interpreting them; works on non-seekable streams
inline void skip_bytes(std::istream& is, std::size_t count) {
    if (count == 0) {
        return;
    }
    is.ignore(static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(is.gcount()) != count) {
        throw io_error(
            "Unexpected end of stream while skipping " + std::to_string(count) + " bytes");
    }
}

template<std::unsigned_integral U>
auto read_raw(std::istream& is) -> U {
    unsigned char bytes[sizeof(U)];
    read_bytes(is, reinterpret_cast<char*>(bytes), sizeof(U));
    U value = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        value = static_cast<U>(value | (static_cast<U>(bytes[i]) << (8 * i)));
    }
    return value;
}

template<Scalar T>
auto read_scalar(std::istream& is) -> T {
    if constexpr (std::is_same_v<T, bool>) {
        return read_raw<uint8_t>(is) != 0;
    } else if constexpr (std::is_same_v<T, char>) {
        return static_cast<char>(read_raw<uint8_t>(is));
    } else if constexpr (std::is_same_v<T, float>) {
        return std::bit_cast<float>(read_raw<uint32_t>(is));
    } else if constexpr (std::is_same_v<T, double>) {
        return std::bit_cast<double>(read_raw<uint64_t>(is));
    } else if constexpr (std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>) {
        using part_t = typename T::value_type;
        auto re = read_scalar<part_t>(is);
        auto im = read_scalar<part_t>(is);
        return T(re, im);
    } else if constexpr (std::is_signed_v<T>) {
        return static_cast<T>(read_raw<std::make_unsigned_t<T>>(is));
    } else {
        return read_raw<T>(is);
    }
}

} // namespace binary_reader

} // namespace qcsr
