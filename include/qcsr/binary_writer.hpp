#pragma once

#include <bit>
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include "error.hpp"
#include "scalar.hpp"

namespace qcsr {

// =============================================================================
// Little-endian primitives (write side)
// =============================================================================
//
// Values are laid out byte by byte so the stream is little-endian whatever
// the host byte order. Any stream failure raises io_error.
//
// =============================================================================

namespace binary_writer {

inline void write_bytes(std::ostream& os, const char* data, std::size_t count) {
    if (count == 0) {
        return;
    }
    os.write(data, static_cast<std::streamsize>(count));
    if (!os) {
        throw io_error("Failed to write " + std::to_string(count) + " bytes to stream");
    }
}

inline void write_zeros(std::ostream& os, std::size_t count) {
    constexpr std::size_t block = 16;
    const char zeros[block] = {};
    while (count > 0) {
        auto n = count < block ? count : block;
        write_bytes(os, zeros, n);
        count -= n;
    }
}

template<std::unsigned_integral U>
void write_raw(std::ostream& os, U value) {
    char bytes[sizeof(U)];
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        bytes[i] = static_cast<char>(static_cast<uint8_t>((value >> (8 * i)) & 0xFFu));
    }
    write_bytes(os, bytes, sizeof(U));
}

// Writes the fixed-width encoding of one scalar; returns scalar_traits<T>::width
template<Scalar T>
auto write_scalar(std::ostream& os, const T& value) -> std::size_t {
    if constexpr (std::is_same_v<T, bool>) {
        write_raw<uint8_t>(os, value ? 1 : 0);
    } else if constexpr (std::is_same_v<T, char>) {
        write_raw(os, static_cast<uint8_t>(value));
    } else if constexpr (std::is_same_v<T, float>) {
        write_raw(os, std::bit_cast<uint32_t>(value));
    } else if constexpr (std::is_same_v<T, double>) {
        write_raw(os, std::bit_cast<uint64_t>(value));
    } else if constexpr (std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>) {
        write_scalar(os, value.real());
        write_scalar(os, value.imag());
    } else if constexpr (std::is_signed_v<T>) {
        write_raw(os, static_cast<std::make_unsigned_t<T>>(value));
    } else {
        write_raw(os, value);
    }
    return scalar_traits<T>::width;
}

} // namespace binary_writer

} // namespace qcsr
