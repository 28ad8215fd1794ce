#include <cassert>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include "qcsr/binary_format.hpp"
#include "qcsr/error.hpp"
#include "qcsr/header.hpp"
#include "test_helpers.hpp"

using namespace qcsr;

auto make_header_bytes(uint32_t version, uint8_t reserved_fill) -> std::string {
    auto bytes = std::string(binary_format::HEADER_SIZE, static_cast<char>(reserved_fill));
    std::memcpy(bytes.data(), binary_format::MAGIC.data(), binary_format::MAGIC.size());
    for (int i = 0; i < 4; ++i) {
        bytes[8 + i] = static_cast<char>((version >> (8 * i)) & 0xFF);
    }
    return bytes;
}

void test_encode_layout() {
    auto ss = std::stringstream(std::ios::binary | std::ios::in | std::ios::out);
    auto n = encode_header(ss);
    assert(n == 32);

    auto bytes = bytes_of(ss.str());
    assert(bytes.size() == 32);

    const uint8_t expected[32] = {
        0x51, 0x43, 0x53, 0x52, 0x00, 0x00, 0x00, 0x00,  // magic
        0x01, 0x00, 0x00, 0x00,                          // version
        0x00, 0x00, 0x00, 0x00,                          // reserved word
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,  // reserved bytes
    };
    for (std::size_t i = 0; i < 32; ++i) {
        assert(bytes[i] == expected[i]);
    }

    std::cout << "test_encode_layout: PASSED\n";
}

void test_decode_round_trip() {
    auto ss = std::stringstream(std::ios::binary | std::ios::in | std::ios::out);
    encode_header(ss);

    auto header = decode_header(ss);
    assert(header.magic == binary_format::MAGIC);
    assert(header.version == binary_format::VERSION);
    assert(ss.tellg() == std::streampos(32));

    check_header(header);
    check_header(scalar_kind::float64, header.magic, header.version, tag_of(scalar_kind::float64));

    std::cout << "test_decode_round_trip: PASSED\n";
}

void test_reserved_bytes_ignored() {
    auto ss = std::istringstream(make_header_bytes(1, 0xFF));
    auto header = decode_header(ss);
    assert(header.version == 1);
    check_header(header);
    check_header(scalar_kind::int32, header.magic, header.version, 9);

    std::cout << "test_reserved_bytes_ignored: PASSED\n";
}

void test_bad_magic() {
    auto bytes = make_header_bytes(1, 0x00);
    bytes[0] = 'X';
    auto ss = std::istringstream(bytes);
    auto header = decode_header(ss);

    assert(throws<format_error>([&] { check_header(header); }));
    assert(throws<format_error>([&] {
        check_header(scalar_kind::uint8, header.magic, header.version, 3);
    }));

    // Magic is checked before the data type
    assert(throws<format_error>([&] {
        check_header(scalar_kind::uint8, header.magic, header.version, 4);
    }));

    std::cout << "test_bad_magic: PASSED\n";
}

void test_newer_version_rejected() {
    auto ss = std::istringstream(make_header_bytes(2, 0x00));
    auto header = decode_header(ss);
    assert(header.version == 2);
    assert(throws<version_error>([&] { check_header(header); }));

    auto old = std::istringstream(make_header_bytes(0, 0x00));
    check_header(decode_header(old));

    std::cout << "test_newer_version_rejected: PASSED\n";
}

void test_dtype_mismatch() {
    auto ss = std::istringstream(make_header_bytes(1, 0x00));
    auto header = decode_header(ss);
    assert(throws<type_mismatch_error>([&] {
        check_header(scalar_kind::float32, header.magic, header.version, tag_of(scalar_kind::float64));
    }));

    std::cout << "test_dtype_mismatch: PASSED\n";
}

void test_truncated_header() {
    auto bytes = make_header_bytes(1, 0x00);
    bytes.resize(20);
    auto ss = std::istringstream(bytes);
    assert(throws<io_error>([&] { decode_header(ss); }));

    auto empty = std::istringstream(std::string{});
    assert(throws<io_error>([&] { decode_header(empty); }));

    std::cout << "test_truncated_header: PASSED\n";
}

int main() {
    std::cout << "=== Header Codec ===\n\n";

    test_encode_layout();
    test_decode_round_trip();
    test_reserved_bytes_ignored();
    test_bad_magic();
    test_newer_version_rejected();
    test_dtype_mismatch();
    test_truncated_header();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
