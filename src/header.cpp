#include "qcsr/header.hpp"
#include "qcsr/binary_reader.hpp"
#include "qcsr/binary_writer.hpp"
#include "qcsr/error.hpp"

namespace qcsr {

namespace {

void check_magic(const std::array<uint8_t, 8>& magic) {
    if (magic != binary_format::MAGIC) {
        throw format_error("Not a valid QCSR stream: bad magic number");
    }
}

void check_version(uint32_t version) {
    if (version > binary_format::VERSION) {
        throw version_error(
            "Unsupported QCSR version " + std::to_string(version) +
            " (newest supported is " + std::to_string(binary_format::VERSION) + ")");
    }
}

} // anonymous namespace

auto encode_header(std::ostream& os) -> uint64_t {
    binary_writer::write_bytes(
        os, reinterpret_cast<const char*>(binary_format::MAGIC.data()), binary_format::MAGIC.size());
    binary_writer::write_raw<uint32_t>(os, binary_format::VERSION);
    binary_writer::write_raw<uint32_t>(os, 0);
    binary_writer::write_zeros(os, binary_format::HEADER_RESERVED_BYTES);
    return binary_format::HEADER_SIZE;
}

auto decode_header(std::istream& is) -> header_t {
    auto header = header_t{};
    binary_reader::read_bytes(is, reinterpret_cast<char*>(header.magic.data()), header.magic.size());
    header.version = binary_reader::read_raw<uint32_t>(is);
    binary_reader::skip_bytes(is, binary_format::HEADER_RESERVED_WORD);
    binary_reader::skip_bytes(is, binary_format::HEADER_RESERVED_BYTES);
    return header;
}

void check_header(
    scalar_kind expected,
    const std::array<uint8_t, 8>& magic,
    uint32_t version,
    uint8_t dtype)
{
    check_magic(magic);
    if (dtype != tag_of(expected)) {
        throw type_mismatch_error(
            std::string("Incompatible data type: expected ") + to_string(expected) +
            " (tag " + std::to_string(tag_of(expected)) + "), found tag " + std::to_string(dtype));
    }
    check_version(version);
}

void check_header(const header_t& header) {
    check_magic(header.magic);
    check_version(header.version);
}

} // namespace qcsr
