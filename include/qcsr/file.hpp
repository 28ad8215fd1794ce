#pragma once

// Whole-file save and load, composed from the streaming port.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <utility>
#include <vector>
#include "binary_format.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "port.hpp"

namespace qcsr {

constexpr const char* extension = binary_format::EXTENSION;

auto has_qcsr_extension(const std::filesystem::path& path) -> bool;

// Writes the header and every chunk; returns total bytes including the header
auto save(const std::filesystem::path& destination, const std::vector<chunk_t>& chunks, const options_t& options = {}) -> uint64_t;
auto save(std::ostream& destination, const std::vector<chunk_t>& chunks, const options_t& options = {}) -> uint64_t;

// Reads every chunk up to end of stream
auto load(const std::filesystem::path& source, const options_t& options = {}) -> std::vector<chunk_t>;
auto load(std::istream& source, const options_t& options = {}) -> std::vector<chunk_t>;

// Reads exactly n chunks from the start of the stream
auto load(const std::filesystem::path& source, std::size_t n, const options_t& options = {}) -> std::vector<chunk_t>;
auto load(std::istream& source, std::size_t n, const options_t& options = {}) -> std::vector<chunk_t>;

template<Scalar T, typename Destination>
auto save(Destination&& destination, const std::vector<typed_chunk_t<T>>& chunks, const options_t& options = {}) -> uint64_t {
    return with_write_port(std::forward<Destination>(destination), [&chunks](port_t& port) {
        port.write(chunks);
        return port.bytes_written();
    }, options);
}

// Throws type_mismatch_error at the first chunk that is not of kind T
template<Scalar T, typename Source>
auto load_as(Source&& source, const options_t& options = {}) -> std::vector<typed_chunk_t<T>> {
    return with_read_port(std::forward<Source>(source), [](port_t& port) {
        return port.read_all_as<T>();
    }, options);
}

} // namespace qcsr
