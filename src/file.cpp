#include "qcsr/file.hpp"

namespace qcsr {

namespace {

template<typename Destination>
auto save_impl(Destination& destination, const std::vector<chunk_t>& chunks, const options_t& options) -> uint64_t {
    return with_write_port(destination, [&chunks](port_t& port) {
        port.write(chunks);
        return port.bytes_written();
    }, options);
}

template<typename Source>
auto load_impl(Source& source, const options_t& options) -> std::vector<chunk_t> {
    return with_read_port(source, [](port_t& port) {
        return port.read_all();
    }, options);
}

template<typename Source>
auto load_impl(Source& source, std::size_t n, const options_t& options) -> std::vector<chunk_t> {
    return with_read_port(source, [n](port_t& port) {
        return port.read(n);
    }, options);
}

} // anonymous namespace

auto has_qcsr_extension(const std::filesystem::path& path) -> bool {
    return path.extension() == extension;
}

auto save(const std::filesystem::path& destination, const std::vector<chunk_t>& chunks, const options_t& options) -> uint64_t {
    return save_impl(destination, chunks, options);
}

auto save(std::ostream& destination, const std::vector<chunk_t>& chunks, const options_t& options) -> uint64_t {
    return save_impl(destination, chunks, options);
}

auto load(const std::filesystem::path& source, const options_t& options) -> std::vector<chunk_t> {
    return load_impl(source, options);
}

auto load(std::istream& source, const options_t& options) -> std::vector<chunk_t> {
    return load_impl(source, options);
}

auto load(const std::filesystem::path& source, std::size_t n, const options_t& options) -> std::vector<chunk_t> {
    return load_impl(source, n, options);
}

auto load(std::istream& source, std::size_t n, const options_t& options) -> std::vector<chunk_t> {
    return load_impl(source, n, options);
}

} // namespace qcsr
