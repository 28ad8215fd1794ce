#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "chunk.hpp"
#include "config.hpp"
#include "header.hpp"
#include "log.hpp"

namespace qcsr {

// =============================================================================
// Streaming port
// =============================================================================
//
// An open handle over a byte stream. Opening for write emits the header;
// opening for read consumes it. After that the port reads or writes one
// chunk at a time, so a file never has to fit in memory.
//
// A port opened from a path owns the file and closes it exactly once (on
// close(), or on destruction). A port opened over a caller's stream borrows
// it and never closes it.
//
// =============================================================================

enum class port_mode {
    read,
    write,
};

inline auto to_string(port_mode mode) -> const char* {
    switch (mode) {
        case port_mode::read:  return "read";
        case port_mode::write: return "write";
    }
    return "unknown";
}

class port_t;

auto open_for_read(const std::filesystem::path& path, const options_t& options = {}) -> port_t;
auto open_for_read(std::istream& is, const options_t& options = {}) -> port_t;
auto open_for_write(const std::filesystem::path& path, const options_t& options = {}) -> port_t;
auto open_for_write(std::ostream& os, const options_t& options = {}) -> port_t;

class port_t {
public:
    ~port_t();

    port_t(const port_t&) = delete;
    auto operator=(const port_t&) -> port_t& = delete;
    port_t(port_t&& other) noexcept;
    auto operator=(port_t&& other) noexcept -> port_t&;

    // --- State ---

    auto mode() const -> port_mode { return mode_; }
    auto is_readable() const -> bool { return open_ && mode_ == port_mode::read; }
    auto is_writable() const -> bool { return open_ && mode_ == port_mode::write; }
    auto is_open() const -> bool { return open_; }
    auto owns_stream() const -> bool { return owns_; }
    auto header() const -> const header_t& { return header_; }
    auto bytes_written() const -> uint64_t { return bytes_written_; }
    auto logger() -> logger_t& { return logger_; }

    // --- Positioning ---

    // True when no further byte can be read; read ports only
    auto eof() -> bool;

    // Rewinds to the first chunk, just past the header
    void seek_start();
    void seek_end();

    void flush();

    // Flushes a write port and closes the stream if this port owns it.
    // Calling close() again is a no-op.
    void close();

    // Closes without flushing or reporting; used while unwinding
    void release() noexcept;

    // --- Writing ---

    auto write(const chunk_t& chunk) -> uint64_t;

    template<Scalar T>
    auto write(const bitmask_t& mask, const T& value) -> uint64_t {
        require_writable("write");
        auto n = encode_chunk(*os_, mask, value);
        after_write(n);
        return n;
    }

    // Stops at the first failing chunk; bytes already written stay written
    auto write(const std::vector<chunk_t>& chunks) -> uint64_t;

    template<Scalar T>
    auto write(const std::vector<typed_chunk_t<T>>& chunks) -> uint64_t {
        auto total = uint64_t{0};
        for (const auto& chunk : chunks) {
            total += write(chunk.mask, chunk.value);
        }
        logger_.log("wrote " + std::to_string(chunks.size()) + " chunks (" + std::to_string(total) + " bytes)");
        return total;
    }

    // --- Reading ---

    auto read() -> chunk_t;

    // Throws type_mismatch_error if the next chunk is not of kind T
    template<Scalar T>
    auto read_as() -> typed_chunk_t<T> {
        require_readable("read");
        return decode_chunk_as<T>(*is_);
    }

    // Exactly n chunks; io_error if the stream ends first
    auto read(std::size_t n) -> std::vector<chunk_t>;

    // Every remaining chunk, in stream order
    auto read_all() -> std::vector<chunk_t>;

    template<Scalar T>
    auto read_all_as() -> std::vector<typed_chunk_t<T>> {
        auto result = std::vector<typed_chunk_t<T>>{};
        while (!eof()) {
            result.push_back(read_as<T>());
        }
        logger_.log("read " + std::to_string(result.size()) + " chunks of " + to_string(kind_of_type<T>()));
        return result;
    }

    friend auto open_for_read(const std::filesystem::path& path, const options_t& options) -> port_t;
    friend auto open_for_read(std::istream& is, const options_t& options) -> port_t;
    friend auto open_for_write(const std::filesystem::path& path, const options_t& options) -> port_t;
    friend auto open_for_write(std::ostream& os, const options_t& options) -> port_t;

private:
    port_t(port_mode mode,
           std::unique_ptr<std::fstream> owned,
           std::istream* is,
           std::ostream* os,
           std::string description,
           const options_t& options);

    port_mode mode_;
    std::unique_ptr<std::fstream> owned_;
    std::istream* is_ = nullptr;
    std::ostream* os_ = nullptr;
    std::string description_;
    options_t options_;
    logger_t logger_;
    header_t header_;
    std::streampos first_chunk_ = std::streampos(-1);
    uint64_t bytes_written_ = 0;
    bool owns_ = false;
    bool open_ = true;

    void begin_read();
    void begin_write();
    void require_readable(const char* operation) const;
    void require_writable(const char* operation) const;
    void after_write(uint64_t n);
};

// =============================================================================
// Scoped acquisition
// =============================================================================
//
// Opens a port, hands it to `body`, and closes it on every exit path. If the
// body throws, the port is released and the original exception propagates.
//
// =============================================================================

namespace detail {

template<typename Body>
auto run_scoped(port_t& port, Body&& body) {
    using result_t = std::invoke_result_t<Body, port_t&>;
    try {
        if constexpr (std::is_void_v<result_t>) {
            std::invoke(std::forward<Body>(body), port);
            port.close();
        } else {
            auto result = std::invoke(std::forward<Body>(body), port);
            port.close();
            return result;
        }
    } catch (...) {
        port.release();
        throw;
    }
}

} // namespace detail

template<typename Source, typename Body>
auto with_read_port(Source&& source, Body&& body, const options_t& options = {}) {
    auto port = open_for_read(std::forward<Source>(source), options);
    return detail::run_scoped(port, std::forward<Body>(body));
}

template<typename Destination, typename Body>
auto with_write_port(Destination&& destination, Body&& body, const options_t& options = {}) {
    auto port = open_for_write(std::forward<Destination>(destination), options);
    return detail::run_scoped(port, std::forward<Body>(body));
}

} // namespace qcsr
