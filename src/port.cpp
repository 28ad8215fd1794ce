#include "qcsr/error.hpp"
#include "qcsr/port.hpp"

namespace qcsr {

// =============================================================================
// Opening
// =============================================================================

auto open_for_read(const std::filesystem::path& path, const options_t& options) -> port_t {
    auto file = std::make_unique<std::fstream>(path, std::ios::in | std::ios::binary);
    if (!file->is_open()) {
        throw io_error("cannot open '" + path.string() + "' for reading");
    }
    auto* is = static_cast<std::istream*>(file.get());
    auto port = port_t(port_mode::read, std::move(file), is, nullptr, path.string(), options);
    port.begin_read();
    return port;
}

auto open_for_read(std::istream& is, const options_t& options) -> port_t {
    auto port = port_t(port_mode::read, nullptr, &is, nullptr, "<stream>", options);
    port.begin_read();
    return port;
}

auto open_for_write(const std::filesystem::path& path, const options_t& options) -> port_t {
    auto file = std::make_unique<std::fstream>(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file->is_open()) {
        throw io_error("cannot open '" + path.string() + "' for writing");
    }
    auto* os = static_cast<std::ostream*>(file.get());
    auto port = port_t(port_mode::write, std::move(file), nullptr, os, path.string(), options);
    port.begin_write();
    return port;
}

auto open_for_write(std::ostream& os, const options_t& options) -> port_t {
    auto port = port_t(port_mode::write, nullptr, nullptr, &os, "<stream>", options);
    port.begin_write();
    return port;
}

// =============================================================================
// Construction and lifetime
// =============================================================================

port_t::port_t(port_mode mode,
               std::unique_ptr<std::fstream> owned,
               std::istream* is,
               std::ostream* os,
               std::string description,
               const options_t& options)
    : mode_(mode)
    , owned_(std::move(owned))
    , is_(is)
    , os_(os)
    , description_(std::move(description))
    , options_(options)
{
    owns_ = owned_ != nullptr;
    if (!options_.log_file.empty()) {
        logger_.open(options_.log_file);
    }
}

port_t::~port_t() {
    release();
}

port_t::port_t(port_t&& other) noexcept
    : mode_(other.mode_)
    , owned_(std::move(other.owned_))
    , is_(other.is_)
    , os_(other.os_)
    , description_(std::move(other.description_))
    , options_(std::move(other.options_))
    , logger_(std::move(other.logger_))
    , header_(other.header_)
    , first_chunk_(other.first_chunk_)
    , bytes_written_(other.bytes_written_)
    , owns_(other.owns_)
    , open_(other.open_)
{
    other.is_ = nullptr;
    other.os_ = nullptr;
    other.open_ = false;
}

auto port_t::operator=(port_t&& other) noexcept -> port_t& {
    if (this != &other) {
        release();
        mode_ = other.mode_;
        owned_ = std::move(other.owned_);
        is_ = other.is_;
        os_ = other.os_;
        description_ = std::move(other.description_);
        options_ = std::move(other.options_);
        logger_ = std::move(other.logger_);
        header_ = other.header_;
        first_chunk_ = other.first_chunk_;
        bytes_written_ = other.bytes_written_;
        owns_ = other.owns_;
        open_ = other.open_;
        other.is_ = nullptr;
        other.os_ = nullptr;
        other.open_ = false;
    }
    return *this;
}

void port_t::begin_read() {
    header_ = decode_header(*is_);
    if (options_.validate_header) {
        check_header(header_);
    }
    first_chunk_ = is_->tellg();
    logger_.log("open " + description_ + " for read (version " + std::to_string(header_.version) + ")");
}

void port_t::begin_write() {
    bytes_written_ = encode_header(*os_);
    header_.magic = binary_format::MAGIC;
    header_.version = binary_format::VERSION;
    first_chunk_ = os_->tellp();
    logger_.log("open " + description_ + " for write");
}

void port_t::require_readable(const char* operation) const {
    if (!open_) {
        throw io_error(std::string("cannot ") + operation + ": port is closed");
    }
    if (mode_ != port_mode::read) {
        throw argument_error(std::string("cannot ") + operation + ": port is open for write");
    }
}

void port_t::require_writable(const char* operation) const {
    if (!open_) {
        throw io_error(std::string("cannot ") + operation + ": port is closed");
    }
    if (mode_ != port_mode::write) {
        throw argument_error(std::string("cannot ") + operation + ": port is open for read");
    }
}

// =============================================================================
// Positioning
// =============================================================================

auto port_t::eof() -> bool {
    require_readable("query end of stream");
    return is_->peek() == std::char_traits<char>::eof();
}

void port_t::seek_start() {
    if (!open_) {
        throw io_error("cannot seek: port is closed");
    }
    if (first_chunk_ == std::streampos(-1)) {
        throw io_error("cannot seek: " + description_ + " is not seekable");
    }
    if (mode_ == port_mode::read) {
        is_->clear();
        is_->seekg(first_chunk_);
        if (!*is_) throw io_error("failed to seek to start of " + description_);
    } else {
        os_->seekp(first_chunk_);
        if (!*os_) throw io_error("failed to seek to start of " + description_);
    }
}

void port_t::seek_end() {
    if (!open_) {
        throw io_error("cannot seek: port is closed");
    }
    if (mode_ == port_mode::read) {
        is_->clear();
        is_->seekg(0, std::ios::end);
        if (!*is_) throw io_error("failed to seek to end of " + description_);
    } else {
        os_->seekp(0, std::ios::end);
        if (!*os_) throw io_error("failed to seek to end of " + description_);
    }
}

void port_t::flush() {
    if (!open_ || mode_ != port_mode::write) {
        return;
    }
    os_->flush();
    if (!*os_) {
        throw io_error("failed to flush " + description_);
    }
}

void port_t::close() {
    if (!open_) {
        return;
    }
    auto flushed = true;
    if (mode_ == port_mode::write) {
        os_->flush();
        flushed = static_cast<bool>(*os_);
    }
    release();
    logger_.log("close " + description_);
    if (!flushed) {
        throw io_error("failed to flush " + description_ + " on close");
    }
}

void port_t::release() noexcept {
    if (!open_) {
        return;
    }
    if (owned_) {
        owned_->close();
        owned_.reset();
    }
    is_ = nullptr;
    os_ = nullptr;
    open_ = false;
}

// =============================================================================
// Chunk I/O
// =============================================================================

void port_t::after_write(uint64_t n) {
    bytes_written_ += n;
    if (options_.flush_each_chunk) {
        flush();
    }
}

auto port_t::write(const chunk_t& chunk) -> uint64_t {
    require_writable("write");
    auto n = encode_chunk(*os_, chunk);
    after_write(n);
    return n;
}

auto port_t::write(const std::vector<chunk_t>& chunks) -> uint64_t {
    auto total = uint64_t{0};
    auto index = std::size_t{0};
    try {
        for (const auto& chunk : chunks) {
            total += write(chunk);
            ++index;
        }
    } catch (const std::exception& e) {
        logger_.log("write failed at chunk " + std::to_string(index) + ": " + e.what());
        throw;
    }
    logger_.log("wrote " + std::to_string(chunks.size()) + " chunks (" + std::to_string(total) + " bytes)");
    return total;
}

auto port_t::read() -> chunk_t {
    require_readable("read");
    return decode_chunk(*is_);
}

auto port_t::read(std::size_t n) -> std::vector<chunk_t> {
    auto result = std::vector<chunk_t>{};
    try {
        for (std::size_t i = 0; i < n; ++i) {
            if (eof()) {
                throw io_error(
                    "expected " + std::to_string(n) + " chunks, " +
                    description_ + " ended after " + std::to_string(i));
            }
            result.push_back(read());
        }
    } catch (const std::exception& e) {
        logger_.log(std::string("read failed: ") + e.what());
        throw;
    }
    logger_.log("read " + std::to_string(n) + " chunks");
    return result;
}

auto port_t::read_all() -> std::vector<chunk_t> {
    auto result = std::vector<chunk_t>{};
    try {
        while (!eof()) {
            result.push_back(read());
        }
    } catch (const std::exception& e) {
        logger_.log("read failed at chunk " + std::to_string(result.size()) + ": " + e.what());
        throw;
    }
    logger_.log("read " + std::to_string(result.size()) + " chunks");
    return result;
}

} // namespace qcsr
