#include "qcsr/error.hpp"
#include "qcsr/log.hpp"

namespace qcsr {

logger_t::logger_t(logger_t&& other) noexcept
    : file_(std::move(other.file_))
    , stream_(file_ ? &*file_ : other.stream_)
{
    other.file_.reset();
    other.stream_ = nullptr;
}

auto logger_t::operator=(logger_t&& other) noexcept -> logger_t& {
    if (this != &other) {
        file_ = std::move(other.file_);
        stream_ = file_ ? &*file_ : other.stream_;
        other.file_.reset();
        other.stream_ = nullptr;
    }
    return *this;
}

void logger_t::open(const std::string& filename) {
    file_.emplace(filename, std::ios::app);
    if (!*file_) {
        file_.reset();
        stream_ = nullptr;
        throw io_error("Failed to open log file " + filename);
    }
    stream_ = &*file_;
}

void logger_t::attach(std::ostream& os) {
    file_.reset();
    stream_ = &os;
}

void logger_t::detach() {
    file_.reset();
    stream_ = nullptr;
}

void logger_t::log(const std::string& message) {
    if (stream_) {
        *stream_ << message << "\n";
        stream_->flush();
    }
}

} // namespace qcsr
