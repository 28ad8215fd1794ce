#pragma once

#include <fstream>
#include <optional>
#include <ostream>
#include <string>

namespace qcsr {

// =============================================================================
// logger_t - optional line-oriented log sink
// =============================================================================
//
// Disabled until a file is opened or a stream is attached. Each message is
// written as one line and flushed immediately.
//
// =============================================================================

class logger_t {
public:
    logger_t() = default;
    explicit logger_t(std::ostream& os) : stream_(&os) {}

    logger_t(const logger_t&) = delete;
    auto operator=(const logger_t&) -> logger_t& = delete;
    logger_t(logger_t&& other) noexcept;
    auto operator=(logger_t&& other) noexcept -> logger_t&;

    // Appends to `filename`; throws io_error if it cannot be opened
    void open(const std::string& filename);
    void attach(std::ostream& os);
    void detach();

    auto enabled() const -> bool { return stream_ != nullptr; }

    void log(const std::string& message);

private:
    std::optional<std::ofstream> file_;
    std::ostream* stream_ = nullptr;
};

} // namespace qcsr
