#pragma once

// Port options and the key = value text format they are read from.

#include <filesystem>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include "error.hpp"

namespace qcsr {

// =============================================================================
// options_t - per-port behaviour
// =============================================================================
//
// Text form:
//
//   qcsr {
//       validate_header = 1     # reject bad magic / newer versions on open
//       flush_each_chunk = 0    # flush the stream after every chunk written
//       log_file = "qcsr.log"   # append port activity here; empty disables
//   }
//
// Missing keys keep their defaults. Other top-level groups are skipped.
//
// =============================================================================

struct options_t {
    bool validate_header = false;
    bool flush_each_chunk = false;
    std::string log_file;
};

namespace config {

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename T>
concept HasConstFields = requires(const T& t) {
    { fields(t) };
};

// Accepts 1/0/true/false; `key` names the setting in the error message
auto parse_bool(const std::string& key, const std::string& text) -> bool;

// ============================================================================
// ascii_sink - writes one `name { key = value }` group
// ============================================================================

class ascii_sink {
public:
    explicit ascii_sink(std::ostream& stream) : os(stream) {}

    void begin_named(const char* name) { pending_name = name; }
    void write(bool value);
    void write(const std::string& value);
    void begin_group();
    void end_group();

private:
    std::ostream& os;
    const char* pending_name = nullptr;
    bool in_group = false;

    void write_key();
};

// ============================================================================
// ascii_source - finds one top-level group and looks fields up by key
// ============================================================================
//
// begin_group() scans the stream for the pending group name and collects its
// `key = value` entries. Reads of absent keys return false.
//
// ============================================================================

class ascii_source {
public:
    struct entry_t {
        std::string text;
        bool quoted = false;
    };

    explicit ascii_source(std::istream& stream) : is(stream) {}

    void begin_named(const char* name) { pending_name = name; }
    auto read(bool& value) -> bool;
    auto read(std::string& value) -> bool;
    auto begin_group() -> bool;
    void end_group() { entries.clear(); }

private:
    std::istream& is;
    const char* pending_name = nullptr;
    std::map<std::string, entry_t> entries;

    auto take_pending(std::string& key) -> const entry_t*;
};

// ============================================================================
// read / write free functions
// ============================================================================

template <typename Sink>
void write(Sink& sink, bool value) {
    sink.write(value);
}

template <typename Sink>
void write(Sink& sink, const std::string& value) {
    sink.write(value);
}

template <typename Sink, typename T>
    requires HasConstFields<T>
void write(Sink& sink, const T& value) {
    sink.begin_group();
    std::apply([&sink](auto&&... f) {
        (write(sink, f.first, f.second), ...);
    }, fields(value));
    sink.end_group();
}

template <typename Sink, typename T>
void write(Sink& sink, const char* name, const T& value) {
    sink.begin_named(name);
    write(sink, value);
}

template <typename Source>
auto read(Source& source, bool& value) -> bool {
    return source.read(value);
}

template <typename Source>
auto read(Source& source, std::string& value) -> bool {
    return source.read(value);
}

template <typename Source, typename T>
    requires HasFields<T>
auto read(Source& source, T& value) -> bool {
    if (!source.begin_group()) return false;
    std::apply([&source](auto&&... f) {
        (read(source, f.first, f.second), ...);
    }, fields(value));
    source.end_group();
    return true;
}

template <typename Source, typename T>
auto read(Source& source, const char* name, T& value) -> bool {
    source.begin_named(name);
    return read(source, value);
}

} // namespace config

inline auto fields(const options_t& o) {
    return std::make_tuple(
        config::field("validate_header", o.validate_header),
        config::field("flush_each_chunk", o.flush_each_chunk),
        config::field("log_file", o.log_file)
    );
}

inline auto fields(options_t& o) {
    return std::make_tuple(
        config::field("validate_header", o.validate_header),
        config::field("flush_each_chunk", o.flush_each_chunk),
        config::field("log_file", o.log_file)
    );
}

// Reads the `qcsr { ... }` group; a stream without one yields the defaults
auto read_options(std::istream& is) -> options_t;

// Throws io_error if the file cannot be opened
auto load_options(const std::filesystem::path& path) -> options_t;

void write_options(std::ostream& os, const options_t& options);

// Overrides one option by key from its text form, e.g. ("log_file", "a.log")
void set_option(options_t& options, const std::string& key, const std::string& value);

// Applies a command-line `key=value` override
void apply_override(options_t& options, const std::string& assignment);

} // namespace qcsr
