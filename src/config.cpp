#include <cctype>
#include <fstream>
#include "qcsr/config.hpp"

namespace qcsr {

namespace {

constexpr const char* group_name = "qcsr";

enum class token_kind {
    word,
    string,
    open,
    close,
    equals,
    end,
};

struct token_t {
    token_kind kind;
    std::string text;
};

class lexer_t {
public:
    explicit lexer_t(std::istream& is) : is_(is) {}

    auto next() -> token_t {
        skip_blank();
        if (at_eof()) {
            return {token_kind::end, ""};
        }
        auto c = static_cast<char>(is_.peek());
        switch (c) {
            case '{': is_.get(); return {token_kind::open, "{"};
            case '}': is_.get(); return {token_kind::close, "}"};
            case '=': is_.get(); return {token_kind::equals, "="};
            case '"': return {token_kind::string, read_quoted()};
            default: break;
        }
        auto word = std::string{};
        while (!at_eof() && !is_delimiter(static_cast<char>(is_.peek()))) {
            word += static_cast<char>(is_.get());
        }
        return {token_kind::word, word};
    }

private:
    std::istream& is_;

    auto at_eof() -> bool {
        return is_.peek() == std::char_traits<char>::eof();
    }

    static auto is_delimiter(char c) -> bool {
        return std::isspace(static_cast<unsigned char>(c)) || c == '{' || c == '}' || c == '=' || c == '"' || c == '#';
    }

    void skip_blank() {
        while (!at_eof()) {
            auto c = static_cast<char>(is_.peek());
            if (std::isspace(static_cast<unsigned char>(c))) {
                is_.get();
            } else if (c == '#') {
                while (!at_eof() && is_.get() != '\n') {}
            } else {
                break;
            }
        }
    }

    auto read_quoted() -> std::string {
        is_.get();
        auto result = std::string{};
        while (true) {
            if (at_eof()) {
                throw config_error("unterminated string");
            }
            auto c = static_cast<char>(is_.get());
            if (c == '"') {
                return result;
            }
            if (c == '\\') {
                if (at_eof()) {
                    throw config_error("unterminated string");
                }
                switch (auto next = static_cast<char>(is_.get())) {
                    case 'n': result += '\n'; break;
                    case 't': result += '\t'; break;
                    default:  result += next; break;
                }
            } else {
                result += c;
            }
        }
    }
};

auto read_value(lexer_t& lexer, const std::string& key) -> config::ascii_source::entry_t {
    auto value = lexer.next();
    if (value.kind == token_kind::word) {
        return {value.text, false};
    }
    if (value.kind == token_kind::string) {
        return {value.text, true};
    }
    throw config_error("missing value for " + key);
}

// Reads `key = value` lines up to the closing brace of the current group
void read_entries(lexer_t& lexer, std::map<std::string, config::ascii_source::entry_t>& entries) {
    while (true) {
        auto key = lexer.next();
        if (key.kind == token_kind::close) {
            return;
        }
        if (key.kind == token_kind::end) {
            throw config_error("unterminated group");
        }
        if (key.kind != token_kind::word) {
            throw config_error("expected a key, found '" + key.text + "'");
        }
        if (lexer.next().kind != token_kind::equals) {
            throw config_error("expected '=' after " + key.text);
        }
        entries[key.text] = read_value(lexer, key.text);
    }
}

auto escape(const std::string& s) -> std::string {
    auto result = std::string{};
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c; break;
        }
    }
    return result;
}

} // anonymous namespace

namespace config {

auto parse_bool(const std::string& key, const std::string& text) -> bool {
    if (text == "1" || text == "true") return true;
    if (text == "0" || text == "false") return false;
    throw config_error("invalid boolean for " + key + ": " + text);
}

// =============================================================================
// ascii_sink
// =============================================================================

void ascii_sink::write_key() {
    if (in_group) {
        os << "    ";
    }
    if (pending_name) {
        os << pending_name << " = ";
        pending_name = nullptr;
    }
}

void ascii_sink::write(bool value) {
    write_key();
    os << (value ? 1 : 0) << "\n";
}

void ascii_sink::write(const std::string& value) {
    write_key();
    os << "\"" << escape(value) << "\"\n";
}

void ascii_sink::begin_group() {
    if (pending_name) {
        os << pending_name << " ";
        pending_name = nullptr;
    }
    os << "{\n";
    in_group = true;
}

void ascii_sink::end_group() {
    os << "}\n";
    in_group = false;
}

// =============================================================================
// ascii_source
// =============================================================================

auto ascii_source::begin_group() -> bool {
    auto name = std::string(pending_name ? pending_name : "");
    pending_name = nullptr;
    entries.clear();

    auto lexer = lexer_t(is);
    while (true) {
        auto key = lexer.next();
        if (key.kind == token_kind::end) {
            return false;
        }
        if (key.kind != token_kind::word) {
            throw config_error("expected a name, found '" + key.text + "'");
        }
        auto next = lexer.next();
        if (next.kind == token_kind::equals) {
            read_value(lexer, key.text);
        } else if (next.kind == token_kind::open) {
            if (key.text == name) {
                read_entries(lexer, entries);
                return true;
            }
            auto ignored = std::map<std::string, entry_t>{};
            read_entries(lexer, ignored);
        } else {
            throw config_error("expected '=' or '{' after " + key.text);
        }
    }
}

auto ascii_source::take_pending(std::string& key) -> const entry_t* {
    if (!pending_name) {
        return nullptr;
    }
    key = pending_name;
    pending_name = nullptr;
    auto it = entries.find(key);
    return it == entries.end() ? nullptr : &it->second;
}

auto ascii_source::read(bool& value) -> bool {
    auto key = std::string{};
    auto entry = take_pending(key);
    if (!entry) return false;
    if (entry->quoted) {
        throw config_error("expected a boolean for " + key + ", found a string");
    }
    value = parse_bool(key, entry->text);
    return true;
}

auto ascii_source::read(std::string& value) -> bool {
    auto key = std::string{};
    auto entry = take_pending(key);
    if (!entry) return false;
    if (!entry->quoted) {
        throw config_error("expected a quoted string for " + key);
    }
    value = entry->text;
    return true;
}

} // namespace config

// =============================================================================
// Options
// =============================================================================

auto read_options(std::istream& is) -> options_t {
    auto options = options_t{};
    auto source = config::ascii_source(is);
    config::read(source, group_name, options);
    return options;
}

auto load_options(const std::filesystem::path& path) -> options_t {
    auto file = std::ifstream(path);
    if (!file) {
        throw io_error("cannot open config file '" + path.string() + "'");
    }
    return read_options(file);
}

void write_options(std::ostream& os, const options_t& options) {
    auto sink = config::ascii_sink(os);
    config::write(sink, group_name, options);
}

void set_option(options_t& options, const std::string& key, const std::string& value) {
    if (key == "validate_header") {
        options.validate_header = config::parse_bool(key, value);
    } else if (key == "flush_each_chunk") {
        options.flush_each_chunk = config::parse_bool(key, value);
    } else if (key == "log_file") {
        options.log_file = value;
    } else {
        throw config_error("unknown option: " + key);
    }
}

void apply_override(options_t& options, const std::string& assignment) {
    auto split = assignment.find('=');
    if (split == std::string::npos || split == 0) {
        throw config_error("expected key=value, got '" + assignment + "'");
    }
    set_option(options, assignment.substr(0, split), assignment.substr(split + 1));
}

} // namespace qcsr
