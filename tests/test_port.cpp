#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>
#include "qcsr/error.hpp"
#include "qcsr/file.hpp"
#include "qcsr/port.hpp"
#include "test_helpers.hpp"

using namespace qcsr;

// =============================================================================
// Test fixtures
// =============================================================================

auto binary_stream() -> std::stringstream {
    return std::stringstream(std::ios::binary | std::ios::in | std::ios::out);
}

auto sample_chunks() -> std::vector<chunk_t> {
    return {
        make_chunk(bitmask_t{true, false, true, true}, int32_t{-17}),
        make_chunk(bitmask_t{}, 2.5),
        make_chunk(bitmask_t{false, true}, std::complex<float>(1.0f, -1.0f)),
    };
}

// Accepts `limit` bytes, then reports failure for every further byte
class limited_buffer_t : public std::streambuf {
public:
    explicit limited_buffer_t(std::size_t limit) : limit_(limit) {}

    auto size() const -> std::size_t { return data_.size(); }

protected:
    auto overflow(int_type ch) -> int_type override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        if (data_.size() >= limit_) {
            return traits_type::eof();
        }
        data_.push_back(traits_type::to_char_type(ch));
        return ch;
    }

private:
    std::size_t limit_;
    std::string data_;
};

struct body_failure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Writing and reading
// =============================================================================

void test_write_then_read() {
    auto ss = binary_stream();
    auto chunks = sample_chunks();

    auto writer = open_for_write(ss);
    assert(writer.is_writable());
    assert(!writer.is_readable());
    assert(!writer.owns_stream());
    assert(writer.bytes_written() == 32);

    auto total = writer.write(chunks);
    assert(total == encoded_size(chunks[0]) + encoded_size(chunks[1]) + encoded_size(chunks[2]));
    assert(writer.bytes_written() == 32 + total);
    writer.close();
    assert(ss.str().size() == 32 + total);

    auto reader = open_for_read(ss);
    assert(reader.is_readable());
    assert(reader.header().version == 1);
    assert(reader.read() == chunks[0]);
    assert(reader.read() == chunks[1]);
    assert(reader.read() == chunks[2]);
    assert(reader.eof());

    std::cout << "test_write_then_read: PASSED\n";
}

void test_typed_write_and_read() {
    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    writer.write(bitmask_t{true}, uint16_t{65535});
    writer.write(std::vector<typed_chunk_t<uint16_t>>{
        {bitmask_t{false}, 1},
        {bitmask_t{}, 2},
    });
    writer.close();

    auto reader = open_for_read(ss);
    auto first = reader.read_as<uint16_t>();
    assert(first.value == 65535);
    auto rest = reader.read_all_as<uint16_t>();
    assert(rest.size() == 2);
    assert(rest[0].value == 1 && rest[1].value == 2);

    auto again = binary_stream();
    auto w = open_for_write(again);
    w.write(bitmask_t{}, 1.5f);
    w.close();
    auto r = open_for_read(again);
    assert(throws<type_mismatch_error>([&] { r.read_as<double>(); }));

    std::cout << "test_typed_write_and_read: PASSED\n";
}

void test_read_exactly_n() {
    auto ss = binary_stream();
    auto chunks = sample_chunks();
    auto writer = open_for_write(ss);
    writer.write(chunks);
    writer.close();

    auto reader = open_for_read(ss);
    auto two = reader.read(2);
    assert(two.size() == 2);
    assert(two[0] == chunks[0] && two[1] == chunks[1]);
    assert(throws<io_error>([&] { reader.read(2); }));

    ss.clear();
    ss.seekg(0);
    auto fresh = open_for_read(ss);
    assert(fresh.read(0).empty());

    std::cout << "test_read_exactly_n: PASSED\n";
}

void test_read_all_preserves_order() {
    auto rng = std::mt19937_64(7);
    auto chunks = std::vector<chunk_t>{};
    for (int i = 0; i < 50; ++i) {
        chunks.push_back(random_chunk(rng));
    }

    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    writer.write(chunks);
    writer.close();

    auto reader = open_for_read(ss);
    assert(reader.read_all() == chunks);
    assert(reader.eof());
    assert(reader.read_all().empty());

    std::cout << "test_read_all_preserves_order: PASSED\n";
}

void test_header_only_stream() {
    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    writer.close();
    assert(ss.str().size() == 32);

    auto reader = open_for_read(ss);
    assert(reader.eof());
    assert(reader.read_all().empty());

    std::cout << "test_header_only_stream: PASSED\n";
}

// =============================================================================
// Positioning
// =============================================================================

void test_seek_on_read() {
    auto ss = binary_stream();
    auto chunks = sample_chunks();
    auto writer = open_for_write(ss);
    writer.write(chunks);
    writer.close();

    auto reader = open_for_read(ss);
    assert(reader.read_all().size() == 3);
    assert(reader.eof());

    reader.seek_start();
    assert(!reader.eof());
    assert(reader.read() == chunks[0]);

    reader.seek_end();
    assert(reader.eof());

    std::cout << "test_seek_on_read: PASSED\n";
}

void test_seek_start_on_write_overwrites() {
    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    writer.write(bitmask_t{true, true}, int32_t{1});
    writer.write(bitmask_t{false}, int8_t{2});

    writer.seek_start();
    writer.write(bitmask_t{false, false}, int32_t{99});
    writer.seek_end();
    writer.close();

    auto reader = open_for_read(ss);
    auto chunks = reader.read_all();
    assert(chunks.size() == 2);
    assert(std::get<int32_t>(chunks[0].value) == 99);
    assert((chunks[0].mask == bitmask_t{false, false}));
    assert(std::get<int8_t>(chunks[1].value) == 2);

    std::cout << "test_seek_start_on_write_overwrites: PASSED\n";
}

// =============================================================================
// Ownership and lifetime
// =============================================================================

void test_borrowed_stream_stays_open() {
    auto path = temp_path("borrowed.qcsr");
    {
        auto file = std::fstream(path, std::ios::out | std::ios::binary);
        auto port = open_for_write(file);
        assert(!port.owns_stream());
        port.write(bitmask_t{true}, 'a');
        port.close();
        assert(!port.is_open());
        assert(file.is_open());

        port.close();
        assert(file.is_open());
        file.close();
    }
    {
        auto file = std::ifstream(path, std::ios::binary);
        auto port = open_for_read(file);
        assert(std::get<char>(port.read().value) == 'a');
        port.close();
        assert(file.is_open());
    }
    std::filesystem::remove(path);

    std::cout << "test_borrowed_stream_stays_open: PASSED\n";
}

void test_owned_file_closed_once() {
    auto path = temp_path("owned.qcsr");
    auto port = open_for_write(path);
    assert(port.owns_stream());
    port.write(bitmask_t{false, true}, uint64_t{123});
    assert(port.bytes_written() == 32 + 16 + 2 + 8);
    port.close();
    assert(!port.is_open());
    assert(port.owns_stream());

    // Every byte is on disk once the port lets go of the file
    assert(std::filesystem::file_size(path) == port.bytes_written());

    port.close();
    assert(std::filesystem::file_size(path) == port.bytes_written());

    auto reader = open_for_read(path);
    assert(reader.owns_stream());
    auto chunks = reader.read_all();
    assert(chunks.size() == 1);
    assert(std::get<uint64_t>(chunks[0].value) == 123);
    reader.close();
    reader.close();

    // The closed reader no longer holds the file, so it can be replaced
    assert(std::filesystem::remove(path));
    {
        auto replacement = std::ofstream(path, std::ios::binary);
        assert(replacement.is_open());
    }
    assert(std::filesystem::file_size(path) == 0);
    std::filesystem::remove(path);

    std::cout << "test_owned_file_closed_once: PASSED\n";
}

void test_missing_path() {
    auto path = temp_path("does_not_exist/nothing.qcsr");
    assert(throws<io_error>([&] { open_for_read(path); }));
    assert(throws<io_error>([&] { open_for_write(path); }));

    std::cout << "test_missing_path: PASSED\n";
}

void test_move_transfers_ownership() {
    auto ss = binary_stream();
    auto a = open_for_write(ss);
    auto b = std::move(a);
    assert(!a.is_open());
    assert(b.is_writable());
    b.write(bitmask_t{}, true);
    b.close();

    auto reader = open_for_read(ss);
    assert(std::get<bool>(reader.read().value) == true);

    std::cout << "test_move_transfers_ownership: PASSED\n";
}

void test_wrong_mode_operations() {
    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    assert(throws<argument_error>([&] { writer.read(); }));
    assert(throws<argument_error>([&] { writer.eof(); }));
    writer.close();
    assert(throws<io_error>([&] { writer.write(bitmask_t{}, 1.0); }));

    auto reader = open_for_read(ss);
    assert(throws<argument_error>([&] { reader.write(bitmask_t{}, 1.0); }));
    reader.flush();
    reader.close();
    assert(throws<io_error>([&] { reader.read(); }));

    std::cout << "test_wrong_mode_operations: PASSED\n";
}

// =============================================================================
// Failures
// =============================================================================

void test_write_sequence_stops_at_failure() {
    auto chunk = make_chunk(bitmask_t{true, false, true, false}, int32_t{5});
    auto chunk_size = encoded_size(chunk);
    auto limit = 32 + chunk_size + 10;

    auto buffer = limited_buffer_t(limit);
    auto os = std::ostream(&buffer);
    auto writer = open_for_write(os);

    auto chunks = std::vector<chunk_t>{chunk, chunk, chunk};
    assert(throws<io_error>([&] { writer.write(chunks); }));
    assert(buffer.size() == limit);
    assert(writer.bytes_written() == 32 + chunk_size);

    std::cout << "test_write_sequence_stops_at_failure: PASSED\n";
}

void test_truncated_stream_aborts_bulk_read() {
    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    writer.write(sample_chunks());
    writer.close();

    auto bytes = ss.str();
    auto truncated = std::istringstream(bytes.substr(0, bytes.size() - 3));
    auto reader = open_for_read(truncated);
    assert(throws<io_error>([&] { reader.read_all(); }));

    std::cout << "test_truncated_stream_aborts_bulk_read: PASSED\n";
}

void test_header_validation_option() {
    auto bytes = std::string(32, '\0');
    bytes.replace(0, 4, "NOPE");

    // The default reader skips the header without checking it
    auto lenient = std::istringstream(bytes);
    auto port = open_for_read(lenient);
    assert(port.eof());

    auto options = options_t{};
    options.validate_header = true;
    auto strict = std::istringstream(bytes);
    assert(throws<format_error>([&] { open_for_read(strict, options); }));

    auto newer = std::string(32, '\0');
    newer.replace(0, 4, "QCSR");
    newer[8] = 2;
    auto future = std::istringstream(newer);
    assert(throws<version_error>([&] { open_for_read(future, options); }));

    std::cout << "test_header_validation_option: PASSED\n";
}

// =============================================================================
// Scoped acquisition
// =============================================================================

void test_scoped_helpers_return_body_result() {
    auto ss = binary_stream();
    auto written = with_write_port(ss, [](port_t& port) {
        return port.write(sample_chunks());
    });
    assert(written + 32 == ss.str().size());

    auto count = with_read_port(ss, [](port_t& port) {
        return port.read_all().size();
    });
    assert(count == 3);

    std::cout << "test_scoped_helpers_return_body_result: PASSED\n";
}

void test_scoped_helpers_close_on_failure() {
    auto path = temp_path("scoped.qcsr");

    auto message = std::string{};
    try {
        with_write_port(path, [](port_t& port) {
            port.write(bitmask_t{true}, int32_t{1});
            throw body_failure("body failed");
        });
    } catch (const body_failure& e) {
        message = e.what();
    }
    assert(message == "body failed");

    // The file was closed on the way out, so the chunk written before the
    // failure is on disk.
    auto chunks = load(path);
    assert(chunks.size() == 1);
    assert(std::get<int32_t>(chunks[0].value) == 1);

    message.clear();
    try {
        with_read_port(path, [](port_t& port) -> std::size_t {
            port.read();
            throw body_failure("read body failed");
        });
    } catch (const body_failure& e) {
        message = e.what();
    }
    assert(message == "read body failed");

    std::filesystem::remove(path);

    std::cout << "test_scoped_helpers_close_on_failure: PASSED\n";
}

// =============================================================================
// Logging
// =============================================================================

void test_log_file_option() {
    auto log_path = temp_path("port.log");
    std::filesystem::remove(log_path);

    auto options = options_t{};
    options.log_file = log_path.string();

    auto ss = binary_stream();
    {
        auto port = open_for_write(ss, options);
        port.write(sample_chunks());
        port.close();
    }

    auto file = std::ifstream(log_path);
    auto contents = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    assert(contents.find("open <stream> for write") != std::string::npos);
    assert(contents.find("wrote 3 chunks") != std::string::npos);
    assert(contents.find("close <stream>") != std::string::npos);
    file.close();

    std::filesystem::remove(log_path);

    std::cout << "test_log_file_option: PASSED\n";
}

void test_attached_logger() {
    auto ss = binary_stream();
    auto writer = open_for_write(ss);
    writer.write(sample_chunks());
    writer.close();

    auto log = std::ostringstream{};
    auto truncated = std::istringstream(ss.str().substr(0, ss.str().size() - 1));
    auto reader = open_for_read(truncated);
    reader.logger().attach(log);
    assert(throws<io_error>([&] { reader.read_all(); }));
    assert(log.str().find("read failed at chunk 2") != std::string::npos);

    std::cout << "test_attached_logger: PASSED\n";
}

int main() {
    std::cout << "=== Writing and Reading ===\n\n";

    test_write_then_read();
    test_typed_write_and_read();
    test_read_exactly_n();
    test_read_all_preserves_order();
    test_header_only_stream();

    std::cout << "\n=== Positioning ===\n\n";

    test_seek_on_read();
    test_seek_start_on_write_overwrites();

    std::cout << "\n=== Ownership ===\n\n";

    test_borrowed_stream_stays_open();
    test_owned_file_closed_once();
    test_missing_path();
    test_move_transfers_ownership();
    test_wrong_mode_operations();

    std::cout << "\n=== Failures ===\n\n";

    test_write_sequence_stops_at_failure();
    test_truncated_stream_aborts_bulk_read();
    test_header_validation_option();

    std::cout << "\n=== Scoped Acquisition ===\n\n";

    test_scoped_helpers_return_body_result();
    test_scoped_helpers_close_on_failure();

    std::cout << "\n=== Logging ===\n\n";

    test_log_file_option();
    test_attached_logger();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
