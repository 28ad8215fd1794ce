#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include "qcsr/qcsr.hpp"

using namespace qcsr;

// =============================================================================
// Value formatting
// =============================================================================

auto format_value(const scalar_t& value) -> std::string {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        auto oss = std::ostringstream{};
        oss << std::setprecision(17);
        if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, char>) {
            oss << "'" << v << "'";
        } else if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, int8_t>) {
            oss << static_cast<int>(v);
        } else if constexpr (std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>) {
            oss << v.real() << (v.imag() < 0 ? " - " : " + ") << std::abs(v.imag()) << "i";
        } else {
            oss << v;
        }
        return oss.str();
    }, value);
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.qcsr> [config_file] [key=value ...]\n";
        return 1;
    }

    try {
        // A config file comes first; key=value arguments override it
        auto options = options_t{};
        for (int i = 2; i < argc; ++i) {
            auto arg = std::string(argv[i]);
            if (arg.find('=') != std::string::npos) {
                apply_override(options, arg);
            } else if (i == 2) {
                options = load_options(arg);
            } else {
                std::cerr << "Unexpected argument '" << arg << "'\n";
                return 1;
            }
        }

        if (!has_qcsr_extension(argv[1])) {
            std::cerr << "Warning: '" << argv[1] << "' does not have a " << extension << " extension\n";
        }

        with_read_port(std::filesystem::path(argv[1]), [](port_t& port) {
            std::cout << "QCSR version " << port.header().version << "\n";
            std::cout << "========================================\n";

            auto index = std::size_t{0};
            auto total_bits = uint64_t{0};
            while (!port.eof()) {
                auto chunk = port.read();
                auto set = std::count(chunk.mask.begin(), chunk.mask.end(), true);
                total_bits += chunk.mask.size();
                std::cout << std::setw(6) << index << "  "
                          << std::setw(10) << std::left << to_string(chunk.kind()) << std::right
                          << "  len " << std::setw(8) << chunk.mask.size()
                          << "  set " << std::setw(8) << set
                          << "  value " << format_value(chunk.value) << "\n";
                ++index;
            }

            std::cout << "========================================\n";
            std::cout << index << " chunks, " << total_bits << " mask bits\n";
        }, options);
    } catch (const std::exception& e) {
        std::cerr << "Error reading " << argv[1] << ": " << e.what() << "\n";
        return 1;
    }

    return 0;
}
