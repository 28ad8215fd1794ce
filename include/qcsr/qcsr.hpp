#pragma once

// ============================================================================
// QCSR - chunked mask/scalar container format
// ============================================================================
//
// A QCSR stream is a 32-byte header followed by chunks, each pairing a
// boolean mask of any length with one scalar of a fixed set of kinds.
//
// Basic usage:
//
//   #include "qcsr/qcsr.hpp"
//
//   auto chunks = std::vector<qcsr::chunk_t>{
//       qcsr::make_chunk(qcsr::bitmask_t{true, false, true}, 2.5),
//       qcsr::make_chunk(qcsr::bitmask_t{}, std::complex<float>(1, -1)),
//   };
//
//   // Whole file
//   qcsr::save("state.qcsr", chunks);
//   auto loaded = qcsr::load("state.qcsr");
//
//   // Incremental
//   auto port = qcsr::open_for_write("state.qcsr");
//   port.write(qcsr::bitmask_t{false, true}, int32_t{7});
//   port.close();
//
//   qcsr::with_read_port("state.qcsr", [](qcsr::port_t& port) {
//       while (!port.eof()) {
//           auto chunk = port.read();
//       }
//   });
//
// ============================================================================

#include "binary_format.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "error.hpp"
#include "file.hpp"
#include "header.hpp"
#include "log.hpp"
#include "port.hpp"
#include "scalar.hpp"
