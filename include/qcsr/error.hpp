#pragma once

#include <stdexcept>
#include <string>

namespace qcsr {

// =============================================================================
// Exception taxonomy
// =============================================================================
//
// Every failure raised by the codec derives from qcsr::error, so callers can
// catch the whole family with one handler or pick out a single condition.
//
// =============================================================================

class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Magic bytes do not identify a QCSR stream
class format_error : public error {
public:
    using error::error;
};

// Stream was written by a newer codec
class version_error : public error {
public:
    using error::error;
};

// Tag is not in the registry, or differs from the expected scalar kind
class type_mismatch_error : public error {
public:
    using error::error;
};

// Caller asked for something the codec cannot do
class argument_error : public error {
public:
    using error::error;
};

// Short read, failed write, or a path that could not be opened
class io_error : public error {
public:
    using error::error;
};

// Malformed configuration text
class config_error : public error {
public:
    using error::error;
};

} // namespace qcsr
