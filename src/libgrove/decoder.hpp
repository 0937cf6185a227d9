/*
 * decoder.hpp
 *
 * strict DAG-CBOR decoding
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_DECODER_HPP
#define GROVE_DECODER_HPP

#include <optional>
#include "datum.h"
#include "error.hpp"
#include "value.hpp"

namespace grove::cbor {

/// decode_result holds the outcome of decoding: on success, the
/// decoded value and the unconsumed remainder of the input; on
/// failure, a \ref decode_error, a null value, and the remainder
/// starting at the item that could not be decoded
///
struct decode_result {
    value val;
    datum remainder;
    std::optional<decode_error> error;

    explicit operator bool() const { return !error.has_value(); }
};

/// decodes the first DAG-CBOR data item in \param d and returns it
/// along with the bytes that follow it.  Any input that is not in
/// canonical form is rejected: arguments must be minimal, map keys
/// must be text strings in canonical order without duplicates, text
/// must be valid UTF-8, floats must be finite 64-bit doubles, and the
/// only tag is 42 (a CID link).
///
/// Containers are decoded with an explicit stack rather than by
/// recursion, so the nesting depth is limited only by memory.
///
decode_result decode_first(datum d);

/// decodes the single DAG-CBOR data item that makes up all of \param
/// d; unlike \ref decode_first(), bytes after the item are an error
/// (`error_kind::trailing_data`)
///
decode_result decode(datum d);

}  // namespace grove::cbor

#endif // GROVE_DECODER_HPP
