/*
 * encoder.hpp
 *
 * canonical DAG-CBOR encoding
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_ENCODER_HPP
#define GROVE_ENCODER_HPP

#include <string>
#include <vector>
#include "datum.h"
#include "error.hpp"
#include "value.hpp"

namespace grove::cbor {

/// class encoder writes values in canonical DAG-CBOR form into a
/// growable buffer.  Map entries are written in canonical key order
/// (shorter keys first, then bytewise), every argument uses its
/// shortest form, and every float is written as a 64-bit double.
///
/// A value that has no canonical encoding (a NaN or infinite float, a
/// text string that is not UTF-8, or a map with a duplicate key)
/// causes \ref encode_error to be thrown; its path locates the value,
/// as in `$.entries[3].name`.
///
class encoder {
    dynamic_buffer buf;
    std::string path;

    // an array or map whose elements are being written; arrays and
    // maps are written with an explicit stack of frames rather than
    // by recursion, so the nesting depth is limited only by memory
    //
    struct frame {
        const value::array *items;                  // nullptr for a map
        std::vector<const map::entry *> entries;    // in canonical order
        size_t next;
        size_t path_length;

        size_t size() const { return items ? items->size() : entries.size(); }
    };

    void write_item(const value &v, std::vector<frame> &stack);
    void write_nested(std::vector<frame> &stack);
    void open_array(const value::array &a, std::vector<frame> &stack);
    void open_map(const map &m, std::vector<frame> &stack);
    void write_integer(const integer &i);
    void write_float(double d);
    void write_bytes(const value::bytes &b);
    void write_text(const std::string &s);
    void write_link(const cid &c);

    [[noreturn]] void reject(value::type t, const std::string &msg) const;

public:

    static constexpr size_t default_initial_size = 1024;

    explicit encoder(size_t initial_size=default_initial_size) : buf{initial_size}, path{"$"} { }

    /// appends the encoding of \param v to the buffer; if an \ref
    /// encode_error is thrown, the buffer contents are unspecified
    ///
    void encode(const value &v);

    void encode(const map &m);

    /// returns the bytes written so far; the encoder must not be used
    /// afterwards
    ///
    std::vector<uint8_t> finalize() { return buf.finalize(); }

    datum contents() const { return buf.contents(); }

};

/// returns the canonical encoding of the map \param m
///
std::vector<uint8_t> encode(const value::map &m);

/// returns the canonical encoding of the value \param v, which may be
/// of any kind
///
std::vector<uint8_t> encode_value(const value &v);

}  // namespace grove::cbor

#endif // GROVE_ENCODER_HPP
