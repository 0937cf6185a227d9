/*
 * error.hpp
 *
 * error types reported by the DAG-CBOR encoder and decoder
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_ERROR_HPP
#define GROVE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace grove {

/// error_kind classifies a failure to encode or decode a value
///
enum class error_kind {
    end_of_input,        ///< input truncated in the middle of an item
    malformed,           ///< reserved or indefinite-length encoding
    non_minimal,         ///< argument not in its shortest form
    invalid_utf8,        ///< text string is not valid UTF-8
    duplicate_map_key,   ///< map key equal to the previous key
    map_key_order,       ///< map key sorts before the previous key
    invalid_float,       ///< NaN, infinity, or a non-64-bit float
    invalid_map_key,     ///< map key that is not a text string
    invalid_link,        ///< tag 42 content that is not a valid CID
    unsupported,         ///< tag or simple value outside of DAG-CBOR
    unsupported_value,   ///< encoder input that has no canonical encoding
    trailing_data,       ///< bytes left over after the top-level item
};

inline const char *to_string(error_kind k) {
    switch (k) {
    case error_kind::end_of_input:      return "end_of_input";
    case error_kind::malformed:         return "malformed";
    case error_kind::non_minimal:       return "non_minimal";
    case error_kind::invalid_utf8:      return "invalid_utf8";
    case error_kind::duplicate_map_key: return "duplicate_map_key";
    case error_kind::map_key_order:     return "map_key_order";
    case error_kind::invalid_float:     return "invalid_float";
    case error_kind::invalid_map_key:   return "invalid_map_key";
    case error_kind::invalid_link:      return "invalid_link";
    case error_kind::unsupported:       return "unsupported";
    case error_kind::unsupported_value: return "unsupported_value";
    case error_kind::trailing_data:     return "trailing_data";
    }
    return "unknown";
}

/// decode_error describes where and why decoding failed.  The
/// offset is the position, relative to the start of the input, of the
/// initial byte of the item that could not be decoded.  The path names
/// the array index or map key that was being filled, outermost first,
/// as in `$.entries[3].name`; it is `$` at the top level.
///
class decode_error : public std::runtime_error {
    error_kind kind_;
    size_t offset_;
    std::string path_;

    static std::string format(error_kind k, const std::string &msg, size_t offset, const std::string &path) {
        std::string s{"cbor decode error ("};
        s.append(to_string(k));
        s.append(") at offset ");
        s.append(std::to_string(offset));
        s.append(", ");
        s.append(path);
        s.append(": ");
        s.append(msg);
        return s;
    }

public:

    decode_error(error_kind k, const std::string &msg, size_t offset, const std::string &path) :
        std::runtime_error{format(k, msg, offset, path)},
        kind_{k},
        offset_{offset},
        path_{path}
    { }

    error_kind kind() const { return kind_; }

    size_t offset() const { return offset_; }

    const std::string &path() const { return path_; }
};

/// encode_error reports a value that has no canonical encoding; the
/// path locates it within the value being encoded
///
class encode_error : public std::runtime_error {
    std::string path_;

public:

    encode_error(const std::string &msg, const std::string &path) :
        std::runtime_error{"cbor encode error at " + path + ": " + msg},
        path_{path}
    { }

    error_kind kind() const { return error_kind::unsupported_value; }

    const std::string &path() const { return path_; }
};

}  // namespace grove

#endif // GROVE_ERROR_HPP
