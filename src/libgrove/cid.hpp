/*
 * cid.hpp
 *
 * content identifiers: version 1 CIDs over SHA-256 digests
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_CID_HPP
#define GROVE_CID_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "datum.h"

namespace grove {

struct json_object;

/// cid_error is thrown when a content identifier cannot be created,
/// parsed, or decoded
///
class cid_error : public std::runtime_error {
public:

    enum class reason {
        bad_prefix,         ///< text form does not start with 'b'
        bad_length,         ///< text or binary form has an impossible length
        bad_encoding,       ///< text form is not unpadded lowercase base32
        too_short,          ///< fewer bytes than the header or digest require
        bad_version,        ///< version is not 1
        invalid_codec,      ///< codec is neither raw nor dag-cbor
        bad_hash_type,      ///< hash type is not SHA-256
        bad_digest_size,    ///< digest length is neither 0 nor 32
        trailing_bytes,     ///< bytes follow the digest
        bad_json,           ///< not a JSON object with a string `$link` member
    };

    cid_error(reason r, const char *msg) : std::runtime_error{msg}, reason_{r} { }

    reason get_reason() const { return reason_; }

private:
    reason reason_;
};

/// class cid represents a version 1 content identifier, which names
/// a sequence of bytes by its SHA-256 digest.  Its binary form is
///
///    version (1) | codec | hash type (0x12) | digest length | digest
///
/// where the digest length is 32, or 0 for the empty CID, which names
/// no content.  The text form is the character `b` followed by the
/// unpadded, lowercase base32 encoding of the binary form.
///
/// A cid object always holds a valid identifier; the static
/// functions that construct one throw \ref cid_error otherwise.
///
class cid {
    std::vector<uint8_t> bytes_;

    explicit cid(std::vector<uint8_t> b) : bytes_{std::move(b)} { }

public:

    static constexpr uint8_t version_1     = 0x01;
    static constexpr uint8_t raw           = 0x55;   ///< multicodec for raw bytes
    static constexpr uint8_t dag_cbor      = 0x71;   ///< multicodec for DAG-CBOR
    static constexpr uint8_t sha2_256      = 0x12;   ///< multihash type
    static constexpr uint8_t digest_length = 32;
    static constexpr size_t header_length  = 4;

    /// text lengths of the empty and full forms, including the `b`
    ///
    static constexpr size_t empty_text_length = 8;
    static constexpr size_t text_length       = 59;

    /// the byte that precedes a CID in a binary (tag 42) context
    ///
    static constexpr uint8_t binary_prefix = 0x00;

    /// returns the CID of \param content with codec \param codec,
    /// which must be \ref raw or \ref dag_cbor
    ///
    static cid create(uint8_t codec, datum content);

    /// returns the empty CID (with a zero-length digest) for the
    /// codec \param codec
    ///
    static cid create_empty(uint8_t codec);

    /// parses the text form \param s
    ///
    static cid parse(const std::string &s);

    /// decodes a `0x00`-prefixed binary CID, the inverse of \ref
    /// to_bytes()
    ///
    static cid from_bytes(datum d);

    /// decodes and validates the raw (un-prefixed) CID bytes in \param d
    ///
    static cid decode(datum d);

    std::string to_string() const;

    /// returns the `0x00`-prefixed binary form
    ///
    std::vector<uint8_t> to_bytes() const;

    const std::vector<uint8_t> &bytes() const { return bytes_; }

    /// the JSON form of a link is an object with a single member,
    /// `{"$link":"<text form>"}`
    ///
    static constexpr const char *json_link_key = "$link";

    /// writes the JSON form of this cid into \param buf
    ///
    void write_json(writeable &buf) const;

    /// writes the JSON form of this cid as the member \param name of
    /// the \ref json_object \param o
    ///
    void write_json(json_object &o, const char *name) const;

    std::string to_json() const;

    /// parses the JSON form \param json; throws \ref cid_error with
    /// reason `bad_json` if it is not an object with a string `$link`
    /// member, and with the reason reported by \ref parse() if that
    /// member is not a valid cid
    ///
    static cid from_json(const std::string &json);

    uint8_t version() const { return bytes_[0]; }

    uint8_t codec() const { return bytes_[1]; }

    uint8_t hash_type() const { return bytes_[2]; }

    datum digest() const {
        return datum{bytes_.data() + header_length, bytes_.data() + bytes_.size()};
    }

    bool is_empty() const { return bytes_[3] == 0; }

    bool operator==(const cid &rhs) const { return bytes_ == rhs.bytes_; }
    bool operator!=(const cid &rhs) const { return bytes_ != rhs.bytes_; }
    bool operator<(const cid &rhs) const { return bytes_ < rhs.bytes_; }

};

}  // namespace grove

#endif // GROVE_CID_HPP
