/*
 * cid.cc
 *
 * content identifiers: version 1 CIDs over SHA-256 digests
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <optional>
#include "rapidjson/document.h"
#include "cid.hpp"
#include "base32.hpp"
#include "crypto_hash.hpp"
#include "err.h"
#include "json_object.h"

namespace grove {

static void check_codec(uint8_t codec) {
    if (codec != cid::raw && codec != cid::dag_cbor) {
        throw cid_error{cid_error::reason::invalid_codec, "invalid codec"};
    }
}

cid cid::create(uint8_t codec, datum content) {
    check_codec(codec);

    hasher::digest d = sha256_hash(content);

    std::vector<uint8_t> b;
    b.reserve(header_length + digest_length);
    b.push_back(version_1);
    b.push_back(codec);
    b.push_back(sha2_256);
    b.push_back(digest_length);
    b.insert(b.end(), d.begin(), d.end());
    return cid{std::move(b)};
}

cid cid::create_empty(uint8_t codec) {
    check_codec(codec);
    return cid{{ version_1, codec, sha2_256, 0 }};
}

cid cid::decode(datum d) {
    if (d.is_null() || d.length() < (ssize_t)header_length) {
        throw cid_error{cid_error::reason::too_short, "cid too short"};
    }
    datum tmp = d;
    uint8_t version     = encoded<uint8_t>{tmp};
    uint8_t codec       = encoded<uint8_t>{tmp};
    uint8_t hash_type   = encoded<uint8_t>{tmp};
    uint8_t digest_size = encoded<uint8_t>{tmp};

    if (version != version_1) {
        throw cid_error{cid_error::reason::bad_version, "invalid version"};
    }
    check_codec(codec);
    if (hash_type != sha2_256) {
        throw cid_error{cid_error::reason::bad_hash_type, "invalid hash type"};
    }
    if (digest_size != digest_length && digest_size != 0) {
        throw cid_error{cid_error::reason::bad_digest_size, "invalid digest size"};
    }
    if (tmp.length() < digest_size) {
        throw cid_error{cid_error::reason::too_short, "cid too short"};
    }
    if (tmp.length() > digest_size) {
        throw cid_error{cid_error::reason::trailing_bytes, "cid bytes include a remainder"};
    }
    return cid{d.get_bytes()};
}

cid cid::parse(const std::string &s) {
    if (s.length() < 2 || s[0] != 'b') {
        throw cid_error{cid_error::reason::bad_prefix, "invalid cid format"};
    }
    if (s.length() != text_length && s.length() != empty_text_length) {
        throw cid_error{cid_error::reason::bad_length, "invalid cid length"};
    }
    std::optional<std::vector<uint8_t>> b = base32::decode(s.substr(1));
    if (!b) {
        throw cid_error{cid_error::reason::bad_encoding, "invalid base32 in cid"};
    }
    return decode(datum{*b});
}

cid cid::from_bytes(datum d) {
    size_t len = d.is_null() ? 0 : d.length();
    if (len != header_length + 1 && len != header_length + digest_length + 1) {
        throw cid_error{cid_error::reason::bad_length, "invalid cid length"};
    }
    if (d.data[0] != binary_prefix) {
        throw cid_error{cid_error::reason::bad_prefix, "incorrect binary cid prefix"};
    }
    return decode(datum{d.data + 1, d.data_end});
}

std::string cid::to_string() const {
    return "b" + base32::encode(datum{bytes_});
}

std::vector<uint8_t> cid::to_bytes() const {
    std::vector<uint8_t> b;
    b.reserve(bytes_.size() + 1);
    b.push_back(binary_prefix);
    b.insert(b.end(), bytes_.begin(), bytes_.end());
    return b;
}

void cid::write_json(writeable &buf) const {
    json_object o{&buf};
    o.print_key_string(json_link_key, to_string().c_str());
    o.close();
}

void cid::write_json(json_object &o, const char *name) const {
    json_object link{o, name};
    link.print_key_string(json_link_key, to_string().c_str());
    link.close();
}

std::string cid::to_json() const {
    dynamic_buffer buf{80};
    write_json(buf);
    return buf.contents().get_string();
}

cid cid::from_json(const std::string &json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (!doc.IsObject()) {
        printf_err(log_debug, "invalid cid-link JSON\n");
        throw cid_error{cid_error::reason::bad_json, "invalid cid-link JSON"};
    }
    if (!doc.HasMember(json_link_key) || !doc[json_link_key].IsString()) {
        printf_err(log_debug, "cid-link JSON has no string \"%s\" member\n", json_link_key);
        throw cid_error{cid_error::reason::bad_json, "cid-link JSON has no string $link member"};
    }
    return parse(doc[json_link_key].GetString());
}

}  // namespace grove
