/*
 * decoder.cc
 *
 * strict DAG-CBOR decoding
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>
#include "decoder.hpp"
#include "cbor.hpp"
#include "cid.hpp"
#include "err.h"
#include "utf8.hpp"

namespace grove::cbor {

namespace {

// an array or map that has been opened but not yet completed
//
struct container {
    bool is_map;
    uint64_t remaining;                      // elements, or key/value pairs
    value::array items;
    map entries;
    std::optional<std::string> pending_key;
    datum previous_key;                      // null until the first key is read

    container(bool m, uint64_t count, size_t capacity) : is_map{m}, remaining{count} {
        if (is_map) {
            entries.reserve(capacity);
        } else {
            items.reserve(capacity);
        }
    }

    bool expects_key() const { return is_map && !pending_key; }
};

class decoder {
    datum input;
    datum d;
    std::vector<container> stack;
    const uint8_t *item_start;
    std::optional<decode_error> error;

    std::string path() const {
        std::string p{"$"};
        for (const auto &c : stack) {
            if (!c.is_map) {
                p.append("[").append(std::to_string(c.items.size())).append("]");
            } else if (c.pending_key) {
                p.append(".").append(*c.pending_key);
            }
        }
        return p;
    }

    void fail(error_kind k, const std::string &msg) {
        size_t offset = input.is_null() ? 0 : item_start - input.data;
        error.emplace(k, msg, offset, path());
        printf_err(log_debug, "%s\n", error->what());
    }

    decode_result failure() {
        return { value{}, datum{item_start, input.data_end}, std::move(error) };
    }

    bool check(const header &h) {
        switch (h.status()) {
        case header_status::ok:
            return true;
        case header_status::end_of_input:
            fail(error_kind::end_of_input, "unexpected end of input");
            break;
        case header_status::non_minimal:
            fail(error_kind::non_minimal,
                 std::string{"argument of "} + major_type_name(h.major_type()) + " is not minimally encoded");
            break;
        case header_status::reserved:
            fail(error_kind::malformed, "reserved additional information " + std::to_string(h.additional_info()));
            break;
        case header_status::indefinite:
            if (h.major_type() == simple_or_float_type) {
                fail(error_kind::malformed, "unexpected break");
            } else {
                fail(error_kind::malformed,
                     std::string{"indefinite-length "} + major_type_name(h.major_type()) + " is not supported");
            }
            break;
        }
        return false;
    }

    // reads the string body that follows the header \param h
    //
    std::optional<datum> read_body(const header &h) {
        datum body{d, h.argument()};
        if (body.is_null()) {
            fail(error_kind::end_of_input,
                 std::string{major_type_name(h.major_type())} + " of length " + std::to_string(h.argument())
                 + " extends past the end of input");
            return std::nullopt;
        }
        return body;
    }

    bool read_key() {
        header h{d};
        if (!check(h)) {
            return false;
        }
        if (h.major_type() != text_string_type) {
            fail(error_kind::invalid_map_key,
                 std::string{"map key must be a text string, found "} + major_type_name(h.major_type()));
            return false;
        }
        std::optional<datum> key = read_body(h);
        if (!key) {
            return false;
        }
        if (!utf8_string::is_valid(*key)) {
            fail(error_kind::invalid_utf8, "map key is not valid UTF-8");
            return false;
        }
        container &top = stack.back();
        if (top.previous_key.is_not_null()) {
            int c = compare_map_keys(top.previous_key, *key);
            if (c == 0) {
                fail(error_kind::duplicate_map_key, "duplicate map key \"" + key->get_string() + "\"");
                return false;
            }
            if (c > 0) {
                fail(error_kind::map_key_order,
                     "map key \"" + key->get_string() + "\" follows \"" + top.previous_key.get_string()
                     + "\", which is out of canonical order");
                return false;
            }
        }
        top.previous_key = *key;
        top.pending_key = key->get_string();
        return true;
    }

    // a link is tag 42 applied to a byte string holding a 0x00 prefix
    // and a CID; the tag itself has already been read
    //
    std::optional<value> read_link() {
        header h{d};
        if (!check(h)) {
            return std::nullopt;
        }
        if (h.major_type() != byte_string_type) {
            fail(error_kind::invalid_link,
                 std::string{"tag 42 content must be a byte string, found "} + major_type_name(h.major_type()));
            return std::nullopt;
        }
        std::optional<datum> body = read_body(h);
        if (!body) {
            return std::nullopt;
        }
        if (body->length() == 0) {
            fail(error_kind::invalid_link, "link of length 0 is too short for the prefix");
            return std::nullopt;
        }
        if (body->data[0] != cid::binary_prefix) {
            char msg[64];
            snprintf(msg, sizeof(msg), "expected 0x00 link prefix, found 0x%02x", body->data[0]);
            fail(error_kind::invalid_link, msg);
            return std::nullopt;
        }
        try {
            // the embedded cid must survive a round trip through its
            // text form
            //
            cid c = cid::from_bytes(*body);
            return value{cid::parse(c.to_string())};
        }
        catch (const cid_error &e) {
            fail(error_kind::invalid_link, std::string{"invalid CID: "} + e.what());
        }
        return std::nullopt;
    }

    std::optional<value> read_simple(const header &h) {
        switch (h.additional_info()) {
        case simple_false:
            return value{false};
        case simple_true:
            return value{true};
        case simple_null:
            return value{nullptr};
        case float64_info:
            {
                double x = float64::from_bits(h.argument()).value();
                if (std::isnan(x)) {
                    fail(error_kind::invalid_float, "NaN is not allowed");
                    return std::nullopt;
                }
                if (std::isinf(x)) {
                    fail(error_kind::invalid_float, "infinity is not allowed");
                    return std::nullopt;
                }
                return value{x};
            }
        case 25:
        case 26:
            fail(error_kind::invalid_float, "half and single precision floats are not canonical");
            return std::nullopt;
        default:
            ;
        }
        fail(error_kind::unsupported, "simple value " + std::to_string(h.additional_info()) + " is not supported");
        return std::nullopt;
    }

    // opens a container with \param count elements or pairs; an empty
    // container is complete as soon as it is opened
    //
    std::optional<value> open(bool is_map, uint64_t count) {
        if (count == 0) {
            if (is_map) {
                return value{map{}};
            }
            return value{value::array{}};
        }
        grove_debug("cbor decoder: opening %s of size %lu at depth %zu\n",
                    is_map ? "map" : "array", static_cast<unsigned long>(count), stack.size());

        // the reservation is bounded by the input length, since every
        // element takes at least one byte
        //
        size_t capacity = std::min(count, static_cast<uint64_t>(d.length()));
        stack.emplace_back(is_map, count, capacity);
        return std::nullopt;
    }

    // reads a scalar, or opens a container, in which case an empty
    // optional is returned and error is not set
    //
    std::optional<value> read_item() {
        header h{d};
        if (!check(h)) {
            return std::nullopt;
        }
        switch (h.major_type()) {
        case unsigned_integer_type:
            return value{integer::from_argument(false, h.argument())};
        case negative_integer_type:
            return value{integer::from_argument(true, h.argument())};
        case byte_string_type:
            if (std::optional<datum> body = read_body(h)) {
                return value{body->get_bytes()};
            }
            return std::nullopt;
        case text_string_type:
            if (std::optional<datum> body = read_body(h)) {
                if (!utf8_string{*body}.is_valid()) {
                    fail(error_kind::invalid_utf8, "text string is not valid UTF-8");
                    return std::nullopt;
                }
                return value{body->get_string()};
            }
            return std::nullopt;
        case array_type:
            return open(false, h.argument());
        case map_type:
            return open(true, h.argument());
        case tagged_item_type:
            if (h.argument() != cid_tag) {
                fail(error_kind::unsupported, "tag " + std::to_string(h.argument()) + " is not supported");
                return std::nullopt;
            }
            return read_link();
        default:
            ;
        }
        return read_simple(h);
    }

public:

    explicit decoder(datum in) : input{in}, d{in}, item_start{in.data} { }

    decode_result run() {
        while (true) {
            item_start = d.data;

            if (!stack.empty() && stack.back().expects_key()) {
                if (!read_key()) {
                    return failure();
                }
                continue;
            }

            std::optional<value> current = read_item();
            if (error) {
                return failure();
            }
            if (!current) {
                continue;       // a container was opened
            }

            // hand the completed value to its parent; a parent that
            // is now full is itself completed
            //
            while (true) {
                if (stack.empty()) {
                    return { std::move(*current), d, std::nullopt };
                }
                container &top = stack.back();
                if (top.is_map) {
                    top.entries.insert(std::move(*top.pending_key), std::move(*current));
                    top.pending_key.reset();
                } else {
                    top.items.push_back(std::move(*current));
                }
                if (--top.remaining > 0) {
                    break;
                }
                if (top.is_map) {
                    current = value{std::move(top.entries)};
                } else {
                    current = value{std::move(top.items)};
                }
                stack.pop_back();
            }
        }
    }

};

}  // namespace

decode_result decode_first(datum d) {
    return decoder{d}.run();
}

decode_result decode(datum d) {
    decode_result r = decode_first(d);
    if (r && r.remainder.is_readable()) {
        size_t offset = r.remainder.data - d.data;
        decode_error e{error_kind::trailing_data,
                       std::to_string(r.remainder.length()) + " bytes follow the data item",
                       offset,
                       "$"};
        printf_err(log_debug, "%s\n", e.what());
        return { value{}, r.remainder, std::move(e) };
    }
    return r;
}

}  // namespace grove::cbor
