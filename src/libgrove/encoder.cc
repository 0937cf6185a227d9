/*
 * encoder.cc
 *
 * canonical DAG-CBOR encoding
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <algorithm>
#include <cmath>
#include "encoder.hpp"
#include "cbor.hpp"
#include "err.h"
#include "utf8.hpp"

namespace grove::cbor {

void encoder::reject(value::type t, const std::string &msg) const {
    std::string full_msg{value::type_name(t)};
    full_msg.append(" value ");
    full_msg.append(msg);
    printf_err(log_debug, "cbor encoder rejected %s: %s\n", path.c_str(), full_msg.c_str());
    throw encode_error{full_msg, path};
}

void encoder::encode(const value &v) {
    path = "$";
    std::vector<frame> stack;
    write_item(v, stack);
    write_nested(stack);
}

void encoder::encode(const map &m) {
    path = "$";
    std::vector<frame> stack;
    open_map(m, stack);
    write_nested(stack);
}

// writes the scalar \param v, or the header of the array or map \param
// v, in which case a frame for its elements is pushed onto \param stack
//
void encoder::write_item(const value &v, std::vector<frame> &stack) {
    switch (v.get_type()) {
    case value::type::null:
        buf << initial_byte{simple_or_float_type, simple_null};
        break;
    case value::type::boolean:
        buf << initial_byte{simple_or_float_type, v.as_bool() ? simple_true : simple_false};
        break;
    case value::type::integer:
        write_integer(v.as_integer());
        break;
    case value::type::floating_point:
        write_float(v.as_double());
        break;
    case value::type::bytes:
        write_bytes(v.as_bytes());
        break;
    case value::type::text:
        write_text(v.as_text());
        break;
    case value::type::array:
        open_array(v.as_array(), stack);
        break;
    case value::type::map:
        open_map(v.as_map(), stack);
        break;
    case value::type::link:
        write_link(v.as_link());
        break;
    }
}

// writes the remaining elements of every frame on \param stack
//
void encoder::write_nested(std::vector<frame> &stack) {
    while (!stack.empty()) {
        frame &top = stack.back();
        path.resize(top.path_length);
        if (top.next == top.size()) {
            stack.pop_back();
            continue;
        }
        const value *v;
        if (top.items) {
            path.append("[").append(std::to_string(top.next)).append("]");
            v = &(*top.items)[top.next];
        } else {
            const map::entry *e = top.entries[top.next];
            buf << header{text_string_type, e->first.size()};
            buf << datum{e->first};
            path.append(".").append(e->first);
            v = &e->second;
        }
        top.next++;
        write_item(*v, stack);      // may invalidate top
    }
}

void encoder::write_integer(const integer &i) {
    uint8_t type = i.is_negative() ? negative_integer_type : unsigned_integer_type;
    buf << header{type, i.argument()};
}

void encoder::write_float(double d) {
    if (std::isnan(d)) {
        reject(value::type::floating_point, "is NaN");
    }
    if (std::isinf(d)) {
        reject(value::type::floating_point, "is infinite");
    }
    buf << float64{d};
}

void encoder::write_bytes(const value::bytes &b) {
    buf << header{byte_string_type, b.size()};
    buf.copy(b.data(), b.size());
}

void encoder::write_text(const std::string &s) {
    datum d{s};
    if (!utf8_string::is_valid(d)) {
        reject(value::type::text, "is not valid UTF-8");
    }
    buf << header{text_string_type, s.size()};
    buf << d;
}

void encoder::open_array(const value::array &a, std::vector<frame> &stack) {
    buf << header{array_type, a.size()};
    if (!a.empty()) {
        stack.push_back({ &a, {}, 0, path.length() });
    }
}

void encoder::open_map(const map &m, std::vector<frame> &stack) {

    // sort the entries into canonical key order
    //
    std::vector<const map::entry *> entries;
    entries.reserve(m.size());
    for (const auto &e : m) {
        entries.push_back(&e);
    }
    std::sort(entries.begin(), entries.end(), [](const map::entry *a, const map::entry *b) {
        return compare_map_keys(datum{a->first}, datum{b->first}) < 0;
    });

    for (size_t i = 0; i < entries.size(); i++) {
        const std::string &key = entries[i]->first;
        if (!utf8_string::is_valid(datum{key})) {
            reject(value::type::map, "has a key that is not valid UTF-8");
        }
        if (i > 0 && entries[i - 1]->first == key) {
            reject(value::type::map, "has duplicate key \"" + key + "\"");
        }
    }

    buf << header{map_type, entries.size()};
    if (!entries.empty()) {
        stack.push_back({ nullptr, std::move(entries), 0, path.length() });
    }
}

// a link is tag 42 applied to a byte string that holds the binary
// prefix byte followed by the CID
//
void encoder::write_link(const cid &c) {
    const std::vector<uint8_t> &b = c.bytes();
    buf << header{tagged_item_type, cid_tag};
    buf << header{byte_string_type, b.size() + 1};
    buf << cid::binary_prefix;
    buf.copy(b.data(), b.size());
}

std::vector<uint8_t> encode(const value::map &m) {
    encoder e;
    e.encode(m);
    return e.finalize();
}

std::vector<uint8_t> encode_value(const value &v) {
    encoder e;
    e.encode(v);
    return e.finalize();
}

}  // namespace grove::cbor
