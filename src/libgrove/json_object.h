/*
 * json_object.h
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_JSON_OBJECT_H
#define GROVE_JSON_OBJECT_H

#include <cstring>
#include "datum.h"

namespace grove {

/*
 * json_object serializes a JSON object into a writeable.  Keys and
 * string values are written as given, without escaping, so they must
 * not contain quotes, backslashes, or control characters.
 */

struct json_object {
    writeable *b;
    bool comma = false;

    void write_comma(bool &c) {
        if (c) {
            write_char(',');
        } else {
            c = true;
        }
    }
    void write_char(char c) {
        b->copy(static_cast<uint8_t>(c));
    }
    void puts(const char *s) {
        b->copy(reinterpret_cast<const uint8_t *>(s), strlen(s));
    }
    void write_key(const char *k) {
        write_comma(comma);
        write_char('\"');
        puts(k);
        puts("\":");
    }

    explicit json_object(writeable *buf) : b{buf} {
        write_char('{');
    }
    json_object(json_object &object, const char *name) : b{object.b} {
        object.write_key(name);
        write_char('{');
    }
    void close() {
        write_char('}');
    }
    void print_key_string(const char *k, const char *v) {
        write_key(k);
        write_char('\"');
        puts(v);
        write_char('\"');
    }
    void print_key_null(const char *k) {
        write_key(k);
        puts("null");
    }
};

}  // namespace grove

#endif // GROVE_JSON_OBJECT_H
