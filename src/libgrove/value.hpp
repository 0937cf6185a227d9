/*
 * value.hpp
 *
 * the DAG-CBOR data model: a closed set of value kinds
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_VALUE_HPP
#define GROVE_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "cid.hpp"

namespace grove {

/// class integer holds any integer that CBOR can represent, which is
/// every value in the range -2^64 to 2^64-1.  It is stored as the
/// CBOR argument and a sign flag: a non-negative integer is equal to
/// its argument, and a negative integer is equal to -1 minus its
/// argument.
///
class integer {
    bool negative_;
    uint64_t argument_;

    constexpr integer(bool negative, uint64_t arg) : negative_{negative}, argument_{arg} { }

public:

    constexpr integer() : negative_{false}, argument_{0} { }

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> and !std::is_same_v<T, bool>, bool> = true>
    constexpr integer(T x) : negative_{false}, argument_{0} {
        if constexpr (std::is_signed_v<T>) {
            if (x < 0) {
                negative_ = true;
                argument_ = static_cast<uint64_t>(-1 - static_cast<int64_t>(x));
                return;
            }
        }
        argument_ = static_cast<uint64_t>(x);
    }

    /// returns the integer with sign \param negative and CBOR
    /// argument \param arg
    ///
    static constexpr integer from_argument(bool negative, uint64_t arg) {
        return integer{negative, arg};
    }

    constexpr bool is_negative() const { return negative_; }

    constexpr uint64_t argument() const { return argument_; }

    /// returns the value as an `int64_t`, if it is in range
    ///
    std::optional<int64_t> as_int64() const {
        if (argument_ > static_cast<uint64_t>(INT64_MAX)) {
            return std::nullopt;
        }
        int64_t a = static_cast<int64_t>(argument_);
        return negative_ ? -1 - a : a;
    }

    /// returns the value as a `uint64_t`, if it is non-negative
    ///
    std::optional<uint64_t> as_uint64() const {
        if (negative_) {
            return std::nullopt;
        }
        return argument_;
    }

    constexpr bool operator==(const integer &rhs) const {
        return negative_ == rhs.negative_ && argument_ == rhs.argument_;
    }
    constexpr bool operator!=(const integer &rhs) const { return !(*this == rhs); }
};

class value;

/// class map is an association from text keys to values.  The
/// entries are kept in insertion order; the encoder sorts them into
/// canonical order, and the decoder produces them in canonical
/// order.  Two maps are equal when they hold the same set of entries,
/// regardless of order.
///
class map {
public:
    using entry = std::pair<std::string, value>;
    using const_iterator = std::vector<entry>::const_iterator;

    map() = default;
    map(std::initializer_list<entry> init);

    /// appends the entry \param key, \param v; duplicates are not
    /// checked here, but are rejected by the encoder
    ///
    void insert(std::string key, value v);

    /// returns a pointer to the value with key \param key, or
    /// `nullptr` if there is none
    ///
    const value *find(const std::string &key) const;

    size_t size() const;
    bool empty() const;
    void reserve(size_t n);

    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const map &rhs) const;
    bool operator!=(const map &rhs) const { return !(*this == rhs); }

private:
    std::vector<entry> entries_;

    friend class value;
};

/// class value is a DAG-CBOR value: null, a boolean, an integer, a
/// 64-bit float, a byte string, a text string, an array, a map with
/// text keys, or a link to other content (a \ref cid).  Arrays and
/// maps own their elements.
///
class value {
public:
    using map = grove::map;
    using array = std::vector<value>;
    using bytes = std::vector<uint8_t>;

    // the order of the enumerators matches the order of the
    // alternatives in the variant
    //
    enum class type : uint8_t {
        null,
        boolean,
        integer,
        floating_point,
        bytes,
        text,
        array,
        map,
        link,
    };

private:
    std::variant<std::nullptr_t, bool, integer, double, bytes, std::string, array, map, cid> v;

public:

    value() : v{nullptr} { }
    value(const value &) = default;
    value(value &&) = default;
    value &operator=(const value &) = default;
    value &operator=(value &&) = default;

    /// destroys this value without recursing into nested arrays and
    /// maps, so that values of any nesting depth can be freed
    ///
    ~value();

    value(std::nullptr_t) : v{nullptr} { }
    value(bool b) : v{b} { }

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> and !std::is_same_v<T, bool>, bool> = true>
    value(T x) : v{integer{x}} { }

    value(integer i) : v{i} { }
    value(double d) : v{d} { }
    value(bytes b) : v{std::move(b)} { }
    value(std::string s) : v{std::move(s)} { }
    value(const char *s) : v{std::string{s}} { }
    value(array a) : v{std::move(a)} { }
    value(map m) : v{std::move(m)} { }
    value(cid c) : v{std::move(c)} { }

    type get_type() const { return static_cast<type>(v.index()); }

    const char *type_name() const { return type_name(get_type()); }

    static const char *type_name(type t) {
        switch (t) {
        case type::null:           return "null";
        case type::boolean:        return "bool";
        case type::integer:        return "integer";
        case type::floating_point: return "float";
        case type::bytes:          return "bytes";
        case type::text:           return "text";
        case type::array:          return "array";
        case type::map:            return "map";
        case type::link:           return "link";
        }
        return "unknown";
    }

    bool is_null() const { return get_type() == type::null; }

    // accessors; each throws std::bad_variant_access if the value
    // holds a different kind
    //
    bool as_bool() const                  { return std::get<bool>(v); }
    const integer &as_integer() const     { return std::get<integer>(v); }
    double as_double() const              { return std::get<double>(v); }
    const bytes &as_bytes() const         { return std::get<bytes>(v); }
    const std::string &as_text() const    { return std::get<std::string>(v); }
    const array &as_array() const         { return std::get<array>(v); }
    const map &as_map() const             { return std::get<map>(v); }
    const cid &as_link() const            { return std::get<cid>(v); }

    template <typename T>
    const T *get_if() const { return std::get_if<T>(&v); }

    /// compares two values element by element, using a worklist
    /// rather than recursion; maps compare equal regardless of entry
    /// order
    ///
    bool operator==(const value &rhs) const;
    bool operator!=(const value &rhs) const { return !(*this == rhs); }

private:

    bool has_children() const {
        if (const array *a = std::get_if<array>(&v)) {
            return !a->empty();
        }
        if (const map *m = std::get_if<map>(&v)) {
            return !m->empty();
        }
        return false;
    }

    // moves the nested arrays and maps held by this value into \param
    // out, and empties this value's own array or map
    //
    void release_children(std::vector<value> &out) {
        if (array *a = std::get_if<array>(&v)) {
            for (value &x : *a) {
                if (x.has_children()) {
                    out.push_back(std::move(x));
                }
            }
            a->clear();
        } else if (map *m = std::get_if<map>(&v)) {
            for (map::entry &e : m->entries_) {
                if (e.second.has_children()) {
                    out.push_back(std::move(e.second));
                }
            }
            m->entries_.clear();
        }
    }
};

// the destructor's worklist relies on moves, not copies, when it grows
//
static_assert(std::is_nothrow_move_constructible<value>::value);

inline value::~value() {
    if (!has_children()) {
        return;
    }
    std::vector<value> pending;
    release_children(pending);
    while (!pending.empty()) {
        value x = std::move(pending.back());
        pending.pop_back();
        x.release_children(pending);
    }
}

inline bool value::operator==(const value &rhs) const {
    std::vector<std::pair<const value *, const value *>> pending{ { this, &rhs } };
    while (!pending.empty()) {
        const value *a = pending.back().first;
        const value *b = pending.back().second;
        pending.pop_back();

        if (a->get_type() != b->get_type()) {
            return false;
        }
        switch (a->get_type()) {
        case type::array:
            {
                const array &x = a->as_array();
                const array &y = b->as_array();
                if (x.size() != y.size()) {
                    return false;
                }
                for (size_t i = 0; i < x.size(); i++) {
                    pending.emplace_back(&x[i], &y[i]);
                }
            }
            break;
        case type::map:
            {
                const map &x = a->as_map();
                const map &y = b->as_map();
                if (x.size() != y.size()) {
                    return false;
                }
                for (const map::entry &e : x) {
                    const value *other = y.find(e.first);
                    if (other == nullptr) {
                        return false;
                    }
                    pending.emplace_back(&e.second, other);
                }
            }
            break;
        default:
            if (a->v != b->v) {
                return false;
            }
        }
    }
    return true;
}

inline map::map(std::initializer_list<entry> init) : entries_{init} { }

inline void map::insert(std::string key, value v) {
    entries_.emplace_back(std::move(key), std::move(v));
}

inline const value *map::find(const std::string &key) const {
    for (const auto &e : entries_) {
        if (e.first == key) {
            return &e.second;
        }
    }
    return nullptr;
}

inline size_t map::size() const { return entries_.size(); }

inline bool map::empty() const { return entries_.empty(); }

inline void map::reserve(size_t n) { entries_.reserve(n); }

inline map::const_iterator map::begin() const { return entries_.begin(); }

inline map::const_iterator map::end() const { return entries_.end(); }

inline bool map::operator==(const map &rhs) const {
    if (entries_.size() != rhs.entries_.size()) {
        return false;
    }
    for (const auto &e : entries_) {
        const value *other = rhs.find(e.first);
        if (other == nullptr || *other != e.second) {
            return false;
        }
    }
    return true;
}

}  // namespace grove

#endif // GROVE_VALUE_HPP
