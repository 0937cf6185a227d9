///
/// \file datum.h
///
/// Copyright (c) 2019-2020 Cisco Systems, Inc. All rights reserved.
/// License at https://github.com/cisco/mercury/blob/master/LICENSE
///

#ifndef GROVE_DATUM_H
#define GROVE_DATUM_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <sys/types.h>
#include <algorithm>
#include <array>
#include <cassert>
#include <climits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/// `grove_debug` is a compile-time option that turns on debugging output
///
/// the macro `grove_debug` accepts `printf()` style arguments, and
/// prints out debugging information only if DEBUG is `#defined` at
/// compile time, and otherwise prints out nothing
///
#ifndef DEBUG
#define grove_debug(...)
#else
#define grove_debug(...)  (fprintf(stderr, __VA_ARGS__))
#endif

namespace grove {

/// \defgroup byteorder Integer Byte Order Operations
/// @{

static constexpr bool host_little_endian = (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__);

/// returns an integer equal to x with its byte order reversed (from
/// little endian to big endian or vice-versa)
///
inline constexpr uint16_t swap_byte_order(uint16_t x) { return __builtin_bswap16(x); }
inline constexpr uint32_t swap_byte_order(uint32_t x) { return __builtin_bswap32(x); }
inline constexpr uint64_t swap_byte_order(uint64_t x) { return __builtin_bswap64(x); }

/// when `x` is in host byte order, `hton(x)` returns the value of `x`
/// in network byte order
///
template <typename T>
inline constexpr T hton(T x) { if (host_little_endian) { return swap_byte_order(x); } return x; }

/// @} -- end of byteorder

/// \struct datum
///
/// datum is a lightweight, non-owning structure that represents a
/// readable sequence of bytes in memory, suitable for use in data
/// parsing.
///
/// Each datum is in one of the states `null`, `readable`, or `empty`:
///
///   |    State        | data          |   data_end   |
///   |-----------------|---------------|--------------|
///   |    null         | `nullptr`     |   `nullptr`  |
///   |    readable     | `!= nullptr`  |   `> data`   |
///   |    empty        | `!= nullptr`  |   `== data`  |
///
/// If an accept operation on a datum fails, then the datum will be
/// set to the null state.
///
/// A datum does not own the memory it refers to.  If that memory is
/// freed, or the variable owning it goes out of scope, then the datum
/// is invalid.
///
struct datum {
    const unsigned char *data;          ///< the start of the data in memory, or `nullptr`
    const unsigned char *data_end;      ///< the end of data in memory, or `nullptr`

    /// construct a null datum
    ///
    datum() : data{nullptr}, data_end{nullptr} {}

    /// construct a datum representing the sequence between `first` and `last`
    ///
    datum(const uint8_t *first, const uint8_t *last) : data{first}, data_end{last} {}

    /// construct a datum representing the `std::string` \param str
    ///
    explicit datum(const std::string &str) :
        data{reinterpret_cast<const uint8_t *>(str.data())},
        data_end{data + str.length()}
    { }

    /// construct a datum representing the bytes in the vector \param v
    ///
    explicit datum(const std::vector<uint8_t> &v) : data{v.data()}, data_end{v.data() + v.size()} { }

    /// construct a datum by accepting \p length bytes from datum \p d
    ///
    /// If `length > d.length()`, then \p d and this datum are set to
    /// the null state.
    ///
    datum(datum &d, size_t length) {
        parse(d, length);
    }

    bool is_null() const { return data == nullptr; }
    bool is_not_null() const { return data != nullptr; }
    bool is_readable() const { return data != nullptr && data < data_end; }
    bool is_not_readable() const { return data == nullptr || data == data_end; }
    bool is_empty() const { return data != nullptr && data == data_end; }
    void set_null() { data = data_end = nullptr; }
    ssize_t length() const { return data_end - data; }

    void parse(datum &r, size_t num_bytes) {
        if (r.is_null() || static_cast<size_t>(r.length()) < num_bytes) {
            r.set_null();
            set_null();
            return;
        }
        data = r.data;
        data_end = r.data + num_bytes;
        r.data += num_bytes;
    }

    /// returns a `std::string` that contains a copy of the data in this datum
    ///
    std::string get_string() const {
        if (is_null()) {
            return {};
        }
        return std::string(reinterpret_cast<const char *>(data), length());
    }

    /// returns a `std::vector<uint8_t>` that contains a copy of the
    /// data in this datum
    ///
    std::vector<uint8_t> get_bytes() const {
        if (is_null()) {
            return {};
        }
        return std::vector<uint8_t>(data, data_end);
    }

    /// Compares this \ref datum to `p` lexicographically, and returns
    /// an integer less than, equal to, or greater than zero if this
    /// is found to be less than, to match, or to be greater than `p`,
    /// respectively.  If one datum is a prefix of the other, the
    /// prefix is considered lesser; a null datum is less than any
    /// other datum.
    ///
    int cmp(const datum &p) const {
        if (is_null()) {
            return p.is_null() ? 0 : -1;
        }
        if (p.is_null()) {
            return 1;
        }
        size_t common = std::min(length(), p.length());
        int result = common ? ::memcmp(data, p.data, common) : 0;
        if (result == 0) {
            if (length() < p.length()) {
                return -1;
            }
            return length() > p.length() ? 1 : 0;
        }
        return result;
    }

    // member functions that can be used in STL algorithms
    //
    const uint8_t *begin() const { return data; }
    const uint8_t *end()   const { return data_end; }

};

// sanity checks on class datum
//
static_assert(sizeof(datum) == 2 * sizeof(uint8_t *));

/// \defgroup bitops Bit Operations
/// @{

template <typename T>
constexpr size_t bitsizeof() { return sizeof(T) * CHAR_BIT; }

/// returns the unsigned integer represented by the bits of `x` in
/// between `i` and `j-1`, inclusive, where zero denotes the leftmost
/// (most significant) bit.  For example, `slice<0,3>(0xd8)` is `6`
/// and `slice<3,8>(0xd8)` is `24`.
///
// The cast to type T is essential so that types smaller than
// 'unsigned integer' will not be promoted to a larger type.
//
template <size_t i, size_t j, typename T>
constexpr T slice(T s) {
    return ((T)(s << i)) >> (bitsizeof<T>() - (j - i));
}

/// @} - end of bitops

/// writeable tracks a region of memory into which data is written
/// sequentially.  Writes that do not fit call \ref extend(), which
/// fails (setting the writeable to the null state) unless a derived
/// class supplies more room.
///
class writeable {
protected:

    uint8_t *data;
    uint8_t *data_end;

    bool is_invalid() const {
        return data > data_end;
    }

    /// attempts to make room for at least \param num_bytes more
    /// bytes, and returns true if that room is now available
    ///
    virtual bool extend(size_t /* num_bytes */) { return false; }

public:

    /// constructs a null writeable object
    ///
    writeable() : data{nullptr}, data_end{nullptr} { }

    writeable(const writeable &) = delete;
    writeable &operator=(const writeable &) = delete;

    virtual ~writeable() = default;

    /// returns true if the writeable object is in the null state, and false otherwise
    ///
    bool is_null() const { return data == nullptr || data_end == nullptr; }

    /// returns the number of bytes in the writeable region to which
    /// data can be written
    ///
    ssize_t writeable_length() const { return data_end - data; }

    void set_null() {
        data = nullptr;
        data_end = nullptr;
    }

    /// Copies the single `uint8_t` \param x into this `writeable`, if
    /// there is room; otherwise, sets it to the null state.
    ///
    void copy(uint8_t x) {
        if (is_null()) {
            return;
        }
        if (data + 1 > data_end && !extend(1)) {
            set_null();
            return;
        }
        *data++ = x;
        assert(!is_invalid());
    }

    /// Copies \p num_bytes bytes from location \p rdata into this
    /// `writeable`, if there is room; otherwise, sets it to the
    /// null state.
    ///
    void copy(const uint8_t *rdata, size_t num_bytes) {
        if (is_null()) {
            return;
        }
        if (num_bytes == 0) {
            return;
        }
        if (rdata == nullptr) {
            set_null();
            return;
        }
        if (writeable_length() < (ssize_t)num_bytes && !extend(num_bytes)) {
            set_null();
            return;
        }
        memcpy(data, rdata, num_bytes);
        data += num_bytes;
        assert(!is_invalid());
    }

    /// Copies the contents of `datum` \p d into this `writeable`
    ///
    void copy(datum d) {
        if (d.is_null()) {
            return;
        }
        copy(d.data, d.length());
    }

    template <typename Type>
    writeable & operator<<(const Type &t) {
        t.write(*this);
        return *this;
    }

    writeable & operator<<(datum d) {
        copy(d);
        return *this;
    }

    writeable & operator<<(uint8_t x) {
        copy(x);
        return *this;
    }

};

/// dynamic_buffer is a writeable that grows on demand.  When a write
/// does not fit, the backing store grows to twice its size, or to
/// exactly the required size if doubling is not enough; it never
/// shrinks.
///
///      +-- start of buffer               end of buffer --+
///      v                                                 v
///      +--------------------+----------------------------+
///      |   readable part    |       writeable part       |
///      +--------------------+----------------------------+
///                           ^
///                           +-- start of writeable
///
class dynamic_buffer : public writeable {
    std::vector<uint8_t> buffer;

    bool extend(size_t num_bytes) override {
        size_t used = data - buffer.data();
        size_t required = used + num_bytes;
        size_t new_size = std::max(buffer.size() * 2, required);
        buffer.resize(new_size);
        data = buffer.data() + used;
        data_end = buffer.data() + buffer.size();
        return true;
    }

public:

    /// constructs a `dynamic_buffer` with an initial size of
    /// \param initial_size bytes (at least one)
    ///
    explicit dynamic_buffer(size_t initial_size) :
        buffer(std::max(initial_size, size_t{1}))
    {
        data = buffer.data();
        data_end = data + buffer.size();
    }

    /// reset this `dynamic_buffer` so that the readable part is empty
    ///
    void reset() {
        data = buffer.data();
        data_end = data + buffer.size();
    }

    /// returns the number of bytes in the backing store
    ///
    size_t capacity() const { return buffer.size(); }

    /// returns the number of bytes in the readable region, if the
    /// writeable region is not null; otherwise, zero is returned
    ///
    size_t readable_length() const {
        if (writeable::is_null()) {
            return 0;
        }
        return data - buffer.data();
    }

    /// returns a \ref datum representing the readable part of the
    /// \ref dynamic_buffer
    ///
    datum contents() const {
        if (writeable::is_null()) {
            return {nullptr, nullptr};
        }
        return {buffer.data(), data};
    }

    /// moves the readable part out of this buffer, which is left in
    /// the null state
    ///
    std::vector<uint8_t> finalize() {
        size_t used = readable_length();
        buffer.resize(used);
        set_null();
        return std::move(buffer);
    }

};

/// represents an unsigned integer type `T` that is read from, or
/// written to, a byte stream in network byte order
///
template <typename T>
class encoded {
    T val;

    static_assert(std::is_unsigned_v<T>, "T must be an unsigned integer");

public:

    /// constructs an `encoded<T>` by accepting/reading an unsigned
    /// integer type `T` from the datum `d` in network byte order; if
    /// `d` holds fewer than `sizeof(T)` bytes, it is set to null
    ///
    encoded(datum &d) {
        if (d.data == nullptr || d.data + sizeof(T) > d.data_end) {
            d.set_null();
            val = 0;
            return;
        }
        T tmp = 0;
        for (size_t i = 0; i < sizeof(T); i++) {
            tmp = (T)(tmp << 8) | d.data[i];
        }
        val = tmp;
        d.data += sizeof(T);
    }

    encoded(const T& rhs) : val{rhs} { }

    operator T() const { return val; }

    T value() const { return val; }

    /// returns the unsigned integer given by the bits in between `i`
    /// and `j-1`, inclusive, where zero denotes the leftmost (most
    /// significant) bit
    ///
    template <size_t i, size_t j>
    T slice() const {
        return grove::slice<i,j>(val);
    }

    /// writes this integer into \param buf in network byte order
    ///
    void write(writeable &buf) const {
        T tmp = hton(val);
        buf.copy(reinterpret_cast<const uint8_t *>(&tmp), sizeof(T));
    }
};

template <>
inline void encoded<uint8_t>::write(writeable &buf) const {
    buf.copy(val);
}

static_assert(sizeof(encoded<uint8_t>)  == 1);
static_assert(sizeof(encoded<uint16_t>) == 2);
static_assert(sizeof(encoded<uint32_t>) == 4);
static_assert(sizeof(encoded<uint64_t>) == 8);

}  // namespace grove

#endif // GROVE_DATUM_H
