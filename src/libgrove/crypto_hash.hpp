/*
 * crypto_hash.hpp
 *
 * SHA-256 digests through the OpenSSL EVP interface
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_CRYPTO_HASH_HPP
#define GROVE_CRYPTO_HASH_HPP

#include <openssl/evp.h>
#include <array>
#include <stdexcept>
#include "datum.h"
#include "err.h"

namespace grove {

class hasher {
    EVP_MD_CTX *mdctx;

public:

    hasher() : mdctx{nullptr} { }

    hasher(const hasher &) = delete;
    hasher &operator=(const hasher &) = delete;

    ~hasher() {
        EVP_MD_CTX_free(mdctx);
    }

    constexpr static size_t output_size = 32;

    using digest = std::array<uint8_t, output_size>;

    /// computes the SHA-256 digest of the \param message_len bytes at
    /// \param message and writes it into \param output
    ///
    void hash_buffer(const unsigned char *message, size_t message_len, digest &output) {

        if (mdctx == nullptr) {
            if ((mdctx = EVP_MD_CTX_new()) == nullptr) {
                handle_errors("EVP_MD_CTX_new");
            }
        }

        if (1 != EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr)) {
            handle_errors("EVP_DigestInit_ex");
        }

        if (1 != EVP_DigestUpdate(mdctx, message, message_len)) {
            handle_errors("EVP_DigestUpdate");
        }

        unsigned int tmp_len = 0;
        if (1 != EVP_DigestFinal_ex(mdctx, output.data(), &tmp_len) || tmp_len != output_size) {
            handle_errors("EVP_DigestFinal_ex");
        }
    }

    [[noreturn]] static void handle_errors(const char *operation) {
        printf_err(log_err, "EVP hash failure in %s\n", operation);
        throw std::runtime_error{std::string{"sha256: EVP failure in "} + operation};
    }
};

/// returns the SHA-256 digest of the bytes in \param d
///
inline hasher::digest sha256_hash(datum d) {
    hasher h;
    hasher::digest output;
    h.hash_buffer(d.data, d.is_null() ? 0 : d.length(), output);
    return output;
}

}  // namespace grove

#endif // GROVE_CRYPTO_HASH_HPP
