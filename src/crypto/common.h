// Copyright (c) 2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_CRYPTO_COMMON_H
#define SHIELDPOOL_CRYPTO_COMMON_H

#include <endian.h>
#include <stdint.h>
#include <string.h>

#include "sodium.h"

uint64_t static inline ReadLE64(const unsigned char* ptr)
{
    uint64_t x;
    memcpy((char*)&x, ptr, 8);
    return le64toh(x);
}

void static inline WriteLE64(unsigned char* ptr, uint64_t x)
{
    uint64_t v = htole64(x);
    memcpy(ptr, (char*)&v, 8);
}

/**
 * Initialise libsodium and confirm that its SHA-256 produces the
 * standard digest of the empty string. Returns -1 on failure.
 */
int inline init_and_check_sodium()
{
    if (sodium_init() == -1) {
        return -1;
    }

    static const unsigned char EMPTY_SHA256[crypto_hash_sha256_BYTES] =
      { 0xe3, 0xb0, 0xc4, 0x42, 0x98, 0xfc, 0x1c, 0x14,
        0x9a, 0xfb, 0xf4, 0xc8, 0x99, 0x6f, 0xb9, 0x24,
        0x27, 0xae, 0x41, 0xe4, 0x64, 0x9b, 0x93, 0x4c,
        0xa4, 0x95, 0x99, 0x1b, 0x78, 0x52, 0xb8, 0x55 };

    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, NULL, 0);
    if (memcmp(digest, EMPTY_SHA256, sizeof(digest)) != 0) {
        return -1;
    }

    return 0;
}

#endif // SHIELDPOOL_CRYPTO_COMMON_H
