// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_CRYPTO_KECCAK_H
#define SHIELDPOOL_CRYPTO_KECCAK_H

#include <stdint.h>
#include <stdlib.h>

/** A hasher class for Keccak-256 (original 0x01 padding, not FIPS-202 SHA3). */
class CKeccak256
{
private:
    uint64_t s[25];
    unsigned char buf[136];
    size_t bufsize;

public:
    static const size_t OUTPUT_SIZE = 32;
    static const size_t RATE = 136;

    CKeccak256();
    CKeccak256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CKeccak256& Reset();
};

#endif // SHIELDPOOL_CRYPTO_KECCAK_H
