// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "crypto/keccak.h"

#include "crypto/common.h"

#include <string.h>

// Internal implementation code.
namespace
{
namespace keccak
{
const uint64_t RNDC[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rotation offsets and lane order for the combined rho and pi steps.
const int ROTC[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};
const int PILN[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

uint64_t inline rotl(uint64_t x, int n) { return (x << n) | (x >> (64 - n)); }

/** Perform the Keccak-f[1600] permutation on the state. */
void Permute(uint64_t st[25])
{
    uint64_t bc[5];
    for (int round = 0; round < 24; round++) {
        // theta
        for (int i = 0; i < 5; i++)
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        for (int i = 0; i < 5; i++) {
            uint64_t t = bc[(i + 4) % 5] ^ rotl(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5)
                st[j + i] ^= t;
        }

        // rho, pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; i++) {
            int j = PILN[i];
            bc[0] = st[j];
            st[j] = rotl(t, ROTC[i]);
            t = bc[0];
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; i++)
                bc[i] = st[j + i];
            for (int i = 0; i < 5; i++)
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }

        // iota
        st[0] ^= RNDC[round];
    }
}

void Absorb(uint64_t st[25], const unsigned char* block)
{
    for (size_t i = 0; i < CKeccak256::RATE / 8; i++) {
        st[i] ^= ReadLE64(block + 8 * i);
    }
    Permute(st);
}

} // namespace keccak

} // namespace

////// Keccak-256

CKeccak256::CKeccak256() : bufsize(0)
{
    memset(s, 0, sizeof(s));
}

CKeccak256& CKeccak256::Write(const unsigned char* data, size_t len)
{
    const unsigned char* end = data + len;
    if (bufsize && bufsize + len >= RATE) {
        // Fill the buffer, and process it.
        memcpy(buf + bufsize, data, RATE - bufsize);
        data += RATE - bufsize;
        keccak::Absorb(s, buf);
        bufsize = 0;
    }
    while (end >= data + RATE) {
        // Process full chunks directly from the source.
        keccak::Absorb(s, data);
        data += RATE;
    }
    if (end > data) {
        // Fill the buffer with what remains.
        memcpy(buf + bufsize, data, end - data);
        bufsize += end - data;
    }
    return *this;
}

void CKeccak256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    memset(buf + bufsize, 0, RATE - bufsize);
    buf[bufsize] |= 0x01;
    buf[RATE - 1] |= 0x80;
    keccak::Absorb(s, buf);
    for (size_t i = 0; i < OUTPUT_SIZE / 8; i++) {
        WriteLE64(hash + 8 * i, s[i]);
    }
    Reset();
}

CKeccak256& CKeccak256::Reset()
{
    memset(s, 0, sizeof(s));
    bufsize = 0;
    return *this;
}
