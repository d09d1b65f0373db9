// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_UINT256_H
#define SHIELDPOOL_UINT256_H

#include <assert.h>
#include <cstring>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

/** Template base class for fixed-sized opaque blobs.
 *
 * Bytes are kept in big-endian (network) order: byte 0 is the most
 * significant, which is the layout every field element and curve
 * coordinate uses on the wire. GetHex() prints the bytes in that order.
 */
template<unsigned int BITS>
class base_blob
{
protected:
    enum { WIDTH=BITS/8 };
    uint8_t data[WIDTH];
public:
    base_blob()
    {
        memset(data, 0, sizeof(data));
    }

    explicit base_blob(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (int i = 0; i < WIDTH; i++)
            if (data[i] != 0)
                return false;
        return true;
    }

    void SetNull()
    {
        memset(data, 0, sizeof(data));
    }

    inline int Compare(const base_blob& other) const { return memcmp(data, other.data, sizeof(data)); }

    friend inline bool operator==(const base_blob& a, const base_blob& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const base_blob& a, const base_blob& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const base_blob& a, const base_blob& b) { return a.Compare(b) < 0; }

    std::string GetHex() const;
    void SetHex(const char* psz);
    void SetHex(const std::string& str);
    std::string ToString() const;

    unsigned char* begin()
    {
        return &data[0];
    }

    unsigned char* end()
    {
        return &data[WIDTH];
    }

    const unsigned char* begin() const
    {
        return &data[0];
    }

    const unsigned char* end() const
    {
        return &data[WIDTH];
    }

    static constexpr unsigned int size()
    {
        return sizeof(data);
    }

    /** Big-endian value of the trailing eight bytes. */
    uint64_t GetUint64() const
    {
        uint64_t x = 0;
        for (int i = WIDTH - 8; i < WIDTH; i++) {
            x = (x << 8) | data[i];
        }
        return x;
    }
};

/** 256-bit opaque blob. Holds field elements, hashes and addresses. */
class uint256 : public base_blob<256> {
public:
    uint256() {}
    uint256(const base_blob<256>& b) : base_blob<256>(b) {}
    explicit uint256(const std::vector<unsigned char>& vch) : base_blob<256>(vch) {}

    static uint256 FromRawBytes(const unsigned char* bytes)
    {
        uint256 ret;
        memcpy(ret.begin(), bytes, ret.size());
        return ret;
    }

    /** Big-endian encoding of a 64-bit value in the last eight bytes. */
    static uint256 FromUint64(uint64_t x)
    {
        uint256 ret;
        for (int i = 31; i >= 24; i--) {
            ret.data[i] = x & 0xff;
            x >>= 8;
        }
        return ret;
    }
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can result
 * in dangerously catching uint256(0).
 */
inline uint256 uint256S(const char *str)
{
    uint256 rv;
    rv.SetHex(str);
    return rv;
}

inline uint256 uint256S(const std::string& str)
{
    return uint256S(str.c_str());
}

#endif // SHIELDPOOL_UINT256_H
