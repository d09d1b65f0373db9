// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "uint256.h"

#include "utilstrencodings.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

template <unsigned int BITS>
base_blob<BITS>::base_blob(const std::vector<unsigned char>& vch)
{
    if (vch.size() != sizeof(data)) {
        throw std::invalid_argument("base_blob: vector has the wrong length");
    }
    memcpy(data, &vch[0], sizeof(data));
}

template <unsigned int BITS>
std::string base_blob<BITS>::GetHex() const
{
    return HexStr(begin(), end());
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(const char* psz)
{
    memset(data, 0, sizeof(data));

    // skip leading spaces
    while (isspace(*psz))
        psz++;

    // skip 0x
    if (psz[0] == '0' && tolower(psz[1]) == 'x')
        psz += 2;

    // hex string is right-aligned: a short string is a small number
    const char* pbegin = psz;
    while (::HexDigit(*psz) != -1)
        psz++;
    psz--;
    int i = WIDTH - 1;
    while (psz >= pbegin && i >= 0) {
        data[i] = ::HexDigit(*psz--);
        if (psz >= pbegin) {
            data[i] |= ((unsigned char)::HexDigit(*psz--) << 4);
        }
        i--;
    }
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(const std::string& str)
{
    SetHex(str.c_str());
}

template <unsigned int BITS>
std::string base_blob<BITS>::ToString() const
{
    return (GetHex());
}

// Explicit instantiations for base_blob<256>
template base_blob<256>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<256>::GetHex() const;
template std::string base_blob<256>::ToString() const;
template void base_blob<256>::SetHex(const char*);
template void base_blob<256>::SetHex(const std::string&);

// Explicit instantiations for base_blob<512> (G1 points)
template base_blob<512>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<512>::GetHex() const;
template std::string base_blob<512>::ToString() const;
template void base_blob<512>::SetHex(const char*);
template void base_blob<512>::SetHex(const std::string&);

// Explicit instantiations for base_blob<1024> (G2 points)
template base_blob<1024>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<1024>::GetHex() const;
template std::string base_blob<1024>::ToString() const;
template void base_blob<1024>::SetHex(const char*);
template void base_blob<1024>::SetHex(const std::string&);
