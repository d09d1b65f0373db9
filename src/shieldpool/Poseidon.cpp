#include "shieldpool/Poseidon.hpp"

#include "shieldpool/Field.hpp"
#include "logging.h"

#include <array>
#include <set>
#include <stdexcept>

namespace libshieldpool {

namespace {

// 80-bit Grain LFSR in self-shrinking mode, seeded with the Poseidon
// parameters as in the reference parameter generation script.
class GrainLFSR {
public:
    GrainLFSR(size_t width, size_t full_rounds, size_t partial_rounds) : pos(0)
    {
        size_t n = 0;
        auto push = [&](uint64_t value, size_t bits) {
            for (size_t i = bits; i-- > 0;) {
                state[n++] = (value >> i) & 1;
            }
        };
        push(1, 2);     // prime field
        push(0, 4);     // x^alpha S-box
        push(254, 12);  // field size in bits
        push(width, 12);
        push(full_rounds, 10);
        push(partial_rounds, 10);
        push((1 << 30) - 1, 30);

        for (size_t i = 0; i < 160; i++) {
            Next();
        }
    }

    // 254-bit draw, most significant bit first.
    mpz_class FieldElement()
    {
        mpz_class v = 0;
        for (size_t i = 0; i < 254; i++) {
            v <<= 1;
            v += Bit();
        }
        return v;
    }

private:
    std::array<unsigned char, 80> state;
    size_t pos;

    unsigned char Next()
    {
        unsigned char bit = state[(pos + 62) % 80] ^ state[(pos + 51) % 80] ^
                            state[(pos + 38) % 80] ^ state[(pos + 23) % 80] ^
                            state[(pos + 13) % 80] ^ state[pos];
        state[pos] = bit;
        pos = (pos + 1) % 80;
        return bit;
    }

    unsigned char Bit()
    {
        while (true) {
            unsigned char b1 = Next();
            unsigned char b2 = Next();
            if (b1 == 1) {
                return b2;
            }
        }
    }
};

PoseidonHasher::Params GenerateParams(size_t width, size_t full_rounds, size_t partial_rounds)
{
    const mpz_class& r = ScalarModulus();
    PoseidonHasher::Params params;
    params.width = width;
    params.full_rounds = full_rounds;
    params.partial_rounds = partial_rounds;

    GrainLFSR grain(width, full_rounds, partial_rounds);

    size_t count = (full_rounds + partial_rounds) * width;
    while (params.round_constants.size() < count) {
        mpz_class v = grain.FieldElement();
        if (v < r) {
            params.round_constants.push_back(v);
        }
    }

    std::vector<mpz_class> xs;
    while (true) {
        xs.clear();
        std::set<mpz_class> seen;
        for (size_t i = 0; i < 2 * width; i++) {
            mpz_class v = grain.FieldElement() % r;
            xs.push_back(v);
            seen.insert(v);
        }
        if (seen.size() == 2 * width) {
            break;
        }
    }

    params.mds.assign(width, std::vector<mpz_class>(width));
    for (size_t i = 0; i < width; i++) {
        for (size_t j = 0; j < width; j++) {
            mpz_class sum = (xs[i] + xs[width + j]) % r;
            if (mpz_invert(params.mds[i][j].get_mpz_t(), sum.get_mpz_t(), r.get_mpz_t()) == 0) {
                throw std::logic_error("Poseidon MDS entry is not invertible");
            }
        }
    }
    return params;
}

mpz_class Sbox(const mpz_class& v, const mpz_class& r)
{
    mpz_class out;
    mpz_powm_ui(out.get_mpz_t(), v.get_mpz_t(), 5, r.get_mpz_t());
    return out;
}

}

PoseidonHasher::PoseidonHasher() :
    params3(GenerateParams(3, 8, 57)),
    params5(GenerateParams(5, 8, 60))
{
    LogPrint("pool", "Poseidon tables generated for widths 3 and 5\n");
}

const PoseidonHasher::Params& PoseidonHasher::ParamsForWidth(size_t width) const
{
    switch (width) {
    case 3:
        return params3;
    case 5:
        return params5;
    default:
        throw std::invalid_argument("Poseidon width must be 3 or 5");
    }
}

uint256 PoseidonHasher::Hash(const std::vector<uint256>& inputs) const
{
    if (inputs.size() != 2 && inputs.size() != 4) {
        throw std::invalid_argument("Poseidon takes two or four inputs");
    }
    const Params& params = ParamsForWidth(inputs.size() + 1);
    const mpz_class& r = ScalarModulus();
    const size_t t = params.width;

    std::vector<mpz_class> state(t);
    for (size_t i = 0; i < inputs.size(); i++) {
        if (!IsCanonicalScalar(inputs[i])) {
            throw std::domain_error("Poseidon input is not a canonical field element");
        }
        state[i + 1] = ToMpz(inputs[i]);
    }

    const size_t half = params.full_rounds / 2;
    const size_t rounds = params.full_rounds + params.partial_rounds;
    std::vector<mpz_class> mixed(t);
    for (size_t round = 0; round < rounds; round++) {
        for (size_t i = 0; i < t; i++) {
            state[i] = (state[i] + params.round_constants[round * t + i]) % r;
        }
        if (round < half || round >= half + params.partial_rounds) {
            for (size_t i = 0; i < t; i++) {
                state[i] = Sbox(state[i], r);
            }
        } else {
            state[0] = Sbox(state[0], r);
        }
        for (size_t i = 0; i < t; i++) {
            mixed[i] = 0;
            for (size_t j = 0; j < t; j++) {
                mpz_addmul(mixed[i].get_mpz_t(), params.mds[i][j].get_mpz_t(), state[j].get_mpz_t());
            }
            mixed[i] %= r;
        }
        state.swap(mixed);
    }
    return FromMpz(state[0]);
}

uint256 PoseidonHasher::Hash(const uint256& a, const uint256& b) const
{
    return Hash(std::vector<uint256>{a, b});
}

uint256 PoseidonHasher::Hash(const uint256& a, const uint256& b, const uint256& c, const uint256& d) const
{
    return Hash(std::vector<uint256>{a, b, c, d});
}

}
