// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_CONSENSUS_VALIDATION_H
#define SHIELDPOOL_CONSENSUS_VALIDATION_H

#include <string>

/** Reject codes. One per error class of the pool. */
/** Malformed sizes or shapes, out-of-range amounts. */
static const unsigned char REJECT_VALIDATION = 0x01;
/** Undecodable or out-of-subgroup curve points, non-canonical scalars. */
static const unsigned char REJECT_CRYPTOGRAPHY = 0x02;
/** Well-formed proof for a false statement. */
static const unsigned char REJECT_PROOF = 0x10;
/** Nullifier already spent, tree full, root outside the history window. */
static const unsigned char REJECT_CONFLICT = 0x12;
/** Verification key missing or unlocked, schema-version mismatch, paused pool. */
static const unsigned char REJECT_CONFIG = 0x40;

/** Human-readable name of a reject code, for logs and the command line tool. */
inline const char* RejectCodeName(unsigned char chRejectCode)
{
    switch (chRejectCode) {
        case REJECT_VALIDATION: return "ValidationError";
        case REJECT_CRYPTOGRAPHY: return "CryptographyError";
        case REJECT_PROOF: return "ProofVerificationFailed";
        case REJECT_CONFLICT: return "StateConflict";
        case REJECT_CONFIG: return "ConfigError";
        default: return "Unknown";
    }
}

/** Capture information about instruction validation */
class CValidationState {
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< instruction rejected
        MODE_ERROR,   //!< run-time error
    } mode;
    int nDoS;
    std::string strRejectReason;
    unsigned char chRejectCode;
    bool corruptionPossible;
public:
    CValidationState() : mode(MODE_VALID), nDoS(0), chRejectCode(0), corruptionPossible(false) {}
    virtual ~CValidationState() {}

    virtual bool DoS(int level, bool ret = false,
             unsigned char chRejectCodeIn=0, std::string strRejectReasonIn="",
             bool corruptionIn=false) {
        chRejectCode = chRejectCodeIn;
        strRejectReason = strRejectReasonIn;
        corruptionPossible = corruptionIn;
        if (mode == MODE_ERROR)
            return ret;
        nDoS += level;
        mode = MODE_INVALID;
        return ret;
    }
    virtual bool Invalid(bool ret = false,
                 unsigned char _chRejectCode=0, std::string _strRejectReason="") {
        return DoS(0, ret, _chRejectCode, _strRejectReason);
    }
    virtual bool Error(std::string strRejectReasonIn) {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }
    virtual bool IsValid() const {
        return mode == MODE_VALID;
    }
    virtual bool IsInvalid() const {
        return mode == MODE_INVALID;
    }
    virtual bool IsError() const {
        return mode == MODE_ERROR;
    }
    virtual bool IsInvalid(int &nDoSOut) const {
        if (IsInvalid()) {
            nDoSOut = nDoS;
            return true;
        }
        return false;
    }
    virtual bool CorruptionPossible() const {
        return corruptionPossible;
    }
    virtual unsigned char GetRejectCode() const { return chRejectCode; }
    virtual std::string GetRejectReason() const { return strRejectReason; }
};

#endif // SHIELDPOOL_CONSENSUS_VALIDATION_H
