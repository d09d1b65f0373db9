// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2022 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef SHIELDPOOL_VALIDATIONINTERFACE_H
#define SHIELDPOOL_VALIDATIONINTERFACE_H

#include <stdint.h>
#include <string>

#include <boost/signals2/signal.hpp>

class CPoolReceipt;
class CValidationInterface;
class CValidationState;
class uint256;

// These functions dispatch to one or all registered listeners

/** Register a listener to receive pool notifications */
void RegisterValidationInterface(CValidationInterface* pwalletIn);
/** Unregister a listener */
void UnregisterValidationInterface(CValidationInterface* pwalletIn);
/** Unregister all listeners */
void UnregisterAllValidationInterfaces();

class CValidationInterface {
protected:
    virtual void InstructionAccepted(const CPoolReceipt &receipt) {}
    virtual void InstructionChecked(const std::string &strInstruction, const CValidationState &state) {}
    virtual void UpdatedTreeRoot(const uint256 &root, uint64_t nextIndex) {}
    virtual void NullifierSpent(const uint256 &nullifierHash) {}
    friend void ::RegisterValidationInterface(CValidationInterface*);
    friend void ::UnregisterValidationInterface(CValidationInterface*);
    friend void ::UnregisterAllValidationInterfaces();
};

struct CMainSignals {
    /** Notifies listeners of an instruction whose changes were committed */
    boost::signals2::signal<void (const CPoolReceipt &)> InstructionAccepted;
    /** Notifies listeners of the outcome of every instruction, accepted or rejected */
    boost::signals2::signal<void (const std::string &, const CValidationState &)> InstructionChecked;
    /** Notifies listeners of a new ledger tree root */
    boost::signals2::signal<void (const uint256 &, uint64_t)> UpdatedTreeRoot;
    /** Notifies listeners of a committed spent-nullifier record */
    boost::signals2::signal<void (const uint256 &)> NullifierSpent;
};

CMainSignals& GetMainSignals();

#endif // SHIELDPOOL_VALIDATIONINTERFACE_H
