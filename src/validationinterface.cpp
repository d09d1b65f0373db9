// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "validationinterface.h"

#include <boost/bind/bind.hpp>

using namespace boost::placeholders;

static CMainSignals g_signals;

CMainSignals& GetMainSignals()
{
    return g_signals;
}

void RegisterValidationInterface(CValidationInterface* pwalletIn) {
    g_signals.InstructionAccepted.connect(boost::bind(&CValidationInterface::InstructionAccepted, pwalletIn, _1));
    g_signals.InstructionChecked.connect(boost::bind(&CValidationInterface::InstructionChecked, pwalletIn, _1, _2));
    g_signals.UpdatedTreeRoot.connect(boost::bind(&CValidationInterface::UpdatedTreeRoot, pwalletIn, _1, _2));
    g_signals.NullifierSpent.connect(boost::bind(&CValidationInterface::NullifierSpent, pwalletIn, _1));
}

void UnregisterValidationInterface(CValidationInterface* pwalletIn) {
    g_signals.NullifierSpent.disconnect(boost::bind(&CValidationInterface::NullifierSpent, pwalletIn, _1));
    g_signals.UpdatedTreeRoot.disconnect(boost::bind(&CValidationInterface::UpdatedTreeRoot, pwalletIn, _1, _2));
    g_signals.InstructionChecked.disconnect(boost::bind(&CValidationInterface::InstructionChecked, pwalletIn, _1, _2));
    g_signals.InstructionAccepted.disconnect(boost::bind(&CValidationInterface::InstructionAccepted, pwalletIn, _1));
}

void UnregisterAllValidationInterfaces() {
    g_signals.NullifierSpent.disconnect_all_slots();
    g_signals.UpdatedTreeRoot.disconnect_all_slots();
    g_signals.InstructionChecked.disconnect_all_slots();
    g_signals.InstructionAccepted.disconnect_all_slots();
}
