// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2024 The Shieldpool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "primitives/instruction.h"

#include "tinyformat.h"

std::string ReceiptTypeName(ReceiptType type)
{
    switch (type) {
    case RECEIPT_POOL_INITIALIZED: return "pool-initialized";
    case RECEIPT_ASSET_REGISTERED: return "asset-registered";
    case RECEIPT_ASSET_CONFIGURED: return "asset-configured";
    case RECEIPT_VK_UPDATED: return "vk-updated";
    case RECEIPT_VK_LOCKED: return "vk-locked";
    case RECEIPT_POOL_PAUSED: return "pool-paused";
    case RECEIPT_POOL_UNPAUSED: return "pool-unpaused";
    case RECEIPT_AUTHORITY_TRANSFER_INITIATED: return "authority-transfer-initiated";
    case RECEIPT_AUTHORITY_TRANSFERRED: return "authority-transferred";
    case RECEIPT_AUTHORITY_TRANSFER_CANCELLED: return "authority-transfer-cancelled";
    case RECEIPT_RELAYER_REGISTRY_CONFIGURED: return "relayer-registry-configured";
    case RECEIPT_RELAYER_REGISTERED: return "relayer-registered";
    case RECEIPT_RELAYER_UPDATED: return "relayer-updated";
    case RECEIPT_RELAYER_DEACTIVATED: return "relayer-deactivated";
    case RECEIPT_DEPOSIT: return "deposit";
    case RECEIPT_WITHDRAW: return "withdraw";
    case RECEIPT_WITHDRAW_V2: return "withdraw-v2";
    case RECEIPT_JOINSPLIT: return "joinsplit";
    case RECEIPT_MEMBERSHIP: return "membership";
    case RECEIPT_BATCH_SETTLED: return "batch-settled";
    case RECEIPT_BATCH_PROCESSED: return "batch-processed";
    }
    return "unknown";
}

std::string CPoolReceipt::ToString() const
{
    std::string str;
    str += tfm::format("CPoolReceipt(type=%s, pool=%s, asset=%s, leafIndex=%u, amount=%u, fee=%u, publicAmount=%d, root=%s, time=%d)\n",
        ReceiptTypeName(type),
        pool.GetHex().substr(0, 10),
        assetId.GetHex().substr(0, 10),
        leafIndex,
        amount,
        fee,
        publicAmount,
        merkleRoot.GetHex().substr(0, 10),
        nTime);
    for (const uint256& nf : nullifiers)
        str += "    nullifier " + nf.GetHex() + "\n";
    for (const uint256& cm : commitments)
        str += "    commitment " + cm.GetHex() + "\n";
    return str;
}
