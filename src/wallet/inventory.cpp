// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/inventory.h"
#include "core/logging.h"
#include "wallet/utxo_lock.h"

#include <set>

namespace wallet {

core::Result<std::vector<primitives::Utxo>> load_inventory(
    ledger::LedgerClient& ledger,
    const std::vector<std::string>& addresses,
    int min_confirmations,
    const UtxoLockTable* locks) {

    auto reply = ledger.list_unspent(min_confirmations,
                                     ledger::MAX_CONFIRMATIONS, addresses);
    if (!reply.ok()) {
        LOG_WARN(core::LogCategory::LEDGER,
                 "listunspent failed: " + reply.error().message());
        return core::Error(core::ErrorCode::INVENTORY_UNAVAILABLE,
                           "Unable to list unspent outputs: " +
                           reply.error().message());
    }

    std::set<std::string> wanted(addresses.begin(), addresses.end());
    std::set<primitives::OutPoint> seen;

    std::vector<primitives::Utxo> inventory;
    inventory.reserve(reply.value().size());
    size_t dropped = 0;

    for (const auto& utxo : reply.value()) {
        bool keep = !utxo.locked &&
                    utxo.confirmations >= min_confirmations &&
                    utxo.amount.value() > 0 && utxo.amount.is_valid() &&
                    (wanted.empty() || wanted.count(utxo.address) > 0) &&
                    (locks == nullptr || !locks->is_locked(utxo.outpoint));
        if (!keep || !seen.insert(utxo.outpoint).second) {
            ++dropped;
            continue;
        }
        inventory.push_back(utxo);
    }

    LOG_DEBUG(core::LogCategory::WALLET,
              "Inventory: " + std::to_string(inventory.size()) +
              " spendable outputs (" + std::to_string(dropped) +
              " filtered)");
    return inventory;
}

primitives::Amount inventory_total(
    const std::vector<primitives::Utxo>& inventory) {
    int64_t total = 0;
    for (const auto& u : inventory) {
        total += u.amount.value();
    }
    return primitives::Amount(total);
}

} // namespace wallet
