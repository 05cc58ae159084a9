#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "ledger/client.h"
#include "primitives/amount.h"
#include "primitives/utxo.h"

#include <string>
#include <vector>

namespace wallet {

class UtxoLockTable;

/// Bookkeeping reads (balances, estimates) may include unconfirmed outputs.
inline constexpr int INVENTORY_BOOKKEEPING_MIN_CONF = 0;

/// Fetch the spendable outputs of @p addresses from the node.
///
/// Drops outputs that are locked on the node, held by a live entry in
/// @p locks (when given), below @p min_confirmations, owned by an address
/// that was not asked for, or of non-positive amount. Duplicate outpoints
/// in the reply are collapsed. A failed node query is reported as
/// INVENTORY_UNAVAILABLE, never as an empty inventory.
core::Result<std::vector<primitives::Utxo>> load_inventory(
    ledger::LedgerClient& ledger,
    const std::vector<std::string>& addresses,
    int min_confirmations,
    const UtxoLockTable* locks = nullptr);

/// Sum of all amounts in @p inventory.
[[nodiscard]] primitives::Amount inventory_total(
    const std::vector<primitives::Utxo>& inventory);

} // namespace wallet
