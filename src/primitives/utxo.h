#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"
#include "primitives/outpoint.h"

#include <string>

namespace primitives {

// ---------------------------------------------------------------------------
// Utxo -- one spendable output as reported by the ledger node
// ---------------------------------------------------------------------------
// A snapshot value: it describes the output at the moment the node was
// queried and is never updated in place.
// ---------------------------------------------------------------------------

struct Utxo {
    OutPoint outpoint;
    std::string address;
    Amount amount;
    int confirmations = 0;
    bool locked = false;   // locked by the node (lockunspent)

    bool operator==(const Utxo&) const = default;
};

} // namespace primitives
