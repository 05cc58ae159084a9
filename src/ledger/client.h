#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/amount.h"
#include "primitives/outpoint.h"
#include "primitives/utxo.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

/// Upper confirmation bound passed to list_unspent when any depth is fine.
inline constexpr int MAX_CONFIRMATIONS = 9'999'999;

/// A transaction as returned by the node's signer.
struct SignedTransaction {
    std::string hex;
    /// False when the node could not produce every signature.
    bool complete = false;
};

// ---------------------------------------------------------------------------
// LedgerClient -- the ledger node as seen by the planner
// ---------------------------------------------------------------------------

/// Abstract interface to a ledger node. Implementations may talk to a real
/// node over its RPC port, or be an in-process ledger for tests and offline
/// planning. All methods may be called from several threads at once.
class LedgerClient {
public:
    virtual ~LedgerClient() = default;

    /// Unspent outputs owned by @p addresses with a confirmation count in
    /// [min_conf, max_conf]. An empty address list means every address.
    virtual core::Result<std::vector<primitives::Utxo>> list_unspent(
        int min_conf, int max_conf,
        const std::vector<std::string>& addresses) = 0;

    /// Mark an output as not spendable by the node's own coin selection.
    /// Fails with UTXO_LOCK_CONFLICT if it is already locked.
    virtual core::Result<void> lock_output(
        const primitives::OutPoint& outpoint) = 0;

    virtual core::Result<void> unlock_output(
        const primitives::OutPoint& outpoint) = 0;

    /// Build an unsigned raw transaction; returns its hex encoding.
    virtual core::Result<std::string> create_transaction(
        const std::vector<primitives::OutPoint>& inputs,
        const std::map<std::string, primitives::Amount>& outputs) = 0;

    virtual core::Result<SignedTransaction> sign_transaction(
        const std::string& raw_hex) = 0;

    /// Submit a fully signed transaction; returns its txid.
    virtual core::Result<core::uint256> broadcast_transaction(
        const SignedTransaction& tx) = 0;

    /// Current state of one output: nullopt once it has been spent.
    virtual core::Result<std::optional<primitives::Utxo>> get_output(
        const primitives::OutPoint& outpoint) = 0;

    /// A fresh address owned by the node's wallet, for change.
    virtual core::Result<std::string> get_change_address() = 0;
};

} // namespace ledger
