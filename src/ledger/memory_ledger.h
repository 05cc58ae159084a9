#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "core/types.h"
#include "ledger/client.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ledger {

// ---------------------------------------------------------------------------
// MemoryLedger -- in-process ledger node
// ---------------------------------------------------------------------------
// Holds a UTXO set, node-side output locks and the transactions it has
// drafted, signed and accepted. Used by the test suite and by the CLI for
// offline planning against a snapshot file. Every operation can be made to
// fail on demand.
// ---------------------------------------------------------------------------

class MemoryLedger : public LedgerClient {
public:
    enum class Operation : uint8_t {
        LIST_UNSPENT,
        LOCK_OUTPUT,
        UNLOCK_OUTPUT,
        CREATE_TRANSACTION,
        SIGN_TRANSACTION,
        BROADCAST_TRANSACTION,
        GET_OUTPUT,
        GET_CHANGE_ADDRESS,
    };

    /// Called after list_unspent has built its reply, without the ledger
    /// lock held, so it may call back into the ledger.
    using ListUnspentHook = std::function<void(MemoryLedger&)>;

    /// A transaction the ledger accepted.
    struct Accepted {
        core::uint256 txid;
        std::vector<primitives::OutPoint> inputs;
        std::map<std::string, primitives::Amount> outputs;
        primitives::Amount fee;
    };

    MemoryLedger() = default;

    // -- Population ---------------------------------------------------------

    /// Insert (or replace) an output.
    void add_output(const primitives::Utxo& utxo);

    /// Insert an output under a fresh random txid and return it.
    primitives::Utxo add_output(const std::string& address,
                                primitives::Amount amount,
                                int confirmations);

    /// Forget an output, as if it had been spent by someone else.
    bool remove_output(const primitives::OutPoint& outpoint);

    /// Mine a block: every output gains one confirmation.
    void confirm_block();

    // -- Failure injection --------------------------------------------------

    /// Make the next @p times calls of @p op fail with @p code.
    void fail_next(Operation op,
                   core::ErrorCode code = core::ErrorCode::NETWORK_ERROR,
                   int times = 1);

    /// When set, sign_transaction reports complete = false.
    void set_sign_incomplete(bool incomplete);

    void set_list_unspent_hook(ListUnspentHook hook);

    /// Hand out @p address for change instead of generated ones.
    void set_change_address(std::string address);

    // -- Inspection ---------------------------------------------------------

    [[nodiscard]] std::vector<primitives::Utxo> outputs() const;
    [[nodiscard]] size_t output_count() const;
    [[nodiscard]] bool is_locked(const primitives::OutPoint& outpoint) const;
    [[nodiscard]] std::vector<Accepted> accepted() const;
    [[nodiscard]] size_t call_count(Operation op) const;

    // -- LedgerClient -------------------------------------------------------

    core::Result<std::vector<primitives::Utxo>> list_unspent(
        int min_conf, int max_conf,
        const std::vector<std::string>& addresses) override;

    core::Result<void> lock_output(
        const primitives::OutPoint& outpoint) override;

    core::Result<void> unlock_output(
        const primitives::OutPoint& outpoint) override;

    core::Result<std::string> create_transaction(
        const std::vector<primitives::OutPoint>& inputs,
        const std::map<std::string, primitives::Amount>& outputs) override;

    core::Result<SignedTransaction> sign_transaction(
        const std::string& raw_hex) override;

    core::Result<core::uint256> broadcast_transaction(
        const SignedTransaction& tx) override;

    core::Result<std::optional<primitives::Utxo>> get_output(
        const primitives::OutPoint& outpoint) override;

    core::Result<std::string> get_change_address() override;

private:
    struct Draft {
        std::vector<primitives::OutPoint> inputs;
        std::map<std::string, primitives::Amount> outputs;
        bool signed_ = false;
    };

    struct InjectedFailure {
        core::ErrorCode code = core::ErrorCode::NETWORK_ERROR;
        int remaining = 0;
    };

    /// Count the call and consume an injected failure for @p op, if any.
    /// Caller holds mutex_.
    std::optional<core::Error> begin_call(Operation op);

    mutable core::Mutex mutex_{"memory_ledger"};
    std::map<primitives::OutPoint, primitives::Utxo> utxos_;
    std::set<primitives::OutPoint> locked_;
    std::map<std::string, Draft> drafts_;
    std::vector<Accepted> accepted_;
    std::map<Operation, InjectedFailure> failures_;
    std::map<Operation, size_t> calls_;
    ListUnspentHook list_unspent_hook_;
    bool sign_incomplete_ = false;
    uint64_t next_change_index_ = 0;
    std::string fixed_change_address_;
};

[[nodiscard]] std::string_view operation_name(MemoryLedger::Operation op);

} // namespace ledger
