// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/memory_ledger.h"
#include "core/logging.h"
#include "core/random.h"

#include <utility>

namespace ledger {

std::string_view operation_name(MemoryLedger::Operation op) {
    switch (op) {
        case MemoryLedger::Operation::LIST_UNSPENT:          return "listunspent";
        case MemoryLedger::Operation::LOCK_OUTPUT:           return "lockoutput";
        case MemoryLedger::Operation::UNLOCK_OUTPUT:         return "unlockoutput";
        case MemoryLedger::Operation::CREATE_TRANSACTION:    return "createrawtransaction";
        case MemoryLedger::Operation::SIGN_TRANSACTION:      return "signrawtransaction";
        case MemoryLedger::Operation::BROADCAST_TRANSACTION: return "sendrawtransaction";
        case MemoryLedger::Operation::GET_OUTPUT:            return "gettxout";
        case MemoryLedger::Operation::GET_CHANGE_ADDRESS:    return "getrawchangeaddress";
        default:                                             return "unknown";
    }
}

// ---------------------------------------------------------------------------
// Population
// ---------------------------------------------------------------------------

void MemoryLedger::add_output(const primitives::Utxo& utxo) {
    LOCK(mutex_);
    utxos_[utxo.outpoint] = utxo;
    if (utxo.locked) {
        locked_.insert(utxo.outpoint);
    }
}

primitives::Utxo MemoryLedger::add_output(const std::string& address,
                                          primitives::Amount amount,
                                          int confirmations) {
    primitives::Utxo utxo;
    utxo.outpoint = primitives::OutPoint(core::get_random_uint256(), 0);
    utxo.address = address;
    utxo.amount = amount;
    utxo.confirmations = confirmations;
    add_output(utxo);
    return utxo;
}

bool MemoryLedger::remove_output(const primitives::OutPoint& outpoint) {
    LOCK(mutex_);
    locked_.erase(outpoint);
    return utxos_.erase(outpoint) > 0;
}

void MemoryLedger::confirm_block() {
    LOCK(mutex_);
    for (auto& [outpoint, utxo] : utxos_) {
        ++utxo.confirmations;
    }
}

// ---------------------------------------------------------------------------
// Failure injection
// ---------------------------------------------------------------------------

void MemoryLedger::fail_next(Operation op, core::ErrorCode code, int times) {
    LOCK(mutex_);
    failures_[op] = InjectedFailure{code, times};
}

void MemoryLedger::set_sign_incomplete(bool incomplete) {
    LOCK(mutex_);
    sign_incomplete_ = incomplete;
}

void MemoryLedger::set_list_unspent_hook(ListUnspentHook hook) {
    LOCK(mutex_);
    list_unspent_hook_ = std::move(hook);
}

void MemoryLedger::set_change_address(std::string address) {
    LOCK(mutex_);
    fixed_change_address_ = std::move(address);
}

std::optional<core::Error> MemoryLedger::begin_call(Operation op) {
    ++calls_[op];

    auto it = failures_.find(op);
    if (it == failures_.end() || it->second.remaining <= 0) {
        return std::nullopt;
    }
    core::ErrorCode code = it->second.code;
    if (--it->second.remaining == 0) {
        failures_.erase(it);
    }
    return core::Error(code, "injected failure in " +
                       std::string(operation_name(op)));
}

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

std::vector<primitives::Utxo> MemoryLedger::outputs() const {
    LOCK(mutex_);
    std::vector<primitives::Utxo> out;
    out.reserve(utxos_.size());
    for (const auto& [outpoint, utxo] : utxos_) {
        out.push_back(utxo);
        out.back().locked = locked_.count(outpoint) > 0;
    }
    return out;
}

size_t MemoryLedger::output_count() const {
    LOCK(mutex_);
    return utxos_.size();
}

bool MemoryLedger::is_locked(const primitives::OutPoint& outpoint) const {
    LOCK(mutex_);
    return locked_.count(outpoint) > 0;
}

std::vector<MemoryLedger::Accepted> MemoryLedger::accepted() const {
    LOCK(mutex_);
    return accepted_;
}

size_t MemoryLedger::call_count(Operation op) const {
    LOCK(mutex_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

// ---------------------------------------------------------------------------
// LedgerClient
// ---------------------------------------------------------------------------

core::Result<std::vector<primitives::Utxo>> MemoryLedger::list_unspent(
    int min_conf, int max_conf, const std::vector<std::string>& addresses) {

    std::vector<primitives::Utxo> reply;
    ListUnspentHook hook;
    {
        LOCK(mutex_);
        if (auto err = begin_call(Operation::LIST_UNSPENT)) {
            return *err;
        }

        std::set<std::string> wanted(addresses.begin(), addresses.end());
        for (const auto& [outpoint, utxo] : utxos_) {
            if (utxo.confirmations < min_conf ||
                utxo.confirmations > max_conf) {
                continue;
            }
            if (!wanted.empty() && wanted.count(utxo.address) == 0) {
                continue;
            }
            reply.push_back(utxo);
            reply.back().locked = locked_.count(outpoint) > 0;
        }
        hook = list_unspent_hook_;
    }

    if (hook) {
        hook(*this);
    }
    return reply;
}

core::Result<void> MemoryLedger::lock_output(
    const primitives::OutPoint& outpoint) {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::LOCK_OUTPUT)) {
        return *err;
    }
    if (utxos_.count(outpoint) == 0) {
        return core::Error(core::ErrorCode::UTXO_LOCK_CONFLICT,
                           "Output " + outpoint.to_string() +
                           " is spent or unknown");
    }
    if (!locked_.insert(outpoint).second) {
        return core::Error(core::ErrorCode::UTXO_LOCK_CONFLICT,
                           "Output " + outpoint.to_string() +
                           " is already locked");
    }
    return core::make_ok();
}

core::Result<void> MemoryLedger::unlock_output(
    const primitives::OutPoint& outpoint) {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::UNLOCK_OUTPUT)) {
        return *err;
    }
    locked_.erase(outpoint);
    return core::make_ok();
}

core::Result<std::string> MemoryLedger::create_transaction(
    const std::vector<primitives::OutPoint>& inputs,
    const std::map<std::string, primitives::Amount>& outputs) {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::CREATE_TRANSACTION)) {
        return *err;
    }
    if (inputs.empty() || outputs.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Transaction needs at least one input and output");
    }

    int64_t total_in = 0;
    for (const auto& op : inputs) {
        auto it = utxos_.find(op);
        if (it == utxos_.end()) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Unknown input " + op.to_string());
        }
        total_in += it->second.amount.value();
    }

    int64_t total_out = 0;
    for (const auto& [address, amount] : outputs) {
        if (address.empty() || amount.value() <= 0) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Invalid output to '" + address + "'");
        }
        total_out += amount.value();
    }
    if (total_out > total_in) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Outputs exceed inputs");
    }

    std::string raw = core::get_random_uint256().to_hex();
    drafts_[raw] = Draft{inputs, outputs, false};
    return raw;
}

core::Result<SignedTransaction> MemoryLedger::sign_transaction(
    const std::string& raw_hex) {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::SIGN_TRANSACTION)) {
        return *err;
    }
    auto it = drafts_.find(raw_hex);
    if (it == drafts_.end()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "Unknown raw transaction");
    }
    it->second.signed_ = !sign_incomplete_;
    return SignedTransaction{raw_hex, !sign_incomplete_};
}

core::Result<core::uint256> MemoryLedger::broadcast_transaction(
    const SignedTransaction& tx) {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::BROADCAST_TRANSACTION)) {
        return *err;
    }
    auto it = drafts_.find(tx.hex);
    if (it == drafts_.end() || !tx.complete || !it->second.signed_) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Transaction is not fully signed");
    }

    const Draft& draft = it->second;
    int64_t total_in = 0;
    for (const auto& op : draft.inputs) {
        auto utxo = utxos_.find(op);
        if (utxo == utxos_.end()) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Missing inputs: " + op.to_string());
        }
        total_in += utxo->second.amount.value();
    }

    TXP_TRY_ASSIGN(txid, core::uint256::from_hex(tx.hex));

    for (const auto& op : draft.inputs) {
        utxos_.erase(op);
        locked_.erase(op);
    }

    int64_t total_out = 0;
    uint32_t n = 0;
    for (const auto& [address, amount] : draft.outputs) {
        primitives::Utxo created;
        created.outpoint = primitives::OutPoint(txid, n++);
        created.address = address;
        created.amount = amount;
        created.confirmations = 0;
        utxos_[created.outpoint] = created;
        total_out += amount.value();
    }

    accepted_.push_back(Accepted{txid, draft.inputs, draft.outputs,
                                 primitives::Amount(total_in - total_out)});
    drafts_.erase(it);

    LOG_DEBUG(core::LogCategory::LEDGER,
              "Accepted transaction " + txid.to_hex());
    return txid;
}

core::Result<std::optional<primitives::Utxo>> MemoryLedger::get_output(
    const primitives::OutPoint& outpoint) {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::GET_OUTPUT)) {
        return *err;
    }
    auto it = utxos_.find(outpoint);
    if (it == utxos_.end()) {
        return std::optional<primitives::Utxo>{};
    }
    primitives::Utxo utxo = it->second;
    utxo.locked = locked_.count(outpoint) > 0;
    return std::optional<primitives::Utxo>{utxo};
}

core::Result<std::string> MemoryLedger::get_change_address() {
    LOCK(mutex_);
    if (auto err = begin_call(Operation::GET_CHANGE_ADDRESS)) {
        return *err;
    }
    if (!fixed_change_address_.empty()) {
        return fixed_change_address_;
    }
    return "change" + std::to_string(++next_change_index_);
}

} // namespace ledger
