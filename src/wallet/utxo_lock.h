#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "ledger/client.h"
#include "primitives/outpoint.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace wallet {

class UtxoLockTable;

// ---------------------------------------------------------------------------
// ScopedUtxoLock -- ownership of a set of table entries
// ---------------------------------------------------------------------------
// Move-only. Releases its entries (and any node-side locks it took) when it
// is destroyed or release() is called. The table must outlive every guard it
// hands out.
// ---------------------------------------------------------------------------

class ScopedUtxoLock {
public:
    ScopedUtxoLock() = default;
    ~ScopedUtxoLock();

    ScopedUtxoLock(ScopedUtxoLock&& other) noexcept;
    ScopedUtxoLock& operator=(ScopedUtxoLock&& other) noexcept;
    ScopedUtxoLock(const ScopedUtxoLock&) = delete;
    ScopedUtxoLock& operator=(const ScopedUtxoLock&) = delete;

    [[nodiscard]] bool owns() const { return table_ != nullptr; }
    [[nodiscard]] uint64_t token() const { return token_; }
    [[nodiscard]] const std::vector<primitives::OutPoint>& outpoints() const {
        return outpoints_;
    }

    /// Also lock every held output on the node (lockunspent). All or
    /// nothing: on failure the node locks taken so far are undone.
    core::Result<void> pin_on_node(ledger::LedgerClient& ledger);

    /// Drop node locks (best effort, failures are logged) and then the
    /// table entries. Safe to call more than once.
    void release();

private:
    friend class UtxoLockTable;

    ScopedUtxoLock(UtxoLockTable* table, uint64_t token,
                   std::vector<primitives::OutPoint> outpoints);

    void unpin();

    UtxoLockTable* table_ = nullptr;
    uint64_t token_ = 0;
    std::vector<primitives::OutPoint> outpoints_;
    ledger::LedgerClient* ledger_ = nullptr;
    std::vector<primitives::OutPoint> pinned_;
};

// ---------------------------------------------------------------------------
// UtxoLockTable -- process-wide record of outputs promised to a plan
// ---------------------------------------------------------------------------
// An application constructs exactly one table and hands it by reference to
// every planner. Entries expire after their TTL (measured with
// core::MockableClock) and are then free for anyone; a guard whose entry
// expired and was retaken never releases the new holder's entry because
// every acquisition carries its own random token.
//
// Shutdown: call clear() once no request is in flight. The destructor logs
// any entry still held.
// ---------------------------------------------------------------------------

class UtxoLockTable {
public:
    UtxoLockTable() = default;
    ~UtxoLockTable();

    UtxoLockTable(const UtxoLockTable&) = delete;
    UtxoLockTable& operator=(const UtxoLockTable&) = delete;

    /// Lock every outpoint for @p ttl_seconds, or none of them.
    /// Fails with UTXO_LOCK_CONFLICT if any is held by a live entry.
    core::Result<ScopedUtxoLock> try_acquire(
        const std::vector<primitives::OutPoint>& outpoints,
        int64_t ttl_seconds);

    /// True when a live (unexpired) entry holds @p outpoint.
    [[nodiscard]] bool is_locked(const primitives::OutPoint& outpoint) const;

    /// Number of live entries.
    [[nodiscard]] size_t size() const;

    /// Purge expired entries; returns how many were removed.
    size_t expire_stale();

    /// Drop every entry; returns how many were removed.
    size_t clear();

private:
    friend class ScopedUtxoLock;

    struct Entry {
        uint64_t token = 0;
        int64_t expires_at = 0;
    };

    void release(uint64_t token,
                 const std::vector<primitives::OutPoint>& outpoints);

    mutable core::Mutex mutex_{"utxo_lock_table"};
    std::map<primitives::OutPoint, Entry> entries_;
};

} // namespace wallet
