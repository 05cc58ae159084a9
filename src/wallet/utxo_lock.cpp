// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/utxo_lock.h"
#include "core/logging.h"
#include "core/random.h"
#include "core/time.h"

#include <set>
#include <utility>

namespace wallet {

// ---------------------------------------------------------------------------
// ScopedUtxoLock
// ---------------------------------------------------------------------------

ScopedUtxoLock::ScopedUtxoLock(UtxoLockTable* table, uint64_t token,
                               std::vector<primitives::OutPoint> outpoints)
    : table_(table), token_(token), outpoints_(std::move(outpoints)) {}

ScopedUtxoLock::~ScopedUtxoLock() {
    release();
}

ScopedUtxoLock::ScopedUtxoLock(ScopedUtxoLock&& other) noexcept
    : table_(std::exchange(other.table_, nullptr)),
      token_(std::exchange(other.token_, 0)),
      outpoints_(std::move(other.outpoints_)),
      ledger_(std::exchange(other.ledger_, nullptr)),
      pinned_(std::move(other.pinned_)) {
    other.outpoints_.clear();
    other.pinned_.clear();
}

ScopedUtxoLock& ScopedUtxoLock::operator=(ScopedUtxoLock&& other) noexcept {
    if (this != &other) {
        release();
        table_ = std::exchange(other.table_, nullptr);
        token_ = std::exchange(other.token_, 0);
        outpoints_ = std::move(other.outpoints_);
        ledger_ = std::exchange(other.ledger_, nullptr);
        pinned_ = std::move(other.pinned_);
        other.outpoints_.clear();
        other.pinned_.clear();
    }
    return *this;
}

core::Result<void> ScopedUtxoLock::pin_on_node(ledger::LedgerClient& ledger) {
    if (!owns()) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
                           "pin_on_node on a released lock");
    }
    ledger_ = &ledger;
    for (const auto& op : outpoints_) {
        auto res = ledger.lock_output(op);
        if (!res.ok()) {
            unpin();
            return res.error();
        }
        pinned_.push_back(op);
    }
    return core::make_ok();
}

void ScopedUtxoLock::unpin() {
    if (ledger_ == nullptr) return;
    for (const auto& op : pinned_) {
        auto res = ledger_->unlock_output(op);
        if (!res.ok()) {
            LOG_WARN(core::LogCategory::LOCK,
                     "Failed to unlock " + op.to_string() +
                     " on node: " + res.error().message());
        }
    }
    pinned_.clear();
}

void ScopedUtxoLock::release() {
    if (!owns()) return;
    unpin();
    ledger_ = nullptr;
    table_->release(token_, outpoints_);
    table_ = nullptr;
    token_ = 0;
    outpoints_.clear();
}

// ---------------------------------------------------------------------------
// UtxoLockTable
// ---------------------------------------------------------------------------

UtxoLockTable::~UtxoLockTable() {
    LOCK(mutex_);
    if (!entries_.empty()) {
        LOG_WARN(core::LogCategory::LOCK,
                 "Lock table destroyed with " +
                 std::to_string(entries_.size()) + " entries still held");
    }
}

core::Result<ScopedUtxoLock> UtxoLockTable::try_acquire(
    const std::vector<primitives::OutPoint>& outpoints,
    int64_t ttl_seconds) {

    if (outpoints.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Nothing to lock");
    }
    if (ttl_seconds <= 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Lock TTL must be positive");
    }
    std::set<primitives::OutPoint> unique(outpoints.begin(), outpoints.end());
    if (unique.size() != outpoints.size()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Duplicate outpoint in lock request");
    }

    uint64_t token = 0;
    while (token == 0) {
        token = core::get_random_uint64();
    }

    {
        LOCK(mutex_);
        const int64_t now = core::MockableClock::now();

        for (const auto& op : outpoints) {
            auto it = entries_.find(op);
            if (it != entries_.end() && it->second.expires_at > now) {
                LOG_DEBUG(core::LogCategory::LOCK,
                          "Lock conflict on " + op.to_string());
                return core::Error(core::ErrorCode::UTXO_LOCK_CONFLICT,
                                   "Output " + op.to_string() +
                                   " is in use by another request");
            }
        }

        for (const auto& op : outpoints) {
            entries_[op] = Entry{token, now + ttl_seconds};
        }
    }

    LOG_DEBUG(core::LogCategory::LOCK,
              "Locked " + std::to_string(outpoints.size()) +
              " outputs for " + std::to_string(ttl_seconds) + "s");
    return ScopedUtxoLock(this, token, outpoints);
}

bool UtxoLockTable::is_locked(const primitives::OutPoint& outpoint) const {
    LOCK(mutex_);
    auto it = entries_.find(outpoint);
    return it != entries_.end() &&
           it->second.expires_at > core::MockableClock::now();
}

size_t UtxoLockTable::size() const {
    LOCK(mutex_);
    const int64_t now = core::MockableClock::now();
    size_t live = 0;
    for (const auto& [op, entry] : entries_) {
        if (entry.expires_at > now) ++live;
    }
    return live;
}

size_t UtxoLockTable::expire_stale() {
    LOCK(mutex_);
    const int64_t now = core::MockableClock::now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG(core::LogCategory::LOCK,
                  "Expired " + std::to_string(removed) + " stale locks");
    }
    return removed;
}

size_t UtxoLockTable::clear() {
    LOCK(mutex_);
    size_t removed = entries_.size();
    entries_.clear();
    return removed;
}

void UtxoLockTable::release(uint64_t token,
                            const std::vector<primitives::OutPoint>& outpoints) {
    LOCK(mutex_);
    for (const auto& op : outpoints) {
        auto it = entries_.find(op);
        // An expired entry may have been retaken by someone else.
        if (it != entries_.end() && it->second.token == token) {
            entries_.erase(it);
        }
    }
}

} // namespace wallet
