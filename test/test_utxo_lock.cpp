// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/random.h"
#include "core/time.h"
#include "ledger/memory_ledger.h"
#include "wallet/utxo_lock.h"

#include <atomic>
#include <thread>
#include <utility>
#include <vector>

namespace {

primitives::OutPoint random_outpoint() {
    return primitives::OutPoint(core::get_random_uint256(), 0);
}

/// Pins the mock clock for the lifetime of the object.
struct MockTime {
    explicit MockTime(int64_t t) { core::MockableClock::set_mock_time(t); }
    ~MockTime() { core::MockableClock::set_mock_time(0); }
    void advance(int64_t secs) {
        core::MockableClock::set_mock_time(core::MockableClock::get_mock_time() +
                                           secs);
    }
};

} // namespace

// ===========================================================================
// Lock table
// ===========================================================================

TEST_CASE(UtxoLock, AcquireAndRelease) {
    wallet::UtxoLockTable table;
    auto a = random_outpoint();
    auto b = random_outpoint();

    auto lock = table.try_acquire({a, b}, 60);
    CHECK_OK(lock);
    CHECK(lock.value().owns());
    CHECK_NE(lock.value().token(), uint64_t{0});
    CHECK(table.is_locked(a));
    CHECK(table.is_locked(b));
    CHECK_EQ(table.size(), size_t{2});

    lock.value().release();
    CHECK(!lock.value().owns());
    CHECK(!table.is_locked(a));
    CHECK_EQ(table.size(), size_t{0});

    // Releasing twice is harmless.
    lock.value().release();
}

TEST_CASE(UtxoLock, ReleasedByDestructor) {
    wallet::UtxoLockTable table;
    auto a = random_outpoint();
    {
        auto lock = table.try_acquire({a}, 60);
        CHECK_OK(lock);
        CHECK(table.is_locked(a));
    }
    CHECK(!table.is_locked(a));
}

TEST_CASE(UtxoLock, ConflictIsAllOrNothing) {
    wallet::UtxoLockTable table;
    auto a = random_outpoint();
    auto b = random_outpoint();

    auto first = table.try_acquire({b}, 60);
    CHECK_OK(first);

    auto second = table.try_acquire({a, b}, 60);
    CHECK_ERR_CODE(second, core::ErrorCode::UTXO_LOCK_CONFLICT);
    CHECK(!table.is_locked(a));
    CHECK_EQ(table.size(), size_t{1});
}

TEST_CASE(UtxoLock, RejectsBadRequests) {
    wallet::UtxoLockTable table;
    auto a = random_outpoint();
    CHECK_ERR_CODE(table.try_acquire({}, 60), core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(table.try_acquire({a, a}, 60),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(table.try_acquire({a}, 0), core::ErrorCode::VALIDATION_RANGE);
    CHECK_EQ(table.size(), size_t{0});
}

TEST_CASE(UtxoLock, MoveTransfersOwnership) {
    wallet::UtxoLockTable table;
    auto a = random_outpoint();

    auto acquired = table.try_acquire({a}, 60);
    CHECK_OK(acquired);
    wallet::ScopedUtxoLock moved = std::move(acquired).value();
    CHECK(moved.owns());
    CHECK_EQ(moved.outpoints().size(), size_t{1});

    wallet::ScopedUtxoLock target;
    CHECK(!target.owns());
    target = std::move(moved);
    CHECK(target.owns());
    CHECK(!moved.owns());  // NOLINT(bugprone-use-after-move)
    CHECK(table.is_locked(a));

    target.release();
    CHECK(!table.is_locked(a));
}

// ===========================================================================
// Expiry
// ===========================================================================

TEST_CASE(UtxoLock, EntriesExpire) {
    MockTime clock(1'800'000'000);
    wallet::UtxoLockTable table;
    auto a = random_outpoint();

    auto stale = table.try_acquire({a}, 60);
    CHECK_OK(stale);

    clock.advance(59);
    CHECK(table.is_locked(a));
    CHECK_ERR(table.try_acquire({a}, 60));

    clock.advance(1);
    CHECK(!table.is_locked(a));
    CHECK_EQ(table.size(), size_t{0});

    // Someone else takes the expired output ...
    auto fresh = table.try_acquire({a}, 60);
    CHECK_OK(fresh);

    // ... and the old guard must not release their entry.
    stale.value().release();
    CHECK(table.is_locked(a));

    fresh.value().release();
    CHECK(!table.is_locked(a));
}

TEST_CASE(UtxoLock, ExpireStaleAndClear) {
    MockTime clock(1'800'000'000);
    wallet::UtxoLockTable table;

    auto short_lived = table.try_acquire({random_outpoint(), random_outpoint()}, 10);
    auto long_lived = table.try_acquire({random_outpoint()}, 100);
    CHECK_OK(short_lived);
    CHECK_OK(long_lived);

    clock.advance(30);
    CHECK_EQ(table.expire_stale(), size_t{2});
    CHECK_EQ(table.size(), size_t{1});

    CHECK_EQ(table.clear(), size_t{1});
    CHECK_EQ(table.size(), size_t{0});

    // Guards over cleared entries release cleanly.
    short_lived.value().release();
    long_lived.value().release();
}

// ===========================================================================
// Node-side locks
// ===========================================================================

TEST_CASE(UtxoLock, PinOnNodeLocksAndUnlocks) {
    ledger::MemoryLedger node;
    auto u1 = node.add_output("addr1", primitives::Amount(primitives::Amount::COIN), 3);
    auto u2 = node.add_output("addr1", primitives::Amount(primitives::Amount::COIN), 3);

    wallet::UtxoLockTable table;
    auto lock = table.try_acquire({u1.outpoint, u2.outpoint}, 60);
    CHECK_OK(lock);
    CHECK_OK(lock.value().pin_on_node(node));
    CHECK(node.is_locked(u1.outpoint));
    CHECK(node.is_locked(u2.outpoint));

    lock.value().release();
    CHECK(!node.is_locked(u1.outpoint));
    CHECK(!node.is_locked(u2.outpoint));
    CHECK(!table.is_locked(u1.outpoint));
}

TEST_CASE(UtxoLock, PinOnNodeUndoesPartialLocks) {
    ledger::MemoryLedger node;
    auto u1 = node.add_output("addr1", primitives::Amount(primitives::Amount::COIN), 3);
    auto u2 = node.add_output("addr1", primitives::Amount(primitives::Amount::COIN), 3);
    // Someone else already holds u2 on the node.
    CHECK_OK(node.lock_output(u2.outpoint));

    wallet::UtxoLockTable table;
    auto lock = table.try_acquire({u1.outpoint, u2.outpoint}, 60);
    CHECK_OK(lock);
    CHECK_ERR_CODE(lock.value().pin_on_node(node),
                   core::ErrorCode::UTXO_LOCK_CONFLICT);
    CHECK(!node.is_locked(u1.outpoint));

    // Releasing our guard must not touch the other holder's node lock.
    lock.value().release();
    CHECK(node.is_locked(u2.outpoint));
}

TEST_CASE(UtxoLock, OneWinnerUnderContention) {
    wallet::UtxoLockTable table;
    auto a = random_outpoint();

    constexpr int THREADS = 8;
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<wallet::ScopedUtxoLock> held(THREADS);

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            auto lock = table.try_acquire({a}, 60);
            if (lock.ok()) {
                ++winners;
                held[t] = std::move(lock).value();
            } else if (lock.error().code() ==
                       core::ErrorCode::UTXO_LOCK_CONFLICT) {
                ++conflicts;
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK_EQ(winners.load(), 1);
    CHECK_EQ(conflicts.load(), THREADS - 1);
}
