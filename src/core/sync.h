#pragma once

// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace core {

// ---------------------------------------------------------------------------
// Mutex
// ---------------------------------------------------------------------------
// A named std::mutex. Debug builds remember the owning thread and report a
// thread that tries to take a Mutex it already holds, which would otherwise
// hang silently (e.g. a ledger callback re-entering the ledger while it is
// still locked).

class Mutex {
public:
    explicit Mutex(std::string_view name = "") : name_(name) {}

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();
    bool try_lock();

    const std::string& name() const noexcept { return name_; }

    /// True when the calling thread holds this mutex. Always false in
    /// release builds.
    bool held_by_current_thread() const noexcept;

private:
    std::mutex mutex_;
    std::string name_;
#ifndef NDEBUG
    std::atomic<std::thread::id> owner_{};
#endif
};

/// Report a re-entrant lock attempt on @p mtx (debug builds).
void report_recursive_lock(const Mutex& mtx);

// ---------------------------------------------------------------------------
// UniqueLock
// ---------------------------------------------------------------------------

/// Scoped owner of a core::Mutex, either locked on construction or tried.
class UniqueLock {
public:
    explicit UniqueLock(Mutex& mtx) : mutex_(&mtx), owns_(true) {
        mutex_->lock();
    }

    UniqueLock(Mutex& mtx, std::try_to_lock_t)
        : mutex_(&mtx), owns_(mtx.try_lock()) {}

    ~UniqueLock() {
        if (owns_) mutex_->unlock();
    }

    UniqueLock(const UniqueLock&) = delete;
    UniqueLock& operator=(const UniqueLock&) = delete;

    bool owns_lock() const noexcept { return owns_; }
    explicit operator bool() const noexcept { return owns_; }

    void unlock() {
        if (owns_) {
            mutex_->unlock();
            owns_ = false;
        }
    }

private:
    Mutex* mutex_;
    bool owns_;
};

#define TXP_SYNC_CAT_(a, b) a##b
#define TXP_SYNC_CAT(a, b)  TXP_SYNC_CAT_(a, b)

/// Hold @p cs until the end of the enclosing block.
#define LOCK(cs) \
    core::UniqueLock TXP_SYNC_CAT(txp_lock_, __LINE__)(cs)

/// Try to take @p cs; check `name.owns_lock()` for the outcome.
#define TRY_LOCK(cs, name) \
    core::UniqueLock name(cs, std::try_to_lock)

}  // namespace core
