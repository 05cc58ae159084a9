// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"

#include <cstdio>

namespace core {

void report_recursive_lock(const Mutex& mtx) {
    std::fprintf(stderr,
                 "txplan: thread tried to re-lock mutex '%s' it already "
                 "holds\n",
                 mtx.name().c_str());
}

bool Mutex::held_by_current_thread() const noexcept {
#ifndef NDEBUG
    return owner_.load(std::memory_order_relaxed) ==
           std::this_thread::get_id();
#else
    return false;
#endif
}

void Mutex::lock() {
#ifndef NDEBUG
    if (held_by_current_thread()) report_recursive_lock(*this);
#endif
    mutex_.lock();
#ifndef NDEBUG
    owner_.store(std::this_thread::get_id(), std::memory_order_relaxed);
#endif
}

bool Mutex::try_lock() {
    if (!mutex_.try_lock()) return false;
#ifndef NDEBUG
    owner_.store(std::this_thread::get_id(), std::memory_order_relaxed);
#endif
    return true;
}

void Mutex::unlock() {
#ifndef NDEBUG
    owner_.store(std::thread::id{}, std::memory_order_relaxed);
#endif
    mutex_.unlock();
}

}  // namespace core
