#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <cstdint>
#include <span>

namespace core {

/// Fill @p out from the OpenSSL CSPRNG. Throws std::runtime_error if the
/// generator is not seeded.
void get_random_bytes(std::span<uint8_t> out);

uint64_t get_random_uint64();

/// Random 256-bit value; the in-process ledger uses these as txids and lock
/// tokens are drawn from get_random_uint64().
uint256 get_random_uint256();

} // namespace core
