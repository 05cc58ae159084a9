// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/random.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace core {

void get_random_bytes(std::span<uint8_t> out) {
    if (out.empty()) return;
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
}

uint64_t get_random_uint64() {
    std::array<uint8_t, sizeof(uint64_t)> raw{};
    get_random_bytes(raw);
    uint64_t value = 0;
    std::memcpy(&value, raw.data(), raw.size());
    return value;
}

uint256 get_random_uint256() {
    std::array<uint8_t, uint256::SIZE> raw{};
    get_random_bytes(raw);
    return uint256::from_bytes(raw);
}

} // namespace core
