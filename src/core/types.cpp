// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <cstring>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Convert a single hex character to its 4-bit value.
/// Returns -1 on invalid input.
constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

uint256 uint256::from_bytes(std::span<const uint8_t, SIZE> bytes) noexcept {
    uint256 result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

Result<uint256> uint256::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    if (hex.size() != SIZE * 2) {
        return Error(ErrorCode::PARSE_BAD_FORMAT,
                     "txid must be 64 hex chars, got " +
                     std::to_string(hex.size()));
    }

    uint256 result;
    // hex[0..1] is the most-significant byte, stored last.
    for (std::size_t i = 0; i < SIZE; ++i) {
        int hi = hex_digit_value(hex[2 * i]);
        int lo = hex_digit_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return Error(ErrorCode::PARSE_BAD_FORMAT,
                         "txid contains a non-hex character at offset " +
                         std::to_string(2 * i));
        }
        result.bytes_[SIZE - 1 - i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

std::string uint256::to_hex() const {
    std::string out;
    out.reserve(SIZE * 2);
    for (std::size_t i = SIZE; i-- > 0;) {
        out.push_back(HEX_DIGITS[bytes_[i] >> 4]);
        out.push_back(HEX_DIGITS[bytes_[i] & 0x0f]);
    }
    return out;
}

bool uint256::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

std::strong_ordering uint256::operator<=>(
    const uint256& other) const noexcept {
    for (std::size_t i = SIZE; i-- > 0;) {
        if (bytes_[i] != other.bytes_[i]) {
            return bytes_[i] <=> other.bytes_[i];
        }
    }
    return std::strong_ordering::equal;
}

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    // Txids are already uniformly distributed; the low 8 bytes suffice.
    std::size_t h = 0;
    std::memcpy(&h, v.data(), sizeof(h));
    return h;
}
