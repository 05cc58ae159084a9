#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// uint256 -- 32-byte transaction identifier
// ---------------------------------------------------------------------------
// Bytes are stored in LITTLE-ENDIAN order internally (least-significant byte
// at index 0). Hex display uses BIG-ENDIAN order (most-significant byte
// first), matching what the ledger node prints for txids.
// ---------------------------------------------------------------------------
class uint256 {
public:
    static constexpr std::size_t SIZE = 32;

    /// Default: zero-initialized.
    constexpr uint256() noexcept : bytes_{} {}

    /// Construct from a raw little-endian byte span.
    static uint256 from_bytes(std::span<const uint8_t, SIZE> bytes) noexcept;

    /// Parse exactly 64 hex chars in big-endian display order.
    /// Accepts an optional "0x" prefix and either letter case.
    static Result<uint256> from_hex(std::string_view hex);

    /// Big-endian hex string (64 lower-case hex chars, no prefix).
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }
    [[nodiscard]] constexpr std::size_t size() const noexcept { return SIZE; }

    [[nodiscard]] bool is_zero() const noexcept;

    /// Numeric comparison, most-significant byte first.
    [[nodiscard]] std::strong_ordering operator<=>(
        const uint256& other) const noexcept;
    [[nodiscard]] bool operator==(const uint256& other) const noexcept {
        return bytes_ == other.bytes_;
    }

private:
    std::array<uint8_t, SIZE> bytes_;
};

}  // namespace core

template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};
