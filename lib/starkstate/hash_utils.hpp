// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "felt.hpp"
#include <ethash/keccak.hpp>
#include <evmc/hex.hpp>
#include <bit>
#include <optional>
#include <span>
#include <vector>

namespace starkstate
{
/// Computes Keccak hash out of input bytes (wrapper of ethash::keccak256).
inline bytes32 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<bytes32>(ethash::keccak256(data.data(), data.size()));
}

/// Formats a 32-byte hash as 0x-prefixed hex.
inline std::string to_hex(const bytes32& h)
{
    return "0x" + evmc::hex({h.bytes, sizeof(h.bytes)});
}

/// Keccak-256 with the 6 most significant bits cleared, so the result fits in the field.
bytes32 calculate_sn_keccak(bytes_view data) noexcept;

/// The keccak used for selectors and names: calculate_sn_keccak() as a field element.
Felt starknet_keccak(bytes_view data) noexcept;

inline Felt starknet_keccak(std::string_view s) noexcept
{
    return starknet_keccak(bytes_view{reinterpret_cast<const uint8_t*>(s.data()), s.size()});
}

/// Parses a hex felt, with or without the 0x prefix, into a class hash.
/// Throws std::invalid_argument.
ClassHash string_to_hash(std::string_view hex);

/// Serializes field elements as consecutive 32-byte big-endian words.
bytes to_words(std::span<const Felt> values);

/// Splits the data into 32-byte big-endian words reduced modulo P.
/// Returns std::nullopt if the size is not a multiple of 32.
std::optional<std::vector<Felt>> from_words(bytes_view data);
}  // namespace starkstate
