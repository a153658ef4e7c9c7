// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <starkstate/felt.hpp>
#include <starkstate/hash_utils.hpp>
#include <initializer_list>
#include <vector>

namespace starkstate::test
{
using evmc::from_hex;
using evmc::from_spaced_hex;
using evmc::hex;

/// Converts a string to bytes by casting individual characters.
inline bytes to_bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

/// Produces bytes out of string literal.
inline bytes operator""_b(const char* data, size_t size)
{
    return to_bytes({data, size});
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

inline std::vector<Felt> felts(std::initializer_list<uint64_t> values)
{
    return {values.begin(), values.end()};
}

/// Computes the storage key of a storage variable: keccak256 of the name's starknet keccak
/// followed by the argument words.
inline StorageKey get_storage_var_address(std::string_view name, std::vector<Felt> args = {})
{
    const auto name_hash = calculate_sn_keccak(to_bytes(name));
    bytes preimage{name_hash.bytes, sizeof(name_hash)};
    preimage += to_words(args);
    return starkstate::keccak256(preimage);
}
}  // namespace starkstate::test
