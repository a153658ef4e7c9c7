// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "hash_utils.hpp"
#include <string>

namespace starkstate
{
bytes32 calculate_sn_keccak(bytes_view data) noexcept
{
    auto h = keccak256(data);
    h.bytes[0] &= 0x03;
    return h;
}

Felt starknet_keccak(bytes_view data) noexcept
{
    return Felt::from_bytes32(calculate_sn_keccak(data));
}

ClassHash string_to_hash(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X"))
        return Felt::from_string(hex).to_bytes32();
    return Felt::from_string("0x" + std::string{hex}).to_bytes32();
}

bytes to_words(std::span<const Felt> values)
{
    bytes out;
    out.reserve(values.size() * sizeof(bytes32));
    for (const auto& v : values)
    {
        const auto word = v.to_bytes32();
        out.append(word.bytes, sizeof(word.bytes));
    }
    return out;
}

std::optional<std::vector<Felt>> from_words(bytes_view data)
{
    if (data.size() % sizeof(bytes32) != 0)
        return std::nullopt;

    std::vector<Felt> out;
    out.reserve(data.size() / sizeof(bytes32));
    for (size_t i = 0; i < data.size(); i += sizeof(bytes32))
        out.push_back(Felt::from_bytes_be(data.substr(i, sizeof(bytes32))));
    return out;
}
}  // namespace starkstate
