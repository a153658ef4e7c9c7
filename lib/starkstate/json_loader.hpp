// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "felt.hpp"
#include <nlohmann/json.hpp>

namespace starkstate
{
namespace json = nlohmann;

/// Converts a JSON value to T. Throws std::invalid_argument or nlohmann::json exceptions.
template <typename T>
T from_json(const json::json& j);

/// Accepts a JSON integer or a decimal / 0x-prefixed hex string.
template <>
uint64_t from_json<uint64_t>(const json::json& j);

/// Accepts a JSON integer or a decimal / 0x-prefixed hex string; reduces modulo P.
template <>
Felt from_json<Felt>(const json::json& j);

template <>
Address from_json<Address>(const json::json& j);
}  // namespace starkstate
