// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "json_loader.hpp"
#include <cctype>
#include <stdexcept>

namespace starkstate
{
template <>
uint64_t from_json<uint64_t>(const json::json& j)
{
    if (j.is_number_unsigned() || (j.is_number_integer() && j.get<int64_t>() >= 0))
        return j.get<uint64_t>();

    if (!j.is_string())
        throw std::invalid_argument("from_json<uint64_t>: must be integer or string of integer");

    const auto s = j.get<std::string>();
    const bool is_hex = s.starts_with("0x") || s.starts_with("0X");
    const auto digits = is_hex ? s.substr(2) : s;
    // Only decimal or 0x-prefixed hex digits; stoull would also take a sign or whitespace.
    if (digits.empty() || !std::isxdigit(static_cast<unsigned char>(digits[0])))
        throw std::invalid_argument("from_json<uint64_t>: invalid integer: " + s);
    size_t num_processed = 0;
    const auto v = std::stoull(digits, &num_processed, is_hex ? 16 : 10);
    if (num_processed != digits.size())
        throw std::invalid_argument("from_json<uint64_t>: invalid integer: " + s);
    return v;
}

template <>
Felt from_json<Felt>(const json::json& j)
{
    if (j.is_number_unsigned() || j.is_number_integer())
        return Felt{from_json<uint64_t>(j)};
    if (!j.is_string())
        throw std::invalid_argument("from_json<Felt>: must be integer or string of integer");
    return Felt::from_string(j.get<std::string>());
}

template <>
Address from_json<Address>(const json::json& j)
{
    return Address{from_json<Felt>(j)};
}
}  // namespace starkstate
