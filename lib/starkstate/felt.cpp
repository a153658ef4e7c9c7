// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "felt.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace starkstate
{
Felt Felt::from_bytes_be(bytes_view data)
{
    if (data.size() > sizeof(bytes32))
        throw std::invalid_argument{"felt data too long"};

    bytes32 word;
    std::copy(data.begin(), data.end(), &word.bytes[sizeof(word) - data.size()]);
    return from_bytes32(word);
}

Felt Felt::from_string(std::string_view s)
{
    try
    {
        return from_uint256(intx::from_string<uint256>(std::string{s}));
    }
    catch (const std::out_of_range&)
    {
        throw std::invalid_argument{"felt value out of range: " + std::string{s}};
    }
}

std::variant<size_t, std::error_code> Felt::to_size() const noexcept
{
    if (m_value > std::numeric_limits<size_t>::max())
        return make_error_code(FELT_TO_USIZE_FAIL);
    return static_cast<size_t>(m_value);
}
}  // namespace starkstate
