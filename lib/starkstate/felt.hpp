// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace starkstate
{
using evmc::bytes;
using evmc::bytes32;
using evmc::bytes_view;
using intx::uint256;
using namespace evmc::literals;

/// The order of the field: 2^251 + 17·2^192 + 1.
inline constexpr uint256 FIELD_PRIME = (uint256{1} << 251) + (uint256{17} << 192) + 1;

/// An element of the prime field. The value is always kept in the canonical range [0, P).
class Felt
{
    uint256 m_value{};

public:
    constexpr Felt() noexcept = default;

    /// Implicit, a small integer is always a canonical field element.
    constexpr Felt(uint64_t v) noexcept : m_value{v} {}

    /// Reduces an arbitrary 256-bit value modulo P.
    static Felt from_uint256(const uint256& v) noexcept
    {
        Felt f;
        f.m_value = v % FIELD_PRIME;
        return f;
    }

    /// Interprets up to 32 bytes as a big-endian number and reduces it modulo P.
    static Felt from_bytes_be(bytes_view data);

    static Felt from_bytes32(const bytes32& data) noexcept
    {
        return from_uint256(intx::be::load<uint256>(data));
    }

    /// Parses decimal or 0x-prefixed hexadecimal text. Throws std::invalid_argument.
    static Felt from_string(std::string_view s);

    [[nodiscard]] constexpr const uint256& value() const noexcept { return m_value; }

    [[nodiscard]] bytes32 to_bytes32() const noexcept
    {
        return intx::be::store<bytes32>(m_value);
    }

    [[nodiscard]] std::string to_string() const { return intx::to_string(m_value); }

    [[nodiscard]] std::string to_hex() const { return "0x" + intx::hex(m_value); }

    /// Converts to an index. Fails with FELT_TO_USIZE_FAIL if the value does not fit.
    [[nodiscard]] std::variant<size_t, std::error_code> to_size() const noexcept;

    [[nodiscard]] constexpr bool is_zero() const noexcept { return m_value == 0; }

    friend Felt operator+(const Felt& a, const Felt& b) noexcept
    {
        Felt f;
        f.m_value = intx::addmod(a.m_value, b.m_value, FIELD_PRIME);
        return f;
    }

    friend Felt operator-(const Felt& a, const Felt& b) noexcept
    {
        Felt f;
        f.m_value = intx::addmod(a.m_value, FIELD_PRIME - b.m_value, FIELD_PRIME);
        return f;
    }

    friend Felt operator*(const Felt& a, const Felt& b) noexcept
    {
        Felt f;
        f.m_value = intx::mulmod(a.m_value, b.m_value, FIELD_PRIME);
        return f;
    }

    friend constexpr bool operator==(const Felt& a, const Felt& b) noexcept
    {
        return a.m_value == b.m_value;
    }

    friend constexpr bool operator<(const Felt& a, const Felt& b) noexcept
    {
        return a.m_value < b.m_value;
    }
};

/// The contract address. A separate type so that addresses and stored values are never mixed.
struct Address
{
    Felt value;

    constexpr Address() noexcept = default;
    constexpr explicit Address(Felt v) noexcept : value{v} {}

    friend constexpr bool operator==(const Address& a, const Address& b) noexcept
    {
        return a.value == b.value;
    }

    friend constexpr bool operator<(const Address& a, const Address& b) noexcept
    {
        return a.value < b.value;
    }
};

using ClassHash = bytes32;
using StorageKey = bytes32;

/// The class hash of an address where nothing has been deployed.
inline constexpr ClassHash UNINITIALIZED_CLASS_HASH{};

/// A single storage cell: the owning contract and the key within its storage.
struct StorageEntry
{
    Address address;
    StorageKey key;

    friend bool operator==(const StorageEntry&, const StorageEntry&) noexcept = default;
};
}  // namespace starkstate

template <>
struct std::hash<starkstate::Felt>
{
    size_t operator()(const starkstate::Felt& f) const noexcept
    {
        return std::hash<evmc::bytes32>{}(f.to_bytes32());
    }
};

template <>
struct std::hash<starkstate::Address>
{
    size_t operator()(const starkstate::Address& a) const noexcept
    {
        return std::hash<starkstate::Felt>{}(a.value);
    }
};

template <>
struct std::hash<starkstate::StorageEntry>
{
    size_t operator()(const starkstate::StorageEntry& e) const noexcept
    {
        const auto h = std::hash<starkstate::Address>{}(e.address);
        return h ^ (std::hash<evmc::bytes32>{}(e.key) + 0x9e3779b97f4a7c15 + (h << 6) + (h >> 2));
    }
};
