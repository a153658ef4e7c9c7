// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "felt.hpp"
#include <unordered_map>
#include <unordered_set>

namespace starkstate
{
/// The flat storage mapping of the state cache: (address, key) => value.
using StorageMapping = std::unordered_map<StorageEntry, Felt>;

/// The nested storage mapping of a state diff: address => (key => value).
using StorageUpdates = std::unordered_map<Address, std::unordered_map<StorageKey, Felt>>;

/// Groups flat storage entries by contract address.
StorageUpdates to_state_diff_storage_mapping(const StorageMapping& storage);

/// The exact inverse of to_state_diff_storage_mapping().
StorageMapping to_cache_state_storage_mapping(const StorageUpdates& updates);

/// Returns the entries of a which are absent from b or have a different value in b.
template <typename Map>
Map subtract_mappings(const Map& a, const Map& b)
{
    Map out;
    for (const auto& [key, value] : a)
    {
        if (const auto it = b.find(key); it == b.end() || !(it->second == value))
            out.emplace(key, value);
    }
    return out;
}

/// Returns the union of the keys of a and b.
template <typename Map>
std::unordered_set<typename Map::key_type> get_keys(const Map& a, const Map& b)
{
    std::unordered_set<typename Map::key_type> keys;
    for (const auto& [key, _] : a)
        keys.insert(key);
    for (const auto& [key, _] : b)
        keys.insert(key);
    return keys;
}

/// Collection of changes to the state made by a transaction.
struct StateDiff
{
    /// Deployed or replaced classes: address => new class hash.
    std::unordered_map<Address, ClassHash> address_to_class_hash;

    /// New nonce values.
    std::unordered_map<Address, Felt> address_to_nonce;

    /// The storage modifications: address => (key => new value).
    /// The value 0 means the storage entry is deleted.
    StorageUpdates storage_updates;

    /// Merges a diff applied after this one. Values of other win.
    [[nodiscard]] StateDiff squash(const StateDiff& other) const;

    friend bool operator==(const StateDiff&, const StateDiff&) = default;
};
}  // namespace starkstate
