// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "state_diff.hpp"

namespace starkstate
{
StorageUpdates to_state_diff_storage_mapping(const StorageMapping& storage)
{
    StorageUpdates updates;
    for (const auto& [entry, value] : storage)
        updates[entry.address].insert_or_assign(entry.key, value);
    return updates;
}

StorageMapping to_cache_state_storage_mapping(const StorageUpdates& updates)
{
    StorageMapping storage;
    for (const auto& [addr, cells] : updates)
    {
        for (const auto& [key, value] : cells)
            storage.insert_or_assign(StorageEntry{addr, key}, value);
    }
    return storage;
}

StateDiff StateDiff::squash(const StateDiff& other) const
{
    StateDiff out = *this;
    for (const auto& [addr, class_hash] : other.address_to_class_hash)
        out.address_to_class_hash.insert_or_assign(addr, class_hash);
    for (const auto& [addr, nonce] : other.address_to_nonce)
        out.address_to_nonce.insert_or_assign(addr, nonce);

    for (const auto& addr : get_keys(storage_updates, other.storage_updates))
    {
        const auto it = other.storage_updates.find(addr);
        if (it == other.storage_updates.end())
            continue;
        auto& cells = out.storage_updates[addr];
        for (const auto& [key, value] : it->second)
            cells.insert_or_assign(key, value);
    }
    return out;
}
}  // namespace starkstate
