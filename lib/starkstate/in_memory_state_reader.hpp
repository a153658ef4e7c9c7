// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "state_diff.hpp"
#include "state_reader.hpp"
#include <unordered_map>

namespace starkstate
{
/// The committed state kept in memory.
///
/// Serves as the backing reader of CachedState and as the target of committed diffs.
class InMemoryStateReader : public StateReader
{
public:
    std::unordered_map<Address, ClassHash> address_to_class_hash;
    std::unordered_map<Address, Felt> address_to_nonce;
    StorageMapping address_to_storage;
    std::unordered_map<ClassHash, std::shared_ptr<const ContractClass>> class_hash_to_contract_class;

    std::variant<ClassHash, std::error_code> get_class_hash_at(
        const Address& addr) const override;

    std::variant<Felt, std::error_code> get_nonce_at(const Address& addr) const override;

    std::variant<Felt, std::error_code> get_storage_at(const StorageEntry& entry) const override;

    std::variant<std::shared_ptr<const ContractClass>, std::error_code> get_contract_class(
        const ClassHash& class_hash) const override;

    /// Commits the state changes. Zero storage values delete the cell.
    void apply(const StateDiff& diff);
};
}  // namespace starkstate
