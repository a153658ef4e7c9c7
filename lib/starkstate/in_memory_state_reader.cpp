// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_state_reader.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"

namespace starkstate
{
std::variant<ClassHash, std::error_code> InMemoryStateReader::get_class_hash_at(
    const Address& addr) const
{
    const auto it = address_to_class_hash.find(addr);
    return it != address_to_class_hash.end() ? it->second : UNINITIALIZED_CLASS_HASH;
}

std::variant<Felt, std::error_code> InMemoryStateReader::get_nonce_at(const Address& addr) const
{
    const auto it = address_to_nonce.find(addr);
    return it != address_to_nonce.end() ? it->second : Felt{};
}

std::variant<Felt, std::error_code> InMemoryStateReader::get_storage_at(
    const StorageEntry& entry) const
{
    const auto it = address_to_storage.find(entry);
    return it != address_to_storage.end() ? it->second : Felt{};
}

std::variant<std::shared_ptr<const ContractClass>, std::error_code>
InMemoryStateReader::get_contract_class(const ClassHash& class_hash) const
{
    const auto it = class_hash_to_contract_class.find(class_hash);
    if (it == class_hash_to_contract_class.end())
    {
        log::logger()->warn("missing contract class {}", to_hex(class_hash));
        return make_error_code(MISSING_CONTRACT_CLASS);
    }
    return it->second;
}

void InMemoryStateReader::apply(const StateDiff& diff)
{
    for (const auto& [addr, class_hash] : diff.address_to_class_hash)
        address_to_class_hash.insert_or_assign(addr, class_hash);
    for (const auto& [addr, nonce] : diff.address_to_nonce)
        address_to_nonce.insert_or_assign(addr, nonce);

    for (const auto& [entry, value] : to_cache_state_storage_mapping(diff.storage_updates))
    {
        if (value.is_zero())
            address_to_storage.erase(entry);
        else
            address_to_storage.insert_or_assign(entry, value);
    }
}
}  // namespace starkstate
