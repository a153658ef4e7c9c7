// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "state_diff.hpp"
#include "state_reader.hpp"
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace starkstate
{
/// The values read from the committed state and the values written by the transaction.
struct StateCache
{
    /// The values present before the transaction, memoized on first access.
    /// @{
    std::unordered_map<Address, ClassHash> class_hash_initial_values;
    std::unordered_map<Address, Felt> nonce_initial_values;
    StorageMapping storage_initial_values;
    /// @}

    /// The values written by the transaction.
    /// @{
    std::unordered_map<Address, ClassHash> class_hash_writes;
    std::unordered_map<Address, Felt> nonce_writes;
    StorageMapping storage_writes;
    /// @}
};

/// The transaction-local state: a read-through, write-buffering overlay of a StateReader.
///
/// Reads are served from the written values, then from the memoized initial values,
/// and finally from the reader. Writes never reach the reader.
/// One instance serves a single transaction and is not thread safe.
class CachedState
{
    struct JournalClassHashWrite
    {
        Address addr;
        std::optional<ClassHash> prev;
    };

    struct JournalNonceWrite
    {
        Address addr;
        std::optional<Felt> prev;
    };

    struct JournalStorageWrite
    {
        StorageEntry entry;
        std::optional<Felt> prev;
    };

    struct JournalContractClass
    {
        ClassHash class_hash;
        std::shared_ptr<const ContractClass> prev;
    };

    using JournalEntry = std::variant<JournalClassHashWrite, JournalNonceWrite,
        JournalStorageWrite, JournalContractClass>;

    /// The read-only view of the committed state.
    const StateReader& m_reader;

    StateCache m_cache;

    /// The contract classes loaded from the reader or declared by the transaction.
    std::unordered_map<ClassHash, std::shared_ptr<const ContractClass>> m_contract_classes;

    /// The list of cache writes with information how to revert them.
    std::vector<JournalEntry> m_journal;

public:
    explicit CachedState(const StateReader& reader) noexcept : m_reader{reader} {}

    CachedState(const CachedState&) = delete;
    CachedState(CachedState&&) = delete;
    CachedState& operator=(CachedState&&) = delete;

    [[nodiscard]] const StateCache& cache() const noexcept { return m_cache; }

    [[nodiscard]] const auto& contract_classes() const noexcept { return m_contract_classes; }

    std::variant<ClassHash, std::error_code> get_class_hash_at(const Address& addr);

    std::variant<Felt, std::error_code> get_nonce_at(const Address& addr);

    std::variant<Felt, std::error_code> get_storage_at(const StorageEntry& entry);

    std::variant<std::shared_ptr<const ContractClass>, std::error_code> get_contract_class(
        const ClassHash& class_hash);

    /// Methods writing to the cache. They can be reverted by rollback().
    /// @{
    std::error_code set_class_hash_at(const Address& addr, const ClassHash& class_hash);

    std::error_code set_nonce_at(const Address& addr, const Felt& nonce);

    std::error_code increment_nonce(const Address& addr);

    std::error_code set_storage_at(const StorageEntry& entry, const Felt& value);

    void set_contract_class(
        const ClassHash& class_hash, std::shared_ptr<const ContractClass> contract_class);

    /// Assigns the class hash to an address where nothing is deployed yet.
    std::error_code deploy_contract(const Address& addr, const ClassHash& class_hash);
    /// @}

    /// Returns the class hash deployed at the address.
    ///
    /// Fails with FAIL_TO_READ_CLASS_HASH if the class hash cannot be read
    /// and with NOT_DEPLOYED_CONTRACT if nothing is deployed at the address.
    std::variant<ClassHash, std::error_code> validate_contract_deployed(const Address& addr);

    /// Returns the number of modified contracts and the number of changed storage cells,
    /// both relative to the values before the transaction.
    [[nodiscard]] std::pair<size_t, size_t> count_actual_storage_changes() const;

    /// Returns the changes relative to the values before the transaction.
    [[nodiscard]] StateDiff build_diff() const;

    /// Returns the journal checkpoint. It can be later used in rollback()
    /// to revert writes newer than the checkpoint.
    [[nodiscard]] size_t checkpoint() const noexcept { return m_journal.size(); }

    /// Reverts writes made after the checkpoint.
    void rollback(size_t checkpoint);

private:
    /// Memoizes the initial class hash of the address unless already known.
    std::error_code load_class_hash(const Address& addr);
    std::error_code load_nonce(const Address& addr);
    std::error_code load_storage(const StorageEntry& entry);
};
}  // namespace starkstate
