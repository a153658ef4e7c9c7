// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "cached_state.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"
#include <unordered_set>

namespace starkstate
{
namespace
{
template <typename Map>
std::optional<typename Map::mapped_type> find_value(const Map& map, const typename Map::key_type& k)
{
    if (const auto it = map.find(k); it != map.end())
        return it->second;
    return std::nullopt;
}

template <typename Map>
void restore(Map& map, const typename Map::key_type& k,
    const std::optional<typename Map::mapped_type>& prev)
{
    if (prev.has_value())
        map.insert_or_assign(k, *prev);
    else
        map.erase(k);
}
}  // namespace

std::error_code CachedState::load_class_hash(const Address& addr)
{
    if (m_cache.class_hash_initial_values.contains(addr))
        return {};
    const auto r = m_reader.get_class_hash_at(addr);
    if (const auto* err = std::get_if<std::error_code>(&r))
        return *err;
    m_cache.class_hash_initial_values.emplace(addr, std::get<ClassHash>(r));
    return {};
}

std::error_code CachedState::load_nonce(const Address& addr)
{
    if (m_cache.nonce_initial_values.contains(addr))
        return {};
    const auto r = m_reader.get_nonce_at(addr);
    if (const auto* err = std::get_if<std::error_code>(&r))
        return *err;
    m_cache.nonce_initial_values.emplace(addr, std::get<Felt>(r));
    return {};
}

std::error_code CachedState::load_storage(const StorageEntry& entry)
{
    if (m_cache.storage_initial_values.contains(entry))
        return {};
    const auto r = m_reader.get_storage_at(entry);
    if (const auto* err = std::get_if<std::error_code>(&r))
        return *err;
    m_cache.storage_initial_values.emplace(entry, std::get<Felt>(r));
    return {};
}

std::variant<ClassHash, std::error_code> CachedState::get_class_hash_at(const Address& addr)
{
    if (const auto it = m_cache.class_hash_writes.find(addr); it != m_cache.class_hash_writes.end())
        return it->second;
    if (const auto ec = load_class_hash(addr))
        return ec;
    return m_cache.class_hash_initial_values.at(addr);
}

std::variant<Felt, std::error_code> CachedState::get_nonce_at(const Address& addr)
{
    if (const auto it = m_cache.nonce_writes.find(addr); it != m_cache.nonce_writes.end())
        return it->second;
    if (const auto ec = load_nonce(addr))
        return ec;
    return m_cache.nonce_initial_values.at(addr);
}

std::variant<Felt, std::error_code> CachedState::get_storage_at(const StorageEntry& entry)
{
    if (const auto it = m_cache.storage_writes.find(entry); it != m_cache.storage_writes.end())
        return it->second;
    if (const auto ec = load_storage(entry))
        return ec;
    return m_cache.storage_initial_values.at(entry);
}

std::variant<std::shared_ptr<const ContractClass>, std::error_code> CachedState::get_contract_class(
    const ClassHash& class_hash)
{
    if (const auto it = m_contract_classes.find(class_hash); it != m_contract_classes.end())
        return it->second;

    auto r = m_reader.get_contract_class(class_hash);
    if (const auto* err = std::get_if<std::error_code>(&r))
        return *err;
    auto& contract_class = std::get<std::shared_ptr<const ContractClass>>(r);
    m_contract_classes.emplace(class_hash, contract_class);
    return contract_class;
}

std::error_code CachedState::set_class_hash_at(const Address& addr, const ClassHash& class_hash)
{
    if (const auto ec = load_class_hash(addr))
        return ec;
    m_journal.emplace_back(JournalClassHashWrite{addr, find_value(m_cache.class_hash_writes, addr)});
    m_cache.class_hash_writes.insert_or_assign(addr, class_hash);
    return {};
}

std::error_code CachedState::set_nonce_at(const Address& addr, const Felt& nonce)
{
    if (const auto ec = load_nonce(addr))
        return ec;
    m_journal.emplace_back(JournalNonceWrite{addr, find_value(m_cache.nonce_writes, addr)});
    m_cache.nonce_writes.insert_or_assign(addr, nonce);
    return {};
}

std::error_code CachedState::increment_nonce(const Address& addr)
{
    const auto r = get_nonce_at(addr);
    if (const auto* err = std::get_if<std::error_code>(&r))
        return *err;
    return set_nonce_at(addr, std::get<Felt>(r) + 1);
}

std::error_code CachedState::set_storage_at(const StorageEntry& entry, const Felt& value)
{
    if (const auto ec = load_storage(entry))
        return ec;
    m_journal.emplace_back(JournalStorageWrite{entry, find_value(m_cache.storage_writes, entry)});
    m_cache.storage_writes.insert_or_assign(entry, value);
    return {};
}

void CachedState::set_contract_class(
    const ClassHash& class_hash, std::shared_ptr<const ContractClass> contract_class)
{
    auto& slot = m_contract_classes[class_hash];
    m_journal.emplace_back(JournalContractClass{class_hash, slot});
    slot = std::move(contract_class);
}

std::error_code CachedState::deploy_contract(const Address& addr, const ClassHash& class_hash)
{
    if (addr.value.is_zero())
        return make_error_code(CONTRACT_ADDRESS_OUT_OF_RANGE);

    const auto current = get_class_hash_at(addr);
    if (const auto* err = std::get_if<std::error_code>(&current))
        return *err;
    if (std::get<ClassHash>(current) != UNINITIALIZED_CLASS_HASH)
    {
        log::logger()->warn("contract address {} unavailable", addr.value.to_hex());
        return make_error_code(CONTRACT_ADDRESS_UNAVAILABLE);
    }
    return set_class_hash_at(addr, class_hash);
}

std::variant<ClassHash, std::error_code> CachedState::validate_contract_deployed(
    const Address& addr)
{
    const auto r = get_class_hash_at(addr);
    if (std::holds_alternative<std::error_code>(r))
    {
        log::logger()->warn("failed to read class hash of {}: {}", addr.value.to_hex(),
            std::get<std::error_code>(r).message());
        return make_error_code(FAIL_TO_READ_CLASS_HASH);
    }

    const auto& class_hash = std::get<ClassHash>(r);
    if (class_hash == UNINITIALIZED_CLASS_HASH)
    {
        log::logger()->warn("contract {} not deployed", addr.value.to_hex());
        return make_error_code(NOT_DEPLOYED_CONTRACT);
    }
    return class_hash;
}

std::pair<size_t, size_t> CachedState::count_actual_storage_changes() const
{
    const auto storage_updates =
        subtract_mappings(m_cache.storage_writes, m_cache.storage_initial_values);

    std::unordered_set<Address> modified_contracts;
    for (const auto& [entry, _] : storage_updates)
        modified_contracts.insert(entry.address);

    return {modified_contracts.size(), storage_updates.size()};
}

StateDiff CachedState::build_diff() const
{
    return {
        .address_to_class_hash =
            subtract_mappings(m_cache.class_hash_writes, m_cache.class_hash_initial_values),
        .address_to_nonce = subtract_mappings(m_cache.nonce_writes, m_cache.nonce_initial_values),
        .storage_updates = to_state_diff_storage_mapping(
            subtract_mappings(m_cache.storage_writes, m_cache.storage_initial_values)),
    };
}

void CachedState::rollback(size_t checkpoint)
{
    while (m_journal.size() != checkpoint)
    {
        std::visit(
            [this](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, JournalClassHashWrite>)
                    restore(m_cache.class_hash_writes, e.addr, e.prev);
                else if constexpr (std::is_same_v<T, JournalNonceWrite>)
                    restore(m_cache.nonce_writes, e.addr, e.prev);
                else if constexpr (std::is_same_v<T, JournalStorageWrite>)
                    restore(m_cache.storage_writes, e.entry, e.prev);
                else if constexpr (std::is_same_v<T, JournalContractClass>)
                {
                    if (e.prev != nullptr)
                        m_contract_classes.insert_or_assign(e.class_hash, e.prev);
                    else
                        m_contract_classes.erase(e.class_hash);
                }
                else
                    static_assert(std::is_void_v<T>, "unhandled journal entry type");
            },
            m_journal.back());
        m_journal.pop_back();
    }
}
}  // namespace starkstate
