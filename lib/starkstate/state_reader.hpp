// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "contract_class.hpp"
#include "felt.hpp"
#include <memory>
#include <system_error>
#include <variant>

namespace starkstate
{
/// Read-only access to a committed state snapshot.
///
/// Reads are deterministic for a fixed snapshot.
class StateReader
{
public:
    virtual ~StateReader() = default;

    /// Returns UNINITIALIZED_CLASS_HASH for an address where nothing is deployed.
    virtual std::variant<ClassHash, std::error_code> get_class_hash_at(
        const Address& addr) const = 0;

    virtual std::variant<Felt, std::error_code> get_nonce_at(const Address& addr) const = 0;

    virtual std::variant<Felt, std::error_code> get_storage_at(
        const StorageEntry& entry) const = 0;

    virtual std::variant<std::shared_ptr<const ContractClass>, std::error_code> get_contract_class(
        const ClassHash& class_hash) const = 0;
};
}  // namespace starkstate
