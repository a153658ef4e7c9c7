// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "host.hpp"
#include <memory>
#include <optional>

namespace starkstate
{
/// The selector of the constructor entry point.
Felt constructor_selector();

/// Executes the entry point on the state and adds the used resources to the manager.
///
/// The gas budget is config.invoke_tx_max_n_steps unless max_steps is given.
/// A failed execution leaves the state unmodified.
std::variant<CallInfo, std::error_code> execute_entry_point(CachedState& state,
    const ExecutionEntryPoint& entry_point, const GeneralConfig& config,
    ExecutionResourcesManager& resources_manager, evmc::VM& vm, const TxInfo& tx_info = {},
    std::optional<int64_t> max_steps = {});

/// Computes the address of a contract deployed from the class with the constructor calldata.
///
/// The address is the keccak256 of the prefix "STARKNET_CONTRACT_ADDRESS", the deployer,
/// the salt, the class hash and the hash of the calldata, truncated to its low 20 bytes.
Address calculate_contract_address(const Felt& salt, const ClassHash& class_hash,
    std::span<const Felt> constructor_calldata, const Address& deployer_address);

struct DeployResult
{
    Address contract_address;
    ClassHash class_hash;
    CallInfo constructor_call;
};

/// Declares the contract class, deploys it at the computed address and runs its constructor.
///
/// A class without a constructor gets an empty constructor call and the calldata must be empty.
std::variant<DeployResult, std::error_code> deploy_contract(CachedState& state,
    std::shared_ptr<const ContractClass> contract_class, std::span<const Felt> constructor_calldata,
    const Felt& salt, const Address& deployer_address, const GeneralConfig& config,
    ExecutionResourcesManager& resources_manager, evmc::VM& vm);
}  // namespace starkstate
