// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "call_info.hpp"
#include "general_config.hpp"
#include "transaction_type.hpp"
#include <map>
#include <optional>
#include <span>
#include <string>

namespace starkstate
{
/// The resource usage of a transaction: resource name => amount.
using ResourcesMapping = std::map<std::string, size_t>;

/// Returns the number of Constructor calls in the call tree.
size_t get_call_n_deployments(const CallInfo& call_info);

/// Computes the resources consumed by a transaction.
///
/// The result contains the VM resources of the execution and of the OS overhead
/// with zero-valued entries dropped, and always the "l1_gas_usage" entry.
///
/// @param resources_manager  The VM resources and syscall counts of the execution.
/// @param call_infos         The call trees of the transaction's stages; skipped stages are empty.
/// @param tx_type            The transaction type.
/// @param storage_changes    The number of modified contracts and of changed storage cells.
/// @param l1_handler_payload_size  The payload size of the consumed L1 message, if any.
std::variant<ResourcesMapping, std::error_code> calculate_tx_resources(
    const ExecutionResourcesManager& resources_manager,
    std::span<const std::optional<CallInfo>> call_infos, TransactionType tx_type,
    std::pair<size_t, size_t> storage_changes, std::optional<size_t> l1_handler_payload_size);

/// Converts the VM resources to L1 gas: the maximum of the weighted resources.
///
/// Fails with RESOURCES_WITHOUT_FEE_WEIGHT if a resource has no weight.
std::variant<double, std::error_code> calculate_l1_gas_by_cairo_usage(
    const GeneralConfig& config, const ResourcesMapping& resources);

/// Returns the fee of the transaction: the total L1 gas rounded up times the gas price.
std::variant<uint64_t, std::error_code> calculate_tx_fee(
    const ResourcesMapping& resources, uint64_t gas_price, const GeneralConfig& config);

/// Fails with UNAUTHORIZED_ACTION_ON_VALIDATE if any call of the tree
/// targets a contract other than the root's.
std::error_code verify_no_calls_to_other_contracts(const CallInfo& call_info);
}  // namespace starkstate
