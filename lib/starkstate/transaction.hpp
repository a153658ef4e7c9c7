// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution.hpp"
#include "transaction_type.hpp"
#include "tx_resources.hpp"

namespace starkstate
{
/// A transaction calling a contract: an optional validation call followed by the execution call.
struct Transaction
{
    TransactionType tx_type = TransactionType::InvokeFunction;

    /// The account validation call. It must not call other contracts.
    std::optional<ExecutionEntryPoint> validate_entry_point;

    ExecutionEntryPoint entry_point;

    /// The size of the L1 message payload consumed by an L1 handler transaction.
    std::optional<size_t> l1_handler_payload_size;

    TxInfo tx_info;
};

struct TransactionExecutionInfo
{
    std::optional<CallInfo> validate_info;
    std::optional<CallInfo> call_info;
    std::optional<CallInfo> fee_transfer_info;
    uint64_t actual_fee = 0;
    ResourcesMapping actual_resources;
    TransactionType tx_type = TransactionType::InvokeFunction;

    /// Returns the events of all calls in emission order.
    [[nodiscard]] std::variant<std::vector<Event>, std::error_code> get_sorted_events() const;
};

/// Executes the transaction on the state and charges its resources.
///
/// On failure the state is left unmodified.
std::variant<TransactionExecutionInfo, std::error_code> execute_transaction(CachedState& state,
    const Transaction& tx, const GeneralConfig& config, evmc::VM& vm);
}  // namespace starkstate
