// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "execution_resources.hpp"
#include "transaction_type.hpp"
#include <optional>
#include <system_error>
#include <variant>

namespace starkstate
{
/// The fixed VM resources the OS spends on one invocation of the syscall.
/// Returns std::nullopt for an unknown syscall.
std::optional<ExecutionResources> get_syscall_os_resources(std::string_view syscall);

/// The fixed VM resources the OS spends on a transaction of the type.
ExecutionResources get_tx_type_os_resources(TransactionType tx_type);

/// Returns the VM resources the OS needs in addition to the transaction's own execution.
///
/// Fails with UNKNOWN_SYSCALL if a counted syscall has no known cost.
std::variant<ExecutionResources, std::error_code> get_additional_os_resources(
    const std::map<std::string, size_t, std::less<>>& syscall_counter, TransactionType tx_type);
}  // namespace starkstate
