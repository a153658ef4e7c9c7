// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "os_usage.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>

namespace starkstate
{
namespace
{
struct SyscallCost
{
    std::string_view name;
    size_t n_steps;
    size_t pedersen;
    size_t range_check;
};

/// Sorted by name.
constexpr std::array SYSCALL_COSTS{
    SyscallCost{"call_contract", 690, 0, 19},
    SyscallCost{"delegate_call", 712, 0, 19},
    SyscallCost{"delegate_l1_handler", 692, 0, 15},
    SyscallCost{"deploy", 936, 7, 18},
    SyscallCost{"emit_event", 19, 0, 0},
    SyscallCost{"get_block_number", 40, 0, 0},
    SyscallCost{"get_block_timestamp", 38, 0, 0},
    SyscallCost{"get_caller_address", 32, 0, 0},
    SyscallCost{"get_contract_address", 36, 0, 0},
    SyscallCost{"get_sequencer_address", 34, 0, 0},
    SyscallCost{"get_tx_info", 29, 0, 0},
    SyscallCost{"get_tx_signature", 44, 0, 0},
    SyscallCost{"library_call", 679, 0, 19},
    SyscallCost{"library_call_l1_handler", 658, 0, 14},
    SyscallCost{"replace_class", 73, 0, 0},
    SyscallCost{"send_message_to_l1", 84, 0, 0},
    SyscallCost{"storage_read", 44, 0, 0},
    SyscallCost{"storage_write", 46, 0, 0},
};

static_assert(std::ranges::is_sorted(SYSCALL_COSTS, {}, &SyscallCost::name));

ExecutionResources make_resources(size_t n_steps, size_t pedersen, size_t range_check)
{
    ExecutionResources r{.n_steps = n_steps};
    if (pedersen != 0)
        r.builtin_instance_counter.emplace("pedersen_builtin", pedersen);
    if (range_check != 0)
        r.builtin_instance_counter.emplace("range_check_builtin", range_check);
    return r;
}
}  // namespace

std::optional<ExecutionResources> get_syscall_os_resources(std::string_view syscall)
{
    const auto it = std::ranges::lower_bound(SYSCALL_COSTS, syscall, {}, &SyscallCost::name);
    if (it == SYSCALL_COSTS.end() || it->name != syscall)
        return std::nullopt;
    return make_resources(it->n_steps, it->pedersen, it->range_check);
}

ExecutionResources get_tx_type_os_resources(TransactionType tx_type)
{
    switch (tx_type)
    {
    case TransactionType::Declare:
        return make_resources(2336, 15, 63);
    case TransactionType::DeployAccount:
        return make_resources(3098, 23, 83);
    case TransactionType::InvokeFunction:
        return make_resources(2839, 16, 70);
    case TransactionType::L1Handler:
        return make_resources(1069, 11, 16);
    case TransactionType::Deploy:
    case TransactionType::InitializeBlockInfo:
        break;
    }
    return {};
}

std::variant<ExecutionResources, std::error_code> get_additional_os_resources(
    const std::map<std::string, size_t, std::less<>>& syscall_counter, TransactionType tx_type)
{
    ExecutionResources additional;
    for (const auto& [syscall, count] : syscall_counter)
    {
        const auto cost = get_syscall_os_resources(syscall);
        if (!cost.has_value())
        {
            log::logger()->warn("unknown syscall: {}", syscall);
            return make_error_code(UNKNOWN_SYSCALL);
        }
        additional += *cost * count;
    }
    return additional + get_tx_type_os_resources(tx_type);
}
}  // namespace starkstate
