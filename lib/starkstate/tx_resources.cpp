// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tx_resources.hpp"
#include "errors.hpp"
#include "gas_usage.hpp"
#include "log.hpp"
#include "os_usage.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace starkstate
{
size_t get_call_n_deployments(const CallInfo& call_info)
{
    const auto topology = call_info.gen_call_topology();
    return static_cast<size_t>(std::ranges::count_if(topology, [](const CallInfo* call) {
        return call->entry_point_type == EntryPointType::Constructor;
    }));
}

std::variant<ResourcesMapping, std::error_code> calculate_tx_resources(
    const ExecutionResourcesManager& resources_manager,
    std::span<const std::optional<CallInfo>> call_infos, TransactionType tx_type,
    std::pair<size_t, size_t> storage_changes, std::optional<size_t> l1_handler_payload_size)
{
    const auto [n_modified_contracts, n_storage_changes] = storage_changes;

    size_t n_deployments = 0;
    std::vector<L2ToL1MessageInfo> l2_to_l1_messages;
    for (const auto& call_info : call_infos)
    {
        if (!call_info.has_value())
            continue;

        n_deployments += get_call_n_deployments(*call_info);

        auto messages = call_info->get_sorted_l2_to_l1_messages();
        if (const auto* err = std::get_if<std::error_code>(&messages))
            return *err;
        auto& sorted = std::get<std::vector<L2ToL1MessageInfo>>(messages);
        std::ranges::move(sorted, std::back_inserter(l2_to_l1_messages));
    }

    const auto l1_gas_usage = calculate_tx_gas_usage(l2_to_l1_messages, n_modified_contracts,
        n_storage_changes, l1_handler_payload_size, n_deployments);

    const auto additional = get_additional_os_resources(resources_manager.syscall_counter, tx_type);
    if (const auto* err = std::get_if<std::error_code>(&additional))
        return *err;

    const auto total =
        (resources_manager.cairo_usage + std::get<ExecutionResources>(additional))
            .filter_unused_builtins();

    ResourcesMapping resources;
    resources.emplace("l1_gas_usage", l1_gas_usage);
    if (total.n_steps != 0)
        resources.emplace("n_steps", total.n_steps);
    if (total.n_memory_holes != 0)
        resources.emplace("n_memory_holes", total.n_memory_holes);
    for (const auto& [builtin, count] : total.builtin_instance_counter)
        resources.emplace(builtin, count);
    return resources;
}

std::variant<double, std::error_code> calculate_l1_gas_by_cairo_usage(
    const GeneralConfig& config, const ResourcesMapping& resources)
{
    double l1_gas = 0;
    for (const auto& [name, amount] : resources)
    {
        if (name == "l1_gas_usage")
            continue;
        const auto it = config.cairo_resource_fee_weights.find(name);
        if (it == config.cairo_resource_fee_weights.end())
        {
            log::logger()->warn("no fee weight for resource {}", name);
            return make_error_code(RESOURCES_WITHOUT_FEE_WEIGHT);
        }
        l1_gas = std::max(l1_gas, it->second * static_cast<double>(amount));
    }
    return l1_gas;
}

std::variant<uint64_t, std::error_code> calculate_tx_fee(
    const ResourcesMapping& resources, uint64_t gas_price, const GeneralConfig& config)
{
    const auto by_cairo_usage = calculate_l1_gas_by_cairo_usage(config, resources);
    if (const auto* err = std::get_if<std::error_code>(&by_cairo_usage))
        return *err;

    const auto it = resources.find("l1_gas_usage");
    const auto l1_gas_usage = it != resources.end() ? static_cast<double>(it->second) : 0.0;
    const auto total_l1_gas = std::ceil(l1_gas_usage + std::get<double>(by_cairo_usage));
    return static_cast<uint64_t>(total_l1_gas) * gas_price;
}

std::error_code verify_no_calls_to_other_contracts(const CallInfo& call_info)
{
    for (const auto* call : call_info.gen_call_topology())
    {
        if (call->contract_address != call_info.contract_address)
        {
            log::logger()->warn("validation of {} called {}", call_info.contract_address.value.to_hex(),
                call->contract_address.value.to_hex());
            return make_error_code(UNAUTHORIZED_ACTION_ON_VALIDATE);
        }
    }
    return {};
}
}  // namespace starkstate
