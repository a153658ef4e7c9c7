// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <iterator>

namespace starkstate
{
std::variant<std::vector<Event>, std::error_code> TransactionExecutionInfo::get_sorted_events() const
{
    std::vector<Event> events;
    for (const auto* call : {&validate_info, &call_info, &fee_transfer_info})
    {
        if (!call->has_value())
            continue;
        auto r = (*call)->get_sorted_events();
        if (const auto* err = std::get_if<std::error_code>(&r))
            return *err;
        auto& sorted = std::get<std::vector<Event>>(r);
        std::ranges::move(sorted, std::back_inserter(events));
    }
    return events;
}

std::variant<TransactionExecutionInfo, std::error_code> execute_transaction(CachedState& state,
    const Transaction& tx, const GeneralConfig& config, evmc::VM& vm)
{
    const auto checkpoint = state.checkpoint();
    const auto fail = [&](std::error_code ec) {
        state.rollback(checkpoint);
        log::logger()->warn("{} transaction failed: {}", to_string(tx.tx_type), ec.message());
        return ec;
    };

    ExecutionResourcesManager resources_manager;
    TransactionExecutionInfo info{.tx_type = tx.tx_type};

    if (tx.validate_entry_point.has_value())
    {
        auto validate = execute_entry_point(state, *tx.validate_entry_point, config,
            resources_manager, vm, tx.tx_info, config.validate_max_n_steps);
        if (const auto* err = std::get_if<std::error_code>(&validate))
            return fail(*err);
        auto& validate_info = std::get<CallInfo>(validate);
        if (const auto ec = verify_no_calls_to_other_contracts(validate_info))
            return fail(ec);
        info.validate_info = std::move(validate_info);
    }

    auto call = execute_entry_point(
        state, tx.entry_point, config, resources_manager, vm, tx.tx_info);
    if (const auto* err = std::get_if<std::error_code>(&call))
        return fail(*err);
    info.call_info = std::move(std::get<CallInfo>(call));

    const std::array call_infos{info.validate_info, info.call_info};
    auto resources = calculate_tx_resources(resources_manager, call_infos, tx.tx_type,
        state.count_actual_storage_changes(), tx.l1_handler_payload_size);
    if (const auto* err = std::get_if<std::error_code>(&resources))
        return fail(*err);
    info.actual_resources = std::move(std::get<ResourcesMapping>(resources));

    const auto fee =
        calculate_tx_fee(info.actual_resources, config.block_context.gas_price, config);
    if (const auto* err = std::get_if<std::error_code>(&fee))
        return fail(*err);
    info.actual_fee = std::get<uint64_t>(fee);

    return info;
}
}  // namespace starkstate
