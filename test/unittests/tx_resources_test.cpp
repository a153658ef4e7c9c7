// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <starkstate/errors.hpp>
#include <starkstate/gas_usage.hpp>
#include <starkstate/os_usage.hpp>
#include <starkstate/tx_resources.hpp>

using namespace starkstate;

namespace
{
CallInfo call_with_message(std::vector<Felt> payload)
{
    CallInfo call;
    call.contract_address = Address{Felt{1}};
    call.l2_to_l1_messages.push_back(
        {.order = 0, .to_address = Address{Felt{0xe1}}, .payload = std::move(payload)});
    return call;
}
}  // namespace

TEST(gas_usage, message_to_l1)
{
    const std::vector<L2ToL1MessageInfo> messages{{Address{Felt{1}}, Address{Felt{2}}, {Felt{1}, Felt{2}}}};
    EXPECT_EQ(calculate_tx_gas_usage(messages, 0, 0, std::nullopt, 0), 25584);
}

TEST(gas_usage, storage_changes_only)
{
    EXPECT_EQ(calculate_tx_gas_usage({}, 1, 2, std::nullopt, 0), 600);
    EXPECT_EQ(calculate_tx_gas_usage({}, 0, 0, std::nullopt, 0), 0);
    EXPECT_EQ(calculate_tx_gas_usage({}, 0, 0, std::nullopt, 1), DEPLOYMENT_INFO_SIZE * 100);
}

TEST(gas_usage, l1_handler_payload)
{
    // Message segment 5 + 2, the counter decrease and the consumed message log.
    const auto expected = 7 * GAS_PER_MEMORY_WORD + GAS_PER_COUNTER_DECREASE +
                          get_event_emission_cost(3, 3 + 2) + 7 * SHARP_GAS_PER_MEMORY_WORD;
    EXPECT_EQ(calculate_tx_gas_usage({}, 0, 0, 2, 0), expected);
}

TEST(gas_usage, segment_lengths)
{
    const size_t payload_sizes[]{0, 3};
    EXPECT_EQ(get_message_segment_length(payload_sizes, std::nullopt), 3 + 6);
    EXPECT_EQ(get_message_segment_length({}, 4), 9);
    EXPECT_EQ(get_onchain_data_segment_length(2, 3, 1), 4 + 6 + 2);
    EXPECT_EQ(get_event_emission_cost(2, 4), 375 + 3 * 375 + 4 * 256);
}

TEST(os_usage, syscall_resources)
{
    const auto storage_read = get_syscall_os_resources("storage_read");
    ASSERT_TRUE(storage_read.has_value());
    EXPECT_EQ(storage_read->n_steps, 44);
    EXPECT_TRUE(storage_read->builtin_instance_counter.empty());

    const auto call = get_syscall_os_resources("call_contract");
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->n_steps, 690);
    EXPECT_EQ(call->builtin_instance_counter.at("range_check_builtin"), 19);

    EXPECT_FALSE(get_syscall_os_resources("self_destruct").has_value());
}

TEST(os_usage, additional_resources)
{
    const std::map<std::string, size_t, std::less<>> counter{{"storage_read", 2}, {"emit_event", 1}};
    const auto r = std::get<ExecutionResources>(
        get_additional_os_resources(counter, TransactionType::InvokeFunction));
    EXPECT_EQ(r.n_steps, 2 * 44 + 19 + 2839);
    EXPECT_EQ(r.builtin_instance_counter.at("pedersen_builtin"), 16);
    EXPECT_EQ(r.builtin_instance_counter.at("range_check_builtin"), 70);

    const std::map<std::string, size_t, std::less<>> unknown{{"unknown_syscall", 1}};
    EXPECT_EQ(std::get<std::error_code>(
                  get_additional_os_resources(unknown, TransactionType::InvokeFunction)),
        UNKNOWN_SYSCALL);
}

TEST(tx_resources, always_has_l1_gas_usage)
{
    ExecutionResourcesManager manager;
    const auto resources = std::get<ResourcesMapping>(
        calculate_tx_resources(manager, {}, TransactionType::Deploy, {0, 0}, std::nullopt));
    EXPECT_EQ(resources, (ResourcesMapping{{"l1_gas_usage", 0}}));
}

TEST(tx_resources, zero_resources_dropped)
{
    ExecutionResourcesManager manager;
    manager.cairo_usage.n_steps = 10;
    manager.cairo_usage.builtin_instance_counter["pedersen_builtin"] = 0;
    manager.cairo_usage.builtin_instance_counter["hash_builtin"] = 4;
    manager.increment_syscall_counter("storage_write", 2);

    const std::optional<CallInfo> calls[]{std::nullopt, CallInfo{}};
    const auto resources = std::get<ResourcesMapping>(
        calculate_tx_resources(manager, calls, TransactionType::InvokeFunction, {1, 2}, std::nullopt));

    EXPECT_EQ(resources.at("l1_gas_usage"), 600);
    EXPECT_EQ(resources.at("n_steps"), 10 + 2 * 46 + 2839);
    EXPECT_EQ(resources.at("pedersen_builtin"), 16);
    EXPECT_EQ(resources.at("range_check_builtin"), 70);
    EXPECT_EQ(resources.at("hash_builtin"), 4);
    EXPECT_FALSE(resources.contains("n_memory_holes"));
}

TEST(tx_resources, messages_and_deployments)
{
    auto call = call_with_message({Felt{1}, Felt{2}});
    CallInfo constructor;
    constructor.entry_point_type = EntryPointType::Constructor;
    call.internal_calls.push_back(constructor);
    EXPECT_EQ(get_call_n_deployments(call), 1);

    ExecutionResourcesManager manager;
    const std::optional<CallInfo> calls[]{call};
    const auto resources = std::get<ResourcesMapping>(
        calculate_tx_resources(manager, calls, TransactionType::Deploy, {0, 0}, std::nullopt));
    EXPECT_EQ(resources.at("l1_gas_usage"), 25584 + DEPLOYMENT_INFO_SIZE * 100);
}

TEST(tx_resources, malformed_messages)
{
    auto call = call_with_message({});
    call.l2_to_l1_messages.front().order = 1;

    ExecutionResourcesManager manager;
    const std::optional<CallInfo> calls[]{call};
    EXPECT_EQ(std::get<std::error_code>(calculate_tx_resources(
                  manager, calls, TransactionType::InvokeFunction, {0, 0}, std::nullopt)),
        UNEXPECTED_HOLES_IN_L2_TO_L1_MESSAGES);
}

TEST(tx_resources, unknown_syscall)
{
    ExecutionResourcesManager manager;
    manager.increment_syscall_counter("unknown_syscall");
    EXPECT_EQ(std::get<std::error_code>(calculate_tx_resources(
                  manager, {}, TransactionType::InvokeFunction, {0, 0}, std::nullopt)),
        UNKNOWN_SYSCALL);
}

TEST(tx_resources, fee)
{
    GeneralConfig config;
    const ResourcesMapping resources{{"l1_gas_usage", 1000}, {"n_steps", 200'000},
        {"range_check_builtin", 100}};

    // The cairo usage is the maximum of 0.01 * 200000 and 0.16 * 100.
    EXPECT_DOUBLE_EQ(std::get<double>(calculate_l1_gas_by_cairo_usage(config, resources)), 2000.0);
    EXPECT_EQ(std::get<uint64_t>(calculate_tx_fee(resources, 3, config)), 3000 * 3);

    const ResourcesMapping unweighted{{"l1_gas_usage", 1}, {"keccak_builtin", 1}};
    EXPECT_EQ(std::get<std::error_code>(calculate_tx_fee(unweighted, 1, config)),
        RESOURCES_WITHOUT_FEE_WEIGHT);
}

TEST(tx_resources, fee_rounds_up)
{
    GeneralConfig config;
    const ResourcesMapping resources{{"l1_gas_usage", 10}, {"n_steps", 150}};
    EXPECT_EQ(std::get<uint64_t>(calculate_tx_fee(resources, 1, config)), 12);
}

TEST(tx_resources, verify_no_calls_to_other_contracts)
{
    CallInfo validate;
    validate.contract_address = Address{Felt{1}};
    CallInfo self_call;
    self_call.contract_address = Address{Felt{1}};
    validate.internal_calls.push_back(self_call);
    EXPECT_FALSE(verify_no_calls_to_other_contracts(validate));

    CallInfo other;
    other.contract_address = Address{Felt{2}};
    validate.internal_calls.front().internal_calls.push_back(other);
    EXPECT_EQ(verify_no_calls_to_other_contracts(validate), UNAUTHORIZED_ACTION_ON_VALIDATE);
}

TEST(execution_resources, arithmetic)
{
    const ExecutionResources a{10, 1, {{"hash_builtin", 2}, {"range_check_builtin", 0}}};
    const ExecutionResources b{5, 0, {{"hash_builtin", 1}, {"pedersen_builtin", 3}}};

    const auto sum = a + b;
    EXPECT_EQ(sum.n_steps, 15);
    EXPECT_EQ(sum.n_memory_holes, 1);
    EXPECT_EQ(sum.builtin_instance_counter,
        (std::map<std::string, size_t>{
            {"hash_builtin", 3}, {"pedersen_builtin", 3}, {"range_check_builtin", 0}}));

    const auto scaled = b * 3;
    EXPECT_EQ(scaled, (ExecutionResources{15, 0, {{"hash_builtin", 3}, {"pedersen_builtin", 9}}}));

    EXPECT_EQ(sum.filter_unused_builtins().builtin_instance_counter.size(), 2);
    EXPECT_FALSE(sum.filter_unused_builtins().builtin_instance_counter.contains("range_check_builtin"));
}

TEST(execution_resources, syscall_counter)
{
    ExecutionResourcesManager manager;
    EXPECT_EQ(manager.get_syscall_counter("storage_read"), 0);
    manager.increment_syscall_counter("storage_read");
    manager.increment_syscall_counter("storage_read", 2);
    EXPECT_EQ(manager.get_syscall_counter("storage_read"), 3);
    EXPECT_EQ(manager.syscall_counter.size(), 1);
}
