// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "gas_usage.hpp"
#include <vector>

namespace starkstate
{
namespace
{
/// The gas of the L1 logs and counter updates for the messages.
size_t get_consumed_message_to_l2_emission_cost(std::optional<size_t> l1_handler_payload_size)
{
    if (!l1_handler_payload_size.has_value())
        return 0;
    return get_event_emission_cost(
        CONSUMED_MSG_TO_L2_N_TOPICS, CONSUMED_MSG_TO_L2_ENCODED_DATA_SIZE + *l1_handler_payload_size);
}

size_t get_log_message_to_l1_emissions_cost(std::span<const size_t> l2_to_l1_payload_sizes)
{
    size_t cost = 0;
    for (const auto size : l2_to_l1_payload_sizes)
        cost += get_event_emission_cost(LOG_MSG_TO_L1_N_TOPICS, LOG_MSG_TO_L1_ENCODED_DATA_SIZE + size);
    return cost;
}
}  // namespace

size_t get_message_segment_length(
    std::span<const size_t> l2_to_l1_payload_sizes, std::optional<size_t> l1_handler_payload_size)
{
    size_t length = 0;
    for (const auto size : l2_to_l1_payload_sizes)
        length += L2_TO_L1_MSG_HEADER_SIZE + size;
    if (l1_handler_payload_size.has_value())
        length += L1_TO_L2_MSG_HEADER_SIZE + *l1_handler_payload_size;
    return length;
}

size_t calculate_tx_gas_usage(std::span<const L2ToL1MessageInfo> l2_to_l1_messages,
    size_t n_modified_contracts, size_t n_storage_changes,
    std::optional<size_t> l1_handler_payload_size, size_t n_deployments)
{
    std::vector<size_t> payload_sizes;
    payload_sizes.reserve(l2_to_l1_messages.size());
    for (const auto& msg : l2_to_l1_messages)
        payload_sizes.push_back(msg.payload.size());

    const auto residual_message_segment_length =
        get_message_segment_length(payload_sizes, l1_handler_payload_size);
    const auto residual_onchain_data_segment_length =
        get_onchain_data_segment_length(n_modified_contracts, n_storage_changes, n_deployments);

    const auto n_l2_to_l1_messages = payload_sizes.size();
    const size_t n_l1_to_l2_messages = l1_handler_payload_size.has_value() ? 1 : 0;

    const auto starknet_gas_usage =
        residual_message_segment_length * GAS_PER_MEMORY_WORD +
        n_l2_to_l1_messages * GAS_PER_ZERO_TO_NONZERO_STORAGE_SET +
        n_l1_to_l2_messages * GAS_PER_COUNTER_DECREASE +
        get_consumed_message_to_l2_emission_cost(l1_handler_payload_size) +
        get_log_message_to_l1_emissions_cost(payload_sizes);

    const auto sharp_gas_usage =
        (residual_message_segment_length + residual_onchain_data_segment_length) *
        SHARP_GAS_PER_MEMORY_WORD;

    return starknet_gas_usage + sharp_gas_usage;
}
}  // namespace starkstate
