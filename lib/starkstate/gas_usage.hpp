// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "call_info.hpp"
#include "constants.hpp"
#include <optional>
#include <span>

namespace starkstate
{
/// Returns the L1 gas consumed by publishing the transaction's data and messages on L1.
///
/// @param l2_to_l1_messages     The messages sent to L1 by the transaction.
/// @param n_modified_contracts  The number of contracts with a changed nonce, class or storage.
/// @param n_storage_changes     The number of changed storage cells.
/// @param l1_handler_payload_size  The payload size of the consumed L1 message, if any.
/// @param n_deployments         The number of deployed contracts.
size_t calculate_tx_gas_usage(std::span<const L2ToL1MessageInfo> l2_to_l1_messages,
    size_t n_modified_contracts, size_t n_storage_changes,
    std::optional<size_t> l1_handler_payload_size, size_t n_deployments);

/// The size in words of the messages when encoded on L1.
size_t get_message_segment_length(std::span<const size_t> l2_to_l1_payload_sizes,
    std::optional<size_t> l1_handler_payload_size);

/// The size in words of the state diff data published on L1.
constexpr size_t get_onchain_data_segment_length(
    size_t n_modified_contracts, size_t n_storage_changes, size_t n_deployments) noexcept
{
    // (contract address, nonce and number of storage updates) and (key, value) pairs.
    return n_modified_contracts * 2 + n_storage_changes * 2 + n_deployments * DEPLOYMENT_INFO_SIZE;
}

/// The L1 gas of emitting an event with the given number of topics and data words.
constexpr size_t get_event_emission_cost(size_t n_topics, size_t data_length) noexcept
{
    return GAS_PER_LOG + (n_topics + N_DEFAULT_TOPICS) * GAS_PER_LOG_TOPIC +
           data_length * GAS_PER_LOG_DATA_WORD;
}
}  // namespace starkstate
