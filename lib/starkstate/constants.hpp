// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>

namespace starkstate
{
/// The message and deployment encoding sizes in words.
/// @{
constexpr size_t L2_TO_L1_MSG_HEADER_SIZE = 3;
constexpr size_t L1_TO_L2_MSG_HEADER_SIZE = 5;
constexpr size_t DEPLOYMENT_INFO_SIZE = 2;
/// @}

/// The shape of the L1 events logged for messages.
/// @{
constexpr size_t CONSUMED_MSG_TO_L2_N_TOPICS = 3;
constexpr size_t LOG_MSG_TO_L1_N_TOPICS = 2;
constexpr size_t N_DEFAULT_TOPICS = 1;
constexpr size_t CONSUMED_MSG_TO_L2_ENCODED_DATA_SIZE = 3;
constexpr size_t LOG_MSG_TO_L1_ENCODED_DATA_SIZE = 2;
/// @}

/// The L1 gas prices.
/// @{
constexpr size_t GAS_PER_MEMORY_BYTE = 16;
constexpr size_t WORD_WIDTH = 32;
constexpr size_t GAS_PER_MEMORY_WORD = GAS_PER_MEMORY_BYTE * WORD_WIDTH;
constexpr size_t GAS_PER_LOG = 375;
constexpr size_t GAS_PER_LOG_TOPIC = 375;
constexpr size_t GAS_PER_LOG_DATA_BYTE = 8;
constexpr size_t GAS_PER_LOG_DATA_WORD = GAS_PER_LOG_DATA_BYTE * WORD_WIDTH;
constexpr size_t GAS_PER_ZERO_TO_NONZERO_STORAGE_SET = 20000;
constexpr size_t GAS_PER_COUNTER_DECREASE = 5000;
constexpr size_t SHARP_GAS_PER_MEMORY_WORD = 100;
/// @}
}  // namespace starkstate
