// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "felt.hpp"
#include <evmc/evmc.h>
#include <iosfwd>
#include <map>
#include <string>

namespace starkstate
{
struct BlockContext
{
    uint64_t block_number = 0;
    uint64_t block_timestamp = 0;
    uint64_t gas_price = 0;
    Address sequencer_address;
};

/// The chain-wide execution parameters.
struct GeneralConfig
{
    /// The chain id: the short string "SN_GOERLI" as a big-endian number.
    Felt chain_id = Felt::from_string("0x534e5f474f45524c49");

    /// The VM gas budget of a single transaction.
    int64_t invoke_tx_max_n_steps = 1'000'000;

    /// The VM gas budget of a validation call.
    int64_t validate_max_n_steps = 1'000'000;

    /// The VM gas budget of a class hash computation.
    int64_t hash_program_max_steps = 10'000'000;

    evmc_revision vm_revision = EVMC_SHANGHAI;

    BlockContext block_context;

    /// The L1 gas cost of a unit of each execution resource.
    std::map<std::string, double> cairo_resource_fee_weights = {
        {"n_steps", 0.01},
        {"pedersen_builtin", 0.32},
        {"range_check_builtin", 0.16},
        {"ecdsa_builtin", 20.48},
        {"bitwise_builtin", 0.64},
        {"ec_op_builtin", 10.24},
        {"output_builtin", 0.0},
        {"hash_builtin", 0.32},
    };
};

/// Loads the configuration from JSON. Missing keys keep their defaults.
/// Throws on malformed input.
GeneralConfig load_general_config(std::istream& input);
}  // namespace starkstate
