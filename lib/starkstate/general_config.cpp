// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "general_config.hpp"
#include "json_loader.hpp"
#include <stdexcept>

namespace starkstate
{
namespace
{
evmc_revision to_revision(std::string_view s)
{
    if (s == "Berlin")
        return EVMC_BERLIN;
    if (s == "London")
        return EVMC_LONDON;
    if (s == "Paris" || s == "Merge")
        return EVMC_PARIS;
    if (s == "Shanghai")
        return EVMC_SHANGHAI;
    if (s == "Cancun")
        return EVMC_CANCUN;
    throw std::invalid_argument{"unsupported vm revision: " + std::string{s}};
}

template <typename T>
void load_if_exists(const json::json& j, std::string_view key, T& out)
{
    if (const auto it = j.find(key); it != j.end())
        out = static_cast<T>(from_json<uint64_t>(*it));
}
}  // namespace

template <>
BlockContext from_json<BlockContext>(const json::json& j)
{
    BlockContext ctx;
    load_if_exists(j, "block_number", ctx.block_number);
    load_if_exists(j, "block_timestamp", ctx.block_timestamp);
    load_if_exists(j, "gas_price", ctx.gas_price);
    if (const auto it = j.find("sequencer_address"); it != j.end())
        ctx.sequencer_address = from_json<Address>(*it);
    return ctx;
}

GeneralConfig load_general_config(std::istream& input)
{
    const auto j = json::json::parse(input);

    GeneralConfig config;
    if (const auto it = j.find("chain_id"); it != j.end())
        config.chain_id = from_json<Felt>(*it);
    load_if_exists(j, "invoke_tx_max_n_steps", config.invoke_tx_max_n_steps);
    load_if_exists(j, "validate_max_n_steps", config.validate_max_n_steps);
    load_if_exists(j, "hash_program_max_steps", config.hash_program_max_steps);
    if (const auto it = j.find("vm_revision"); it != j.end())
        config.vm_revision = to_revision(it->get<std::string>());
    if (const auto it = j.find("block_context"); it != j.end())
        config.block_context = from_json<BlockContext>(*it);
    if (const auto it = j.find("cairo_resource_fee_weights"); it != j.end())
        config.cairo_resource_fee_weights = it->get<std::map<std::string, double>>();
    return config;
}
}  // namespace starkstate
