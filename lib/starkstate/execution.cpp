// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "execution.hpp"
#include "class_hash.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>

namespace starkstate
{
Felt constructor_selector()
{
    static const auto selector = starknet_keccak(std::string_view{"constructor"});
    return selector;
}

std::variant<CallInfo, std::error_code> execute_entry_point(CachedState& state,
    const ExecutionEntryPoint& entry_point, const GeneralConfig& config,
    ExecutionResourcesManager& resources_manager, evmc::VM& vm, const TxInfo& tx_info,
    std::optional<int64_t> max_steps)
{
    Host host{config, vm, state, resources_manager, tx_info};
    auto result = host.execute(entry_point, 0, max_steps.value_or(config.invoke_tx_max_n_steps));
    if (const auto* call_info = std::get_if<CallInfo>(&result))
        resources_manager.cairo_usage += call_info->execution_resources;
    return result;
}

Address calculate_contract_address(const Felt& salt, const ClassHash& class_hash,
    std::span<const Felt> constructor_calldata, const Address& deployer_address)
{
    static constexpr std::string_view prefix{"STARKNET_CONTRACT_ADDRESS"};

    bytes preimage;
    bytes32 prefix_word;
    std::copy(prefix.begin(), prefix.end(), &prefix_word.bytes[sizeof(prefix_word) - prefix.size()]);
    preimage.append(prefix_word.bytes, sizeof(prefix_word));
    preimage += to_words(std::array{deployer_address.value, salt, Felt::from_bytes32(class_hash)});
    const auto calldata_hash = keccak256(to_words(constructor_calldata));
    preimage.append(calldata_hash.bytes, sizeof(calldata_hash));

    auto hash = keccak256(preimage);
    std::fill_n(hash.bytes, sizeof(hash) - sizeof(evmc::address), uint8_t{0});
    return Address{Felt::from_bytes32(hash)};
}

std::variant<DeployResult, std::error_code> deploy_contract(CachedState& state,
    std::shared_ptr<const ContractClass> contract_class, std::span<const Felt> constructor_calldata,
    const Felt& salt, const Address& deployer_address, const GeneralConfig& config,
    ExecutionResourcesManager& resources_manager, evmc::VM& vm)
{
    const auto class_hash_result =
        compute_class_hash(vm, *contract_class, config.hash_program_max_steps);
    if (const auto* err = std::get_if<std::error_code>(&class_hash_result))
        return *err;
    const auto class_hash = std::get<ClassHash>(class_hash_result);

    const auto contract_address =
        calculate_contract_address(salt, class_hash, constructor_calldata, deployer_address);

    const auto has_constructor =
        contract_class->entry_points_by_type.contains(EntryPointType::Constructor) &&
        !contract_class->entry_points_by_type.at(EntryPointType::Constructor).empty();
    if (!has_constructor && !constructor_calldata.empty())
    {
        log::logger()->warn("calldata given to the class {} without a constructor", to_hex(class_hash));
        return make_error_code(ENTRY_POINT_NOT_FOUND);
    }

    const auto checkpoint = state.checkpoint();
    state.set_contract_class(class_hash, std::move(contract_class));
    if (const auto ec = state.deploy_contract(contract_address, class_hash))
    {
        state.rollback(checkpoint);
        return ec;
    }

    if (!has_constructor)
    {
        return DeployResult{contract_address, class_hash,
            CallInfo::empty_constructor_call(contract_address, deployer_address, class_hash)};
    }

    const ExecutionEntryPoint constructor{
        .contract_address = contract_address,
        .caller_address = deployer_address,
        .entry_point_selector = constructor_selector(),
        .calldata = {constructor_calldata.begin(), constructor_calldata.end()},
        .entry_point_type = EntryPointType::Constructor,
        .class_hash = class_hash,
    };
    auto call_info = execute_entry_point(state, constructor, config, resources_manager, vm);
    if (const auto* err = std::get_if<std::error_code>(&call_info))
    {
        state.rollback(checkpoint);
        return *err;
    }

    log::logger()->info("deployed class {} at {}", to_hex(class_hash), contract_address.value.to_hex());
    return DeployResult{contract_address, class_hash, std::move(std::get<CallInfo>(call_info))};
}
}  // namespace starkstate
