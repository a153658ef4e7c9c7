// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>
#include <evmone/evmone.h>
#include <nlohmann/json.hpp>
#include <starkstate/hash_utils.hpp>
#include <starkstate/log.hpp>
#include <starkstate/starkstate.hpp>
#include <fstream>
#include <iostream>

namespace json = nlohmann;
using namespace starkstate;

namespace
{
ContractClass read_contract_class(const std::string& path)
{
    std::ifstream in{path};
    return load_contract_class(in);
}

json::json to_json(const StateDiff& diff)
{
    json::json j;
    j["address_to_class_hash"] = json::json::object();
    for (const auto& [addr, class_hash] : diff.address_to_class_hash)
        j["address_to_class_hash"][addr.value.to_hex()] = to_hex(class_hash);
    j["address_to_nonce"] = json::json::object();
    for (const auto& [addr, nonce] : diff.address_to_nonce)
        j["address_to_nonce"][addr.value.to_hex()] = nonce.to_hex();
    j["storage_updates"] = json::json::object();
    for (const auto& [addr, updates] : diff.storage_updates)
    {
        auto& storage = j["storage_updates"][addr.value.to_hex()];
        for (const auto& [key, value] : updates)
            storage[to_hex(key)] = value.to_hex();
    }
    return j;
}
}  // namespace

int main(int argc, char* argv[])
{
    try
    {
        CLI::App app{"starkstate contract state tool"};
        app.set_version_flag("--version", "starkstate " STARKSTATE_VERSION);
        app.require_subcommand(1);

        std::string config_file;
        app.add_option("--config", config_file, "General configuration JSON file")
            ->check(CLI::ExistingFile);

        std::string log_level = "warn";
        app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");

        auto* const class_hash_cmd = app.add_subcommand("class-hash", "Compute the class hash");
        std::string class_file;
        class_hash_cmd->add_option("contract", class_file, "Contract class JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        bool hinted = false;
        class_hash_cmd->add_flag("--hinted", hinted, "Also print the hinted class hash");

        auto* const keccak_cmd = app.add_subcommand("keccak", "Compute the starknet keccak of text");
        std::string text;
        keccak_cmd->add_option("text", text, "Input text")->required();

        auto* const deploy_cmd =
            app.add_subcommand("deploy", "Deploy a contract on an empty state and print the diff");
        deploy_cmd->add_option("contract", class_file, "Contract class JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        std::vector<std::string> calldata_args;
        deploy_cmd->add_option("--calldata", calldata_args, "Constructor calldata");
        std::string salt_arg = "0";
        deploy_cmd->add_option("--salt", salt_arg, "Contract address salt");

        CLI11_PARSE(app, argc, argv);

        log::set_level(spdlog::level::from_str(log_level));

        GeneralConfig config;
        if (!config_file.empty())
        {
            std::ifstream in{config_file};
            config = load_general_config(in);
        }

        evmc::VM vm{evmc_create_evmone()};

        if (*keccak_cmd)
        {
            std::cout << starknet_keccak(std::string_view{text}).to_hex() << "\n";
            return 0;
        }

        if (*class_hash_cmd)
        {
            const auto contract_class = read_contract_class(class_file);
            const auto class_hash =
                compute_class_hash(vm, contract_class, config.hash_program_max_steps);
            if (const auto* err = std::get_if<std::error_code>(&class_hash))
            {
                std::cerr << "class hash computation failed: " << err->message() << "\n";
                return 1;
            }
            std::cout << to_hex(std::get<ClassHash>(class_hash)) << "\n";
            if (hinted)
                std::cout << compute_hinted_class_hash(contract_class).to_hex() << "\n";
            return 0;
        }

        std::vector<Felt> calldata;
        for (const auto& arg : calldata_args)
            calldata.push_back(Felt::from_string(arg));

        InMemoryStateReader reader;
        CachedState state{reader};
        ExecutionResourcesManager resources_manager;
        const auto deployed = deploy_contract(state,
            std::make_shared<const ContractClass>(read_contract_class(class_file)), calldata,
            Felt::from_string(salt_arg), Address{}, config, resources_manager, vm);
        if (const auto* err = std::get_if<std::error_code>(&deployed))
        {
            std::cerr << "deployment failed: " << err->message() << "\n";
            return 1;
        }

        const auto& result = std::get<DeployResult>(deployed);
        json::json out;
        out["contract_address"] = result.contract_address.value.to_hex();
        out["class_hash"] = to_hex(result.class_hash);
        out["state_diff"] = to_json(state.build_diff());
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << "\n";
        return -1;
    }
}
