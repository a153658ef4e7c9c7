// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "class_hash.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>

namespace starkstate
{
namespace
{
/// The hash program.
///
/// class_hash(hash_ptr, record...) returns (hash_ptr + 1, keccak256(record) mod P).
constexpr auto HASH_PROGRAM_JSON = R"({
  "builtins": ["hash"],
  "data": [
    "0x61", "0x0", "0x0", "0x56", "0x0", "0x5b", "0x60", "0x20", "0x36", "0x3", "0x80", "0x60",
    "0x20", "0x60", "0x0", "0x37", "0x60", "0x0", "0x20", "0x7f", "0x8", "0x0", "0x0", "0x0",
    "0x0", "0x0", "0x0", "0x11", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0",
    "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0", "0x0",
    "0x0", "0x0", "0x0", "0x1", "0x90", "0x6", "0x60", "0x20", "0x52", "0x60", "0x0", "0x35",
    "0x60", "0x1", "0x1", "0x60", "0x0", "0x52", "0x60", "0x40", "0x60", "0x0", "0xf3"
  ],
  "identifiers": {
    "__main__.API_VERSION": {"type": "const", "value": 0},
    "__main__.ContractClass": {
      "type": "struct",
      "members": {
        "api_version": {"offset": 0},
        "n_external_functions": {"offset": 1},
        "external_functions": {"offset": 2},
        "n_l1_handlers": {"offset": 3},
        "l1_handlers": {"offset": 4},
        "n_constructors": {"offset": 5},
        "constructors": {"offset": 6},
        "n_builtins": {"offset": 7},
        "builtin_list": {"offset": 8},
        "hinted_class_hash": {"offset": 9},
        "bytecode_length": {"offset": 10},
        "bytecode_ptr": {"offset": 11}
      }
    },
    "__main__.class_hash": {"type": "function", "pc": 5}
  },
  "main_scope": "__main__"
})";

constexpr auto API_VERSION_IDENTIFIER = "__main__.API_VERSION";
constexpr auto CONTRACT_CLASS_IDENTIFIER = "__main__.ContractClass";
constexpr auto CLASS_HASH_IDENTIFIER = "__main__.class_hash";

/// The member of the record struct holding the number of entry points of the kind.
std::string_view count_member(EntryPointType type) noexcept
{
    switch (type)
    {
    case EntryPointType::External:
        return "n_external_functions";
    case EntryPointType::L1Handler:
        return "n_l1_handlers";
    case EntryPointType::Constructor:
        return "n_constructors";
    }
    return {};
}

Felt encode_builtin_name(std::string_view name)
{
    std::string lower{name};
    std::ranges::transform(lower, lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Felt::from_bytes_be({reinterpret_cast<const uint8_t*>(lower.data()), lower.size()});
}
}  // namespace

std::variant<std::vector<ContractEntryPoint>, std::error_code> get_contract_entry_points(
    const ContractClass& contract_class, EntryPointType entry_point_type)
{
    const auto it = contract_class.entry_points_by_type.find(entry_point_type);
    if (it == contract_class.entry_points_by_type.end())
        return std::vector<ContractEntryPoint>{};

    const auto program_length = contract_class.program.data.size();
    for (const auto& ep : it->second)
    {
        if (ep.offset > program_length)
        {
            log::logger()->warn("invalid {} entry point offset {}", to_string(entry_point_type),
                ep.offset);
            return make_error_code(INVALID_OFFSET);
        }
    }
    return it->second;
}

Felt compute_hinted_class_hash(const ContractClass& /*contract_class*/)
{
    return starknet_keccak(R"({"abi": contract_class.abi, "program": contract_class.program})");
}

std::variant<std::vector<ProgramArg>, std::error_code> get_contract_class_struct(
    const std::map<std::string, Identifier>& identifiers, const ContractClass& contract_class)
{
    const auto api_version = identifiers.find(API_VERSION_IDENTIFIER);
    if (api_version == identifiers.end())
    {
        log::logger()->warn("missing identifier {}", API_VERSION_IDENTIFIER);
        return make_error_code(MISSING_IDENTIFIER);
    }
    if (!api_version->second.value.has_value())
        return make_error_code(NONE_API_VERSION);

    const auto layout = identifiers.find(CONTRACT_CLASS_IDENTIFIER);
    if (layout == identifiers.end())
    {
        log::logger()->warn("missing identifier {}", CONTRACT_CLASS_IDENTIFIER);
        return make_error_code(MISSING_IDENTIFIER);
    }

    std::vector<ProgramArg> record;
    record.push_back(ProgramArg::single(*api_version->second.value));

    for (const auto type : ENTRY_POINT_TYPES)
    {
        if (!layout->second.members.contains(std::string{count_member(type)}))
        {
            log::logger()->warn("no {} entry points in the class layout", to_string(type));
            return make_error_code(NONE_EXISTING_ENTRY_POINT_TYPE);
        }

        const auto entry_points = get_contract_entry_points(contract_class, type);
        if (const auto* err = std::get_if<std::error_code>(&entry_points))
            return *err;
        const auto& eps = std::get<std::vector<ContractEntryPoint>>(entry_points);
        record.push_back(ProgramArg::single(eps.size()));
        record.push_back(ProgramArg::array(flatten(eps)));
    }

    const auto& builtins = contract_class.program.builtins;
    std::vector<Felt> builtin_list;
    builtin_list.reserve(builtins.size());
    for (const auto& name : builtins)
        builtin_list.push_back(encode_builtin_name(name));
    record.push_back(ProgramArg::single(builtin_list.size()));
    record.push_back(ProgramArg::array(std::move(builtin_list)));

    record.push_back(ProgramArg::single(compute_hinted_class_hash(contract_class)));

    const auto& bytecode = contract_class.program.data;
    record.push_back(ProgramArg::single(bytecode.size()));
    record.push_back(ProgramArg::array(bytecode));
    return record;
}

const std::shared_ptr<const Program>& hash_calculation_program()
{
    static const std::shared_ptr<const Program> program =
        std::make_shared<const Program>(load_program(nlohmann::json::parse(HASH_PROGRAM_JSON)));
    return program;
}

std::variant<ClassHash, std::error_code> compute_class_hash(
    evmc::VM& vm, const ContractClass& contract_class, int64_t gas)
{
    return compute_class_hash(vm, contract_class, hash_calculation_program(), gas);
}

std::variant<ClassHash, std::error_code> compute_class_hash(evmc::VM& vm,
    const ContractClass& contract_class, std::shared_ptr<const Program> hash_program, int64_t gas)
{
    const auto entry = hash_program->identifiers.find(CLASS_HASH_IDENTIFIER);
    if (entry == hash_program->identifiers.end() || !entry->second.pc.has_value())
    {
        log::logger()->warn("missing identifier {}", CLASS_HASH_IDENTIFIER);
        return make_error_code(MISSING_IDENTIFIER);
    }
    const auto entrypoint = *entry->second.pc;

    auto record = get_contract_class_struct(hash_program->identifiers, contract_class);
    if (const auto* err = std::get_if<std::error_code>(&record))
        return *err;

    ProgramRunner runner{vm, std::move(hash_program)};
    const auto hash_base = runner.add_additional_hash_builtin();
    const std::vector<ProgramArg> args{ProgramArg::single(hash_base),
        ProgramArg::composed(std::move(std::get<std::vector<ProgramArg>>(record)))};

    const auto run = runner.run_from_entrypoint(entrypoint, args, true, gas);
    if (const auto* err = std::get_if<std::error_code>(&run))
        return *err;

    const auto& return_values = std::get<RunResult>(run).return_values;
    if (return_values.size() != 2)
    {
        log::logger()->warn("hash program returned {} values", return_values.size());
        return make_error_code(INDEX_OUT_OF_RANGE);
    }

    const auto class_hash = return_values[1].to_bytes32();
    log::logger()->debug("computed class hash {}", to_hex(class_hash));
    return class_hash;
}
}  // namespace starkstate
