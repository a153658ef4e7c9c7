// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "contract_class.hpp"
#include "program_runner.hpp"
#include <evmc/evmc.hpp>
#include <memory>

namespace starkstate
{
/// Returns the entry points of the kind.
///
/// An absent kind yields an empty list. Fails with INVALID_OFFSET if an offset
/// exceeds the program length.
std::variant<std::vector<ContractEntryPoint>, std::error_code> get_contract_entry_points(
    const ContractClass& contract_class, EntryPointType entry_point_type);

/// Returns the hash of the class ABI and program.
///
/// The hashed text is the fixed placeholder `{"abi": contract_class.abi, "program":
/// contract_class.program}`, not the class content.
/// TODO: Hash the canonical JSON of the ABI and program once its format is settled.
Felt compute_hinted_class_hash(const ContractClass& contract_class);

/// Builds the canonical class record hashed by the hash program.
///
/// The identifiers of the hash program provide the API version and the record layout.
std::variant<std::vector<ProgramArg>, std::error_code> get_contract_class_struct(
    const std::map<std::string, Identifier>& identifiers, const ContractClass& contract_class);

/// The embedded hash program. Parsed once on first use and never modified.
const std::shared_ptr<const Program>& hash_calculation_program();

/// Computes the class hash by running the embedded hash program on the VM.
///
/// The result depends only on the class content.
std::variant<ClassHash, std::error_code> compute_class_hash(
    evmc::VM& vm, const ContractClass& contract_class, int64_t gas = DEFAULT_RUN_GAS);

/// Computes the class hash with the given hash program.
std::variant<ClassHash, std::error_code> compute_class_hash(evmc::VM& vm,
    const ContractClass& contract_class, std::shared_ptr<const Program> hash_program,
    int64_t gas = DEFAULT_RUN_GAS);
}  // namespace starkstate
