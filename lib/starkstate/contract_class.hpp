// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "felt.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace starkstate
{
enum class EntryPointType
{
    External,
    L1Handler,
    Constructor,
};

/// The entry point kinds in the order they appear in the canonical class record.
inline constexpr EntryPointType ENTRY_POINT_TYPES[] = {
    EntryPointType::External, EntryPointType::L1Handler, EntryPointType::Constructor};

/// The JSON key of the entry point kind: EXTERNAL, L1_HANDLER or CONSTRUCTOR.
std::string_view to_string(EntryPointType type) noexcept;

/// A function exported by a contract class: its selector and the program offset it starts at.
struct ContractEntryPoint
{
    Felt selector;
    size_t offset = 0;

    friend bool operator==(const ContractEntryPoint&, const ContractEntryPoint&) noexcept = default;
};

/// Flattens entry points to [offset0, selector0, offset1, selector1, ...], preserving order.
std::vector<Felt> flatten(const std::vector<ContractEntryPoint>& entry_points);

/// A named value of the program's debug information.
struct Identifier
{
    std::string type;

    /// The value of a constant.
    std::optional<Felt> value;

    /// The program counter of a function.
    std::optional<size_t> pc;

    /// The members of a struct: name => offset.
    std::map<std::string, size_t> members;
};

/// A compiled program: one field element per VM code byte.
///
/// A program starts with the dispatch header PUSH2 <pc> JUMP which is patched
/// with the entry point when the program is run.
struct Program
{
    std::vector<Felt> data;
    std::vector<std::string> builtins;
    std::map<std::string, Identifier> identifiers;
    std::string main_scope = "__main__";
};

/// A contract class. Immutable once loaded; shared by reference.
struct ContractClass
{
    Program program;
    std::map<EntryPointType, std::vector<ContractEntryPoint>> entry_points_by_type;
    std::optional<nlohmann::json> abi;
};

/// Loads a program from its JSON form. Throws std::invalid_argument on malformed input.
Program load_program(const nlohmann::json& j);

/// Loads a contract class from its JSON form. Throws on malformed input.
ContractClass load_contract_class(const nlohmann::json& j);

ContractClass load_contract_class(std::istream& input);
}  // namespace starkstate
