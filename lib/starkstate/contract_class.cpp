// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "contract_class.hpp"
#include "json_loader.hpp"
#include <stdexcept>

namespace starkstate
{
std::string_view to_string(EntryPointType type) noexcept
{
    switch (type)
    {
    case EntryPointType::External:
        return "EXTERNAL";
    case EntryPointType::L1Handler:
        return "L1_HANDLER";
    case EntryPointType::Constructor:
        return "CONSTRUCTOR";
    }
    return "UNKNOWN";
}

std::vector<Felt> flatten(const std::vector<ContractEntryPoint>& entry_points)
{
    std::vector<Felt> out;
    out.reserve(entry_points.size() * 2);
    for (const auto& ep : entry_points)
    {
        out.emplace_back(ep.offset);
        out.emplace_back(ep.selector);
    }
    return out;
}

template <>
Identifier from_json<Identifier>(const json::json& j)
{
    Identifier id;
    id.type = j.value("type", std::string{});
    if (const auto it = j.find("value"); it != j.end())
        id.value = from_json<Felt>(*it);
    if (const auto it = j.find("pc"); it != j.end())
        id.pc = from_json<uint64_t>(*it);
    if (const auto it = j.find("members"); it != j.end())
    {
        for (const auto& [name, member] : it->items())
            id.members[name] = from_json<uint64_t>(member.at("offset"));
    }
    return id;
}

template <>
ContractEntryPoint from_json<ContractEntryPoint>(const json::json& j)
{
    return {.selector = from_json<Felt>(j.at("selector")),
        .offset = from_json<uint64_t>(j.at("offset"))};
}

Program load_program(const json::json& j)
{
    Program program;
    for (const auto& cell : j.at("data"))
        program.data.emplace_back(from_json<Felt>(cell));
    if (const auto it = j.find("builtins"); it != j.end())
        program.builtins = it->get<std::vector<std::string>>();
    if (const auto it = j.find("identifiers"); it != j.end())
    {
        for (const auto& [name, id] : it->items())
            program.identifiers.emplace(name, from_json<Identifier>(id));
    }
    program.main_scope = j.value("main_scope", std::string{"__main__"});
    return program;
}

ContractClass load_contract_class(const json::json& j)
{
    ContractClass cls;
    cls.program = load_program(j.at("program"));

    const auto& by_type = j.at("entry_points_by_type");
    for (const auto type : ENTRY_POINT_TYPES)
    {
        const auto it = by_type.find(std::string{to_string(type)});
        if (it == by_type.end())
            continue;
        auto& entry_points = cls.entry_points_by_type[type];
        for (const auto& ep : *it)
            entry_points.emplace_back(from_json<ContractEntryPoint>(ep));
    }

    if (const auto it = j.find("abi"); it != j.end() && !it->is_null())
        cls.abi = *it;
    return cls;
}

ContractClass load_contract_class(std::istream& input)
{
    return load_contract_class(json::json::parse(input));
}
}  // namespace starkstate
