// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "contract_class.hpp"
#include "execution_resources.hpp"
#include <evmc/evmc.hpp>
#include <memory>
#include <span>
#include <system_error>
#include <variant>
#include <vector>

namespace starkstate
{
/// The opcodes of the program dispatch header: PUSH2 <entry point> JUMP.
/// @{
constexpr uint8_t OP_PUSH2 = 0x61;
constexpr uint8_t OP_JUMP = 0x56;
constexpr uint8_t OP_JUMPDEST = 0x5b;
constexpr size_t DISPATCH_HEADER_SIZE = 4;
/// @}

/// The default VM gas budget of a program run.
constexpr int64_t DEFAULT_RUN_GAS = 10'000'000;

/// An argument of a program run: a single value, an array, or a list of arguments.
///
/// Encoded as consecutive 32-byte big-endian words in the call input.
struct ProgramArg
{
    std::variant<Felt, std::vector<Felt>, std::vector<ProgramArg>> value;

    static ProgramArg single(Felt v) { return {v}; }
    static ProgramArg array(std::vector<Felt> v) { return {std::move(v)}; }
    static ProgramArg composed(std::vector<ProgramArg> v) { return {std::move(v)}; }
};

/// Encodes the arguments as the call input.
bytes encode_args(std::span<const ProgramArg> args);

/// Returns the VM code of the program with the dispatch header pointing at the entry point.
///
/// Fails with PROGRAM_LOAD_FAILED if a cell is not a byte or the header is missing,
/// with INVALID_OFFSET if the entry point is outside the code
/// and with INVALID_ENTRY_POINT if it is not a jump destination.
std::variant<bytes, std::error_code> make_entrypoint_code(const Program& program, size_t entrypoint);

struct RunResult
{
    ExecutionResources execution_resources;

    /// The returned words. The final pointers of the added builtins come first.
    std::vector<Felt> return_values;
};

/// Runs a program on the VM, outside of any contract state.
class ProgramRunner
{
    struct Builtin
    {
        std::string name;
        Felt base;
    };

    evmc::VM& m_vm;
    std::shared_ptr<const Program> m_program;
    evmc_revision m_rev;
    std::vector<Builtin> m_builtins;

public:
    ProgramRunner(evmc::VM& vm, std::shared_ptr<const Program> program,
        evmc_revision rev = EVMC_SHANGHAI) noexcept
      : m_vm{vm}, m_program{std::move(program)}, m_rev{rev}
    {}

    /// Registers the "hash_builtin" resource counter and returns its base pointer.
    ///
    /// The program receives the base as an argument and returns the advanced pointer.
    Felt add_additional_hash_builtin();

    /// Runs the program from the entry point with the encoded arguments.
    ///
    /// With verify_secure, the returned words must be canonical field elements.
    /// A builtin pointer below its base fails with PROGRAM_RUN_FAILED and a usage
    /// not fitting in size_t with FELT_TO_USIZE_FAIL.
    std::variant<RunResult, std::error_code> run_from_entrypoint(size_t entrypoint,
        std::span<const ProgramArg> args, bool verify_secure, int64_t gas = DEFAULT_RUN_GAS);
};
}  // namespace starkstate
