// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "program_runner.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"
#include <algorithm>

namespace starkstate
{
namespace
{
/// The host of a program run: the program has no access to any state.
class PureHost : public evmc::Host
{
public:
    bool account_exists(const evmc::address&) const noexcept override { return false; }

    bytes32 get_storage(const evmc::address&, const bytes32&) const noexcept override
    {
        return {};
    }

    evmc_storage_status set_storage(
        const evmc::address&, const bytes32&, const bytes32&) noexcept override
    {
        return EVMC_STORAGE_ASSIGNED;
    }

    evmc::uint256be get_balance(const evmc::address&) const noexcept override { return {}; }

    size_t get_code_size(const evmc::address&) const noexcept override { return 0; }

    bytes32 get_code_hash(const evmc::address&) const noexcept override { return {}; }

    size_t copy_code(const evmc::address&, size_t, uint8_t*, size_t) const noexcept override
    {
        return 0;
    }

    bool selfdestruct(const evmc::address&, const evmc::address&) noexcept override
    {
        return false;
    }

    evmc::Result call(const evmc_message&) noexcept override
    {
        return evmc::Result{EVMC_FAILURE};
    }

    evmc_tx_context get_tx_context() const noexcept override { return {}; }

    bytes32 get_block_hash(int64_t) const noexcept override { return {}; }

    void emit_log(const evmc::address&, const uint8_t*, size_t, const bytes32[],
        size_t) noexcept override
    {}

    evmc_access_status access_account(const evmc::address&) noexcept override
    {
        return EVMC_ACCESS_WARM;
    }

    evmc_access_status access_storage(const evmc::address&, const bytes32&) noexcept override
    {
        return EVMC_ACCESS_WARM;
    }

    bytes32 get_transient_storage(const evmc::address&, const bytes32&) const noexcept override
    {
        return {};
    }

    void set_transient_storage(
        const evmc::address&, const bytes32&, const bytes32&) noexcept override
    {}
};

void encode_arg(const ProgramArg& arg, bytes& out)
{
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Felt>)
                out += to_words({&v, 1});
            else if constexpr (std::is_same_v<T, std::vector<Felt>>)
                out += to_words(v);
            else
            {
                for (const auto& a : v)
                    encode_arg(a, out);
            }
        },
        arg.value);
}
}  // namespace

bytes encode_args(std::span<const ProgramArg> args)
{
    bytes out;
    for (const auto& arg : args)
        encode_arg(arg, out);
    return out;
}

std::variant<bytes, std::error_code> make_entrypoint_code(const Program& program, size_t entrypoint)
{
    bytes code;
    code.reserve(program.data.size());
    for (const auto& cell : program.data)
    {
        if (cell.value() > 0xff)
        {
            log::logger()->warn("program cell {} is not a byte", cell.to_hex());
            return make_error_code(PROGRAM_LOAD_FAILED);
        }
        code.push_back(static_cast<uint8_t>(cell.value()));
    }

    if (code.size() < DISPATCH_HEADER_SIZE || code[0] != OP_PUSH2 || code[3] != OP_JUMP)
        return make_error_code(PROGRAM_LOAD_FAILED);

    if (entrypoint >= code.size() || entrypoint > 0xffff)
    {
        log::logger()->warn("entry point {} outside of program of size {}", entrypoint, code.size());
        return make_error_code(INVALID_OFFSET);
    }
    if (code[entrypoint] != OP_JUMPDEST)
    {
        log::logger()->warn("entry point {} is not a jump destination", entrypoint);
        return make_error_code(INVALID_ENTRY_POINT);
    }

    code[1] = static_cast<uint8_t>(entrypoint >> 8);
    code[2] = static_cast<uint8_t>(entrypoint);
    return code;
}

Felt ProgramRunner::add_additional_hash_builtin()
{
    const Felt base{static_cast<uint64_t>(m_builtins.size() + 1) << 32};
    m_builtins.push_back({"hash_builtin", base});
    return base;
}

std::variant<RunResult, std::error_code> ProgramRunner::run_from_entrypoint(
    size_t entrypoint, std::span<const ProgramArg> args, bool verify_secure, int64_t gas)
{
    const auto code = make_entrypoint_code(*m_program, entrypoint);
    if (const auto* err = std::get_if<std::error_code>(&code))
        return *err;
    const auto& vm_code = std::get<bytes>(code);

    const auto input = encode_args(args);

    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.gas = gas;
    msg.input_data = input.data();
    msg.input_size = input.size();

    PureHost host;
    const auto result = m_vm.execute(host, m_rev, msg, vm_code.data(), vm_code.size());
    if (result.status_code != EVMC_SUCCESS)
    {
        log::logger()->warn("program run failed with status {}", static_cast<int>(result.status_code));
        return make_error_code(PROGRAM_RUN_FAILED);
    }
    if (result.output_size % sizeof(bytes32) != 0)
        return make_error_code(PROGRAM_RUN_FAILED);

    RunResult run;
    run.execution_resources.n_steps = static_cast<size_t>(gas - result.gas_left);
    for (size_t i = 0; i < result.output_size; i += sizeof(bytes32))
    {
        bytes32 word;
        std::copy_n(&result.output_data[i], sizeof(word), word.bytes);
        if (verify_secure && intx::be::load<uint256>(word) >= FIELD_PRIME)
            return make_error_code(PROGRAM_RUN_FAILED);
        run.return_values.push_back(Felt::from_bytes32(word));
    }

    if (run.return_values.size() < m_builtins.size())
        return make_error_code(INDEX_OUT_OF_RANGE);
    for (size_t i = 0; i < m_builtins.size(); ++i)
    {
        const auto& builtin = m_builtins[i];
        const auto& stop_ptr = run.return_values[i];
        if (stop_ptr < builtin.base)
        {
            log::logger()->warn("{} pointer {} below its base {}", builtin.name, stop_ptr.to_hex(),
                builtin.base.to_hex());
            return make_error_code(PROGRAM_RUN_FAILED);
        }
        const auto used = (stop_ptr - builtin.base).to_size();
        if (const auto* err = std::get_if<std::error_code>(&used))
        {
            log::logger()->warn("{} usage {} out of range", builtin.name,
                (stop_ptr - builtin.base).to_hex());
            return *err;
        }
        run.execution_resources.builtin_instance_counter[builtin.name] += std::get<size_t>(used);
    }
    return run;
}
}  // namespace starkstate
