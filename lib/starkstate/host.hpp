// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cached_state.hpp"
#include "call_info.hpp"
#include "execution_resources.hpp"
#include "general_config.hpp"
#include <evmc/evmc.hpp>
#include <optional>

namespace starkstate
{
/// The address of the L1 messenger: a call to it sends the input as a message to L1.
///
/// The input is the recipient L1 address word followed by the payload words.
inline constexpr auto L1_MESSENGER_ADDRESS = 0x4c31_address;

/// Converts the address to the VM address. Fails if the address does not fit in 20 bytes.
[[nodiscard]] std::optional<evmc::address> to_evmc_address(const Address& addr) noexcept;

[[nodiscard]] Address to_address(const evmc::address& addr) noexcept;

/// A call to a contract function.
struct ExecutionEntryPoint
{
    Address contract_address;
    Address caller_address;
    Felt entry_point_selector;
    std::vector<Felt> calldata;
    EntryPointType entry_point_type = EntryPointType::External;
    CallType call_type = CallType::Call;

    /// The class to execute. The class deployed at the contract address if not set.
    std::optional<ClassHash> class_hash;
};

/// The transaction information available to the executed code.
struct TxInfo
{
    Address account_contract_address;
    Felt transaction_hash;
    Felt nonce;
    uint64_t max_fee = 0;
};

/// The VM host executing contract calls over a CachedState.
///
/// Storage access, events, messages to L1 and nested calls are recorded
/// in the CallInfo of the call being executed and counted as syscalls.
class Host : public evmc::Host
{
    const GeneralConfig& m_config;
    evmc::VM& m_vm;
    CachedState& m_state;
    ExecutionResourcesManager& m_resources;
    const TxInfo& m_tx;

    /// The call being executed.
    CallInfo* m_frame = nullptr;

    size_t m_n_emitted_events = 0;
    size_t m_n_sent_messages = 0;

    /// The state read or write failure which occurred during execution.
    mutable std::error_code m_state_error;

public:
    Host(const GeneralConfig& config, evmc::VM& vm, CachedState& state,
        ExecutionResourcesManager& resources, const TxInfo& tx) noexcept
      : m_config{config}, m_vm{vm}, m_state{state}, m_resources{resources}, m_tx{tx}
    {}

    /// Executes the entry point. A failed call leaves the state unmodified.
    std::variant<CallInfo, std::error_code> execute(
        const ExecutionEntryPoint& entry_point, int32_t depth, int64_t gas, uint32_t flags = 0);

    evmc::Result call(const evmc_message& msg) noexcept override;

private:
    [[nodiscard]] bool account_exists(const evmc::address& addr) const noexcept override;

    [[nodiscard]] bytes32 get_storage(
        const evmc::address& addr, const bytes32& key) const noexcept override;

    evmc_storage_status set_storage(
        const evmc::address& addr, const bytes32& key, const bytes32& value) noexcept override;

    [[nodiscard]] evmc::bytes32 get_transient_storage(
        const evmc::address& addr, const bytes32& key) const noexcept override;

    void set_transient_storage(
        const evmc::address& addr, const bytes32& key, const bytes32& value) noexcept override;

    [[nodiscard]] evmc::uint256be get_balance(const evmc::address& addr) const noexcept override;

    [[nodiscard]] size_t get_code_size(const evmc::address& addr) const noexcept override;

    [[nodiscard]] bytes32 get_code_hash(const evmc::address& addr) const noexcept override;

    size_t copy_code(const evmc::address& addr, size_t code_offset, uint8_t* buffer_data,
        size_t buffer_size) const noexcept override;

    bool selfdestruct(const evmc::address& addr, const evmc::address& beneficiary) noexcept override;

    [[nodiscard]] evmc_tx_context get_tx_context() const noexcept override;

    [[nodiscard]] bytes32 get_block_hash(int64_t block_number) const noexcept override;

    void emit_log(const evmc::address& addr, const uint8_t* data, size_t data_size,
        const bytes32 topics[], size_t topics_count) noexcept override;

    evmc_access_status access_account(const evmc::address& addr) noexcept override;

    evmc_access_status access_storage(
        const evmc::address& addr, const bytes32& key) noexcept override;

    /// Records the message to L1 carried by a call to the L1 messenger.
    evmc::Result send_message_to_l1(const evmc_message& msg) noexcept;
};
}  // namespace starkstate
