// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "host.hpp"
#include "class_hash.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"
#include "program_runner.hpp"
#include <algorithm>
#include <utility>

namespace starkstate
{
std::optional<evmc::address> to_evmc_address(const Address& addr) noexcept
{
    const auto word = addr.value.to_bytes32();
    constexpr auto prefix_size = sizeof(word) - sizeof(evmc::address);
    if (std::any_of(word.bytes, word.bytes + prefix_size, [](uint8_t b) { return b != 0; }))
        return std::nullopt;

    evmc::address out;
    std::copy_n(&word.bytes[prefix_size], sizeof(out), out.bytes);
    return out;
}

Address to_address(const evmc::address& addr) noexcept
{
    bytes32 word;
    std::copy_n(addr.bytes, sizeof(addr), &word.bytes[sizeof(word) - sizeof(addr)]);
    return Address{Felt::from_bytes32(word)};
}

bool Host::account_exists(const evmc::address& addr) const noexcept
{
    const auto class_hash = m_state.get_class_hash_at(to_address(addr));
    if (const auto* err = std::get_if<std::error_code>(&class_hash))
    {
        m_state_error = *err;
        return false;
    }
    return std::get<ClassHash>(class_hash) != UNINITIALIZED_CLASS_HASH;
}

bytes32 Host::get_storage(const evmc::address& addr, const bytes32& key) const noexcept
{
    m_resources.increment_syscall_counter("storage_read");

    const auto value = m_state.get_storage_at({to_address(addr), key});
    if (const auto* err = std::get_if<std::error_code>(&value))
    {
        m_state_error = *err;
        return {};
    }

    const auto& v = std::get<Felt>(value);
    m_frame->storage_read_values.push_back(v);
    m_frame->accessed_storage_keys.insert(key);
    return v.to_bytes32();
}

evmc_storage_status Host::set_storage(
    const evmc::address& addr, const bytes32& key, const bytes32& value) noexcept
{
    // Follow EVMC documentation https://evmc.ethereum.org/storagestatus.html#autotoc_md3
    // with the value before the transaction as the original value.
    m_resources.increment_syscall_counter("storage_write");
    m_frame->accessed_storage_keys.insert(key);

    const StorageEntry entry{to_address(addr), key};
    const auto current_value = m_state.get_storage_at(entry);
    if (const auto* err = std::get_if<std::error_code>(&current_value))
    {
        m_state_error = *err;
        return EVMC_STORAGE_ASSIGNED;
    }

    const auto& current = std::get<Felt>(current_value);
    const auto& initial = m_state.cache().storage_initial_values;
    const auto it = initial.find(entry);
    const auto original = it != initial.end() ? it->second : current;
    const auto new_value = Felt::from_bytes32(value);

    const auto dirty = original != current;
    const auto restored = original == new_value;
    const auto current_is_zero = current.is_zero();
    const auto value_is_zero = new_value.is_zero();

    auto status = EVMC_STORAGE_ASSIGNED;  // All other cases.
    if (!dirty && !restored)
    {
        if (current_is_zero)
            status = EVMC_STORAGE_ADDED;  // 0 → 0 → Z
        else if (value_is_zero)
            status = EVMC_STORAGE_DELETED;  // X → X → 0
        else
            status = EVMC_STORAGE_MODIFIED;  // X → X → Z
    }
    else if (dirty && !restored)
    {
        if (current_is_zero && !value_is_zero)
            status = EVMC_STORAGE_DELETED_ADDED;  // X → 0 → Z
        else if (!current_is_zero && value_is_zero)
            status = EVMC_STORAGE_MODIFIED_DELETED;  // X → Y → 0
    }
    else if (dirty && restored)
    {
        if (current_is_zero)
            status = EVMC_STORAGE_DELETED_RESTORED;  // X → 0 → X
        else if (value_is_zero)
            status = EVMC_STORAGE_ADDED_DELETED;  // 0 → Y → 0
        else
            status = EVMC_STORAGE_MODIFIED_RESTORED;  // X → Y → X
    }

    if (const auto ec = m_state.set_storage_at(entry, new_value))
        m_state_error = ec;
    return status;
}

evmc::bytes32 Host::get_transient_storage(const evmc::address&, const bytes32&) const noexcept
{
    return {};
}

void Host::set_transient_storage(const evmc::address&, const bytes32&, const bytes32&) noexcept
{
    // Transient storage is not part of the contract state.
}

evmc::uint256be Host::get_balance(const evmc::address&) const noexcept
{
    // Balances are fee token storage, not VM balances.
    return {};
}

size_t Host::get_code_size(const evmc::address&) const noexcept
{
    return 0;
}

bytes32 Host::get_code_hash(const evmc::address& addr) const noexcept
{
    const auto class_hash = m_state.get_class_hash_at(to_address(addr));
    if (const auto* err = std::get_if<std::error_code>(&class_hash))
    {
        m_state_error = *err;
        return {};
    }
    return std::get<ClassHash>(class_hash);
}

size_t Host::copy_code(const evmc::address&, size_t, uint8_t*, size_t) const noexcept
{
    return 0;
}

bool Host::selfdestruct(const evmc::address&, const evmc::address&) noexcept
{
    return false;
}

evmc_tx_context Host::get_tx_context() const noexcept
{
    m_resources.increment_syscall_counter("get_tx_info");

    const auto& block = m_config.block_context;
    evmc_tx_context ctx{};
    ctx.tx_gas_price = intx::be::store<evmc::uint256be>(uint256{block.gas_price});
    ctx.tx_origin = to_evmc_address(m_tx.account_contract_address).value_or(evmc::address{});
    ctx.block_coinbase = to_evmc_address(block.sequencer_address).value_or(evmc::address{});
    ctx.block_number = static_cast<int64_t>(block.block_number);
    ctx.block_timestamp = static_cast<int64_t>(block.block_timestamp);
    ctx.block_gas_limit = m_config.invoke_tx_max_n_steps;
    ctx.chain_id = m_config.chain_id.to_bytes32();
    return ctx;
}

bytes32 Host::get_block_hash(int64_t) const noexcept
{
    return {};
}

void Host::emit_log(const evmc::address&, const uint8_t* data, size_t data_size,
    const bytes32 topics[], size_t topics_count) noexcept
{
    m_resources.increment_syscall_counter("emit_event");

    OrderedEvent event{.order = m_n_emitted_events++};
    for (size_t i = 0; i < topics_count; ++i)
        event.keys.push_back(Felt::from_bytes32(topics[i]));
    for (size_t i = 0; i < data_size; i += sizeof(bytes32))
    {
        // A trailing partial word is zero-padded on the right.
        bytes32 word;
        std::copy_n(&data[i], std::min(sizeof(word), data_size - i), word.bytes);
        event.data.push_back(Felt::from_bytes32(word));
    }
    m_frame->events.push_back(std::move(event));
}

evmc_access_status Host::access_account(const evmc::address&) noexcept
{
    return EVMC_ACCESS_WARM;
}

evmc_access_status Host::access_storage(const evmc::address&, const bytes32&) noexcept
{
    return EVMC_ACCESS_WARM;
}

evmc::Result Host::send_message_to_l1(const evmc_message& msg) noexcept
{
    m_resources.increment_syscall_counter("send_message_to_l1");

    auto words = from_words({msg.input_data, msg.input_size});
    if (!words.has_value() || words->empty())
        return evmc::Result{EVMC_FAILURE};

    m_frame->l2_to_l1_messages.push_back({
        .order = m_n_sent_messages++,
        .to_address = Address{words->front()},
        .payload = {words->begin() + 1, words->end()},
    });
    return evmc::Result{EVMC_SUCCESS, msg.gas};
}

evmc::Result Host::call(const evmc_message& msg) noexcept
{
    if (msg.kind == EVMC_CREATE || msg.kind == EVMC_CREATE2)
        return evmc::Result{EVMC_FAILURE};  // Contracts are deployed from classes only.

    if (msg.recipient == L1_MESSENGER_ADDRESS)
        return send_message_to_l1(msg);

    const auto is_delegate = msg.kind == EVMC_DELEGATECALL || msg.kind == EVMC_CALLCODE;
    m_resources.increment_syscall_counter(is_delegate ? "delegate_call" : "call_contract");

    // The input is the entry point selector followed by the calldata.
    const auto words = from_words({msg.input_data, msg.input_size});
    if (!words.has_value() || words->empty())
        return evmc::Result{EVMC_FAILURE};

    ExecutionEntryPoint entry_point{
        .contract_address = to_address(msg.recipient),
        .caller_address = to_address(msg.sender),
        .entry_point_selector = words->front(),
        .calldata = {words->begin() + 1, words->end()},
        .call_type = is_delegate ? CallType::Delegate : CallType::Call,
    };
    if (is_delegate)
    {
        const auto class_hash = m_state.validate_contract_deployed(to_address(msg.code_address));
        if (std::holds_alternative<std::error_code>(class_hash))
            return evmc::Result{EVMC_FAILURE};
        entry_point.class_hash = std::get<ClassHash>(class_hash);
    }

    auto result = execute(entry_point, msg.depth, msg.gas, msg.flags);
    if (std::holds_alternative<std::error_code>(result))
        return evmc::Result{EVMC_FAILURE};

    auto& call_info = std::get<CallInfo>(result);
    const auto output = to_words(call_info.retdata);
    const auto gas_left = msg.gas - static_cast<int64_t>(call_info.execution_resources.n_steps);
    m_frame->internal_calls.push_back(std::move(call_info));
    return evmc::Result{EVMC_SUCCESS, gas_left, 0, output.data(), output.size()};
}

std::variant<CallInfo, std::error_code> Host::execute(
    const ExecutionEntryPoint& entry_point, int32_t depth, int64_t gas, uint32_t flags)
{
    ClassHash class_hash;
    if (entry_point.class_hash.has_value())
        class_hash = *entry_point.class_hash;
    else
    {
        const auto deployed = m_state.validate_contract_deployed(entry_point.contract_address);
        if (const auto* err = std::get_if<std::error_code>(&deployed))
            return *err;
        class_hash = std::get<ClassHash>(deployed);
    }

    const auto contract_class = m_state.get_contract_class(class_hash);
    if (const auto* err = std::get_if<std::error_code>(&contract_class))
        return *err;
    const auto& cls = *std::get<std::shared_ptr<const ContractClass>>(contract_class);

    const auto entry_points = get_contract_entry_points(cls, entry_point.entry_point_type);
    if (const auto* err = std::get_if<std::error_code>(&entry_points))
        return *err;
    const auto& eps = std::get<std::vector<ContractEntryPoint>>(entry_points);
    const auto ep = std::ranges::find(eps, entry_point.entry_point_selector,
        &ContractEntryPoint::selector);
    if (ep == eps.end())
    {
        log::logger()->warn("entry point {} not found in class {}",
            entry_point.entry_point_selector.to_hex(), to_hex(class_hash));
        return make_error_code(ENTRY_POINT_NOT_FOUND);
    }

    const auto code = make_entrypoint_code(cls.program, ep->offset);
    if (const auto* err = std::get_if<std::error_code>(&code))
        return *err;
    const auto& vm_code = std::get<bytes>(code);

    const auto recipient = to_evmc_address(entry_point.contract_address);
    const auto sender = to_evmc_address(entry_point.caller_address);
    if (!recipient.has_value() || !sender.has_value())
        return make_error_code(INVALID_CONTRACT_ADDRESS);

    CallInfo call_info{
        .caller_address = entry_point.caller_address,
        .call_type = entry_point.call_type,
        .contract_address = entry_point.contract_address,
        .class_hash = class_hash,
        .entry_point_selector = entry_point.entry_point_selector,
        .entry_point_type = entry_point.entry_point_type,
        .calldata = entry_point.calldata,
    };

    const auto input = to_words(entry_point.calldata);
    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.flags = flags;
    msg.depth = depth;
    msg.gas = gas;
    msg.recipient = *recipient;
    msg.sender = *sender;
    msg.input_data = input.data();
    msg.input_size = input.size();
    msg.code_address = *recipient;

    const auto state_checkpoint = m_state.checkpoint();
    const auto events_checkpoint = m_n_emitted_events;
    const auto messages_checkpoint = m_n_sent_messages;
    const auto syscall_checkpoint = m_resources.syscall_counter;
    const auto revert = [&](std::error_code ec) {
        m_state.rollback(state_checkpoint);
        m_n_emitted_events = events_checkpoint;
        m_n_sent_messages = messages_checkpoint;
        m_resources.syscall_counter = syscall_checkpoint;
        return ec;
    };

    auto* const parent = std::exchange(m_frame, &call_info);
    const auto result = m_vm.execute(*this, m_config.vm_revision, msg, vm_code.data(), vm_code.size());
    m_frame = parent;

    if (m_state_error)
        return revert(std::exchange(m_state_error, {}));

    if (result.status_code != EVMC_SUCCESS)
    {
        log::logger()->warn("entry point {} of {} failed with status {}",
            entry_point.entry_point_selector.to_hex(), entry_point.contract_address.value.to_hex(),
            static_cast<int>(result.status_code));
        return revert(make_error_code(EXECUTION_FAILED));
    }

    auto retdata = from_words({result.output_data, result.output_size});
    if (!retdata.has_value())
        return revert(make_error_code(INVALID_RETURN_DATA));

    call_info.retdata = std::move(*retdata);
    call_info.execution_resources.n_steps = static_cast<size_t>(gas - result.gas_left);
    log::logger()->debug("executed entry point {} of {}", entry_point.entry_point_selector.to_hex(),
        entry_point.contract_address.value.to_hex());
    return call_info;
}
}  // namespace starkstate
