// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "call_info.hpp"
#include "errors.hpp"
#include "hash_utils.hpp"
#include "log.hpp"

namespace starkstate
{
namespace
{
void collect(const CallInfo& call, std::vector<const CallInfo*>& out)
{
    out.push_back(&call);
    for (const auto& internal : call.internal_calls)
        collect(internal, out);
}

/// Places each item at its order. Returns false if the orders are not exactly 0..n-1.
template <typename Item, typename Ordered>
bool place_by_order(std::vector<std::optional<Item>>& slots, const Ordered& item, Item value)
{
    if (item.order >= slots.size() || slots[item.order].has_value())
        return false;
    slots[item.order] = std::move(value);
    return true;
}
}  // namespace

CallInfo CallInfo::empty_constructor_call(
    const Address& contract_address, const Address& caller_address, const ClassHash& class_hash)
{
    return {
        .caller_address = caller_address,
        .call_type = CallType::Call,
        .contract_address = contract_address,
        .class_hash = class_hash,
        .entry_point_selector = starknet_keccak("constructor"),
        .entry_point_type = EntryPointType::Constructor,
    };
}

std::vector<const CallInfo*> CallInfo::gen_call_topology() const
{
    std::vector<const CallInfo*> topology;
    collect(*this, topology);
    return topology;
}

std::variant<std::vector<Event>, std::error_code> CallInfo::get_sorted_events() const
{
    const auto topology = gen_call_topology();

    size_t n_events = 0;
    for (const auto* call : topology)
        n_events += call->events.size();

    std::vector<std::optional<Event>> slots(n_events);
    for (const auto* call : topology)
    {
        for (const auto& event : call->events)
        {
            if (!place_by_order(slots, event, Event{call->contract_address, event.keys, event.data}))
            {
                log::logger()->warn("unexpected event order {} of {}", event.order, n_events);
                return make_error_code(UNEXPECTED_HOLES_IN_EVENT_ORDER);
            }
        }
    }

    std::vector<Event> sorted;
    sorted.reserve(n_events);
    for (auto& slot : slots)
        sorted.emplace_back(std::move(*slot));
    return sorted;
}

std::variant<std::vector<L2ToL1MessageInfo>, std::error_code>
CallInfo::get_sorted_l2_to_l1_messages() const
{
    const auto topology = gen_call_topology();

    size_t n_messages = 0;
    for (const auto* call : topology)
        n_messages += call->l2_to_l1_messages.size();

    std::vector<std::optional<L2ToL1MessageInfo>> slots(n_messages);
    for (const auto* call : topology)
    {
        for (const auto& msg : call->l2_to_l1_messages)
        {
            if (!place_by_order(slots, msg,
                    L2ToL1MessageInfo{call->contract_address, msg.to_address, msg.payload}))
            {
                log::logger()->warn("unexpected message order {} of {}", msg.order, n_messages);
                return make_error_code(UNEXPECTED_HOLES_IN_L2_TO_L1_MESSAGES);
            }
        }
    }

    std::vector<L2ToL1MessageInfo> sorted;
    sorted.reserve(n_messages);
    for (auto& slot : slots)
        sorted.emplace_back(std::move(*slot));
    return sorted;
}
}  // namespace starkstate
