// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "contract_class.hpp"
#include "execution_resources.hpp"
#include "felt.hpp"
#include <optional>
#include <system_error>
#include <unordered_set>
#include <variant>
#include <vector>

namespace starkstate
{
enum class CallType
{
    Call,
    Delegate,
};

/// An event emitted by a call, with its position in the transaction's emission order.
struct OrderedEvent
{
    size_t order = 0;
    std::vector<Felt> keys;
    std::vector<Felt> data;

    friend bool operator==(const OrderedEvent&, const OrderedEvent&) = default;
};

/// A message to L1 sent by a call, with its position in the transaction's send order.
struct OrderedL2ToL1Message
{
    size_t order = 0;
    Address to_address;
    std::vector<Felt> payload;

    friend bool operator==(const OrderedL2ToL1Message&, const OrderedL2ToL1Message&) = default;
};

struct Event
{
    Address from_address;
    std::vector<Felt> keys;
    std::vector<Felt> data;

    friend bool operator==(const Event&, const Event&) = default;
};

struct L2ToL1MessageInfo
{
    Address from_address;
    Address to_address;
    std::vector<Felt> payload;

    friend bool operator==(const L2ToL1MessageInfo&, const L2ToL1MessageInfo&) = default;
};

/// The record of one contract call and, recursively, the calls it made.
struct CallInfo
{
    Address caller_address;
    std::optional<CallType> call_type;
    Address contract_address;
    std::optional<ClassHash> class_hash;
    std::optional<Felt> entry_point_selector;
    std::optional<EntryPointType> entry_point_type;
    std::vector<Felt> calldata;
    std::vector<Felt> retdata;
    ExecutionResources execution_resources;
    std::vector<OrderedEvent> events;
    std::vector<OrderedL2ToL1Message> l2_to_l1_messages;

    /// The values returned by storage reads, in read order.
    std::vector<Felt> storage_read_values;

    /// The storage keys read or written by this call.
    std::unordered_set<StorageKey> accessed_storage_keys;

    std::vector<CallInfo> internal_calls;

    /// The call of a contract class without a constructor.
    static CallInfo empty_constructor_call(
        const Address& contract_address, const Address& caller_address, const ClassHash& class_hash);

    /// Returns this call and all nested calls, each node before its children (pre-order).
    [[nodiscard]] std::vector<const CallInfo*> gen_call_topology() const;

    /// Returns the events of the call tree in emission order.
    ///
    /// Fails with UNEXPECTED_HOLES_IN_EVENT_ORDER unless the orders are exactly 0..n-1.
    [[nodiscard]] std::variant<std::vector<Event>, std::error_code> get_sorted_events() const;

    /// Returns the L2 to L1 messages of the call tree in send order.
    ///
    /// Fails with UNEXPECTED_HOLES_IN_L2_TO_L1_MESSAGES unless the orders are exactly 0..n-1.
    [[nodiscard]] std::variant<std::vector<L2ToL1MessageInfo>, std::error_code>
    get_sorted_l2_to_l1_messages() const;
};
}  // namespace starkstate
