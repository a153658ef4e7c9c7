// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string_view>

namespace starkstate
{
enum class TransactionType : uint64_t
{
    Declare = 0,
    Deploy = 1,
    DeployAccount = 2,
    InitializeBlockInfo = 3,
    InvokeFunction = 4,
    L1Handler = 5,
};

constexpr std::string_view to_string(TransactionType type) noexcept
{
    switch (type)
    {
    case TransactionType::Declare:
        return "DECLARE";
    case TransactionType::Deploy:
        return "DEPLOY";
    case TransactionType::DeployAccount:
        return "DEPLOY_ACCOUNT";
    case TransactionType::InitializeBlockInfo:
        return "INITIALIZE_BLOCK_INFO";
    case TransactionType::InvokeFunction:
        return "INVOKE_FUNCTION";
    case TransactionType::L1Handler:
        return "L1_HANDLER";
    }
    return "UNKNOWN";
}
}  // namespace starkstate
