// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <system_error>

namespace starkstate
{

enum ErrorCode : int
{
    SUCCESS = 0,
    MISSING_IDENTIFIER,
    NONE_EXISTING_ENTRY_POINT_TYPE,
    INVALID_OFFSET,
    NONE_API_VERSION,
    INDEX_OUT_OF_RANGE,
    PROGRAM_LOAD_FAILED,
    PROGRAM_RUN_FAILED,
    INVALID_ENTRY_POINT,
    FELT_TO_USIZE_FAIL,
    NOT_DEPLOYED_CONTRACT,
    FAIL_TO_READ_CLASS_HASH,
    MISSING_CONTRACT_CLASS,
    CONTRACT_ADDRESS_UNAVAILABLE,
    CONTRACT_ADDRESS_OUT_OF_RANGE,
    INVALID_CONTRACT_ADDRESS,
    UNAUTHORIZED_ACTION_ON_VALIDATE,
    UNEXPECTED_HOLES_IN_EVENT_ORDER,
    UNEXPECTED_HOLES_IN_L2_TO_L1_MESSAGES,
    UNKNOWN_SYSCALL,
    ENTRY_POINT_NOT_FOUND,
    EXECUTION_FAILED,
    INVALID_RETURN_DATA,
    RESOURCES_WITHOUT_FEE_WEIGHT,
};

/// Obtains a reference to the static error category object for starkstate errors.
inline const std::error_category& starkstate_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "starkstate"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case MISSING_IDENTIFIER:
                return "missing identifier";
            case NONE_EXISTING_ENTRY_POINT_TYPE:
                return "entry point type not found";
            case INVALID_OFFSET:
                return "invalid entry point offset";
            case NONE_API_VERSION:
                return "api version has no value";
            case INDEX_OUT_OF_RANGE:
                return "return value index out of range";
            case PROGRAM_LOAD_FAILED:
                return "program load failed";
            case PROGRAM_RUN_FAILED:
                return "program run failed";
            case INVALID_ENTRY_POINT:
                return "entry point is not a jump destination";
            case FELT_TO_USIZE_FAIL:
                return "felt does not fit in an index";
            case NOT_DEPLOYED_CONTRACT:
                return "contract not deployed";
            case FAIL_TO_READ_CLASS_HASH:
                return "failed to read class hash";
            case MISSING_CONTRACT_CLASS:
                return "missing contract class";
            case CONTRACT_ADDRESS_UNAVAILABLE:
                return "contract address unavailable";
            case CONTRACT_ADDRESS_OUT_OF_RANGE:
                return "contract address out of range";
            case INVALID_CONTRACT_ADDRESS:
                return "contract address not addressable by the VM";
            case UNAUTHORIZED_ACTION_ON_VALIDATE:
                return "unauthorized action on validate";
            case UNEXPECTED_HOLES_IN_EVENT_ORDER:
                return "unexpected holes in event order";
            case UNEXPECTED_HOLES_IN_L2_TO_L1_MESSAGES:
                return "unexpected holes in l2 to l1 messages";
            case UNKNOWN_SYSCALL:
                return "unknown syscall";
            case ENTRY_POINT_NOT_FOUND:
                return "entry point not found";
            case EXECUTION_FAILED:
                return "execution failed";
            case INVALID_RETURN_DATA:
                return "invalid return data";
            case RESOURCES_WITHOUT_FEE_WEIGHT:
                return "resource without fee weight";
            default:
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of a starkstate error code value.
/// Found by ADL for the implicit ErrorCode -> std::error_code conversion.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, starkstate_category()};
}

}  // namespace starkstate

template <>
struct std::is_error_code_enum<starkstate::ErrorCode> : std::true_type
{};
