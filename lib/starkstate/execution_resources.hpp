// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace starkstate
{
/// The VM resources consumed by a run.
struct ExecutionResources
{
    size_t n_steps = 0;
    size_t n_memory_holes = 0;

    /// The number of instances used of each builtin: builtin name => count.
    std::map<std::string, size_t> builtin_instance_counter;

    ExecutionResources& operator+=(const ExecutionResources& other);

    /// Returns the resources with the zero-valued builtin counters removed.
    [[nodiscard]] ExecutionResources filter_unused_builtins() const;

    friend bool operator==(const ExecutionResources&, const ExecutionResources&) = default;
};

inline ExecutionResources operator+(ExecutionResources a, const ExecutionResources& b)
{
    return a += b;
}

/// Scales all the resources by the number of occurrences.
ExecutionResources operator*(const ExecutionResources& r, size_t n);

/// The resource usage of a transaction: the VM resources of its runs and the syscall counts.
struct ExecutionResourcesManager
{
    ExecutionResources cairo_usage;

    /// syscall name => number of invocations.
    std::map<std::string, size_t, std::less<>> syscall_counter;

    void increment_syscall_counter(std::string_view name, size_t n = 1);

    [[nodiscard]] size_t get_syscall_counter(std::string_view name) const noexcept;
};
}  // namespace starkstate
