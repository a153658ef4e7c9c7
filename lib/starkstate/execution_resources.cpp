// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "execution_resources.hpp"

namespace starkstate
{
ExecutionResources& ExecutionResources::operator+=(const ExecutionResources& other)
{
    n_steps += other.n_steps;
    n_memory_holes += other.n_memory_holes;
    for (const auto& [name, count] : other.builtin_instance_counter)
        builtin_instance_counter[name] += count;
    return *this;
}

ExecutionResources ExecutionResources::filter_unused_builtins() const
{
    ExecutionResources out{n_steps, n_memory_holes, {}};
    for (const auto& [name, count] : builtin_instance_counter)
    {
        if (count != 0)
            out.builtin_instance_counter.emplace(name, count);
    }
    return out;
}

ExecutionResources operator*(const ExecutionResources& r, size_t n)
{
    ExecutionResources out{r.n_steps * n, r.n_memory_holes * n, {}};
    for (const auto& [name, count] : r.builtin_instance_counter)
        out.builtin_instance_counter.emplace(name, count * n);
    return out;
}

void ExecutionResourcesManager::increment_syscall_counter(std::string_view name, size_t n)
{
    const auto it = syscall_counter.find(name);
    if (it != syscall_counter.end())
        it->second += n;
    else
        syscall_counter.emplace(std::string{name}, n);
}

size_t ExecutionResourcesManager::get_syscall_counter(std::string_view name) const noexcept
{
    const auto it = syscall_counter.find(name);
    return it != syscall_counter.end() ? it->second : 0;
}
}  // namespace starkstate
