// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace starkstate::log
{
std::shared_ptr<spdlog::logger> logger()
{
    static const auto instance = [] {
        if (auto existing = spdlog::get("starkstate"))
            return existing;
        auto l = spdlog::stderr_color_mt("starkstate");
        l->set_level(spdlog::level::warn);
        return l;
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}
}  // namespace starkstate::log
