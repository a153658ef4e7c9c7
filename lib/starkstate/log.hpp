// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace starkstate::log
{
/// The library logger named "starkstate". Created on first use, writes to stderr.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);
}  // namespace starkstate::log
