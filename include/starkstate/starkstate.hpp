// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <starkstate/cached_state.hpp>
#include <starkstate/class_hash.hpp>
#include <starkstate/errors.hpp>
#include <starkstate/execution.hpp>
#include <starkstate/general_config.hpp>
#include <starkstate/in_memory_state_reader.hpp>
#include <starkstate/state_diff.hpp>
#include <starkstate/transaction.hpp>
