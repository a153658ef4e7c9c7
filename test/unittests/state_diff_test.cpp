// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <starkstate/state_diff.hpp>
#include <map>

using namespace starkstate;
using namespace evmc::literals;

namespace
{
const Address A{Felt{0xa}};
const Address B{Felt{0xb}};
}  // namespace

TEST(state_diff, subtract_mappings)
{
    const std::map<int, int> a{{1, 10}, {2, 20}, {3, 30}};
    const std::map<int, int> b{{1, 10}, {2, 21}, {4, 40}};

    EXPECT_EQ(subtract_mappings(a, b), (std::map<int, int>{{2, 20}, {3, 30}}));
    EXPECT_EQ(subtract_mappings(a, a), (std::map<int, int>{}));
    EXPECT_EQ(subtract_mappings(a, {}), a);
    EXPECT_EQ(subtract_mappings({}, a), (std::map<int, int>{}));
}

TEST(state_diff, subtract_storage_mappings)
{
    const StorageMapping writes{
        {{A, 0x01_bytes32}, Felt{1}},
        {{A, 0x02_bytes32}, Felt{2}},
        {{B, 0x01_bytes32}, Felt{3}},
    };
    const StorageMapping initial{
        {{A, 0x01_bytes32}, Felt{1}},
        {{A, 0x02_bytes32}, Felt{0}},
    };

    const auto delta = subtract_mappings(writes, initial);
    EXPECT_EQ(delta.size(), 2);
    EXPECT_EQ(delta.at({A, 0x02_bytes32}), Felt{2});
    EXPECT_EQ(delta.at({B, 0x01_bytes32}), Felt{3});
}

TEST(state_diff, get_keys)
{
    const std::map<int, int> a{{1, 0}, {2, 0}};
    const std::map<int, int> b{{2, 1}, {3, 1}};
    EXPECT_EQ(get_keys(a, b), (std::unordered_set<int>{1, 2, 3}));
    EXPECT_EQ(get_keys(a, {}), (std::unordered_set<int>{1, 2}));
    EXPECT_TRUE(get_keys(std::map<int, int>{}, {}).empty());
}

TEST(state_diff, to_state_diff_storage_mapping)
{
    const StorageMapping storage{
        {{A, 0x01_bytes32}, Felt{1}},
        {{A, 0x02_bytes32}, Felt{2}},
        {{B, 0x01_bytes32}, Felt{3}},
    };

    const auto updates = to_state_diff_storage_mapping(storage);
    ASSERT_EQ(updates.size(), 2);
    EXPECT_EQ(updates.at(A).size(), 2);
    EXPECT_EQ(updates.at(A).at(0x02_bytes32), Felt{2});
    EXPECT_EQ(updates.at(B).at(0x01_bytes32), Felt{3});

    EXPECT_EQ(to_cache_state_storage_mapping(updates), storage);
    EXPECT_TRUE(to_state_diff_storage_mapping({}).empty());
}

TEST(state_diff, to_cache_state_storage_mapping)
{
    const StorageUpdates updates{
        {A, {{0x01_bytes32, Felt{5}}}},
        {B, {{0x01_bytes32, Felt{6}}, {0x03_bytes32, Felt{7}}}},
    };

    const auto storage = to_cache_state_storage_mapping(updates);
    EXPECT_EQ(storage.size(), 3);
    EXPECT_EQ(storage.at({B, 0x03_bytes32}), Felt{7});
    EXPECT_EQ(to_state_diff_storage_mapping(storage), updates);
}

TEST(state_diff, squash)
{
    StateDiff first;
    first.address_to_class_hash[A] = 0x0c_bytes32;
    first.address_to_nonce[A] = Felt{1};
    first.storage_updates[A][0x01_bytes32] = Felt{1};
    first.storage_updates[A][0x02_bytes32] = Felt{2};

    StateDiff second;
    second.address_to_nonce[A] = Felt{2};
    second.storage_updates[A][0x02_bytes32] = Felt{0};
    second.storage_updates[B][0x01_bytes32] = Felt{9};

    const auto squashed = first.squash(second);
    EXPECT_EQ(squashed.address_to_class_hash.at(A), 0x0c_bytes32);
    EXPECT_EQ(squashed.address_to_nonce.at(A), Felt{2});
    EXPECT_EQ(squashed.storage_updates.at(A).at(0x01_bytes32), Felt{1});
    EXPECT_EQ(squashed.storage_updates.at(A).at(0x02_bytes32), Felt{0});
    EXPECT_EQ(squashed.storage_updates.at(B).at(0x01_bytes32), Felt{9});

    EXPECT_EQ(first.squash({}), first);
}
