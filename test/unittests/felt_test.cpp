// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <starkstate/errors.hpp>
#include <starkstate/felt.hpp>
#include <test/utils/utils.hpp>

using namespace starkstate;
using namespace starkstate::test;

TEST(felt, prime)
{
    EXPECT_EQ(FIELD_PRIME,
        intx::from_string<uint256>(
            "3618502788666131213697322783095070105623107215331596699973092056135872020481"));
}

TEST(felt, reduction)
{
    EXPECT_TRUE(Felt::from_uint256(FIELD_PRIME).is_zero());
    EXPECT_EQ(Felt::from_uint256(FIELD_PRIME + 5), Felt{5});
    EXPECT_EQ(Felt::from_bytes32(intx::be::store<bytes32>(FIELD_PRIME + 1)), Felt{1});
}

TEST(felt, arithmetic)
{
    const auto max = Felt::from_uint256(FIELD_PRIME - 1);
    EXPECT_EQ(max + Felt{1}, Felt{});
    EXPECT_EQ(Felt{} - Felt{1}, max);
    EXPECT_EQ(Felt{7} - Felt{3}, Felt{4});
    EXPECT_EQ(Felt{6} * Felt{7}, Felt{42});
    EXPECT_EQ(max * max, Felt{1});
}

TEST(felt, from_string)
{
    EXPECT_EQ(Felt::from_string("10000"), Felt{10000});
    EXPECT_EQ(Felt::from_string("0x2710"), Felt{10000});
    EXPECT_THROW(Felt::from_string("ten"), std::invalid_argument);
    EXPECT_THROW(
        Felt::from_string("0x10000000000000000000000000000000000000000000000000000000000000000"),
        std::invalid_argument);
}

TEST(felt, from_bytes_be)
{
    EXPECT_EQ(Felt::from_bytes_be("0102"_hex), Felt{0x0102});
    EXPECT_EQ(Felt::from_bytes_be({}), Felt{});
    EXPECT_THROW(Felt::from_bytes_be(bytes(33, 0)), std::invalid_argument);
}

TEST(felt, to_string)
{
    EXPECT_EQ(Felt{255}.to_string(), "255");
    EXPECT_EQ(Felt{255}.to_hex(), "0xff");
}

TEST(felt, to_size)
{
    EXPECT_EQ(std::get<size_t>(Felt{123}.to_size()), 123);
    const auto too_big = Felt::from_uint256(uint256{1} << 64);
    EXPECT_EQ(std::get<std::error_code>(too_big.to_size()), FELT_TO_USIZE_FAIL);
}

TEST(felt, address_is_distinct_from_value)
{
    const Address a{Felt{1}};
    const Address b{Felt{2}};
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_EQ(std::hash<Address>{}(a), std::hash<Felt>{}(Felt{1}));
}
