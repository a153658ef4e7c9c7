// starkstate: Contract state commitment and class hashing
// Copyright 2025 The starkstate Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <starkstate/cached_state.hpp>
#include <starkstate/errors.hpp>
#include <starkstate/in_memory_state_reader.hpp>

using namespace starkstate;
using namespace evmc::literals;

namespace
{
const Address A{Felt{0xa}};
const Address B{Felt{0xb}};
constexpr auto CLASS_HASH = 0xc1a55_bytes32;

/// Counts the reads reaching the in-memory state.
class CountingStateReader : public InMemoryStateReader
{
public:
    mutable size_t n_reads = 0;

    std::variant<ClassHash, std::error_code> get_class_hash_at(const Address& addr) const override
    {
        ++n_reads;
        return InMemoryStateReader::get_class_hash_at(addr);
    }

    std::variant<Felt, std::error_code> get_nonce_at(const Address& addr) const override
    {
        ++n_reads;
        return InMemoryStateReader::get_nonce_at(addr);
    }

    std::variant<Felt, std::error_code> get_storage_at(const StorageEntry& entry) const override
    {
        ++n_reads;
        return InMemoryStateReader::get_storage_at(entry);
    }
};

class FailingStateReader : public StateReader
{
public:
    std::variant<ClassHash, std::error_code> get_class_hash_at(const Address&) const override
    {
        return make_error_code(FAIL_TO_READ_CLASS_HASH);
    }

    std::variant<Felt, std::error_code> get_nonce_at(const Address&) const override
    {
        return make_error_code(INDEX_OUT_OF_RANGE);
    }

    std::variant<Felt, std::error_code> get_storage_at(const StorageEntry&) const override
    {
        return make_error_code(INDEX_OUT_OF_RANGE);
    }

    std::variant<std::shared_ptr<const ContractClass>, std::error_code> get_contract_class(
        const ClassHash&) const override
    {
        return make_error_code(MISSING_CONTRACT_CLASS);
    }
};
}  // namespace

TEST(cached_state, reads_are_memoized)
{
    CountingStateReader reader;
    reader.address_to_storage[{A, 0x01_bytes32}] = Felt{7};
    reader.address_to_nonce[A] = Felt{3};
    CachedState state{reader};

    EXPECT_EQ(std::get<Felt>(state.get_storage_at({A, 0x01_bytes32})), Felt{7});
    EXPECT_EQ(std::get<Felt>(state.get_storage_at({A, 0x01_bytes32})), Felt{7});
    EXPECT_EQ(std::get<Felt>(state.get_nonce_at(A)), Felt{3});
    EXPECT_EQ(std::get<Felt>(state.get_nonce_at(A)), Felt{3});
    EXPECT_EQ(reader.n_reads, 2);

    // The reader changing afterwards does not affect the transaction.
    reader.address_to_storage[{A, 0x01_bytes32}] = Felt{8};
    EXPECT_EQ(std::get<Felt>(state.get_storage_at({A, 0x01_bytes32})), Felt{7});
}

TEST(cached_state, writes_stay_in_cache)
{
    InMemoryStateReader reader;
    CachedState state{reader};

    EXPECT_FALSE(state.set_storage_at({A, 0x01_bytes32}, Felt{5}));
    EXPECT_FALSE(state.set_nonce_at(A, Felt{1}));
    EXPECT_FALSE(state.set_class_hash_at(A, CLASS_HASH));

    EXPECT_EQ(std::get<Felt>(state.get_storage_at({A, 0x01_bytes32})), Felt{5});
    EXPECT_EQ(std::get<Felt>(state.get_nonce_at(A)), Felt{1});
    EXPECT_EQ(std::get<ClassHash>(state.get_class_hash_at(A)), CLASS_HASH);

    EXPECT_TRUE(reader.address_to_storage.empty());
    EXPECT_TRUE(reader.address_to_nonce.empty());
    EXPECT_TRUE(reader.address_to_class_hash.empty());

    EXPECT_EQ(state.cache().storage_initial_values.at({A, 0x01_bytes32}), Felt{});
}

TEST(cached_state, increment_nonce)
{
    InMemoryStateReader reader;
    reader.address_to_nonce[A] = Felt{41};
    CachedState state{reader};

    EXPECT_FALSE(state.increment_nonce(A));
    EXPECT_EQ(std::get<Felt>(state.get_nonce_at(A)), Felt{42});
}

TEST(cached_state, validate_contract_deployed)
{
    InMemoryStateReader reader;
    reader.address_to_class_hash[A] = CLASS_HASH;
    CachedState state{reader};

    EXPECT_EQ(std::get<ClassHash>(state.validate_contract_deployed(A)), CLASS_HASH);
    EXPECT_EQ(std::get<std::error_code>(state.validate_contract_deployed(B)), NOT_DEPLOYED_CONTRACT);

    FailingStateReader failing;
    CachedState failing_state{failing};
    EXPECT_EQ(std::get<std::error_code>(failing_state.validate_contract_deployed(A)),
        FAIL_TO_READ_CLASS_HASH);
}

TEST(cached_state, read_errors_propagate)
{
    FailingStateReader reader;
    CachedState state{reader};

    EXPECT_EQ(std::get<std::error_code>(state.get_storage_at({A, 0x01_bytes32})), INDEX_OUT_OF_RANGE);
    EXPECT_EQ(state.set_storage_at({A, 0x01_bytes32}, Felt{1}), INDEX_OUT_OF_RANGE);
    EXPECT_EQ(std::get<std::error_code>(state.get_contract_class(CLASS_HASH)), MISSING_CONTRACT_CLASS);
    EXPECT_TRUE(state.cache().storage_writes.empty());
}

TEST(cached_state, deploy_contract)
{
    InMemoryStateReader reader;
    reader.address_to_class_hash[B] = CLASS_HASH;
    CachedState state{reader};

    EXPECT_FALSE(state.deploy_contract(A, CLASS_HASH));
    EXPECT_EQ(std::get<ClassHash>(state.get_class_hash_at(A)), CLASS_HASH);
    EXPECT_EQ(state.deploy_contract(A, CLASS_HASH), CONTRACT_ADDRESS_UNAVAILABLE);
    EXPECT_EQ(state.deploy_contract(B, CLASS_HASH), CONTRACT_ADDRESS_UNAVAILABLE);
    EXPECT_EQ(state.deploy_contract(Address{}, CLASS_HASH), CONTRACT_ADDRESS_OUT_OF_RANGE);
}

TEST(cached_state, contract_class_cache)
{
    InMemoryStateReader reader;
    const auto stored = std::make_shared<const ContractClass>();
    reader.class_hash_to_contract_class[CLASS_HASH] = stored;
    CachedState state{reader};

    EXPECT_EQ(std::get<std::shared_ptr<const ContractClass>>(state.get_contract_class(CLASS_HASH)),
        stored);
    EXPECT_EQ(state.contract_classes().size(), 1);

    const auto declared = std::make_shared<const ContractClass>();
    state.set_contract_class(0x02_bytes32, declared);
    EXPECT_EQ(
        std::get<std::shared_ptr<const ContractClass>>(state.get_contract_class(0x02_bytes32)),
        declared);
    EXPECT_TRUE(reader.class_hash_to_contract_class.size() == 1);
}

TEST(cached_state, count_actual_storage_changes)
{
    InMemoryStateReader reader;
    reader.address_to_storage[{A, 0x01_bytes32}] = Felt{1};
    CachedState state{reader};

    // Rewriting the value present before the transaction is not a change.
    EXPECT_FALSE(state.set_storage_at({A, 0x01_bytes32}, Felt{2}));
    EXPECT_FALSE(state.set_storage_at({A, 0x01_bytes32}, Felt{1}));
    EXPECT_EQ(state.count_actual_storage_changes(), (std::pair<size_t, size_t>{0, 0}));

    EXPECT_FALSE(state.set_storage_at({A, 0x02_bytes32}, Felt{2}));
    EXPECT_FALSE(state.set_storage_at({A, 0x03_bytes32}, Felt{3}));
    EXPECT_FALSE(state.set_storage_at({B, 0x01_bytes32}, Felt{4}));
    EXPECT_EQ(state.count_actual_storage_changes(), (std::pair<size_t, size_t>{2, 3}));

    // A nonce change alone does not count the contract as modified.
    const Address c{Felt{0xc}};
    EXPECT_FALSE(state.increment_nonce(c));
    EXPECT_EQ(state.count_actual_storage_changes(), (std::pair<size_t, size_t>{2, 3}));
}

TEST(cached_state, build_diff)
{
    InMemoryStateReader reader;
    reader.address_to_storage[{A, 0x01_bytes32}] = Felt{1};
    CachedState state{reader};

    EXPECT_FALSE(state.set_storage_at({A, 0x01_bytes32}, Felt{1}));
    EXPECT_FALSE(state.set_storage_at({A, 0x02_bytes32}, Felt{2}));
    EXPECT_FALSE(state.deploy_contract(B, CLASS_HASH));
    EXPECT_FALSE(state.increment_nonce(B));

    const auto diff = state.build_diff();
    EXPECT_EQ(diff.storage_updates.size(), 1);
    EXPECT_EQ(diff.storage_updates.at(A).size(), 1);
    EXPECT_EQ(diff.storage_updates.at(A).at(0x02_bytes32), Felt{2});
    EXPECT_EQ(diff.address_to_class_hash.at(B), CLASS_HASH);
    EXPECT_EQ(diff.address_to_nonce.at(B), Felt{1});

    reader.apply(diff);
    EXPECT_EQ(reader.address_to_storage.at({A, 0x02_bytes32}), Felt{2});
    EXPECT_EQ(reader.address_to_class_hash.at(B), CLASS_HASH);

    // Deleting a cell removes it from the committed state.
    CachedState next{reader};
    EXPECT_FALSE(next.set_storage_at({A, 0x02_bytes32}, Felt{0}));
    reader.apply(next.build_diff());
    EXPECT_FALSE(reader.address_to_storage.contains({A, 0x02_bytes32}));
}

TEST(cached_state, rollback)
{
    InMemoryStateReader reader;
    reader.address_to_storage[{A, 0x01_bytes32}] = Felt{1};
    CachedState state{reader};

    EXPECT_FALSE(state.set_storage_at({A, 0x01_bytes32}, Felt{2}));
    const auto checkpoint = state.checkpoint();

    EXPECT_FALSE(state.set_storage_at({A, 0x01_bytes32}, Felt{3}));
    EXPECT_FALSE(state.set_storage_at({A, 0x02_bytes32}, Felt{4}));
    EXPECT_FALSE(state.set_nonce_at(A, Felt{5}));
    EXPECT_FALSE(state.deploy_contract(B, CLASS_HASH));
    state.set_contract_class(CLASS_HASH, std::make_shared<const ContractClass>());

    state.rollback(checkpoint);
    EXPECT_EQ(std::get<Felt>(state.get_storage_at({A, 0x01_bytes32})), Felt{2});
    EXPECT_EQ(std::get<Felt>(state.get_storage_at({A, 0x02_bytes32})), Felt{});
    EXPECT_EQ(std::get<Felt>(state.get_nonce_at(A)), Felt{});
    EXPECT_EQ(std::get<ClassHash>(state.get_class_hash_at(B)), UNINITIALIZED_CLASS_HASH);
    EXPECT_FALSE(state.contract_classes().contains(CLASS_HASH));

    state.rollback(0);
    EXPECT_TRUE(state.cache().storage_writes.empty());
}
