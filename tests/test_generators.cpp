/**
 * Property tests for the random workload generators
 *
 * Each property runs `iterations` times (see --iterations / --quick) over
 * generators seeded from the harness seed.
 */

#include "harness/generators.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

using namespace vaultsim;
using namespace vaultsim::harness;
using namespace vaultsim::routing;

class GeneratorTest : public ::testing::Test {
protected:
    GeneratorTest()
        : rng_(test::harness_config().seed),
          iterations_(test::harness_config().iterations) {}

    void SetUp() override {
        owner_ = crypto::SecretKeys::generate(rng_).public_keys().public_sign_key();
    }

    common::SeededRng rng_;
    size_t iterations_;
    crypto::PublicSignKey owner_{};
};

TEST_F(GeneratorTest, VecAndImmutableData) {
    EXPECT_EQ(gen_vec(0, rng_).size(), 0u);
    EXPECT_EQ(gen_vec(1024, rng_).size(), 1024u);

    auto data = gen_immutable_data(100, rng_);
    EXPECT_EQ(data.value().size(), 100u);
    EXPECT_EQ(data.name(), ImmutableData(data.value()).name());
}

TEST_F(GeneratorTest, EntryLengthsWithinBounds) {
    for (size_t i = 0; i < iterations_ * 10; ++i) {
        auto [key, value] = gen_mutable_data_entry(rng_);

        EXPECT_GE(key.size(), 1u);
        EXPECT_LT(key.size(), 10u);
        EXPECT_GE(value.content.size(), 1u);
        EXPECT_LT(value.content.size(), 10u);
        EXPECT_EQ(value.entry_version, 0u);
    }
}

TEST_F(GeneratorTest, MutableDataEntriesStartAtVersionZero) {
    for (size_t i = 0; i < iterations_; ++i) {
        size_t num_entries = rng_.gen_range(0, 30);
        auto data = gen_mutable_data(10000, num_entries, owner_, rng_);

        EXPECT_EQ(data.tag(), 10000u);
        EXPECT_EQ(data.owners(), Owners{owner_});
        EXPECT_EQ(data.entries().size(), num_entries);
        EXPECT_EQ(data.version(), 0u);
        for (const auto& entry : data.entries()) {
            EXPECT_EQ(entry.second.entry_version, 0u);
        }
    }
}

TEST_F(GeneratorTest, MutableDataRejectsTooManyEntries) {
    EXPECT_THROW(gen_mutable_data(1, MAX_MUTABLE_DATA_ENTRIES + 1, owner_, rng_),
                 std::invalid_argument);

    auto second = crypto::SecretKeys::generate(rng_).public_keys().public_sign_key();
    EXPECT_THROW(gen_mutable_data(1, 1, Owners{owner_, second}, rng_),
                 std::invalid_argument);
}

TEST_F(GeneratorTest, ActionBatchesAreValidForCurrentState) {
    for (size_t i = 0; i < iterations_; ++i) {
        auto data = gen_mutable_data(10000, rng_.gen_range(0, 20), owner_, rng_);
        size_t count = rng_.gen_range(0, 40);

        auto actions = gen_mutable_data_entry_actions(data, count, rng_);

        ASSERT_EQ(actions.size(), count);
        for (const auto& [key, action] : actions) {
            auto current = data.get(key);
            if (action.kind == EntryAction::Kind::Insert) {
                EXPECT_FALSE(current.has_value());
                EXPECT_EQ(action.version, 0u);
                EXPECT_EQ(key.size(), 10u);
                EXPECT_EQ(action.content.size(), 10u);
            } else {
                ASSERT_TRUE(current.has_value());
                EXPECT_EQ(action.version, current->entry_version + 1);
            }
        }

        // Applying a valid batch as the owner always succeeds
        auto result = data.mutate_entries(actions, owner_);
        EXPECT_TRUE(result.is_ok()) << result.error().to_string();
    }
}

TEST_F(GeneratorTest, SecondBatchUsesAdvancedVersions) {
    auto data = gen_mutable_data(10000, 15, owner_, rng_);

    // At most 15 + 8 * 10 entries, within the record limit
    for (size_t round = 0; round < 8; ++round) {
        auto actions = gen_mutable_data_entry_actions(data, 10, rng_);
        auto result = data.mutate_entries(actions, owner_);
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    }
}

TEST_F(GeneratorTest, ModifyShareNeverExceedsExistingKeys) {
    auto data = gen_mutable_data(10000, 3, owner_, rng_);

    for (size_t i = 0; i < iterations_; ++i) {
        auto actions = gen_mutable_data_entry_actions(data, 20, rng_);

        size_t modified = 0;
        for (const auto& entry : actions) {
            if (entry.second.kind != EntryAction::Kind::Insert) {
                ++modified;
            }
        }
        EXPECT_LE(modified, 3u);
        EXPECT_EQ(actions.size(), 20u);
    }
}

TEST_F(GeneratorTest, ExhaustedKeySpaceStopsEarly) {
    auto data = gen_mutable_data(10000, 0, owner_, rng_);
    GeneratorLimits limits;
    limits.insert_key_len = 1;

    auto actions = gen_mutable_data_entry_actions(data, 300, rng_, limits);

    EXPECT_LE(actions.size(), 256u);
    EXPECT_GT(actions.size(), 0u);

    std::set<Bytes> keys;
    for (const auto& entry : actions) {
        EXPECT_EQ(entry.second.kind, EntryAction::Kind::Insert);
        keys.insert(entry.first);
    }
    EXPECT_EQ(keys.size(), actions.size());
}

TEST_F(GeneratorTest, SameSeedSameWorkload) {
    common::SeededRng a(42);
    common::SeededRng b(42);

    auto first = gen_mutable_data(7, 10, owner_, a);
    auto second = gen_mutable_data(7, 10, owner_, b);
    EXPECT_EQ(first, second);

    EXPECT_EQ(gen_mutable_data_entry_actions(first, 8, a),
              gen_mutable_data_entry_actions(second, 8, b));
}

int main(int argc, char** argv) {
    return test::run_all_tests(argc, argv);
}
