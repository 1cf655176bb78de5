#include <gtest/gtest.h>

#include "gtest/utils.h"

#include "tct/Complete.hpp"
#include "tct/Frontier.hpp"

using namespace libtct;

typedef frontier::Top<Commitment, 2, 2> SmallTop;

static SmallTop::Complete FinalizedWith(uint32_t n)
{
    SmallTop top;
    for (uint32_t i = 0; i < n; i++) {
        top.insert(TestCommitment(i));
    }
    return std::move(top).finalize();
}

// Arity 2, depth 2: a, b, c, d fill the tier.
TEST(CompleteTier, FullTierScenario) {
    Commitment a = TestCommitment(0xa), b = TestCommitment(0xb),
               c = TestCommitment(0xc), d = TestCommitment(0xd);

    SmallTop top;
    std::vector<Commitment> items = {a, b, c, d};
    for (size_t i = 0; i < items.size(); i++) {
        EXPECT_EQ(top.position(), std::optional<uint64_t>(i));
        ASSERT_TRUE(top.insert(items[i]).has_value());
    }
    EXPECT_TRUE(top.is_full());

    Hash root = top.hash();
    Commitment e = TestCommitment(0xe);
    auto rejected = top.insert(e);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), e);
    EXPECT_EQ(top.hash(), root);

    SmallTop::Complete tier = std::move(top).finalize();
    EXPECT_EQ(tier.hash(), root);

    auto witness = tier.witness(2);
    ASSERT_TRUE(witness.has_value());
    EXPECT_EQ(witness->second, c);
    EXPECT_TRUE(witness->first.verify(c.hash(), 2, root));
    EXPECT_EQ(witness->first.levels[0], std::vector<Hash>({d.hash()}));
    EXPECT_EQ(witness->first.levels[1], std::vector<Hash>({Hash::of_node(1, {a.hash(), b.hash()})}));

    EXPECT_TRUE(tier.forget(2));
    EXPECT_FALSE(tier.witness(2).has_value());
    EXPECT_EQ(tier.hash(), root);

    auto witnessB = tier.witness(1);
    ASSERT_TRUE(witnessB.has_value());
    EXPECT_EQ(witnessB->second, b);
    EXPECT_TRUE(witnessB->first.verify(b.hash(), 1, root));
}

TEST(CompleteTier, ForgetIsIdempotent) {
    SmallTop::Complete tier = FinalizedWith(4);
    Hash root = tier.hash();

    EXPECT_TRUE(tier.forget(3));
    EXPECT_EQ(tier.hash(), root);
    EXPECT_FALSE(tier.forget(3));
    EXPECT_EQ(tier.hash(), root);
}

TEST(CompleteTier, OutOfRange) {
    SmallTop::Complete tier = FinalizedWith(3);
    EXPECT_TRUE(tier.witness(2).has_value());
    EXPECT_FALSE(tier.witness(3).has_value());
    EXPECT_FALSE(tier.witness(4).has_value());
    EXPECT_FALSE(tier.forget(3));
    EXPECT_FALSE(tier.forget(4));
}

TEST(CompleteTier, PrunesForgottenSubtrees) {
    SmallTop::Complete tier = FinalizedWith(4);
    Hash root = tier.hash();

    ASSERT_TRUE(tier.root().is_kept());
    const auto& left = tier.root().kept()->child(0);
    EXPECT_TRUE(tier.forget(0));
    EXPECT_TRUE(left.is_kept());
    EXPECT_TRUE(tier.forget(1));
    // Both leaves of the left branch are gone, so the branch is only a hash now.
    EXPECT_TRUE(tier.root().kept()->child(0).is_hash());
    EXPECT_FALSE(tier.is_pruned());

    EXPECT_TRUE(tier.forget(2));
    EXPECT_TRUE(tier.forget(3));
    EXPECT_TRUE(tier.is_pruned());
    EXPECT_EQ(tier.hash(), root);

    for (uint64_t p = 0; p < 4; p++) {
        EXPECT_FALSE(tier.witness(p).has_value());
        EXPECT_FALSE(tier.forget(p));
    }
}

TEST(CompleteTier, FinalizingForgottenTierKeepsOnlyHash) {
    SmallTop top;
    top.insert(TestCommitment(0));
    top.insert(TestCommitment(1));
    top.forget(0);
    top.forget(1);
    Hash root = top.hash();

    SmallTop::Complete tier = std::move(top).finalize();
    EXPECT_TRUE(tier.is_pruned());
    EXPECT_EQ(tier.hash(), root);
}

TEST(CompleteTier, WitnessMatchesFrontierWitness) {
    SmallTop top;
    for (uint32_t i = 0; i < 3; i++) {
        top.insert(TestCommitment(i));
    }
    std::vector<AuthPath> before;
    for (uint64_t p = 0; p < 3; p++) {
        before.push_back(top.witness(p)->first);
    }

    SmallTop::Complete tier = std::move(top).finalize();
    for (uint64_t p = 0; p < 3; p++) {
        auto witness = tier.witness(p);
        ASSERT_TRUE(witness.has_value());
        EXPECT_EQ(witness->first, before[p]);
    }
}
