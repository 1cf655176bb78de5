#include <gtest/gtest.h>

#include "gtest/utils.h"

#include "tct/Tree.hpp"

using namespace libtct;

TEST(CommitmentTree, Empty) {
    CommitmentTree tree;
    EXPECT_TRUE(tree.is_empty());
    EXPECT_EQ(tree.root(), Hash::one());
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, 0, 0)));
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_FALSE(tree.witness(Position(0)).has_value());
    EXPECT_FALSE(tree.witness(TestCommitment(0)).has_value());
    EXPECT_FALSE(tree.forget(Position(0)));
    EXPECT_EQ(tree.current_block_root(), Hash::one());
    EXPECT_EQ(tree.current_epoch_root(), Hash::one());
}

TEST(CommitmentTree, InsertAndWitness) {
    CommitmentTree tree;
    for (uint32_t i = 0; i < 5; i++) {
        auto position = tree.insert(TestCommitment(i));
        ASSERT_TRUE(position.has_value());
        EXPECT_EQ(*position, Position(0, 0, i));
    }
    EXPECT_FALSE(tree.is_empty());
    EXPECT_EQ(tree.size(), 5u);
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, 0, 5)));

    Hash root = tree.root();
    EXPECT_NE(root, Hash::one());
    for (uint32_t i = 0; i < 5; i++) {
        auto proof = tree.witness(TestCommitment(i));
        ASSERT_TRUE(proof.has_value());
        EXPECT_EQ(proof->commitment, TestCommitment(i));
        EXPECT_EQ(proof->position, Position(0, 0, i));
        EXPECT_EQ(proof->path.depth(), 3u * TCT_TIER_DEPTH);
        EXPECT_TRUE(proof->verify(root));
    }
}

TEST(CommitmentTree, EndBlockAndEpoch) {
    CommitmentTree tree;
    tree.insert(TestCommitment(0));
    tree.insert(TestCommitment(1));
    Hash blockRoot = tree.current_block_root();

    auto ended = tree.end_block();
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(*ended, blockRoot);
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, 1, 0)));
    EXPECT_EQ(tree.current_block_root(), Hash::one());

    EXPECT_EQ(*tree.insert(TestCommitment(2)), Position(0, 1, 0));

    Hash epochRoot = tree.current_epoch_root();
    auto endedEpoch = tree.end_epoch();
    ASSERT_TRUE(endedEpoch.has_value());
    EXPECT_EQ(*endedEpoch, epochRoot);
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(1, 0, 0)));

    EXPECT_EQ(*tree.insert(TestCommitment(3)), Position(1, 0, 0));

    Hash root = tree.root();
    for (uint32_t i = 0; i < 4; i++) {
        auto proof = tree.witness(TestCommitment(i));
        ASSERT_TRUE(proof.has_value());
        EXPECT_TRUE(proof->verify(root));
    }
}

TEST(CommitmentTree, EmptyBlocksHashToOne) {
    CommitmentTree tree;
    auto ended = tree.end_block();
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(*ended, Hash::one());
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, 1, 0)));

    ended = tree.end_block();
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(*ended, Hash::one());
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, 2, 0)));

    auto endedEpoch = tree.end_epoch();
    ASSERT_TRUE(endedEpoch.has_value());
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(1, 0, 0)));

    endedEpoch = tree.end_epoch();
    ASSERT_TRUE(endedEpoch.has_value());
    EXPECT_EQ(*endedEpoch, Hash::one());
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(2, 0, 0)));
}

TEST(CommitmentTree, ForgetKeepsRoot) {
    CommitmentTree tree;
    for (uint32_t i = 0; i < 4; i++) {
        tree.insert(TestCommitment(i));
    }
    tree.end_block();
    tree.insert(TestCommitment(4));
    Hash root = tree.root();

    EXPECT_TRUE(tree.forget(TestCommitment(1)));
    EXPECT_EQ(tree.root(), root);
    EXPECT_EQ(tree.size(), 4u);
    EXPECT_FALSE(tree.position_of(TestCommitment(1)).has_value());
    EXPECT_FALSE(tree.witness(Position(0, 0, 1)).has_value());
    EXPECT_FALSE(tree.forget(TestCommitment(1)));
    EXPECT_FALSE(tree.forget(Position(0, 0, 1)));

    EXPECT_TRUE(tree.forget(Position(0, 1, 0)));
    EXPECT_EQ(tree.root(), root);
    EXPECT_FALSE(tree.position_of(TestCommitment(4)).has_value());

    for (uint32_t i : {0, 2, 3}) {
        auto proof = tree.witness(TestCommitment(i));
        ASSERT_TRUE(proof.has_value());
        EXPECT_TRUE(proof->verify(root));
    }

    // Beyond the current position.
    EXPECT_FALSE(tree.forget(Position(0, 1, 1)));
    EXPECT_FALSE(tree.forget(Position(3, 0, 0)));
}

TEST(CommitmentTree, DuplicateCommitment) {
    CommitmentTree tree;
    tree.insert(TestCommitment(0));
    tree.insert(TestCommitment(0));
    EXPECT_EQ(tree.position_of(TestCommitment(0)), std::optional<Position>(Position(0, 0, 1)));
    // Both copies can be witnessed by position, but the index holds one entry.
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_TRUE(tree.witness(Position(0, 0, 0)).has_value());

    // Forgetting the older copy leaves the index pointing at the newer one.
    EXPECT_TRUE(tree.forget(Position(0, 0, 0)));
    EXPECT_EQ(tree.position_of(TestCommitment(0)), std::optional<Position>(Position(0, 0, 1)));
}

TEST(CommitmentTree, BlockFull) {
    CommitmentTree tree;
    const uint32_t blockCapacity = CommitmentTree::Block::CAPACITY;
    for (uint32_t i = 0; i < blockCapacity; i++) {
        ASSERT_TRUE(tree.insert(TestCommitment(i)).has_value());
    }
    Hash root = tree.root();
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, 1, 0)));

    auto rejected = tree.insert(TestCommitment(blockCapacity));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), InsertError::BlockFull);
    EXPECT_EQ(tree.root(), root);

    ASSERT_TRUE(tree.end_block().has_value());
    auto position = tree.insert(TestCommitment(blockCapacity));
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(*position, Position(0, 1, 0));

    auto proof = tree.witness(Position(0, 0, blockCapacity - 1));
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->verify(tree.root()));
}

TEST(CommitmentTree, EpochFull) {
    CommitmentTree tree;
    const uint32_t blocksPerEpoch = CommitmentTree::Epoch::CAPACITY / CommitmentTree::Block::CAPACITY;
    for (uint32_t i = 0; i + 1 < blocksPerEpoch; i++) {
        ASSERT_TRUE(tree.end_block().has_value());
    }
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(0, blocksPerEpoch - 1, 0)));

    auto rejected = tree.end_block();
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), InsertError::EpochFull);

    // The last block of the epoch still takes commitments.
    auto position = tree.insert(TestCommitment(0));
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(*position, Position(0, blocksPerEpoch - 1, 0));

    ASSERT_TRUE(tree.end_epoch().has_value());
    EXPECT_EQ(tree.position(), std::optional<Position>(Position(1, 0, 0)));
}

TEST(Position, Packing) {
    Position p(3, 2, 1);
    EXPECT_EQ(p.epoch(), 3);
    EXPECT_EQ(p.block(), 2);
    EXPECT_EQ(p.commitment(), 1);
    EXPECT_EQ(p.index(), (3ull << 32) | (2ull << 16) | 1ull);
    EXPECT_EQ(p.ToString(), "3/2/1");
    EXPECT_EQ(Position(0, 1, 0), Position(65536));
}

TEST(Position, FromString) {
    EXPECT_EQ(Position::FromString("3/2/1"), std::optional<Position>(Position(3, 2, 1)));
    EXPECT_EQ(Position::FromString("65536"), std::optional<Position>(Position(0, 1, 0)));
    EXPECT_FALSE(Position::FromString("").has_value());
    EXPECT_FALSE(Position::FromString("1/2").has_value());
    EXPECT_FALSE(Position::FromString("1/2/65536").has_value());
    EXPECT_FALSE(Position::FromString("-1").has_value());
    EXPECT_FALSE(Position::FromString("a/b/c").has_value());
    EXPECT_FALSE(Position::FromString("281474976710656").has_value());
}

TEST(InsertError, Strings) {
    EXPECT_EQ(InsertErrorString(InsertError::TreeFull), "tree is full");
    EXPECT_EQ(InsertErrorString(InsertError::EpochFull), "current epoch is full");
    EXPECT_EQ(InsertErrorString(InsertError::BlockFull), "current block is full");
}
