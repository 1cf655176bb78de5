#include <gtest/gtest.h>

#include "gtest/utils.h"

#include "streams.h"
#include "version.h"
#include "tct/Tree.hpp"

using namespace libtct;

namespace {

CommitmentTree ExampleTree()
{
    CommitmentTree tree;
    for (uint32_t i = 0; i < 6; i++) {
        tree.insert(TestCommitment(i));
    }
    tree.end_block();
    tree.insert(TestCommitment(6));
    tree.end_epoch();
    tree.insert(TestCommitment(7));
    tree.insert(TestCommitment(8));
    tree.forget(TestCommitment(2));
    tree.forget(TestCommitment(6));
    return tree;
}

}

TEST(TreeSerialization, RoundTrip) {
    CommitmentTree tree = ExampleTree();
    Hash root = tree.root();

    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << tree;

    CommitmentTree restored;
    ss >> restored;
    ASSERT_TRUE(ss.empty());

    EXPECT_EQ(restored.root(), root);
    EXPECT_EQ(restored.position(), tree.position());
    EXPECT_EQ(restored.size(), tree.size());
    EXPECT_EQ(restored.current_block_root(), tree.current_block_root());
    EXPECT_EQ(restored.current_epoch_root(), tree.current_epoch_root());

    for (uint32_t i = 0; i < 9; i++) {
        EXPECT_EQ(restored.position_of(TestCommitment(i)), tree.position_of(TestCommitment(i)));
    }
    EXPECT_FALSE(restored.witness(Position(0, 0, 2)).has_value());
    EXPECT_FALSE(restored.witness(Position(0, 1, 0)).has_value());

    auto proof = restored.witness(TestCommitment(8));
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->position, Position(1, 0, 1));
    EXPECT_TRUE(proof->verify(root));

    // The restored tree keeps growing from where the saved one stopped.
    auto a = tree.insert(TestCommitment(9));
    auto b = restored.insert(TestCommitment(9));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(tree.root(), restored.root());
}

TEST(TreeSerialization, Deterministic) {
    CDataStream ss1(SER_DISK, CLIENT_VERSION);
    CDataStream ss2(SER_DISK, CLIENT_VERSION);
    ss1 << ExampleTree();
    ss2 << ExampleTree();
    EXPECT_EQ(ss1.str(), ss2.str());
}

TEST(TreeSerialization, EmptyTree) {
    CommitmentTree tree;
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << tree;

    CommitmentTree restored = ExampleTree();
    ss >> restored;
    EXPECT_TRUE(restored.is_empty());
    EXPECT_EQ(restored.size(), 0u);
    EXPECT_EQ(restored.root(), Hash::one());
}

TEST(TreeSerialization, FrontierKeepsCachedHash) {
    typedef frontier::Top<Commitment, 2, 2> SmallTop;
    SmallTop top;
    top.insert(TestCommitment(0));
    top.insert(TestCommitment(1));
    top.insert(TestCommitment(2));
    Hash digest = top.hash();
    ASSERT_TRUE(top.cached_hash().has_value());

    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << top;
    SmallTop restored;
    ss >> restored;

    EXPECT_EQ(restored.cached_hash(), std::optional<Hash>(digest));
    EXPECT_EQ(restored.hash(), digest);
    EXPECT_EQ(restored.position(), top.position());
}

TEST(TreeSerialization, RejectsTruncated) {
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << ExampleTree();
    std::string bytes = ss.str();

    for (size_t len : {(size_t)0, (size_t)1, bytes.size() / 2, bytes.size() - 1}) {
        CDataStream truncated(bytes.data(), bytes.data() + len, SER_DISK, CLIENT_VERSION);
        CommitmentTree tree;
        EXPECT_THROW(truncated >> tree, std::ios_base::failure) << "length " << len;
    }
}

TEST(TreeSerialization, RejectsUnknownVersion) {
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << CommitmentTree();
    std::string bytes = ss.str();
    bytes[0] = (char)(TREE_SERIALIZATION_VERSION + 1);

    CDataStream modified(bytes.data(), bytes.data() + bytes.size(), SER_DISK, CLIENT_VERSION);
    CommitmentTree tree;
    EXPECT_THROW(modified >> tree, std::ios_base::failure);
}

TEST(ProofSerialization, RoundTrip) {
    CommitmentTree tree = ExampleTree();
    auto proof = tree.witness(TestCommitment(4));
    ASSERT_TRUE(proof.has_value());

    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << *proof;
    Proof restored;
    ss >> restored;

    EXPECT_EQ(restored.commitment, proof->commitment);
    EXPECT_EQ(restored.position, proof->position);
    EXPECT_EQ(restored.path, proof->path);
    EXPECT_TRUE(restored.verify(tree.root()));

    // A proof moved to another position no longer verifies.
    restored.position = Position(0, 0, 5);
    EXPECT_FALSE(restored.verify(tree.root()));
}
