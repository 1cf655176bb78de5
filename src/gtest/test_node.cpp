#include <gtest/gtest.h>

#include "gtest/utils.h"
#include "streams.h"
#include "version.h"

#include "tct/Node.hpp"

using namespace libtct;

TEST(Node, ForgetKeepsHash) {
    Commitment c = TestCommitment(7);
    Node<Commitment> node = Node<Commitment>::Kept(c);
    ASSERT_TRUE(node.is_kept());
    ASSERT_NE(node.kept(), nullptr);
    EXPECT_EQ(*node.kept(), c);
    EXPECT_EQ(node.hash(), c.hash());

    EXPECT_TRUE(node.forget());
    EXPECT_TRUE(node.is_hash());
    EXPECT_EQ(node.kept(), nullptr);
    EXPECT_EQ(node.hash(), c.hash());
    EXPECT_EQ(node.cached_hash(), c.hash());

    // Forgetting is one way and idempotent.
    EXPECT_FALSE(node.forget());
    EXPECT_EQ(node.hash(), c.hash());
}

TEST(Node, ForgetByIndex) {
    Node<Commitment> node = Node<Commitment>::Kept(TestCommitment(1));
    EXPECT_FALSE(node.forget(1));
    EXPECT_TRUE(node.is_kept());
    EXPECT_TRUE(node.forget(0));
    EXPECT_FALSE(node.forget(0));
}

TEST(Node, Witness) {
    Commitment c = TestCommitment(3);
    Node<Commitment> node = Node<Commitment>::Kept(c);

    auto witness = node.witness(0);
    ASSERT_TRUE(witness.has_value());
    EXPECT_EQ(witness->first.depth(), 0u);
    EXPECT_EQ(witness->second, c);
    EXPECT_FALSE(node.witness(1).has_value());

    node.forget();
    EXPECT_FALSE(node.witness(0).has_value());
}

TEST(Node, Serialization) {
    Node<Commitment> kept = Node<Commitment>::Kept(TestCommitment(9));
    Node<Commitment> forgotten = Node<Commitment>::Kept(TestCommitment(10));
    forgotten.forget();

    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << kept << forgotten;

    Node<Commitment> keptRead, forgottenRead;
    ss >> keptRead >> forgottenRead;
    ASSERT_TRUE(ss.empty());

    ASSERT_TRUE(keptRead.is_kept());
    EXPECT_EQ(*keptRead.kept(), TestCommitment(9));
    ASSERT_TRUE(forgottenRead.is_hash());
    EXPECT_EQ(forgottenRead.hash(), TestCommitment(10).hash());
}

TEST(Node, RejectsUnknownTag) {
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << (uint8_t)0x02 << Hash::one();

    Node<Commitment> node;
    EXPECT_THROW(ss >> node, std::ios_base::failure);
}

TEST(Node, LeafDigestStoredWithValue) {
    Commitment c = TestCommitment(4);
    Node<Commitment> node = Node<Commitment>::Kept(c);
    EXPECT_EQ(node.cached_hash(), std::optional<Hash>(c.hash()));

    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << node;
    Node<Commitment> read;
    ss >> read;
    ASSERT_TRUE(read.is_kept());
    EXPECT_EQ(read.cached_hash(), std::optional<Hash>(c.hash()));
}

TEST(Node, UpdateRefreshesLeafDigest) {
    Node<Commitment> node = Node<Commitment>::Kept(TestCommitment(5));
    auto replace = [](Commitment& c) {
        c = TestCommitment(6);
        return true;
    };
    auto result = node.update(replace);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(node.hash(), TestCommitment(6).hash());
    EXPECT_EQ(node.cached_hash(), std::optional<Hash>(TestCommitment(6).hash()));

    // The digest kept after forgetting is the updated one.
    EXPECT_TRUE(node.forget());
    EXPECT_EQ(node.hash(), TestCommitment(6).hash());

    EXPECT_FALSE(node.update(replace).has_value());
}
