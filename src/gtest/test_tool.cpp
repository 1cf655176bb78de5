#include <gtest/gtest.h>

#include "gtest/utils.h"

#include "tct/Command.hpp"

#include <stdexcept>

using namespace libtct;

namespace {

bool Run(CommitmentTree& tree, const std::vector<std::string>& args, std::string& strOutput)
{
    strOutput.clear();
    return RunCommand(tree, args, strOutput);
}

size_t CountLines(const std::string& str, const std::string& prefix)
{
    size_t n = 0;
    for (size_t pos = str.find(prefix); pos != std::string::npos; pos = str.find(prefix, pos + 1)) {
        if (pos == 0 || str[pos - 1] == '\n') {
            n++;
        }
    }
    return n;
}

}

TEST(ToolCommand, InsertAndSeal) {
    CommitmentTree tree;
    std::string out;

    EXPECT_TRUE(Run(tree, {"insert", TestCommitment(0).GetHex()}, out));
    EXPECT_EQ(out, "0/0/0\n");
    EXPECT_TRUE(Run(tree, {"insert", TestCommitment(1).GetHex()}, out));
    EXPECT_EQ(out, "0/0/1\n");

    Hash blockRoot = tree.current_block_root();
    EXPECT_TRUE(Run(tree, {"end-block"}, out));
    EXPECT_EQ(out, blockRoot.GetHex() + "\n");
    EXPECT_FALSE(Run(tree, {"position"}, out));
    EXPECT_EQ(out, "0/1/0\n");

    EXPECT_TRUE(Run(tree, {"end-epoch"}, out));
    EXPECT_FALSE(Run(tree, {"position"}, out));
    EXPECT_EQ(out, "1/0/0\n");

    EXPECT_FALSE(Run(tree, {"root"}, out));
    EXPECT_EQ(out, tree.root().GetHex() + "\n");
}

TEST(ToolCommand, WitnessByCommitmentOrPosition) {
    CommitmentTree tree;
    tree.insert(TestCommitment(0));
    tree.insert(TestCommitment(1));
    Hash root = tree.root();
    std::string out;

    EXPECT_FALSE(Run(tree, {"witness", TestCommitment(1).GetHex()}, out));
    EXPECT_NE(out.find("commitment: " + TestCommitment(1).GetHex() + "\n"), std::string::npos);
    EXPECT_NE(out.find("position: 0/0/1\n"), std::string::npos);
    EXPECT_NE(out.find("root: " + root.GetHex() + "\n"), std::string::npos);
    EXPECT_NE(out.find("valid: true\n"), std::string::npos);
    EXPECT_EQ(CountLines(out, "level "), 3u * TCT_TIER_DEPTH);

    std::string byPosition;
    EXPECT_FALSE(Run(tree, {"witness", "0/0/1"}, byPosition));
    EXPECT_EQ(byPosition, out);
    EXPECT_FALSE(Run(tree, {"witness", "1"}, byPosition));
    EXPECT_EQ(byPosition, out);

    // Reading never changes the tree.
    EXPECT_EQ(tree.root(), root);
}

TEST(ToolCommand, Forget) {
    CommitmentTree tree;
    tree.insert(TestCommitment(0));
    tree.insert(TestCommitment(1));
    Hash root = tree.root();
    std::string out;

    EXPECT_TRUE(Run(tree, {"forget", TestCommitment(0).GetHex()}, out));
    EXPECT_EQ(out, "forgotten\n");
    EXPECT_FALSE(Run(tree, {"forget", TestCommitment(0).GetHex()}, out));
    EXPECT_EQ(out, "not found\n");
    EXPECT_FALSE(Run(tree, {"forget", "0/0/0"}, out));
    EXPECT_EQ(out, "not found\n");

    EXPECT_TRUE(Run(tree, {"forget", "0/0/1"}, out));
    EXPECT_EQ(tree.root(), root);
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_THROW(Run(tree, {"witness", "0/0/1"}, out), std::runtime_error);
}

TEST(ToolCommand, ResolvePosition) {
    CommitmentTree tree;
    tree.insert(TestCommitment(0));
    tree.insert(TestCommitment(1));

    EXPECT_EQ(ResolvePosition(tree, TestCommitment(1).GetHex()), std::optional<Position>(Position(0, 0, 1)));
    // A well-formed commitment that is not indexed names no position.
    EXPECT_FALSE(ResolvePosition(tree, TestCommitment(2).GetHex()).has_value());
    EXPECT_EQ(ResolvePosition(tree, "2/3/4"), std::optional<Position>(Position(2, 3, 4)));
    EXPECT_EQ(ResolvePosition(tree, "65536"), std::optional<Position>(Position(0, 1, 0)));
    EXPECT_THROW(ResolvePosition(tree, "not-a-position"), std::runtime_error);
}

TEST(ToolCommand, RejectsBadInvocations) {
    CommitmentTree tree;
    std::string out;

    EXPECT_THROW(Run(tree, {}, out), std::runtime_error);
    EXPECT_THROW(Run(tree, {"frobnicate"}, out), std::runtime_error);
    EXPECT_THROW(Run(tree, {"insert"}, out), std::runtime_error);
    EXPECT_THROW(Run(tree, {"insert", TestCommitment(0).GetHex(), "extra"}, out), std::runtime_error);
    EXPECT_THROW(Run(tree, {"root", "extra"}, out), std::runtime_error);
    EXPECT_THROW(Run(tree, {"insert", "abcd"}, out), std::runtime_error);
    EXPECT_THROW(Run(tree, {"witness", TestCommitment(0).GetHex()}, out), std::runtime_error);

    EXPECT_TRUE(tree.is_empty());
    EXPECT_EQ(tree.size(), 0u);
}

TEST(ToolCommand, RejectedInsertReportsReason) {
    CommitmentTree tree;
    const uint32_t blockCapacity = CommitmentTree::Block::CAPACITY;
    for (uint32_t i = 0; i < blockCapacity; i++) {
        ASSERT_TRUE(tree.insert(TestCommitment(i)).has_value());
    }
    std::string out;
    try {
        Run(tree, {"insert", TestCommitment(blockCapacity).GetHex()}, out);
        FAIL() << "insert into a full block succeeded";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), InsertErrorString(InsertError::BlockFull));
    }
    EXPECT_TRUE(out.empty());
}
