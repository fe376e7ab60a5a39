#include "tree/TestTree.h"
#include <gtest/gtest.h>

using namespace TEB;

TEST(TestTreeTest, StartsEmpty) {
    TestTree tree;
    EXPECT_EQ(tree.root().kind(), TreeNodeKind::Root);
    EXPECT_TRUE(tree.root().children().empty());
    EXPECT_EQ(tree.size(), 0u);
}

TEST(TestTreeTest, GenerationsAreUnique) {
    TestTree tree;
    tree.startNewGeneration({"/a"});
    const std::string first = tree.generation();
    tree.startNewGeneration({"/a"});

    EXPECT_FALSE(first.empty());
    EXPECT_NE(tree.generation(), first);
    EXPECT_EQ(tree.idForLocation("/a/x.spec.ts"), tree.generation() + ":/a/x.spec.ts");
}

TEST(TestTreeTest, StripGenerationKeepsLocationColons) {
    EXPECT_EQ(TestTree::stripGeneration("g1:/ws/a.spec.ts:12#1"), "/ws/a.spec.ts:12#1");
    EXPECT_EQ(TestTree::stripGeneration("plain"), "plain");
}

TEST(TestTreeTest, WorkspaceRootsAreNormalized) {
    TestTree tree;
    tree.startNewGeneration({"c:/work", "/home/me/project"});

    EXPECT_EQ(tree.workspaceRoots()[0], "C:/work");
    EXPECT_EQ(tree.workspaceRootFor("/home/me/project/tests/a.spec.ts"), "/home/me/project");
    EXPECT_EQ(tree.workspaceRootFor("/home/me/project"), "/home/me/project");
    EXPECT_FALSE(tree.workspaceRootFor("/home/me/projectx/a.spec.ts").has_value());
}

TEST(TestTreeTest, SourceRangeForLineIsZeroBased) {
    EXPECT_EQ(SourceRange::forLine(1), (SourceRange{0, 0, 1, 0}));
    EXPECT_EQ(SourceRange::forLine(12), (SourceRange{11, 0, 12, 0}));
}
