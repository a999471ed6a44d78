/**
 * @file test_path_enumerator.cpp
 * @brief Source tree walk: completeness, order, symlink and exclude policy
 */

#include <gtest/gtest.h>
#include "ErrorCodes.h"
#include "PathEnumerator.h"
#include "TestTree.h"

#include <sys/stat.h>
#include <unistd.h>

using namespace ParaCopy;
using ParaCopy::Testing::TestTree;

namespace {

std::vector<std::string> drain(PathEnumerator& enumerator) {
    std::vector<std::string> paths;
    while (auto path = enumerator.next()) {
        paths.push_back(*path);
    }
    return paths;
}

} // namespace

class PathEnumeratorTest : public ::testing::Test {
protected:
    TestTree tree_{"paracopy_enum"};
};

TEST_F(PathEnumeratorTest, EmitsEveryLeafOnceInDepthFirstOrder) {
    tree_.write("src/b.txt", "b");
    tree_.write("src/a/2.txt", "2");
    tree_.write("src/a/1.txt", "1");
    tree_.write("src/a/deep/x.bin", "x");
    tree_.write("src/c.txt", "c");

    PathEnumerator enumerator(tree_.path("src"));
    auto paths = drain(enumerator);

    std::vector<std::string> expected = {"a/1.txt", "a/2.txt", "a/deep/x.bin", "b.txt", "c.txt"};
    EXPECT_EQ(paths, expected);
    EXPECT_EQ(enumerator.emittedCount(), 5u);
    EXPECT_EQ(enumerator.skippedCount(), 0u);
}

TEST_F(PathEnumeratorTest, SameTreeYieldsSameSequence) {
    for (int i = 0; i < 20; ++i) {
        tree_.write("src/d" + std::to_string(i % 3) + "/f" + std::to_string(i), "data");
    }

    PathEnumerator first(tree_.path("src"));
    PathEnumerator second(tree_.path("src"));
    EXPECT_EQ(drain(first), drain(second));
}

TEST_F(PathEnumeratorTest, DirectoriesAreNotEmitted) {
    tree_.mkdir("src/empty");
    tree_.mkdir("src/nested/also_empty");
    tree_.write("src/nested/file", "");

    PathEnumerator enumerator(tree_.path("src"));
    EXPECT_EQ(drain(enumerator), std::vector<std::string>{"nested/file"});
}

TEST_F(PathEnumeratorTest, EmptyFilesAreIncluded) {
    tree_.write("src/zero", "");
    PathEnumerator enumerator(tree_.path("src"));
    EXPECT_EQ(drain(enumerator), std::vector<std::string>{"zero"});
}

TEST_F(PathEnumeratorTest, SymlinksAreLeavesAndNeverFollowed) {
    tree_.write("outside/secret.txt", "s");
    tree_.write("src/real.txt", "r");
    std::filesystem::create_symlink(tree_.path("outside"), tree_.path("src/dirlink"));
    std::filesystem::create_symlink("real.txt", tree_.path("src/filelink"));
    std::filesystem::create_symlink("missing", tree_.path("src/dangling"));

    PathEnumerator enumerator(tree_.path("src"));
    std::vector<std::string> expected = {"dangling", "dirlink", "filelink", "real.txt"};
    EXPECT_EQ(drain(enumerator), expected);
}

TEST_F(PathEnumeratorTest, SpecialFilesAreSkipped) {
    tree_.write("src/file", "f");
    ASSERT_EQ(::mkfifo(tree_.path("src/pipe").c_str(), 0600), 0);

    PathEnumerator enumerator(tree_.path("src"));
    EXPECT_EQ(drain(enumerator), std::vector<std::string>{"file"});
    EXPECT_EQ(enumerator.skippedCount(), 1u);
}

TEST_F(PathEnumeratorTest, ExcludePatternsPruneFilesAndDirectories) {
    tree_.write("src/keep.txt", "k");
    tree_.write("src/.DS_Store", "junk");
    tree_.write("src/.Spotlight-V100/store.db", "junk");
    tree_.write("src/sub/.DS_Store", "junk");
    tree_.write("src/sub/keep2.txt", "k");

    EnumeratorOptions options;
    options.excludePatterns = EnumeratorOptions::defaultExcludePatterns();
    PathEnumerator enumerator(tree_.path("src"), options);

    std::vector<std::string> expected = {"keep.txt", "sub/keep2.txt"};
    EXPECT_EQ(drain(enumerator), expected);
}

TEST_F(PathEnumeratorTest, NoExcludesByDefault) {
    tree_.write("src/.DS_Store", "junk");
    PathEnumerator enumerator(tree_.path("src"));
    EXPECT_EQ(drain(enumerator), std::vector<std::string>{".DS_Store"});
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PathEnumeratorTest, MissingRootThrows) {
    EXPECT_THROW(PathEnumerator(tree_.path("nope")), Core::EnumerationError);
}

TEST_F(PathEnumeratorTest, FileRootThrows) {
    tree_.write("plain", "x");
    EXPECT_THROW(PathEnumerator(tree_.path("plain")), Core::EnumerationError);
}

TEST_F(PathEnumeratorTest, DirectoryRemovedBeforeItIsWalkedThrows) {
    tree_.write("src/a.txt", "a");
    tree_.write("src/gone/b.txt", "b");

    PathEnumerator enumerator(tree_.path("src"));
    EXPECT_EQ(enumerator.next(), std::optional<std::string>("a.txt"));
    std::filesystem::remove_all(tree_.path("src/gone"));
    EXPECT_THROW(enumerator.next(), Core::EnumerationError);
}

TEST_F(PathEnumeratorTest, UnreadableDirectoryThrows) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    tree_.write("src/a.txt", "a");
    tree_.write("src/locked/b.txt", "b");
    std::filesystem::permissions(tree_.path("src/locked"), std::filesystem::perms::none);

    PathEnumerator enumerator(tree_.path("src"));
    EXPECT_EQ(enumerator.next(), std::optional<std::string>("a.txt"));
    EXPECT_THROW(enumerator.next(), Core::EnumerationError);

    std::filesystem::permissions(tree_.path("src/locked"), std::filesystem::perms::owner_all);
}
