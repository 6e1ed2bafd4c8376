#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/ExclusionFilter.hpp"

class ExclusionFilterTest : public ::testing::Test {
protected:
    ExclusionFilter filter;

    void SetUp() override {
        filter.addPatterns({"*.pyc", "node_modules", ".git", "*.log"});
    }
};

TEST_F(ExclusionFilterTest, MatchesFileNamesByGlob) {
    EXPECT_TRUE(filter.shouldExclude("module.pyc"));
    EXPECT_TRUE(filter.shouldExclude("debug.log"));
    EXPECT_FALSE(filter.shouldExclude("main.py"));
    EXPECT_FALSE(filter.shouldExclude("logfile.txt"));
}

TEST_F(ExclusionFilterTest, MatchesDirectoryNames) {
    EXPECT_TRUE(filter.shouldExclude("node_modules"));
    EXPECT_TRUE(filter.shouldExclude(".git"));
    EXPECT_FALSE(filter.shouldExclude("src"));
}

TEST_F(ExclusionFilterTest, OnlyFinalComponentIsMatched) {
    EXPECT_TRUE(filter.shouldExclude("project/build/cache.pyc"));
    EXPECT_TRUE(filter.shouldExclude("/home/user/app/node_modules"));
    EXPECT_TRUE(filter.shouldExclude("/home/user/app/node_modules/"));
    // 目录名匹配并不会排除其中的文件路径
    EXPECT_FALSE(filter.shouldExclude("app/node_modules/index.js"));
}

TEST_F(ExclusionFilterTest, PatternWithSlashNeverMatchesNestedPath) {
    ExclusionFilter pathFilter({"build/output.txt"});
    EXPECT_FALSE(pathFilter.shouldExclude("build/output.txt"));
    EXPECT_FALSE(pathFilter.shouldExclude("output.txt"));
}

TEST_F(ExclusionFilterTest, CharacterClassesAndSingleWildcard) {
    ExclusionFilter classFilter({"file?.txt", "[ab]*.dat"});
    EXPECT_TRUE(classFilter.shouldExclude("file1.txt"));
    EXPECT_FALSE(classFilter.shouldExclude("file12.txt"));
    EXPECT_TRUE(classFilter.shouldExclude("alpha.dat"));
    EXPECT_TRUE(classFilter.shouldExclude("beta.dat"));
    EXPECT_FALSE(classFilter.shouldExclude("gamma.dat"));
}

TEST_F(ExclusionFilterTest, EmptyFilterExcludesNothing) {
    ExclusionFilter empty;
    EXPECT_FALSE(empty.shouldExclude("anything"));
    EXPECT_FALSE(empty.shouldExclude(""));
    EXPECT_EQ(0u, empty.size());
}

TEST_F(ExclusionFilterTest, OnlyPositiveResultsAreCached) {
    filter.clearCache();
    EXPECT_EQ(0u, filter.cacheSize());

    EXPECT_TRUE(filter.shouldExclude("a.pyc"));
    EXPECT_EQ(1u, filter.cacheSize());

    EXPECT_FALSE(filter.shouldExclude("a.py"));
    EXPECT_FALSE(filter.shouldExclude("a.py"));
    EXPECT_EQ(1u, filter.cacheSize());

    // 缓存键是原始输入，不做归一化
    EXPECT_TRUE(filter.shouldExclude("dir/a.pyc"));
    EXPECT_EQ(2u, filter.cacheSize());
}

TEST_F(ExclusionFilterTest, ChangingPatternsInvalidatesCache) {
    EXPECT_TRUE(filter.shouldExclude("trace.log"));
    EXPECT_EQ(1u, filter.cacheSize());

    EXPECT_TRUE(filter.removePattern("*.log"));
    EXPECT_EQ(0u, filter.cacheSize());
    EXPECT_FALSE(filter.shouldExclude("trace.log"));

    filter.addPattern("trace.*");
    EXPECT_TRUE(filter.shouldExclude("trace.log"));
}

TEST_F(ExclusionFilterTest, DuplicateAndEmptyPatternsIgnored) {
    size_t before = filter.size();
    filter.addPattern("*.pyc");
    filter.addPattern("");
    EXPECT_EQ(before, filter.size());
    EXPECT_FALSE(filter.removePattern("not-there"));
}

TEST_F(ExclusionFilterTest, ResultIndependentOfPatternOrder) {
    ExclusionFilter forward({"*.tmp", "cache", "*.o"});
    ExclusionFilter backward({"*.o", "cache", "*.tmp"});
    for (const std::string name : {"x.tmp", "cache", "main.o", "main.c", "cached"}) {
        EXPECT_EQ(forward.shouldExclude(name), backward.shouldExclude(name)) << name;
    }
}

TEST_F(ExclusionFilterTest, FilterPathsInPlace) {
    std::vector<std::string> paths = {"a.py", "b.pyc", "node_modules", "README.md", "out.log"};
    filter.filterPaths(paths);
    std::vector<std::string> expected = {"a.py", "README.md"};
    EXPECT_EQ(expected, paths);
}

TEST_F(ExclusionFilterTest, DescriptionListsPatterns) {
    std::string desc = filter.getFilterDescription();
    EXPECT_NE(std::string::npos, desc.find("*.pyc"));
    EXPECT_NE(std::string::npos, desc.find("(4)"));
}
