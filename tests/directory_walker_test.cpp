#include <gtest/gtest.h>
#include "core/directory_walker.hpp"
#include "test_base.hpp"
#include <map>
#include <sys/stat.h>

class DirectoryWalkerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        createFile("a.jpg");
        createFile("b.png");
        createFile("notes.txt");
        createFile("2024/c.JPG");
        createFile("2024/.jozin/cache.jpg");
    }

    // Relative path -> skip reason ("" for candidates)
    std::map<std::string, std::string> verdicts(const std::vector<DirectoryWalker::Entry> &entries)
    {
        std::map<std::string, std::string> out;
        for (const auto &entry : entries)
        {
            auto relative = std::filesystem::path(entry.path).lexically_relative(testDir()).generic_string();
            out[relative] = entry.skip_reason.value_or("");
        }
        return out;
    }
};

TEST_F(DirectoryWalkerTest, NonRecursiveVisitsDirectChildrenOnly)
{
    DirectoryWalker walker(std::nullopt, std::nullopt);
    auto result = verdicts(walker.walk(testDir(), false));

    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(result["a.jpg"], "");
    EXPECT_EQ(result["b.png"], "");
    EXPECT_EQ(result["notes.txt"], DirectoryWalker::kUnsupportedReason);
}

TEST_F(DirectoryWalkerTest, RecursiveVisitsWholeTreeAndNeverYieldsDirectories)
{
    DirectoryWalker walker(std::nullopt, std::nullopt);
    auto entries = walker.walk(testDir(), true);
    auto result = verdicts(entries);

    EXPECT_EQ(result.size(), 5u);
    EXPECT_EQ(result["2024/c.JPG"], "");
    EXPECT_EQ(result["2024/.jozin/cache.jpg"], "");
    EXPECT_EQ(result.count("2024"), 0u);

    for (size_t i = 1; i < entries.size(); ++i)
    {
        EXPECT_LT(entries[i - 1].path, entries[i].path);
    }
}

TEST_F(DirectoryWalkerTest, ExcludeWinsOverInclude)
{
    DirectoryWalker walker(GlobMatcher::compile({"*.jpg"}), GlobMatcher::compile({"**/.jozin/**"}));
    auto result = verdicts(walker.walk(testDir(), true));

    EXPECT_EQ(result["2024/.jozin/cache.jpg"], DirectoryWalker::kExcludedReason);
    EXPECT_EQ(result["a.jpg"], "");
    EXPECT_EQ(result["b.png"], DirectoryWalker::kNotIncludedReason);
    // Include runs before the extension check
    EXPECT_EQ(result["notes.txt"], DirectoryWalker::kNotIncludedReason);
    // Globs are case sensitive, the extension check is not
    EXPECT_EQ(result["2024/c.JPG"], DirectoryWalker::kNotIncludedReason);
}

TEST_F(DirectoryWalkerTest, UnreadableSubdirectoryIsSkipped)
{
    if (::geteuid() == 0)
    {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    createFile("private/secret.jpg");
    const std::string dir = testDir() + "/private";
    ASSERT_EQ(::chmod(dir.c_str(), 0000), 0);

    DirectoryWalker walker(std::nullopt, std::nullopt);
    auto result = verdicts(walker.walk(testDir(), true));
    ::chmod(dir.c_str(), 0755);

    EXPECT_EQ(result.count("private/secret.jpg"), 0u);
    EXPECT_EQ(result["a.jpg"], "");
}

TEST_F(DirectoryWalkerTest, BrokenSymlinkIsSkipped)
{
    std::filesystem::create_symlink(testDir() + "/does-not-exist.jpg", testDir() + "/dangling.jpg");
    DirectoryWalker walker(std::nullopt, std::nullopt);
    auto result = verdicts(walker.walk(testDir(), false));

    EXPECT_EQ(result.count("dangling.jpg"), 0u);
    EXPECT_EQ(result.size(), 3u);
}

TEST_F(DirectoryWalkerTest, SymlinkLoopIsSkipped)
{
    // Resolving either name fails with ELOOP, whoever runs the test
    std::filesystem::create_symlink(testDir() + "/loop_b.jpg", testDir() + "/loop_a.jpg");
    std::filesystem::create_symlink(testDir() + "/loop_a.jpg", testDir() + "/loop_b.jpg");
    DirectoryWalker walker(std::nullopt, std::nullopt);
    auto result = verdicts(walker.walk(testDir(), true));

    EXPECT_EQ(result.count("loop_a.jpg"), 0u);
    EXPECT_EQ(result.count("loop_b.jpg"), 0u);
    EXPECT_EQ(result.size(), 5u);
}
