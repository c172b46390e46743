#include "../test_utils.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <toolguard/path_sanitizer.hpp>

namespace fs = std::filesystem;
using namespace toolguard;

class PathSanitizerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        workspace_ = temp_.make_dir("workspace");
    }

    test::TempDir temp_;
    fs::path workspace_;
};

TEST_F(PathSanitizerTest, WorkDirIsStoredCanonical)
{
    PathSanitizer sanitizer(workspace_.string() + "/./sub/..");
    EXPECT_EQ(sanitizer.work_dir(), workspace_);
}

TEST_F(PathSanitizerTest, WorkDirNeedNotExist)
{
    PathSanitizer sanitizer((workspace_ / "not-created-yet").string());
    EXPECT_EQ(sanitizer.work_dir(), workspace_ / "not-created-yet");
    EXPECT_TRUE(sanitizer.work_dir().is_absolute());
}

TEST_F(PathSanitizerTest, RelativePathIsResolvedAgainstWorkspace)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("test.txt");
    ASSERT_TRUE(result.ok()) << result.error->what();
    EXPECT_EQ(fs::path(result.path), workspace_ / "test.txt");
    EXPECT_NE(fs::path(result.path), workspace_);
}

TEST_F(PathSanitizerTest, TraversalOutOfWorkspaceFails)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("../../../etc/passwd");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code(), ErrorCode::PathTraversal);
    EXPECT_TRUE(result.path.empty());
}

TEST_F(PathSanitizerTest, DotSegmentsAreCollapsedLexically)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("a/b/../../c/./file.txt");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_ / "c" / "file.txt");

    result = sanitizer.sanitize(".");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_);

    result = sanitizer.sanitize("sub/..");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_);
}

TEST_F(PathSanitizerTest, WhitespaceIsTrimmed)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("  notes.md \n");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_ / "notes.md");
}

TEST_F(PathSanitizerTest, EmptyPathFails)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("   ");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code(), ErrorCode::EmptyInput);
}

TEST_F(PathSanitizerTest, AbsolutePathOutsideWorkspaceFails)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("/etc/passwd");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code(), ErrorCode::PathOutsideWorkspace);
}

TEST_F(PathSanitizerTest, AbsolutePathInsideWorkspacePasses)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize((workspace_ / "src" / "main.cpp").string());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_ / "src" / "main.cpp");

    result = sanitizer.sanitize(workspace_.string() + "/");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_);
}

TEST_F(PathSanitizerTest, SiblingWithSharedPrefixIsOutside)
{
    temp_.make_dir("workspace-evil");
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize((temp_.path() / "workspace-evil" / "x.txt").string());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code(), ErrorCode::PathOutsideWorkspace);

    result = sanitizer.sanitize("../workspace-evil/x.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code(), ErrorCode::PathTraversal);
}

TEST_F(PathSanitizerTest, DotsInsideNamesAreNotTraversal)
{
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("file..txt");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_ / "file..txt");
}

TEST_F(PathSanitizerTest, ExtraRootsAreAccepted)
{
    auto shared = temp_.make_dir("shared");
    PathSanitizer sanitizer(workspace_.string(), {shared.string()});

    auto result = sanitizer.sanitize((shared / "data.csv").string());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), shared / "data.csv");

    // Relative paths still resolve against the workspace
    result = sanitizer.sanitize("../shared/data.csv");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), shared / "data.csv");
}

TEST_F(PathSanitizerTest, HomeIsExpanded)
{
    test::EnvGuard home("HOME", workspace_.string());
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("~/notes.md");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), workspace_ / "notes.md");
}

TEST_F(PathSanitizerTest, UnsetHomeFailsClosed)
{
    test::EnvGuard home("HOME", std::nullopt);
    PathSanitizer sanitizer(workspace_.string());

    auto result = sanitizer.sanitize("~/notes.md");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code(), ErrorCode::PathOutsideWorkspace);
}

TEST(PathSanitizerStaticTest, IsWithinComparesComponents)
{
    EXPECT_TRUE(PathSanitizer::is_within("/srv/ws", "/srv/ws"));
    EXPECT_TRUE(PathSanitizer::is_within("/srv/ws/a/b", "/srv/ws"));
    EXPECT_FALSE(PathSanitizer::is_within("/srv/ws2", "/srv/ws"));
    EXPECT_FALSE(PathSanitizer::is_within("/srv", "/srv/ws"));
    EXPECT_TRUE(PathSanitizer::is_within("/anything", "/"));
}

TEST(PathSanitizerStaticTest, NormalizeDropsTrailingSeparator)
{
    EXPECT_EQ(PathSanitizer::normalize("/srv/ws/"), fs::path("/srv/ws"));
    EXPECT_EQ(PathSanitizer::normalize("/srv/ws/a/../b/."), fs::path("/srv/ws/b"));
    EXPECT_EQ(PathSanitizer::normalize("/"), fs::path("/"));
    EXPECT_EQ(PathSanitizer::normalize("/.."), fs::path("/"));
}
