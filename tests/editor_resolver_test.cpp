#include <gtest/gtest.h>
#include "core/editor_resolver.hpp"
#include "logging/logger.hpp"
#include "test_helpers.hpp"

using test_helpers::ScopedEnv;
using test_helpers::TempDir;

class EditorResolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        editor_path_ = test_helpers::writeScript(bin_, "tl-editor", "exit 0\n");
    }

    TempDir bin_;
    std::string editor_path_;
    ScopedEnv visual_{"VISUAL", nullptr};
    ScopedEnv editor_{"EDITOR", nullptr};
};

TEST_F(EditorResolverTest, ConfiguredEditorGetsLineArgument)
{
    ExecutableFinder finder;
    EditorResolver resolver("myedit --wait", finder);

    std::vector<std::string> expected = {"myedit", "--wait", "+12", "notes.txt"};
    EXPECT_EQ(resolver.getEditor("notes.txt", 12), expected);
}

TEST_F(EditorResolverTest, ConfiguredEditorWithoutPathOrLine)
{
    ExecutableFinder finder;
    EditorResolver resolver("myedit", finder);

    EXPECT_EQ(resolver.getEditor(), std::vector<std::string>{"myedit"});
    std::vector<std::string> no_line = {"myedit", "file"};
    EXPECT_EQ(resolver.getEditor("file", 0), no_line);
}

TEST_F(EditorResolverTest, VisualStudioCodeUsesGoto)
{
    ExecutableFinder finder;
    EditorResolver resolver("/usr/local/bin/Code", finder);

    std::vector<std::string> expected = {"/usr/local/bin/Code", "--goto", "main.cpp:7"};
    EXPECT_EQ(resolver.getEditor("main.cpp", 7), expected);
}

TEST_F(EditorResolverTest, LeadingTildeIsExpanded)
{
    ScopedEnv home("HOME", "/home/tester");
    ExecutableFinder finder;
    EditorResolver resolver("~/bin/ed -q", finder);

    auto cmd = resolver.getEditor();
    ASSERT_EQ(cmd.size(), 2u);
    EXPECT_EQ(cmd[0], "/home/tester/bin/ed");
}

TEST_F(EditorResolverTest, VisualTakesPrecedenceOverEditor)
{
    ScopedEnv visual("VISUAL", (editor_path_ + " -f").c_str());
    ScopedEnv editor("EDITOR", "/bin/false");
    ExecutableFinder finder;
    EditorResolver resolver(".", finder);

    std::vector<std::string> expected = {editor_path_, "-f", "x"};
    EXPECT_EQ(resolver.getEditor("x"), expected);
}

TEST_F(EditorResolverTest, BareEditorNameIsResolvedAgainstPath)
{
    ScopedEnv path("PATH", bin_.path().c_str());
    ScopedEnv editor("EDITOR", "tl-editor");
    ExecutableFinder finder;
    EditorResolver resolver(".", finder);

    auto cmd = resolver.editorFromEnvironmentVariables();
    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd[0], editor_path_);
}

TEST_F(EditorResolverTest, ShellEnvironmentSuppliesEditor)
{
    ScopedEnv path("PATH", "");
    ShellEnvironment shell_env = {{"EDITOR", "tl-editor --shell"}, {"PATH", bin_.path()}};
    int calls = 0;
    ExecutableFinder finder;
    EditorResolver resolver(".", finder, [&]() -> const ShellEnvironment &
                            {
        ++calls;
        return shell_env; });

    auto cmd = resolver.editorFromEnvironmentVariables();
    std::vector<std::string> expected = {editor_path_, "--shell"};
    EXPECT_EQ(cmd, expected);
    EXPECT_EQ(calls, 1);
}

TEST_F(EditorResolverTest, FallsBackToSomeEditor)
{
    ScopedEnv path("PATH", "");
    ExecutableFinder finder;
    EditorResolver resolver(".", finder);

    auto cmd = resolver.editorFromEnvironmentVariables();
    ASSERT_FALSE(cmd.empty());
    EXPECT_FALSE(cmd[0].empty());
}

TEST_F(EditorResolverTest, ResolveEditorCommand)
{
    ExecutableFinder finder;
    EditorResolver resolver(".", finder);
    ShellEnvironment env = {{"PATH", bin_.path()}};

    EXPECT_EQ(resolver.resolveEditorCommand("/opt/ed --x", env, false), "/opt/ed --x");
    EXPECT_EQ(resolver.resolveEditorCommand("tl-editor 'a b'", env, false), editor_path_ + " 'a b'");
    EXPECT_FALSE(resolver.resolveEditorCommand("tl-missing", env, false).has_value());
    EXPECT_FALSE(resolver.resolveEditorCommand("'unterminated", env, false).has_value());
    EXPECT_FALSE(resolver.resolveEditorCommand("   ", env, false).has_value());
}

TEST_F(EditorResolverTest, ProcessEnvironmentReflectsSetenv)
{
    ScopedEnv marker("TL_EDITOR_TEST_MARKER", "value=with=equals");
    auto env = EditorResolver::processEnvironment();
    ASSERT_EQ(env.count("TL_EDITOR_TEST_MARKER"), 1u);
    EXPECT_EQ(env["TL_EDITOR_TEST_MARKER"], "value=with=equals");
}
