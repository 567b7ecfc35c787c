#include <gtest/gtest.h>
#include "core/app_context.hpp"
#include "launcher_config_manager.hpp"
#include "logging/logger.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

using test_helpers::ScopedEnv;
using test_helpers::TempDir;

class AppContextTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        ::mkdir(dir_.file("shell-bin").c_str(), 0755);
        ::mkdir(dir_.file("sockets").c_str(), 0755);
        tool_ = test_helpers::writeScript(dir_, "shell-bin/tl-shell-tool", "exit 0\n");

        marker_ = dir_.file("shell-runs");
        shell_ = test_helpers::writeScript(dir_, "fake-shell",
                                           "echo run >> '" + marker_ + "'\n"
                                           "echo 'PATH=" + dir_.file("shell-bin") + "'\n"
                                           "echo 'EDITOR=tl-shell-tool --from-shell'\n");

        config_path_ = dir_.file("config.json");
        nlohmann::json config = {
            {"app_name", "tl-ctx-" + std::to_string(::getpid()) + "-" + std::to_string(++counter_)},
            {"shell", shell_},
            {"editor", "."},
            {"exe_search_path", nlohmann::json::array()},
            {"shell_environment", {{"timeout_ms", 3000}, {"poll_interval_ms", 10}}},
            {"single_instance", {{"use_abstract_namespace", false}, {"socket_directories", {dir_.file("sockets")}}}}};
        test_helpers::writeFile(config_path_, config.dump());
        ASSERT_TRUE(LauncherConfigManager::getInstance().load(config_path_));
    }

    static int counter_;
    TempDir dir_;
    std::string tool_;
    std::string marker_;
    std::string shell_;
    std::string config_path_;
    ScopedEnv path_{"PATH", ""};
    ScopedEnv visual_{"VISUAL", nullptr};
    ScopedEnv editor_{"EDITOR", nullptr};
};

int AppContextTest::counter_ = 0;

TEST_F(AppContextTest, ShellComesFromConfiguration)
{
    AppContext context(LauncherConfigManager::getInstance());
    EXPECT_EQ(context.shell(), std::vector<std::string>{shell_});
}

TEST_F(AppContextTest, ShellEnvironmentIsReadOnce)
{
    AppContext context(LauncherConfigManager::getInstance());

    const ShellEnvironment &first = context.shellEnvironment();
    const ShellEnvironment &second = context.shellEnvironment();

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.at("PATH"), dir_.file("shell-bin"));
    EXPECT_EQ(test_helpers::readFile(marker_), "run\n");
}

TEST_F(AppContextTest, ShellIsNotLaunchedUntilNeeded)
{
    AppContext context(LauncherConfigManager::getInstance());
    EXPECT_FALSE(std::filesystem::exists(marker_));
}

TEST_F(AppContextTest, FinderUsesShellPath)
{
    AppContext context(LauncherConfigManager::getInstance());

    EXPECT_FALSE(context.executableFinder().find("tl-shell-tool", true).has_value());
    EXPECT_EQ(context.executableFinder().find("tl-shell-tool"), tool_);
}

TEST_F(AppContextTest, EditorFallsBackToShellEditor)
{
    AppContext context(LauncherConfigManager::getInstance());

    std::vector<std::string> expected = {tool_, "--from-shell", "+3", "file.txt"};
    EXPECT_EQ(context.editorResolver().getEditor("file.txt", 3), expected);
}

TEST_F(AppContextTest, SingleInstanceIsDecidedOnce)
{
    AppContext context(LauncherConfigManager::getInstance());
    EXPECT_EQ(context.instanceHandle(), nullptr);

    EXPECT_EQ(context.singleInstance(), InstanceRole::SERVER);
    InstanceHandle *handle = context.instanceHandle();
    ASSERT_NE(handle, nullptr);

    // Later calls return the first decision, whatever group they ask for
    EXPECT_EQ(context.singleInstance("other"), InstanceRole::SERVER);
    EXPECT_EQ(context.instanceHandle(), handle);
}

TEST_F(AppContextTest, DestroyingContextReleasesInstance)
{
    std::string socket_path;
    {
        AppContext context(LauncherConfigManager::getInstance());
        ASSERT_EQ(context.singleInstance(), InstanceRole::SERVER);
        socket_path = context.instanceHandle()->socketPath();
        EXPECT_TRUE(std::filesystem::exists(socket_path));
    }
    EXPECT_FALSE(socket_path.empty());
    EXPECT_FALSE(std::filesystem::exists(socket_path));
}

TEST_F(AppContextTest, FailedDecisionCanBeRetried)
{
    LauncherConfigManager::getInstance().update(
        {{"single_instance", {{"socket_directories", {dir_.file("missing")}}}}});
    AppContext context(LauncherConfigManager::getInstance());

    EXPECT_THROW(context.singleInstance(), SingleInstanceError);
    EXPECT_EQ(context.instanceHandle(), nullptr);

    ::mkdir(dir_.file("missing").c_str(), 0755);
    EXPECT_EQ(context.singleInstance(), InstanceRole::SERVER);
}
