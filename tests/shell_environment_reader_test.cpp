#include <gtest/gtest.h>
#include "core/shell_environment_reader.hpp"
#include "logging/logger.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using test_helpers::TempDir;

class ShellEnvironmentReaderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        options_.timeout = std::chrono::milliseconds(3000);
        options_.poll_interval = std::chrono::milliseconds(10);
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output_);
        Logger::addSink(sink_);
    }

    void TearDown() override
    {
        Logger::removeSink(sink_);
    }

    std::ostringstream log_output_;
    spdlog::sink_ptr sink_;

    TempDir dir_;
    ShellEnvironmentOptions options_;
};

TEST_F(ShellEnvironmentReaderTest, ParsesKeyValueLinesFromShell)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell",
                                                  "printf 'FOO=bar\\nBAZ=\\nMALFORMED\\n=empty\\nQUX=1\\n'\n");
    ShellEnvironmentReader reader(options_);

    const ShellEnvironment &env = reader.read({shell});

    ShellEnvironment expected = {{"FOO", "bar"}, {"QUX", "1"}};
    EXPECT_EQ(env, expected);
}

TEST_F(ShellEnvironmentReaderTest, ShellReceivesLoginFlagsAndEnvCommand)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell", "echo \"ARGS=$*\"\n");
    ShellEnvironmentReader reader(options_);

    const ShellEnvironment &env = reader.read({shell, "--login"});

    ASSERT_EQ(env.count("ARGS"), 1u);
    EXPECT_EQ(env.at("ARGS"), "--login -i -c env");
}

TEST_F(ShellEnvironmentReaderTest, RunsOnAControllingTerminal)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell",
                                                  "if [ -t 0 ] && [ -t 1 ]; then echo TTY=yes; else echo TTY=no; fi\n");
    ShellEnvironmentReader reader(options_);

    const ShellEnvironment &env = reader.read({shell});

    ASSERT_EQ(env.count("TTY"), 1u);
    EXPECT_EQ(env.at("TTY"), "yes");
}

TEST_F(ShellEnvironmentReaderTest, ValuesMayContainEquals)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell", "echo 'OPTS=a=b=c'\n");
    ShellEnvironmentReader reader(options_);

    EXPECT_EQ(reader.read({shell}).at("OPTS"), "a=b=c");
}

TEST_F(ShellEnvironmentReaderTest, InvalidUtf8IsReplaced)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell", "printf 'NAME=a\\377b\\n'\n");
    ShellEnvironmentReader reader(options_);

    const ShellEnvironment &env = reader.read({shell});

    ASSERT_EQ(env.count("NAME"), 1u);
    EXPECT_EQ(env.at("NAME"), "a\xEF\xBF\xBD" "b");
}

TEST_F(ShellEnvironmentReaderTest, ResultIsComputedOnce)
{
    std::string marker = dir_.file("runs");
    std::string shell = test_helpers::writeScript(dir_, "fake-shell",
                                                  "echo run >> '" + marker + "'\necho VALUE=first\n");
    ShellEnvironmentReader reader(options_);

    const ShellEnvironment &first = reader.read({shell});
    test_helpers::writeScript(dir_, "fake-shell", "echo VALUE=second\n");
    const ShellEnvironment &second = reader.read({shell});

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.at("VALUE"), "first");
    EXPECT_EQ(test_helpers::readFile(marker), "run\n");
}

TEST_F(ShellEnvironmentReaderTest, TimeoutYieldsEmptyEnvironment)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell", "echo EARLY=1\nsleep 30\n");
    options_.timeout = std::chrono::milliseconds(200);
    ShellEnvironmentReader reader(options_);

    auto start = std::chrono::steady_clock::now();
    const ShellEnvironment &env = reader.read({shell});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(env.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_NE(log_output_.str().find("Timed out waiting for shell"), std::string::npos);
    // The failure is cached as well
    EXPECT_TRUE(reader.read({shell}).empty());
}

TEST_F(ShellEnvironmentReaderTest, MissingShellYieldsEmptyEnvironmentQuickly)
{
    ShellEnvironmentReader reader(options_);

    auto start = std::chrono::steady_clock::now();
    const ShellEnvironment &env = reader.read({dir_.file("no-such-shell")});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(env.empty());
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_NE(log_output_.str().find("Could not find shell"), std::string::npos);
}

TEST_F(ShellEnvironmentReaderTest, NonZeroExitYieldsEmptyEnvironment)
{
    std::string shell = test_helpers::writeScript(dir_, "fake-shell", "echo FOO=bar\nexit 3\n");
    ShellEnvironmentReader reader(options_);

    EXPECT_TRUE(reader.read({shell}).empty());
    EXPECT_NE(log_output_.str().find("exit status 3"), std::string::npos);
}

TEST_F(ShellEnvironmentReaderTest, EmptyShellYieldsEmptyEnvironment)
{
    ShellEnvironmentReader reader(options_);
    EXPECT_TRUE(reader.read({}).empty());
}

TEST(ShellEnvironmentReaderStaticTest, WithLoginFlags)
{
    using Args = std::vector<std::string>;
    EXPECT_EQ(ShellEnvironmentReader::withLoginFlags({"zsh"}), (Args{"zsh", "-l", "-i"}));
    EXPECT_EQ(ShellEnvironmentReader::withLoginFlags({"bash", "-l"}), (Args{"bash", "-l", "-i"}));
    EXPECT_EQ(ShellEnvironmentReader::withLoginFlags({"bash", "--interactive"}), (Args{"bash", "--interactive", "-l"}));
    EXPECT_EQ(ShellEnvironmentReader::withLoginFlags({"fish", "--login", "-i"}), (Args{"fish", "--login", "-i"}));
}

TEST(ShellEnvironmentReaderStaticTest, ParseEnvironment)
{
    auto env = ShellEnvironmentReader::parseEnvironment("A=1\r\nB=\r\nnoequals\r\n=x\r\nC=x y\r\n");
    ShellEnvironment expected = {{"A", "1"}, {"C", "x y"}};
    EXPECT_EQ(env, expected);
}

TEST(ShellEnvironmentReaderStaticTest, DefaultOptions)
{
    ShellEnvironmentReader reader;
    EXPECT_EQ(reader.options().timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(reader.options().poll_interval, std::chrono::milliseconds(10));
}
