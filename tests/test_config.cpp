#include "config.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

namespace
{
    const char *const kVariables[] = {"FFPB_FFMPEG", "FFPB_BAR_WIDTH", "FFPB_ASCII", "FFPB_VERBOSE", "FFPB_DEBUG"};

    class ConfigEnvTest : public ::testing::Test
    {
    protected:
        void SetUp() override { clear(); }
        void TearDown() override { clear(); }

        static void clear()
        {
            for (const char *name : kVariables)
                unsetenv(name);
        }
    };
}

TEST_F(ConfigEnvTest, DefaultsWithoutEnvironment)
{
    WrapperConfig cfg;
    load_config_from_env(&cfg);

    EXPECT_FALSE(cfg.verbose);
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(cfg.ffmpegPath, "ffmpeg");
    EXPECT_EQ(cfg.barWidth, 0);
    EXPECT_FALSE(cfg.asciiBar);
    EXPECT_TRUE(cfg.watchSignals);
    EXPECT_EQ(cfg.stdinPollMs, 50);
    EXPECT_EQ(cfg.stderrRetryMs, 10);
    EXPECT_EQ(cfg.drainGraceMs, 1000);
}

TEST_F(ConfigEnvTest, ReadsVariables)
{
    setenv("FFPB_FFMPEG", "/opt/ffmpeg/bin/ffmpeg", 1);
    setenv("FFPB_BAR_WIDTH", "32", 1);
    setenv("FFPB_ASCII", "yes", 1);
    setenv("FFPB_VERBOSE", "TRUE", 1);
    setenv("FFPB_DEBUG", "on", 1);

    WrapperConfig cfg;
    load_config_from_env(&cfg);

    EXPECT_EQ(cfg.ffmpegPath, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(cfg.barWidth, 32);
    EXPECT_TRUE(cfg.asciiBar);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_TRUE(cfg.debug);
}

TEST_F(ConfigEnvTest, EmptyValuesAreUnset)
{
    setenv("FFPB_FFMPEG", "", 1);
    setenv("FFPB_BAR_WIDTH", "", 1);

    WrapperConfig cfg;
    load_config_from_env(&cfg);

    EXPECT_EQ(cfg.ffmpegPath, "ffmpeg");
    EXPECT_EQ(cfg.barWidth, 0);
}

TEST_F(ConfigEnvTest, InvalidValuesKeepCurrent)
{
    setenv("FFPB_BAR_WIDTH", "12cols", 1);
    setenv("FFPB_ASCII", "maybe", 1);

    WrapperConfig cfg;
    cfg.barWidth = 15;
    cfg.asciiBar = true;
    load_config_from_env(&cfg);

    EXPECT_EQ(cfg.barWidth, 15);
    EXPECT_TRUE(cfg.asciiBar);
}

TEST_F(ConfigEnvTest, NegativeWidthRejected)
{
    setenv("FFPB_BAR_WIDTH", "-4", 1);

    WrapperConfig cfg;
    load_config_from_env(&cfg);
    EXPECT_EQ(cfg.barWidth, 0);
}

TEST_F(ConfigEnvTest, OutOfRangeWidthRejected)
{
    setenv("FFPB_BAR_WIDTH", "99999999999999999999", 1);

    WrapperConfig cfg;
    load_config_from_env(&cfg);
    EXPECT_EQ(cfg.barWidth, 0);
}

TEST_F(ConfigEnvTest, FalseValues)
{
    setenv("FFPB_ASCII", "0", 1);
    setenv("FFPB_VERBOSE", "off", 1);

    WrapperConfig cfg;
    cfg.asciiBar = true;
    cfg.verbose = true;
    load_config_from_env(&cfg);

    EXPECT_FALSE(cfg.asciiBar);
    EXPECT_FALSE(cfg.verbose);
}

TEST(ConfigTest, NullConfigThrows)
{
    EXPECT_THROW(load_config_from_env(nullptr), std::invalid_argument);
}
