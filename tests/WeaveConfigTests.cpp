#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "core/WeaveConfig.h"

using WeaveTypes::ExitCode;

namespace
{
    WeaveTypes::WeaveStatus parse(const juce::StringArray& arguments, WeaveConfig& config)
    {
        return WeaveConfig::fromArguments(juce::ArgumentList("SliceWeave", arguments), config);
    }
}

TEST(WeaveConfigTest, ParsesSpaceSeparatedOptions)
{
    WeaveConfig config;
    const auto status = parse({ "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav",
                                "--pattern", "2:1", "--realtime", "--tmp", "/tmp/stage" }, config);

    ASSERT_TRUE(status.wasOk()) << status.message;
    ASSERT_EQ(config.inputs.size(), 2u);
    EXPECT_EQ(config.inputs[0], juce::File("/tmp/a.wav"));
    EXPECT_EQ(config.inputs[1], juce::File("/tmp/b.wav"));
    EXPECT_EQ(config.output, juce::File("/tmp/out.wav"));
    EXPECT_EQ(config.pattern, (WeaveTypes::Pattern { 2, 1 }));
    EXPECT_TRUE(config.realtime);
    EXPECT_FALSE(config.random);
    EXPECT_EQ(config.tempDirectory, juce::File("/tmp/stage"));
}

TEST(WeaveConfigTest, ParsesEqualsForm)
{
    WeaveConfig config;
    const auto status = parse({ "--input=/tmp/a.wav:/tmp/b.wav:/tmp/c.wav", "--output=/tmp/out.wav", "--random" }, config);

    ASSERT_TRUE(status.wasOk()) << status.message;
    EXPECT_EQ(config.inputs.size(), 3u);
    EXPECT_TRUE(config.random);
}

TEST(WeaveConfigTest, DefaultsMatchTwentyFourFramesPerSecond)
{
    WeaveConfig config;
    ASSERT_TRUE(parse({ "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav" }, config).wasOk());

    EXPECT_EQ(config.pattern, (WeaveTypes::Pattern { 1, 1 }));
    EXPECT_EQ(config.sliceMillis, 41);
    EXPECT_EQ(config.sampleRate, 44100);
    EXPECT_EQ(config.partSize, 500);
    EXPECT_EQ(config.sliceExtension, "wav");
    EXPECT_EQ(config.tempDirectory, WeaveConfig::getDefaultTempDirectory());
    EXPECT_FALSE(config.hasRandomSeed);
    EXPECT_LE(config.commandTimeoutMs, 0);
}

TEST(WeaveConfigTest, MillisecondsOverrideFramesPerSecond)
{
    WeaveConfig config;
    ASSERT_TRUE(parse({ "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav",
                        "--fps", "10", "--ms", "250" }, config).wasOk());
    EXPECT_EQ(config.sliceMillis, 250);

    ASSERT_TRUE(parse({ "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav", "--fps", "30" }, config).wasOk());
    EXPECT_EQ(config.sliceMillis, 33);
}

TEST(WeaveConfigTest, ParsesHardeningOptions)
{
    WeaveConfig config;
    ASSERT_TRUE(parse({ "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav",
                        "--seed", "1234", "--timeout", "2.5", "--rate", "48000", "--part-size", "64",
                        "--ffmpeg", "/opt/ffmpeg/bin/ffmpeg", "--log", "/tmp/logs" }, config).wasOk());

    EXPECT_TRUE(config.hasRandomSeed);
    EXPECT_EQ(config.randomSeed, 1234);
    EXPECT_EQ(config.commandTimeoutMs, 2500);
    EXPECT_EQ(config.sampleRate, 48000);
    EXPECT_EQ(config.partSize, 64);
    EXPECT_EQ(config.ffmpegPath, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_TRUE(config.ffprobePath.isEmpty());
    EXPECT_EQ(config.logDirectory, juce::File("/tmp/logs"));
}

TEST(WeaveConfigTest, FewerThanTwoInputsIsExitCodeOne)
{
    WeaveConfig config;
    EXPECT_EQ(parse({ "--input", "/tmp/a.wav", "--output", "/tmp/out.wav" }, config).code, ExitCode::tooFewInputs);
    EXPECT_EQ(parse({ "--output", "/tmp/out.wav" }, config).code, ExitCode::tooFewInputs);
    EXPECT_EQ(parse({}, config).getExitCode(), 1);
}

TEST(WeaveConfigTest, MissingOutputIsExitCodeTwo)
{
    WeaveConfig config;
    EXPECT_EQ(parse({ "--input", "/tmp/a.wav:/tmp/b.wav" }, config).getExitCode(), 2);
}

TEST(WeaveConfigTest, PatternMustMatchInputCount)
{
    WeaveConfig config;
    EXPECT_EQ(parse({ "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav", "--pattern", "1:1:1" }, config).code,
              ExitCode::invalidConfiguration);
}

TEST(WeaveConfigTest, RejectsMalformedNumbers)
{
    WeaveConfig config;
    const juce::StringArray base { "--input", "/tmp/a.wav:/tmp/b.wav", "--output", "/tmp/out.wav" };

    for (const auto& extra : { juce::StringArray { "--pattern", "2:x" },
                               juce::StringArray { "--pattern", "0:1" },
                               juce::StringArray { "--ms", "1.5" },
                               juce::StringArray { "--fps", "fast" },
                               juce::StringArray { "--rate", "0" },
                               juce::StringArray { "--seed", "abc" } })
    {
        juce::StringArray arguments(base);
        arguments.addArray(extra);
        EXPECT_EQ(parse(arguments, config).code, ExitCode::invalidConfiguration) << arguments.joinIntoString(" ");
    }
}

TEST(WeaveConfigTest, ValidateCatchesHandBuiltConfigs)
{
    WeaveConfig config;
    config.inputs = { juce::File("/tmp/a.wav"), juce::File("/tmp/b.wav") };
    config.output = juce::File("/tmp/out.wav");
    config.pattern = { 1, 1 };

    EXPECT_TRUE(config.validate().wasOk());

    config.sliceMillis = 0;
    EXPECT_EQ(config.validate().code, ExitCode::invalidConfiguration);
}

TEST(WeaveConfigTest, SliceLengthFromFrameRateRoundsDown)
{
    EXPECT_EQ(WeaveConfig::sliceMillisForFps(24.0), 41);
    EXPECT_EQ(WeaveConfig::sliceMillisForFps(25.0), 40);
    EXPECT_EQ(WeaveConfig::sliceMillisForFps(0.0), 0);
}
