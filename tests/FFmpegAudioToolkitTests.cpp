#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "core/WeaveConfig.h"
#include "rendering/FFmpegAudioToolkit.h"
#include "rendering/FFmpegExecutor.h"
#include "rendering/SliceExtractor.h"

using WeaveTypes::ExitCode;

namespace
{
    WeaveConfig makeToolConfig()
    {
        WeaveConfig config;
        config.ffmpegPath = "/opt/tools/ffmpeg";
        config.ffprobePath = "/opt/tools/ffprobe";
        return config;
    }
}

TEST(ConcatListTest, PlainPathIsSingleQuoted)
{
    EXPECT_EQ(FFmpegAudioToolkit::formatConcatListEntry(juce::File("/tmp/work/render_00000.wav")),
              "file '/tmp/work/render_00000.wav'");
}

TEST(ConcatListTest, SingleQuotesAreEscaped)
{
    EXPECT_EQ(FFmpegAudioToolkit::formatConcatListEntry(juce::File("/tmp/it's here/a.wav")),
              "file '/tmp/it'\\''s here/a.wav'");
}

TEST(ConcatListTest, SpacesNeedNoEscaping)
{
    EXPECT_EQ(FFmpegAudioToolkit::formatConcatListEntry(juce::File("/tmp/my slices/b.wav")),
              "file '/tmp/my slices/b.wav'");
}

TEST(FFmpegCommandTest, ExtractSeeksTrimsAndResamples)
{
    FFmpegAudioToolkit toolkit(makeToolConfig());

    const juce::StringArray command = toolkit.buildExtractCommand(juce::File("/tmp/in/a.wav"),
                                                                  juce::File("/tmp/work/export-00002_0.wav"),
                                                                  48000, 0.082, 0.041);

    const juce::StringArray expected { "/opt/tools/ffmpeg", "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
                                       "-ss", "0.082", "-t", "0.041", "-i", "/tmp/in/a.wav",
                                       "-vn", "-ar", "48000", "-ac", "2",
                                       "/tmp/work/export-00002_0.wav" };
    EXPECT_EQ(command, expected);
}

TEST(FFmpegCommandTest, FirstSliceSkipsSeeking)
{
    FFmpegAudioToolkit toolkit(makeToolConfig());

    const juce::StringArray command = toolkit.buildExtractCommand(juce::File("/tmp/in/a.wav"),
                                                                  juce::File("/tmp/work/export-00000_0.wav"),
                                                                  44100, 0.0, 0.041);

    EXPECT_FALSE(command.contains("-ss"));
    EXPECT_EQ(command[command.indexOf("-t") + 1], "0.041");
}

TEST(FFmpegCommandTest, ConcatCopiesStreamsForMatchingContainers)
{
    FFmpegAudioToolkit toolkit(makeToolConfig());
    const std::vector<juce::File> parts { juce::File("/tmp/work/render_00000.wav"),
                                          juce::File("/tmp/work/render_00001.wav") };

    const juce::StringArray command = toolkit.buildConcatCommand(juce::File("/tmp/list.txt"), parts,
                                                                 juce::File("/tmp/out.wav"));

    const juce::StringArray expected { "/opt/tools/ffmpeg", "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
                                       "-f", "concat", "-safe", "0", "-i", "/tmp/list.txt",
                                       "-c", "copy", "/tmp/out.wav" };
    EXPECT_EQ(command, expected);
}

TEST(FFmpegCommandTest, ConcatEncodesForAnotherContainer)
{
    FFmpegAudioToolkit toolkit(makeToolConfig());
    const std::vector<juce::File> parts { juce::File("/tmp/work/render_00000.wav") };

    const juce::StringArray command = toolkit.buildConcatCommand(juce::File("/tmp/list.txt"), parts,
                                                                 juce::File("/tmp/out.mp3"));

    EXPECT_FALSE(command.contains("-c"));
    EXPECT_EQ(command[command.size() - 1], "/tmp/out.mp3");
}

//==============================================================================
TEST(FFmpegDurationTest, MissingInputHasNoDurationButIsNotAToolFailure)
{
    TestDirectory directory;
    FFmpegExecutor executor;
    executor.setToolPaths("/opt/tools/ffmpeg", "/opt/tools/ffprobe");

    double duration = -1.0;
    EXPECT_TRUE(executor.getFileDuration(directory.getChildFile("missing.wav"), duration));
    EXPECT_EQ(duration, 0.0);
}

TEST(FFmpegDurationTest, MissingInputStopsTheRunAsAnExtractionPhaseFailure)
{
    TestDirectory directory;
    FFmpegAudioToolkit toolkit(makeToolConfig());
    Workspace workspace(directory.getChildFile("work"), "wav");
    SliceExtractor extractor(toolkit, workspace, 41, 44100);

    std::vector<WeaveTypes::Source> sources;
    const auto status = extractor.probeSources({ directory.getChildFile("a.wav"), directory.getChildFile("b.wav") },
                                               sources);

    EXPECT_EQ(status.code, ExitCode::extractionPhaseFailed);
    EXPECT_EQ(status.getExitCode(), 4);
}
