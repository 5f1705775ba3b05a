#pragma once
#include <JuceHeader.h>
#include "AudioToolkit.h"
#include "FFmpegExecutor.h"

struct WeaveConfig;

/**
 * AudioToolkit implemented on top of the ffmpeg and ffprobe command line tools.
 */
class FFmpegAudioToolkit : public AudioToolkit
{
public:
    /**
     * Creates a toolkit using the tool paths, timeout, channel count and log
     * directory from the run's configuration.
     */
    explicit FFmpegAudioToolkit(const WeaveConfig& config);
    ~FFmpegAudioToolkit() override;

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    bool isAvailable() override;

    bool probeDuration(const juce::File& source, double& durationSeconds) override;

    bool extractSlice(const juce::File& source,
                      const juce::File& destination,
                      int sampleRate,
                      double startSeconds,
                      double lengthSeconds) override;

    bool concatenate(const std::vector<juce::File>& orderedFiles,
                     const juce::File& destination) override;

    //==============================================================================
    /**
     * One line of an ffmpeg concat demuxer list: file '<path>', with single
     * quotes in the path escaped.
     */
    static juce::String formatConcatListEntry(const juce::File& file);

    /** Arguments that cut one window out of source and resample it. */
    juce::StringArray buildExtractCommand(const juce::File& source,
                                          const juce::File& destination,
                                          int sampleRate,
                                          double startSeconds,
                                          double lengthSeconds) const;

    /**
     * Arguments that join the files named in listFile. Streams are copied when
     * every input already has the destination's extension.
     */
    juce::StringArray buildConcatCommand(const juce::File& listFile,
                                         const std::vector<juce::File>& orderedFiles,
                                         const juce::File& destination) const;

private:
    std::unique_ptr<FFmpegExecutor> ffmpegExecutor;
    int channels;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegAudioToolkit)
};
