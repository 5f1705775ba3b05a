#pragma once
#include <JuceHeader.h>

//==============================================================================
/**
 * The external audio processing collaborator.
 *
 * Everything that touches sample data goes through this interface: probing,
 * trimming and resampling a window out of a source, and joining files. The
 * slicing, weaving and rendering code only decides which files go where.
 *
 * FFmpegAudioToolkit is the production implementation; tests provide their
 * own.
 */
class AudioToolkit
{
public:
    virtual ~AudioToolkit() = default;

    /** Returns true if the underlying tools are installed and respond. */
    virtual bool isAvailable() = 0;

    /**
     * Reads the duration of an audio file.
     * @param source          The file to inspect
     * @param durationSeconds Receives the duration, or 0 if none could be read
     * @return                false if the probe tool itself failed to run
     */
    virtual bool probeDuration(const juce::File& source, double& durationSeconds) = 0;

    /**
     * Writes one window of a source to a new file, resampled to sampleRate.
     * A window running past the end of the source is clamped by the tool.
     */
    virtual bool extractSlice(const juce::File& source,
                              const juce::File& destination,
                              int sampleRate,
                              double startSeconds,
                              double lengthSeconds) = 0;

    /** Joins files end to end, in order, into destination. */
    virtual bool concatenate(const std::vector<juce::File>& orderedFiles,
                             const juce::File& destination) = 0;
};
