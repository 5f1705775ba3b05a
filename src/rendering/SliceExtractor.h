#pragma once
#include <JuceHeader.h>
#include "WeaveTypes.h"
#include "AudioToolkit.h"
#include "Workspace.h"

/**
 * Turns each source into a run of equally long slice files in the workspace.
 *
 * For every source: probe the duration, derive the windows, and ask the
 * toolkit to extract each one to export-<index>_<source>.<ext>. Sources are
 * processed one after another; everything is on disk when extractAll returns.
 */
class SliceExtractor
{
public:
    /**
     * @param toolkit     Collaborator that does the actual decoding
     * @param workspace   Where the slice files are written
     * @param sliceMillis Slice length in milliseconds
     * @param sampleRate  Rate every slice is resampled to
     */
    SliceExtractor(AudioToolkit& toolkit, const Workspace& workspace, juce::int64 sliceMillis, int sampleRate);
    ~SliceExtractor();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Probes the duration of every input.
     * Fails with probeToolFailed if the prober could not run, and with
     * extractionPhaseFailed if a source has no usable duration.
     */
    WeaveTypes::WeaveStatus probeSources(const std::vector<juce::File>& inputs,
                                         std::vector<WeaveTypes::Source>& sources);

    /** Extracts every window of one source. */
    WeaveTypes::WeaveStatus extractSource(const WeaveTypes::Source& source);

    /** Extracts every source in input order. */
    WeaveTypes::WeaveStatus extractAll(const std::vector<WeaveTypes::Source>& sources);

    /** Total number of slice files written so far. */
    int getNumExtracted() const { return numExtracted; }

private:
    AudioToolkit& toolkit;
    const Workspace& workspace;
    juce::int64 sliceMillis;
    int sampleRate;
    int numExtracted = 0;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SliceExtractor)
};
