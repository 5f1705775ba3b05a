#pragma once
#include <JuceHeader.h>
#include "WeaveTypes.h"
#include "AudioToolkit.h"
#include "Workspace.h"

/**
 * Joins the woven slices into the output file.
 *
 * Plans of up to partSize slices are joined directly. Larger plans are joined
 * in consecutive chunks of partSize into render_part_<index> files, and the
 * parts are then joined into the output. There are exactly two levels; plans
 * longer than partSize * partSize still produce a single second-level join.
 */
class ChunkedRenderer
{
public:
    static constexpr int defaultPartSize = 500;

    ChunkedRenderer(AudioToolkit& toolkit, const Workspace& workspace, int partSize = defaultPartSize);
    ~ChunkedRenderer();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Splits a plan into consecutive chunks of at most partSize slices. */
    static std::vector<WeaveTypes::SequencePlan> partition(const WeaveTypes::SequencePlan& plan, int partSize);

    /**
     * Renders the plan into outputFile.
     * @return true if every join succeeded and the output exists
     */
    bool render(const WeaveTypes::SequencePlan& plan, const juce::File& outputFile);

    /** Intermediate files written by the last render, empty for a direct join. */
    const std::vector<juce::File>& getRenderParts() const { return renderParts; }

private:
    AudioToolkit& toolkit;
    const Workspace& workspace;
    int partSize;
    std::vector<juce::File> renderParts;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ChunkedRenderer)
};
