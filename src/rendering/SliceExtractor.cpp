#include "SliceExtractor.h"
#include "SliceDeriver.h"

using WeaveTypes::ExitCode;
using WeaveTypes::WeaveStatus;

SliceExtractor::SliceExtractor(AudioToolkit& toolkit, const Workspace& workspace, juce::int64 sliceMillis, int sampleRate)
    : toolkit(toolkit),
      workspace(workspace),
      sliceMillis(sliceMillis),
      sampleRate(sampleRate)
{
}

SliceExtractor::~SliceExtractor()
{
}

void SliceExtractor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

WeaveStatus SliceExtractor::probeSources(const std::vector<juce::File>& inputs,
                                         std::vector<WeaveTypes::Source>& sources)
{
    sources.clear();

    for (size_t i = 0; i < inputs.size(); ++i)
    {
        WeaveTypes::Source source;
        source.file = inputs[i];
        source.index = static_cast<int>(i);

        if (!toolkit.probeDuration(source.file, source.durationSeconds))
            return WeaveStatus::fail(ExitCode::probeToolFailed,
                                     "Could not read the duration of " + source.file.getFullPathName());

        if (source.durationSeconds <= 0.0)
            return WeaveStatus::fail(ExitCode::extractionPhaseFailed,
                                     "No usable duration for " + source.file.getFullPathName());

        if (logCallback)
            logCallback("Source " + juce::String(source.index) + ": " + source.file.getFileName()
                        + " (" + juce::String(source.durationSeconds, 3) + "s)");

        sources.push_back(source);
    }

    return WeaveStatus::ok();
}

WeaveStatus SliceExtractor::extractSource(const WeaveTypes::Source& source)
{
    const auto slices = SliceDeriver::deriveSlices(source.index, source.durationSeconds, sliceMillis);

    if (logCallback)
        logCallback("Slicing " + source.file.getFileName() + " into " + juce::String((int) slices.size())
                    + " slices of " + juce::String(sliceMillis) + " ms");

    if (slices.empty() && logCallback)
        logCallback("WARNING: " + source.file.getFileName() + " is shorter than one slice");

    for (const auto& slice : slices)
    {
        const juce::File destination = workspace.getExportFile(slice.sequenceIndex, slice.sourceIndex);

        if (!toolkit.extractSlice(source.file, destination, sampleRate, slice.startSeconds, slice.lengthSeconds))
            return WeaveStatus::fail(ExitCode::sliceExtractionFailed,
                                     "Failed to extract slice " + juce::String(slice.sequenceIndex)
                                         + " of " + source.file.getFileName());

        ++numExtracted;
    }

    return WeaveStatus::ok();
}

WeaveStatus SliceExtractor::extractAll(const std::vector<WeaveTypes::Source>& sources)
{
    for (const auto& source : sources)
    {
        const WeaveStatus status = extractSource(source);
        if (status.failed())
            return status;
    }

    if (logCallback)
        logCallback("Extracted " + juce::String(numExtracted) + " slices from " + juce::String((int) sources.size()) + " sources");

    return WeaveStatus::ok();
}
