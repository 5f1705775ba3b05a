#pragma once
#include <JuceHeader.h>
#include "WeaveTypes.h"
#include "AudioToolkit.h"
#include "Workspace.h"
#include "SliceExtractor.h"
#include "Sequencer.h"
#include "ChunkedRenderer.h"
#include "../core/WeaveConfig.h"

/**
 * Runs one weave from start to finish.
 *
 * Stages run strictly one after another on the calling thread:
 *   check tools -> probe sources -> reset workspace -> slice -> weave
 *   -> render -> reset workspace
 * Each stage failure maps to its own exit code. Configuration and tool
 * problems stop the run before anything is written; later failures still
 * try to leave an empty workspace behind. An interrupt (see InterruptHandler)
 * is checked between stages and reported as ExitCode::interrupted.
 */
class WeaveManager
{
public:
    using WeaveState = WeaveTypes::WeaveState;

    WeaveManager(const WeaveConfig& config, AudioToolkit& toolkit);
    ~WeaveManager();

    /** Defaults to juce::Logger::writeToLog. */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Runs every stage and returns the first failure, or success. */
    WeaveTypes::WeaveStatus run();

    WeaveState getState() const { return state; }

    /** Slices that were rendered by the last successful weave, in order. */
    const WeaveTypes::SequencePlan& getSequencePlan() const { return sequencePlan; }

    const std::vector<WeaveTypes::Source>& getSources() const { return sources; }

private:
    WeaveTypes::WeaveStatus runStages();
    static WeaveTypes::WeaveStatus interruptedStatus();
    WeaveTypes::WeaveStatus fail(const WeaveTypes::WeaveStatus& status, bool attemptCleanup);

    void updateState(WeaveState newState, const juce::String& statusMessage);
    void log(const juce::String& message) const;
    void logSummary() const;

    juce::String getElapsedTimeString() const;

    WeaveConfig config;
    AudioToolkit& toolkit;

    Workspace workspace;
    SliceExtractor sliceExtractor;
    Sequencer sequencer;
    ChunkedRenderer renderer;

    std::vector<WeaveTypes::Source> sources;
    WeaveTypes::SequencePlan sequencePlan;
    WeaveTypes::SequenceStrategy strategy = WeaveTypes::SequenceStrategy::Standard;

    WeaveState state = WeaveState::Idle;
    juce::Time runStartTime;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WeaveManager)
};
