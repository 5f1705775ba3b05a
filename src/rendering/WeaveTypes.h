#pragma once
#include <JuceHeader.h>

/**
 * Common types used across the slicing, weaving and rendering stages.
 * These types are shared by multiple components to ensure consistency.
 */
namespace WeaveTypes
{
    /** An input audio file and what we know about it */
    struct Source
    {
        juce::File file;
        double durationSeconds = 0.0;   // As reported by the audio toolkit
        int index = 0;                  // Position in the --input list
    };

    /** One extraction window for a source */
    struct SliceSpec
    {
        int sourceIndex = 0;
        int sequenceIndex = 0;          // Position within the source
        double startSeconds = 0.0;
        double lengthSeconds = 0.0;     // Always the nominal slice length
    };

    /** Per-source weights, one entry per input */
    using Pattern = std::vector<int>;

    /** Ordered list of staged slice files to render */
    using SequencePlan = std::vector<juce::File>;

    /** The three mutually exclusive ways of ordering slices */
    enum class SequenceStrategy
    {
        Standard,
        WeightedGrouped,
        Random
    };

    inline juce::String getStrategyName(SequenceStrategy strategy)
    {
        switch (strategy)
        {
            case SequenceStrategy::Standard:        return "standard";
            case SequenceStrategy::WeightedGrouped: return "weighted grouped";
            case SequenceStrategy::Random:          return "random";
        }

        return "unknown";
    }

    /** Where a run currently is */
    enum class WeaveState
    {
        Idle,
        Preparing,
        Slicing,
        Weaving,
        Rendering,
        CleaningUp,
        Completed,
        Failed
    };

    /** Process exit codes, one per failing stage */
    enum class ExitCode
    {
        success                = 0,
        tooFewInputs           = 1,
        missingOutput          = 2,
        sliceExtractionFailed  = 3,
        extractionPhaseFailed  = 4,
        weaveFailed            = 5,
        renderFailed           = 6,
        cleanupFailed          = 7,
        invalidConfiguration   = 8,
        renameFailed           = 10,
        probeToolFailed        = 11,
        toolNotInstalled       = 12,
        interrupted            = 130    // SIGINT or SIGTERM, as a shell reports it
    };

    /** Outcome of a stage or of a whole run */
    struct WeaveStatus
    {
        ExitCode code = ExitCode::success;
        juce::String message;

        bool wasOk() const noexcept     { return code == ExitCode::success; }
        bool failed() const noexcept    { return code != ExitCode::success; }
        int getExitCode() const noexcept { return static_cast<int>(code); }

        static WeaveStatus ok()         { return {}; }

        static WeaveStatus fail(ExitCode failureCode, const juce::String& failureMessage)
        {
            WeaveStatus status;
            status.code = failureCode;
            status.message = failureMessage;
            return status;
        }
    };
}
