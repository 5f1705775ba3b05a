#pragma once
#include <JuceHeader.h>
#include "WeaveTypes.h"

/**
 * Computes the extraction windows for a source.
 *
 * Arithmetic is done on whole milliseconds. The count is
 * floor(durationMillis / sliceMillis); a trailing fragment shorter than a
 * slice is dropped rather than emitted short. Every window has the nominal
 * slice length, so the last one may run past the end of the source and
 * relies on the toolkit clamping it.
 */
namespace SliceDeriver
{
    /** Converts seconds to whole milliseconds, rounding down. */
    juce::int64 toMillis(double seconds);

    /** Number of whole slices of sliceMillis that fit in durationSeconds. */
    int countSlices(double durationSeconds, juce::int64 sliceMillis);

    /**
     * Returns the ordered windows for a source.
     * @param sourceIndex     Index of the source in the input list
     * @param durationSeconds Duration of the source
     * @param sliceMillis     Slice length in milliseconds, must be > 0
     * @return                Contiguous windows with offset i * sliceLength,
     *                        or an empty list if sliceMillis <= 0
     */
    std::vector<WeaveTypes::SliceSpec> deriveSlices(int sourceIndex,
                                                    double durationSeconds,
                                                    juce::int64 sliceMillis);
}
