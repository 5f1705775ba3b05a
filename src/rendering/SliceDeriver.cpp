#include "SliceDeriver.h"

namespace SliceDeriver
{
    juce::int64 toMillis(double seconds)
    {
        if (!std::isfinite(seconds) || seconds <= 0.0)
            return 0;

        // The epsilon absorbs values like 1.9999999 coming back from the prober
        return static_cast<juce::int64>(std::floor(seconds * 1000.0 + 1.0e-6));
    }

    int countSlices(double durationSeconds, juce::int64 sliceMillis)
    {
        if (sliceMillis <= 0)
            return 0;

        return static_cast<int>(toMillis(durationSeconds) / sliceMillis);
    }

    std::vector<WeaveTypes::SliceSpec> deriveSlices(int sourceIndex,
                                                    double durationSeconds,
                                                    juce::int64 sliceMillis)
    {
        std::vector<WeaveTypes::SliceSpec> slices;

        const int count = countSlices(durationSeconds, sliceMillis);
        if (count <= 0)
            return slices;

        slices.reserve(static_cast<size_t>(count));

        for (int i = 0; i < count; ++i)
        {
            WeaveTypes::SliceSpec spec;
            spec.sourceIndex = sourceIndex;
            spec.sequenceIndex = i;
            spec.startSeconds = static_cast<double>(i * sliceMillis) / 1000.0;
            spec.lengthSeconds = static_cast<double>(sliceMillis) / 1000.0;
            slices.push_back(spec);
        }

        return slices;
    }
}
