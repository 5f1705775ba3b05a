#pragma once
#include <JuceHeader.h>
#include "../rendering/WeaveTypes.h"

/**
 * Settings for one run. Parsed once from the command line and handed to each
 * component that needs it; nothing here is global.
 */
struct WeaveConfig
{
    std::vector<juce::File> inputs;
    juce::File output;
    WeaveTypes::Pattern pattern;

    bool realtime = false;
    bool random = false;

    juce::File tempDirectory;
    juce::int64 sliceMillis = 41;       // floor(1000 / 24 fps)
    int sampleRate = 44100;
    int channels = 2;
    int partSize = 500;
    juce::String sliceExtension = "wav";

    juce::String ffmpegPath;            // Empty means look beside the executable, then PATH
    juce::String ffprobePath;
    int commandTimeoutMs = -1;          // <= 0 waits forever

    bool hasRandomSeed = false;
    juce::int64 randomSeed = 0;

    juce::File logDirectory;            // Empty means console only

    /** Default staging directory under the system temp folder. */
    static juce::File getDefaultTempDirectory();

    /** Converts a frame rate to a slice length, rounding down. */
    static juce::int64 sliceMillisForFps(double fps);

    /**
     * Fills a config from command line arguments.
     * The returned status carries the exit code of the first problem found.
     */
    static WeaveTypes::WeaveStatus fromArguments(const juce::ArgumentList& args, WeaveConfig& config);

    /** Checks the invariants that must hold before any file is touched. */
    WeaveTypes::WeaveStatus validate() const;

    /** Usage text printed by --help. */
    static juce::String getUsage();
};
