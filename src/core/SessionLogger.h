#pragma once
#include <JuceHeader.h>

/**
 * Logger for a command line session: every message is echoed to stdout and,
 * when a log file is given, also handed to a juce::FileLogger.
 */
class SessionLogger : public juce::Logger
{
public:
    /**
     * @param logFile Destination file, or juce::File() for console only
     */
    explicit SessionLogger(const juce::File& logFile);
    ~SessionLogger() override;

    /** Creates logDirectory/SliceWeave_<yyyymmdd_hhmmss>.log, or returns juce::File() on failure. */
    static juce::File createSessionLogFile(const juce::File& logDirectory);

    bool isWritingToFile() const { return fileLogger != nullptr; }

    /** The session file, or juce::File() when logging to the console only. */
    juce::File getLogFile() const;

    void logMessage(const juce::String& message) override;

private:
    std::unique_ptr<juce::FileLogger> fileLogger;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionLogger)
};
