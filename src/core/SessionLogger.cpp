#include "SessionLogger.h"

#include <iostream>

SessionLogger::SessionLogger(const juce::File& logFile)
{
    if (logFile != juce::File())
        fileLogger.reset(new juce::FileLogger(logFile, "SliceWeave Session Log", 0));
}

SessionLogger::~SessionLogger()
{
}

juce::File SessionLogger::createSessionLogFile(const juce::File& logDirectory)
{
    if (logDirectory == juce::File())
        return {};

    if (!logDirectory.isDirectory() && logDirectory.createDirectory().failed())
        return {};

    const juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    return logDirectory.getChildFile("SliceWeave_" + sessionStamp + ".log");
}

juce::File SessionLogger::getLogFile() const
{
    return fileLogger != nullptr ? fileLogger->getLogFile() : juce::File();
}

void SessionLogger::logMessage(const juce::String& message)
{
    std::cout << message << std::endl;

    if (fileLogger != nullptr)
        fileLogger->logMessage(message);
}
