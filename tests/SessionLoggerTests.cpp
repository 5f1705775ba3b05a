#include <gtest/gtest.h>

#include "TestHelpers.h"
#include "core/SessionLogger.h"

TEST(SessionLoggerTest, SessionFileIsNamedAfterTheRun)
{
    TestDirectory directory;
    const juce::File logDirectory = directory.getChildFile("logs");

    const juce::File logFile = SessionLogger::createSessionLogFile(logDirectory);

    EXPECT_TRUE(logDirectory.isDirectory());
    EXPECT_EQ(logFile.getParentDirectory(), logDirectory);
    EXPECT_TRUE(logFile.getFileName().startsWith("SliceWeave_"));
    EXPECT_TRUE(logFile.hasFileExtension(".log"));
}

TEST(SessionLoggerTest, NoDirectoryMeansConsoleOnly)
{
    EXPECT_EQ(SessionLogger::createSessionLogFile(juce::File()), juce::File());

    SessionLogger logger { juce::File() };
    EXPECT_FALSE(logger.isWritingToFile());
    EXPECT_EQ(logger.getLogFile(), juce::File());
}

TEST(SessionLoggerTest, MessagesReachTheSessionFile)
{
    TestDirectory directory;
    const juce::File logFile = directory.getChildFile("session.log");

    {
        SessionLogger logger(logFile);
        ASSERT_TRUE(logger.isWritingToFile());
        EXPECT_EQ(logger.getLogFile(), logFile);

        logger.logMessage("WARNING: first message");
        logger.logMessage("second message");
    }

    const juce::String contents = logFile.loadFileAsString();
    EXPECT_TRUE(contents.contains("SliceWeave Session Log"));
    EXPECT_TRUE(contents.contains("WARNING: first message"));
    EXPECT_LT(contents.indexOf("first message"), contents.indexOf("second message"));
}
