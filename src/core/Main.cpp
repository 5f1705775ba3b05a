/*
  ==============================================================================
    Main.cpp - Application Entry Point
  ==============================================================================
*/

#include <JuceHeader.h>
#include "InterruptHandler.h"
#include "SessionLogger.h"
#include "WeaveConfig.h"
#include "../rendering/FFmpegAudioToolkit.h"
#include "../rendering/WeaveManager.h"

namespace
{
    // Installs a logger for the lifetime of the scope, including when fail() throws
    class ScopedCurrentLogger
    {
    public:
        explicit ScopedCurrentLogger(juce::Logger* logger)  { juce::Logger::setCurrentLogger(logger); }
        ~ScopedCurrentLogger()                              { juce::Logger::setCurrentLogger(nullptr); }
    };

    void runWeave(const juce::ArgumentList& args)
    {
        WeaveConfig config;
        const WeaveTypes::WeaveStatus parsed = WeaveConfig::fromArguments(args, config);

        if (parsed.failed())
            juce::ConsoleApplication::fail(parsed.message + "\n\n" + WeaveConfig::getUsage(), parsed.getExitCode());

        SessionLogger logger(SessionLogger::createSessionLogFile(config.logDirectory));
        ScopedCurrentLogger scopedLogger(&logger);

        juce::Logger::writeToLog("----------------------------------------------------");
        juce::Logger::writeToLog(juce::String(ProjectInfo::projectName) + " " + ProjectInfo::versionString
                                 + " started: " + juce::Time::getCurrentTime().toString(true, true));
        if (logger.isWritingToFile())
            juce::Logger::writeToLog("Session log: " + logger.getLogFile().getFullPathName());
        juce::Logger::writeToLog("----------------------------------------------------");

        InterruptHandler::install();

        FFmpegAudioToolkit toolkit(config);
        toolkit.setLogCallback([](const juce::String& message) { juce::Logger::writeToLog(message); });

        WeaveManager manager(config, toolkit);
        const WeaveTypes::WeaveStatus status = manager.run();

        if (status.failed())
            juce::ConsoleApplication::fail(status.message, status.getExitCode());

        juce::Logger::writeToLog("Wrote " + config.output.getFullPathName());
    }
}

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", WeaveConfig::getUsage(), false);
    app.addVersionCommand("--version", juce::String(ProjectInfo::projectName) + " " + ProjectInfo::versionString);

    app.addDefaultCommand({ "",
                            "--input a:b --output path [options]",
                            "Slices the inputs, weaves the slices and renders one track",
                            {},
                            runWeave });

    return app.findAndRunCommand(argc, argv);
}
