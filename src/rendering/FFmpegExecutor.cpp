//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which runs ffmpeg and
 * ffprobe as external processes and reports how they exited.
 *
 * Output is drained by a ProcessOutputReader thread while the monitoring loop
 * polls for exit, so cancellation, interrupts and the timeout are checked
 * every 50 ms no matter how much or how little the tool prints.
 */

#include "FFmpegExecutor.h"

namespace
{
    // Keeps error reports readable when a tool dumps a lot of text
    juce::String tailOf(const juce::String& text, int maxLength = 600)
    {
        const juce::String trimmed = text.trim();
        if (trimmed.length() <= maxLength)
            return trimmed;

        return "..." + trimmed.substring(trimmed.length() - maxLength);
    }
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor()
    : shouldCancel(false)
{
}

//==============================================================================
FFmpegExecutor::~FFmpegExecutor()
{
    // Make sure any running processes are terminated when this object is destroyed
    cancelExecution();
}

//==============================================================================
void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void FFmpegExecutor::setToolPaths(const juce::String& ffmpegPath, const juce::String& ffprobePath)
{
    ffmpegOverride = ffmpegPath.trim();
    ffprobeOverride = ffprobePath.trim();
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && directory.createDirectory().failed())
        return;

    sessionAggregateLogFile = directory.getChildFile("ffmpeg.log");
    if (sessionAggregateLogFile.existsAsFile())
        sessionAggregateLogFile.deleteFile();

    sessionLoggingEnabled = directory.isDirectory();
}

//==============================================================================
void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
bool FFmpegExecutor::runProcess(const juce::StringArray& arguments, juce::String& output)
{
    output = juce::String();

    if (arguments.isEmpty())
        return false;

    const juce::String commandLine = arguments.joinIntoString(" ");
    const juce::String commandIndexLabel = juce::String::formatted("#%05d", ++sessionCommandIndex);

    writeToAggregateLog(commandIndexLabel + " [" + juce::Time::getCurrentTime().toString(true, true) + "] START " + commandLine);

    activeProcess = std::make_unique<juce::ChildProcess>();
    shouldCancel.store(false);

    if (!activeProcess->start(arguments, juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr))
    {
        writeToAggregateLog(commandIndexLabel + " START_FAILED");
        if (logCallback)
            logCallback("ERROR: Failed to start " + arguments[0]);
        activeProcess.reset();
        return false;
    }

    auto reader = std::make_unique<ProcessOutputReader>(*activeProcess);
    reader->startThread();

    const juce::uint32 startMs = juce::Time::getMillisecondCounter();

    // Killing the process closes its pipe, which lets the reader finish
    auto abandonProcess = [this, &reader](const juce::String& reason)
    {
        activeProcess->kill();
        reader->stopThread(2000);
        reader.reset();
        activeProcess.reset();
        writeToAggregateLog(reason);
    };

    // Main process monitoring loop
    while (!activeProcess->waitForProcessToFinish(50))
    {
        if (shouldCancel.load())
        {
            abandonProcess(commandIndexLabel + " CANCELLED");
            return false;
        }

        if (InterruptHandler::isInterruptRequested())
        {
            abandonProcess(commandIndexLabel + " INTERRUPTED");
            if (logCallback)
                logCallback("WARNING: Interrupted while running " + arguments[0]);
            return false;
        }

        if (commandTimeoutMs > 0
            && juce::Time::getMillisecondCounter() - startMs > static_cast<juce::uint32>(commandTimeoutMs))
        {
            abandonProcess(commandIndexLabel + " TIMED_OUT after " + juce::String(commandTimeoutMs) + " ms");
            if (logCallback)
                logCallback("ERROR: Command timed out after " + juce::String(commandTimeoutMs) + " ms: " + commandLine);
            return false;
        }
    }

    // The pipe reaches end of file once the process has exited
    reader->waitForThreadToExit(5000);
    reader->stopThread(1000);
    output = reader->getOutput();
    reader.reset();

    const juce::uint32 exitCode = activeProcess->getExitCode();
    activeProcess.reset();

    writeToAggregateLog(commandIndexLabel + " [" + juce::Time::getCurrentTime().toString(true, true)
                        + "] END exitCode=" + juce::String(static_cast<int>(exitCode)));

    if (exitCode != 0)
    {
        writeToAggregateLog(tailOf(output));

        if (logCallback)
        {
            logCallback("ERROR: " + arguments[0] + " failed (exit code: " + juce::String(static_cast<int>(exitCode)) + ")");
            if (output.isNotEmpty())
                logCallback("  " + tailOf(output));
        }
        return false;
    }

    return true;
}

bool FFmpegExecutor::executeCommand(const juce::StringArray& arguments)
{
    juce::String output;
    return runProcess(arguments, output);
}

bool FFmpegExecutor::executeCommandAndGetOutput(const juce::StringArray& arguments, juce::String& output)
{
    return runProcess(arguments, output);
}

//==============================================================================
void FFmpegExecutor::cancelExecution()
{
    shouldCancel.store(true);

    if (activeProcess != nullptr && activeProcess->isRunning())
        activeProcess->kill();
}

//==============================================================================
juce::String FFmpegExecutor::findTool(const juce::String& name)
{
   #if JUCE_WINDOWS
    const juce::String executableName = name + ".exe";
   #else
    const juce::String executableName = name;
   #endif

    // Prefer a copy shipped next to the executable
    juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
    juce::File localTool = appDir.getChildFile(executableName);
    if (localTool.existsAsFile())
        return localTool.getFullPathName();

    // Fallback to system PATH
    return executableName;
}

juce::String FFmpegExecutor::getFFmpegPath() const
{
    return ffmpegOverride.isNotEmpty() ? ffmpegOverride : findTool("ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    return ffprobeOverride.isNotEmpty() ? ffprobeOverride : findTool("ffprobe");
}

//==============================================================================
bool FFmpegExecutor::checkFFmpegAvailability()
{
    for (const auto& tool : { getFFmpegPath(), getFFprobePath() })
    {
        juce::String output;
        if (!executeCommandAndGetOutput(juce::StringArray(tool, "-hide_banner", "-version"), output))
        {
            if (logCallback)
                logCallback("ERROR: " + tool + " is not installed or does not run");
            return false;
        }
    }

    return true;
}

//==============================================================================
bool FFmpegExecutor::getFileDuration(const juce::File& file, double& durationSeconds)
{
    durationSeconds = 0.0;

    // A missing input is a bad source, not a broken prober
    if (!file.existsAsFile())
    {
        if (logCallback)
            logCallback("ERROR: Input file not found: " + file.getFullPathName());
        return true;
    }

    juce::String output;
    const juce::StringArray command { getFFprobePath(),
                                      "-v", "error",
                                      "-show_entries", "format=duration",
                                      "-of", "default=noprint_wrappers=1:nokey=1",
                                      file.getFullPathName() };

    if (!executeCommandAndGetOutput(command, output))
        return false;

    const double duration = output.trim().getDoubleValue();
    durationSeconds = (std::isfinite(duration) && duration > 0.0) ? duration : 0.0;
    return true;
}
