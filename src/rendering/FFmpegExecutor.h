#pragma once
#include <JuceHeader.h>
#include "../core/InterruptHandler.h"

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * ffmpeg and ffprobe as child processes and collecting their results.
 *
 * The class handles:
 * - Command execution with an optional timeout
 * - Capturing tool output for probes and error reports
 * - Locating the ffmpeg/ffprobe executables
 * - Recording every command to a per-run log file
 */

/**
 * ############################################################################
 * # UTILITY CLASS: ProcessOutputReader
 * ############################################################################
 *
 * Drains a child process's output pipe on its own thread while the executor
 * polls for exit. A tool that prints more than the pipe can buffer would
 * otherwise block forever waiting for us to read.
 *
 * Tool output may contain non-ASCII file names. JUCE's String asserts when it
 * is built from 8-bit data above 127 without an encoding, so the collected
 * bytes are decoded as explicit UTF-8.
 */
class ProcessOutputReader : public juce::Thread
{
public:
    explicit ProcessOutputReader(juce::ChildProcess& processToRead)
        : juce::Thread("ProcessOutputReader"),
          process(processToRead)
    {
    }

    ~ProcessOutputReader() override
    {
        stopThread(2000);
    }

    void run() override
    {
        char buffer[4096];

        while (!threadShouldExit())
        {
            // Blocks until data arrives or the pipe is closed
            const int bytesRead = process.readProcessOutput(buffer, sizeof(buffer));
            if (bytesRead <= 0)
                break;

            const juce::ScopedLock sl(outputLock);
            collected.write(buffer, static_cast<size_t>(bytesRead));
        }
    }

    /** Everything read so far, decoded as UTF-8. */
    juce::String getOutput() const
    {
        const juce::ScopedLock sl(outputLock);
        return juce::String::fromUTF8(static_cast<const char*>(collected.getData()),
                                      static_cast<int>(collected.getDataSize()));
    }

private:
    juce::ChildProcess& process;
    juce::MemoryOutputStream collected;
    juce::CriticalSection outputLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProcessOutputReader)
};

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with ffmpeg as an external
 * process.
 *
 * Commands are passed as argument lists, so paths containing spaces or quotes
 * never need escaping. The executor runs one command at a time and blocks
 * until it exits, is cancelled, is interrupted by a signal, or exceeds the
 * configured timeout.
 *
 * @note This class doesn't interpret audio in any way - it only runs tools
 *       and reports results. FFmpegAudioToolkit builds the actual commands.
 */
class FFmpegExecutor
{
public:
    FFmpegExecutor();

    /**
     * Destructor - ensures any running process is killed.
     */
    ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with log messages.
     *
     * @param logCallback Function to be called with log messages as juce::String
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Overrides the executables to run. Empty strings restore the default
     * lookup (next to the application, then PATH).
     */
    void setToolPaths(const juce::String& ffmpegPath, const juce::String& ffprobePath);

    /**
     * Sets the longest a single command may run before it is killed and
     * reported as failed. Zero or negative disables the limit.
     */
    void setCommandTimeout(int timeoutMs) { commandTimeoutMs = timeoutMs; }

    /**
     * Sets the directory where an aggregate log of every command is recorded.
     * Passing an invalid file disables command logging.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Runs a command and waits for it to finish.
     *
     * @param arguments The executable followed by its arguments
     * @return          true if the process ran and exited with code 0
     */
    bool executeCommand(const juce::StringArray& arguments);

    /**
     * Runs a command and captures its standard output.
     *
     * @param arguments The executable followed by its arguments
     * @param output    Receives everything the process printed
     * @return          true if the process ran and exited with code 0
     */
    bool executeCommandAndGetOutput(const juce::StringArray& arguments, juce::String& output);

    /**
     * Cancels the currently running process.
     */
    void cancelExecution();

    /**
     * Gets the path to the ffmpeg executable.
     */
    juce::String getFFmpegPath() const;

    /**
     * Gets the path to the ffprobe executable.
     */
    juce::String getFFprobePath() const;

    /**
     * Checks that both ffmpeg and ffprobe start and answer -version.
     */
    bool checkFFmpegAvailability();

    /**
     * Gets the duration of a media file in seconds using ffprobe.
     *
     * @param file            The file to check
     * @param durationSeconds Receives the duration, or 0 if the file is missing
     *                        or ffprobe reported none
     * @return                false if ffprobe could not be run or failed
     */
    bool getFileDuration(const juce::File& file, double& durationSeconds);

private:
    bool runProcess(const juce::StringArray& arguments, juce::String& output);
    void writeToAggregateLog(const juce::String& message);

    static juce::String findTool(const juce::String& name);

    /** The active child process being monitored */
    std::unique_ptr<juce::ChildProcess> activeProcess;

    /** Flag to indicate if the current process should be cancelled */
    std::atomic<bool> shouldCancel;

    int commandTimeoutMs = -1;

    juce::String ffmpegOverride;
    juce::String ffprobeOverride;

    /** Callback function for reporting log messages */
    std::function<void(const juce::String&)> logCallback;

    //==========================================================================
    // Logging helpers
    juce::CriticalSection logDirectoryLock;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};
