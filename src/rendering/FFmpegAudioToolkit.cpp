#include "FFmpegAudioToolkit.h"
#include "../core/WeaveConfig.h"

namespace
{
    juce::String formatSeconds(double seconds)
    {
        // Fixed precision, never scientific notation
        return juce::String(seconds, 3);
    }
}

FFmpegAudioToolkit::FFmpegAudioToolkit(const WeaveConfig& config)
    : ffmpegExecutor(std::make_unique<FFmpegExecutor>()),
      channels(config.channels)
{
    ffmpegExecutor->setToolPaths(config.ffmpegPath, config.ffprobePath);
    ffmpegExecutor->setCommandTimeout(config.commandTimeoutMs);

    if (config.logDirectory != juce::File())
        ffmpegExecutor->setSessionLogDirectory(config.logDirectory);
}

FFmpegAudioToolkit::~FFmpegAudioToolkit()
{
}

void FFmpegAudioToolkit::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
    ffmpegExecutor->setLogCallback(callback);
}

bool FFmpegAudioToolkit::isAvailable()
{
    return ffmpegExecutor->checkFFmpegAvailability();
}

bool FFmpegAudioToolkit::probeDuration(const juce::File& source, double& durationSeconds)
{
    return ffmpegExecutor->getFileDuration(source, durationSeconds);
}

bool FFmpegAudioToolkit::extractSlice(const juce::File& source,
                                      const juce::File& destination,
                                      int sampleRate,
                                      double startSeconds,
                                      double lengthSeconds)
{
    if (lengthSeconds <= 0.0)
    {
        if (logCallback)
            logCallback("ERROR: Invalid slice length: " + juce::String(lengthSeconds));
        return false;
    }

    const juce::StringArray command = buildExtractCommand(source, destination, sampleRate, startSeconds, lengthSeconds);

    if (!ffmpegExecutor->executeCommand(command))
    {
        if (logCallback)
            logCallback("ERROR: Failed to extract " + formatSeconds(startSeconds) + "s from " + source.getFileName());
        return false;
    }

    return destination.existsAsFile();
}

bool FFmpegAudioToolkit::concatenate(const std::vector<juce::File>& orderedFiles,
                                     const juce::File& destination)
{
    if (orderedFiles.empty())
    {
        if (logCallback)
            logCallback("ERROR: Nothing to concatenate into " + destination.getFileName());
        return false;
    }

    // The list lives outside the workspace and is removed when this goes out of scope
    juce::TemporaryFile listFile(".txt");

    {
        juce::FileOutputStream listStream(listFile.getFile());
        if (!listStream.openedOk())
        {
            if (logCallback)
                logCallback("ERROR: Failed to create concat list " + listFile.getFile().getFullPathName());
            return false;
        }

        for (const auto& file : orderedFiles)
            listStream.writeText(formatConcatListEntry(file) + "\n", false, false, nullptr);

        listStream.flush();
    }

    const juce::StringArray command = buildConcatCommand(listFile.getFile(), orderedFiles, destination);

    if (!ffmpegExecutor->executeCommand(command))
    {
        if (logCallback)
            logCallback("ERROR: Failed to concatenate " + juce::String((int) orderedFiles.size())
                        + " files into " + destination.getFileName());
        return false;
    }

    return destination.existsAsFile();
}

//==============================================================================
juce::String FFmpegAudioToolkit::formatConcatListEntry(const juce::File& file)
{
    juce::String path = file.getFullPathName();

   #if JUCE_WINDOWS
    path = path.replace("\\", "/");
   #endif

    // Inside single quotes only the quote itself needs escaping, as '\''
    return "file '" + path.replace("'", "'\\''") + "'";
}

juce::StringArray FFmpegAudioToolkit::buildExtractCommand(const juce::File& source,
                                                          const juce::File& destination,
                                                          int sampleRate,
                                                          double startSeconds,
                                                          double lengthSeconds) const
{
    juce::StringArray command;
    command.add(ffmpegExecutor->getFFmpegPath());
    command.addArray(juce::StringArray("-hide_banner", "-nostdin", "-loglevel", "error", "-y"));

    // Input seeking; -t past the end of the source is clamped by ffmpeg
    if (startSeconds > 0.0)
        command.addArray(juce::StringArray("-ss", formatSeconds(startSeconds)));

    command.addArray(juce::StringArray("-t", formatSeconds(lengthSeconds)));
    command.addArray(juce::StringArray("-i", source.getFullPathName()));
    command.addArray(juce::StringArray("-vn", "-ar", juce::String(sampleRate), "-ac", juce::String(channels)));
    command.add(destination.getFullPathName());

    return command;
}

juce::StringArray FFmpegAudioToolkit::buildConcatCommand(const juce::File& listFile,
                                                         const std::vector<juce::File>& orderedFiles,
                                                         const juce::File& destination) const
{
    bool sameContainer = true;
    for (const auto& file : orderedFiles)
        sameContainer = sameContainer && file.hasFileExtension(destination.getFileExtension());

    juce::StringArray command;
    command.add(ffmpegExecutor->getFFmpegPath());
    command.addArray(juce::StringArray("-hide_banner", "-nostdin", "-loglevel", "error", "-y"));
    command.addArray(juce::StringArray("-f", "concat", "-safe", "0", "-i", listFile.getFullPathName()));

    // Stream copy is only safe when nothing needs re-encoding
    if (sameContainer)
        command.addArray(juce::StringArray("-c", "copy"));

    command.add(destination.getFullPathName());

    return command;
}
