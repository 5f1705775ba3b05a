#include "WeaveManager.h"
#include "SliceDeriver.h"
#include "../core/InterruptHandler.h"

using WeaveTypes::ExitCode;
using WeaveTypes::WeaveStatus;

WeaveManager::WeaveManager(const WeaveConfig& runConfig, AudioToolkit& toolkit)
    : config(runConfig),
      toolkit(toolkit),
      workspace(runConfig.tempDirectory, runConfig.sliceExtension),
      sliceExtractor(toolkit, workspace, runConfig.sliceMillis, runConfig.sampleRate),
      sequencer(workspace),
      renderer(toolkit, workspace, runConfig.partSize)
{
    setLogCallback([](const juce::String& message) { juce::Logger::writeToLog(message); });
}

WeaveManager::~WeaveManager()
{
}

void WeaveManager::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;

    workspace.setLogCallback(callback);
    sliceExtractor.setLogCallback(callback);
    sequencer.setLogCallback(callback);
    renderer.setLogCallback(callback);
}

void WeaveManager::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

void WeaveManager::updateState(WeaveState newState, const juce::String& statusMessage)
{
    state = newState;
    log(statusMessage);
}

WeaveStatus WeaveManager::run()
{
    runStartTime = juce::Time::getCurrentTime();
    sources.clear();
    sequencePlan.clear();

    log("=== WEAVE ===");
    log("Started at: " + runStartTime.toString(true, true));
    log("Output file: " + config.output.getFullPathName());
    log("Workspace: " + workspace.getRoot().getFullPathName());

    WeaveStatus status = runStages();

    // A tool killed by an interrupt shows up as a stage failure; report the cause instead
    if (status.failed() && InterruptHandler::isInterruptRequested())
        status = interruptedStatus();

    if (status.failed())
    {
        state = WeaveState::Failed;
        log("ERROR: " + status.message + " (exit code " + juce::String(status.getExitCode()) + ")");
        return status;
    }

    updateState(WeaveState::Completed, "Weave completed in " + getElapsedTimeString());
    logSummary();
    return status;
}

WeaveStatus WeaveManager::fail(const WeaveStatus& status, bool attemptCleanup)
{
    if (attemptCleanup)
    {
        // Best effort only; the original failure is what gets reported
        const juce::Result cleanup = workspace.reset();
        if (cleanup.failed())
            log("WARNING: Workspace cleanup after failure did not complete: " + cleanup.getErrorMessage());
    }

    return status;
}

WeaveStatus WeaveManager::interruptedStatus()
{
    return WeaveStatus::fail(ExitCode::interrupted, "Interrupted");
}

WeaveStatus WeaveManager::runStages()
{
    // Configuration and environment checks touch nothing on disk
    updateState(WeaveState::Preparing, "Checking configuration...");

    const WeaveStatus configStatus = config.validate();
    if (configStatus.failed())
        return configStatus;

    if (!toolkit.isAvailable())
        return WeaveStatus::fail(ExitCode::toolNotInstalled, "The audio toolkit (ffmpeg/ffprobe) is not installed");

    strategy = Sequencer::selectStrategy(config.pattern, config.random);

    // Probe before writing anything, so a bad input never leaves files behind
    const WeaveStatus probeStatus = sliceExtractor.probeSources(config.inputs, sources);
    if (probeStatus.failed())
        return probeStatus;

    const juce::Result prepared = workspace.reset();
    if (prepared.failed())
        return WeaveStatus::fail(ExitCode::extractionPhaseFailed, "Could not prepare workspace: " + prepared.getErrorMessage());

    updateState(WeaveState::Slicing, "Slicing " + juce::String((int) sources.size()) + " sources...");

    const WeaveStatus sliceStatus = sliceExtractor.extractAll(sources);
    if (sliceStatus.failed())
        return fail(sliceStatus, true);

    if (InterruptHandler::isInterruptRequested())
        return fail(interruptedStatus(), true);

    updateState(WeaveState::Weaving, "Weaving slices...");

    juce::Random random;
    if (config.hasRandomSeed)
        random.setSeed(config.randomSeed);
    else
        random.setSeedRandomly();

    const WeaveStatus weaveStatus = sequencer.weave(config.pattern, config.realtime, config.random, random, sequencePlan);
    if (weaveStatus.failed())
        return fail(weaveStatus, true);

    if (InterruptHandler::isInterruptRequested())
        return fail(interruptedStatus(), true);

    updateState(WeaveState::Rendering, "Rendering " + juce::String((int) sequencePlan.size()) + " slices...");

    if (!renderer.render(sequencePlan, config.output))
        return fail(WeaveStatus::fail(ExitCode::renderFailed, "Failed to render " + config.output.getFullPathName()), true);

    updateState(WeaveState::CleaningUp, "Cleaning up workspace...");

    const juce::Result cleaned = workspace.reset();
    if (cleaned.failed())
        return WeaveStatus::fail(ExitCode::cleanupFailed, "Could not reset workspace: " + cleaned.getErrorMessage());

    return WeaveStatus::ok();
}

void WeaveManager::logSummary() const
{
    log("=== SUMMARY ===");
    log("Sources: " + juce::String((int) sources.size()));

    for (const auto& source : sources)
        log("  " + juce::String(source.index) + ": " + source.file.getFileName() + " -> "
            + juce::String(SliceDeriver::countSlices(source.durationSeconds, config.sliceMillis)) + " slices");

    log("Strategy: " + WeaveTypes::getStrategyName(strategy) + (config.realtime ? " (realtime)" : ""));
    log("Slices rendered: " + juce::String((int) sequencePlan.size()) + ", dropped: " + juce::String(sequencer.getNumDropped()));
    log("Render parts: " + juce::String((int) renderer.getRenderParts().size()));
    log("Elapsed: " + getElapsedTimeString());
}

juce::String WeaveManager::getElapsedTimeString() const
{
    int seconds = static_cast<int>((juce::Time::getCurrentTime() - runStartTime).inSeconds());

    const int hours = seconds / 3600;
    seconds %= 3600;
    const int minutes = seconds / 60;
    seconds %= 60;

    juce::String result;

    if (hours > 0)
        result += juce::String(hours) + "h ";

    if (minutes > 0 || hours > 0)
        result += juce::String(minutes) + "m ";

    result += juce::String(seconds) + "s";

    return result;
}
