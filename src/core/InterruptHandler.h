#pragma once
#include <JuceHeader.h>

/**
 * Turns SIGINT and SIGTERM into a flag the run can poll.
 *
 * The executor kills whatever tool is running as soon as the flag is set, and
 * WeaveManager stops between stages, so an interrupted run still empties its
 * workspace before the process exits.
 */
class InterruptHandler
{
public:
    /** Routes SIGINT and SIGTERM to requestInterrupt(). */
    static void install();

    /** Marks the run as interrupted. Safe to call from a signal handler. */
    static void requestInterrupt() noexcept;

    static bool isInterruptRequested() noexcept;

    /** Clears the flag for the next run. */
    static void reset() noexcept;

private:
    InterruptHandler() = delete;
};
