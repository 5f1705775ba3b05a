#include "InterruptHandler.h"

#include <atomic>
#include <csignal>

namespace
{
    std::atomic<bool> interruptRequested { false };

    void handleSignal(int signalNumber)
    {
        if (signalNumber == SIGINT || signalNumber == SIGTERM)
            interruptRequested.store(true);
    }
}

void InterruptHandler::install()
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

void InterruptHandler::requestInterrupt() noexcept
{
    interruptRequested.store(true);
}

bool InterruptHandler::isInterruptRequested() noexcept
{
    return interruptRequested.load();
}

void InterruptHandler::reset() noexcept
{
    interruptRequested.store(false);
}
