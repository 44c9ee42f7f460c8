#include "CliSignal.h"

#include <QTextStream>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <csignal>
#endif

/**
 * @file CliSignal.cpp
 * @brief Implementation of signal handling for CLI.
 * 
 * @see CliSignal.h for API documentation
 */

namespace Cli {

static std::atomic<bool> g_cancelled(false);
static std::atomic<bool> g_cancelNoticePrinted(false);

#ifdef Q_OS_WIN

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType)
{
    if (ctrlType == CTRL_C_EVENT || ctrlType == CTRL_BREAK_EVENT) {
        g_cancelled = true;
        return TRUE;
    }
    // Close, logoff and shutdown keep the default handling
    return FALSE;
}

void installSignalHandlers()
{
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
}

#else

// Async-signal-safe: only touches the atomic flag
static void cancelHandler(int signal)
{
    (void)signal;
    g_cancelled = true;
}

void installSignalHandlers()
{
    struct sigaction sa;
    sa.sa_handler = cancelHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

#endif

std::atomic<bool>* getCancellationFlag()
{
    return &g_cancelled;
}

bool wasCancelled()
{
    if (!g_cancelled.load()) {
        return false;
    }
    
    if (!g_cancelNoticePrinted.exchange(true)) {
        QTextStream err(stderr);
        err << "Cancelled. Remaining documents were skipped.\n";
        err.flush();
    }
    return true;
}

} // namespace Cli
