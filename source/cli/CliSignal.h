#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for the ClassReview CLI.
 * 
 * Ctrl+C (and SIGTERM on Unix) sets a cancellation flag. Batches check it
 * before each document starts; the document in progress is finished so no
 * partial output is left behind.
 */

#include <atomic>

namespace Cli {

/**
 * @brief Install handlers for SIGINT/SIGTERM (Unix) or CTRL_C_EVENT (Windows).
 * 
 * Call once at CLI startup, before any batch operation.
 */
void installSignalHandlers();

/**
 * @brief Pointer to the cancellation flag (never null).
 */
std::atomic<bool>* getCancellationFlag();

/**
 * @brief Check if cancellation was requested.
 * 
 * Prints a one-time notice on stderr the first time it returns true.
 */
bool wasCancelled();

} // namespace Cli

#endif // CLISIGNAL_H
