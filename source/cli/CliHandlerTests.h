#ifndef CLIHANDLERTESTS_H
#define CLIHANDLERTESTS_H

/**
 * @file CliHandlerTests.h
 * @brief Exit code mapping of the ClassReview CLI.
 * 
 * Run with: classreview --test-cli
 */

#include "CliHandler.h"

#include <QDebug>

namespace CliHandlerTests {

inline BatchOps::FileResult fileResult(BatchOps::FileStatus status, ErrorKind error = ErrorKind::None)
{
    BatchOps::FileResult result;
    result.status = status;
    result.error = error;
    return result;
}

inline bool testBuildExitCodes()
{
    qDebug() << "=== Test: Build Exit Codes ===";

    bool success = true;
    const auto expect = [&success](int actual, int expected, const char* what) {
        if (actual != expected) {
            qDebug() << "FAIL:" << what << "gave" << actual << "expected" << expected;
            success = false;
        }
    };

    using BatchOps::FileStatus;
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Success)), Cli::ExitCode::Success, "success");
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Error, ErrorKind::InvalidInput)),
           Cli::ExitCode::InvalidArgs, "invalid input");
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Error, ErrorKind::Io)),
           Cli::ExitCode::IoError, "io error");
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Error, ErrorKind::Internal)),
           Cli::ExitCode::TotalFailure, "internal error");
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Skipped)),
           Cli::ExitCode::PartialFailure, "skipped");

    // Ctrl+C during a build that still completed keeps the document
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Success), true),
           Cli::ExitCode::Success, "success after interrupt");
    expect(Cli::exitCodeFromBuild(fileResult(FileStatus::Error, ErrorKind::Io), true),
           Cli::ExitCode::Cancelled, "failure after interrupt");

    if (success) {
        qDebug() << "PASS: Build exit codes";
    }
    return success;
}

inline bool testBatchExitCodes()
{
    qDebug() << "=== Test: Batch Exit Codes ===";

    bool success = true;

    BatchOps::BatchResult empty;
    if (Cli::exitCodeFromResult(empty) != Cli::ExitCode::InvalidArgs) {
        qDebug() << "FAIL: empty batch";
        success = false;
    }

    BatchOps::BatchResult allGood;
    allGood.successCount = 2;
    allGood.skippedCount = 1;
    if (Cli::exitCodeFromResult(allGood) != Cli::ExitCode::Success) {
        qDebug() << "FAIL: successful batch with a skip";
        success = false;
    }

    BatchOps::BatchResult partial;
    partial.successCount = 1;
    partial.errorCount = 1;
    if (Cli::exitCodeFromResult(partial) != Cli::ExitCode::PartialFailure) {
        qDebug() << "FAIL: partial failure";
        success = false;
    }

    BatchOps::BatchResult allBad;
    allBad.errorCount = 3;
    if (Cli::exitCodeFromResult(allBad) != Cli::ExitCode::TotalFailure) {
        qDebug() << "FAIL: total failure";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Batch exit codes";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running CLI Handler Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testBuildExitCodes();
    allPass &= testBatchExitCodes();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace CliHandlerTests

#endif // CLIHANDLERTESTS_H
