#include "CliProgress.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLocale>

/**
 * @file CliProgress.cpp
 * @brief Implementation of console progress reporter.
 * 
 * @see CliProgress.h for API documentation
 */

namespace Cli {

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

void ConsoleProgress::writeJson(QTextStream& stream, const QJsonObject& object)
{
    stream << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << "\n";
    stream.flush();
}

// =============================================================================
// Progress Callback
// =============================================================================

BatchOps::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& currentFile, const QString& status) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        
        // "    2/5  IMG_0042.jpg  Composing page..."
        m_out << QStringLiteral("    %1/%2  %3  %4\n")
                 .arg(current)
                 .arg(total)
                 .arg(QFileInfo(currentFile).fileName(), status);
        m_out.flush();
    };
}

// =============================================================================
// File Result Reporting
// =============================================================================

QString ConsoleProgress::statusText(const BatchOps::FileResult& result)
{
    switch (result.status) {
        case BatchOps::FileStatus::Success:
            if (result.pagesProcessed == 1) {
                return QCoreApplication::translate("CLI", "OK (1 page)");
            }
            return QCoreApplication::translate("CLI", "OK (%1 pages)").arg(result.pagesProcessed);
        case BatchOps::FileStatus::Skipped:
            return QCoreApplication::translate("CLI", "SKIPPED (%1)").arg(result.message);
        case BatchOps::FileStatus::Error:
            break;
    }
    return QCoreApplication::translate("CLI", "ERROR: %1").arg(result.message);
}

QJsonObject ConsoleProgress::fileJson(const BatchOps::FileResult& result)
{
    QJsonObject obj;
    obj["type"] = QStringLiteral("file");
    obj["input"] = result.inputPath;
    obj["output"] = result.outputPath;
    
    switch (result.status) {
        case BatchOps::FileStatus::Success: obj["status"] = QStringLiteral("success"); break;
        case BatchOps::FileStatus::Skipped: obj["status"] = QStringLiteral("skipped"); break;
        case BatchOps::FileStatus::Error:
            obj["status"] = QStringLiteral("error");
            obj["error"] = errorKindName(result.error);
            break;
    }
    
    obj["pages"] = result.pagesProcessed;
    if (result.outputSize > 0) {
        obj["size"] = static_cast<double>(result.outputSize);
    }
    if (!result.message.isEmpty()) {
        obj["message"] = result.message;
    }
    return obj;
}

void ConsoleProgress::reportFile(int index, int total, const BatchOps::FileResult& result)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj = fileJson(result);
        obj["index"] = index;
        obj["total"] = total;
        writeJson(m_out, obj);
        return;
    }
    reportFileText(index, total, result);
}

void ConsoleProgress::reportFileText(int index, int total, const BatchOps::FileResult& result)
{
    m_out << QStringLiteral("[%1/%2] %3... %4\n")
             .arg(index)
             .arg(total)
             .arg(QFileInfo(result.inputPath).fileName(), statusText(result));
    
    if (m_mode == OutputMode::Verbose) {
        const QLocale locale;
        if (!result.outputPath.isEmpty() && result.status != BatchOps::FileStatus::Error) {
            m_out << "    -> " << result.outputPath;
            if (result.outputSize > 0) {
                m_out << " (" << locale.formattedDataSize(result.outputSize) << ")";
            }
            m_out << "\n";
        }
        if (result.status == BatchOps::FileStatus::Error) {
            m_out << "    " << errorKindName(result.error) << " error\n";
        }
    }
    m_out.flush();
}

// =============================================================================
// Summary Reporting
// =============================================================================

void ConsoleProgress::reportSummary(const BatchOps::BatchResult& result, bool dryRun)
{
    if (m_mode != OutputMode::Json) {
        reportSummaryText(result, dryRun);
        return;
    }
    
    QJsonObject obj;
    obj["type"] = QStringLiteral("summary");
    obj["total"] = result.totalCount();
    obj["success"] = result.successCount;
    obj["skipped"] = result.skippedCount;
    obj["errors"] = result.errorCount;
    obj["total_size"] = static_cast<double>(result.totalOutputSize);
    obj["elapsed_ms"] = static_cast<double>(result.elapsedMs);
    obj["dry_run"] = dryRun;
    writeJson(m_out, obj);
}

void ConsoleProgress::reportSummaryText(const BatchOps::BatchResult& result, bool dryRun)
{
    const QString verb = dryRun ? QCoreApplication::translate("CLI", "Checked")
                                : QCoreApplication::translate("CLI", "Wrote");
    
    // "Wrote 2 of 3 documents (1 failed, 0 skipped), 1.2 MB in 840 ms"
    m_out << "\n" << QCoreApplication::translate("CLI", "%1 %2 of %3 documents (%4 failed, %5 skipped)")
                         .arg(verb)
                         .arg(result.successCount)
                         .arg(result.totalCount())
                         .arg(result.errorCount)
                         .arg(result.skippedCount);
    if (!dryRun && result.totalOutputSize > 0) {
        m_out << ", " << QLocale().formattedDataSize(result.totalOutputSize);
    }
    m_out << QCoreApplication::translate("CLI", " in ") << formatDuration(result.elapsedMs) << "\n";
    
    // Failed inputs again at the end, where they are easy to find
    for (const BatchOps::FileResult& fileResult : result.results) {
        if (fileResult.status == BatchOps::FileStatus::Error) {
            m_out << "  " << QCoreApplication::translate("CLI", "failed: ")
                  << fileResult.inputPath << ": " << fileResult.message << "\n";
        }
    }
    m_out.flush();
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    reportMessage("error", QCoreApplication::translate("CLI", "Error: "), message);
}

void ConsoleProgress::reportWarning(const QString& message)
{
    reportMessage("warning", QCoreApplication::translate("CLI", "Warning: "), message);
}

void ConsoleProgress::reportMessage(const char* type, const QString& label, const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QString::fromLatin1(type);
        obj["message"] = message;
        writeJson(m_err, obj);
        return;
    }
    m_err << label << message << "\n";
    m_err.flush();
}

} // namespace Cli
