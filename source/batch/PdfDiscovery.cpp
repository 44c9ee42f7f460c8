#include "PdfDiscovery.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

/**
 * @file PdfDiscovery.cpp
 * @brief Implementation of PDF input discovery.
 * 
 * @see PdfDiscovery.h for API documentation
 */

namespace BatchOps {

// ============================================================================
// PDF Discovery
// ============================================================================

QStringList discoverPdfs(const QString& directory, bool recursive)
{
    QStringList results;
    
    QDir dir(directory);
    if (!dir.exists()) {
        qWarning() << "[PdfDiscovery] Directory does not exist:" << directory;
        return results;
    }
    
    QString absPath = dir.absolutePath();
    QStringList filters;
    filters << "*.pdf" << "*.PDF";
    
    if (recursive) {
        QDirIterator it(absPath, filters, QDir::Files, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            results.append(it.next());
        }
    } else {
        QStringList files = dir.entryList(filters, QDir::Files);
        for (const QString& file : files) {
            results.append(absPath + "/" + file);
        }
    }
    
    results.removeDuplicates();  // case-insensitive file systems match both filters
    results.sort(Qt::CaseInsensitive);
    
    return results;
}

// ============================================================================
// Path Expansion
// ============================================================================

QStringList expandPdfPaths(const QStringList& inputPaths, bool recursive)
{
    QSet<QString> seen;  // For deduplication
    QStringList results;
    
    auto addUnique = [&seen, &results](const QString& path) {
        if (!seen.contains(path)) {
            seen.insert(path);
            results.append(path);
        }
    };
    
    for (const QString& inputPath : inputPaths) {
        QFileInfo info(inputPath);
        QString absPath = QDir::cleanPath(info.absoluteFilePath());
        
        if (info.isDir()) {
            const QStringList pdfs = discoverPdfs(absPath, recursive);
            if (pdfs.isEmpty()) {
                qWarning() << "[PdfDiscovery] No PDF files in:" << inputPath;
            }
            for (const QString& pdf : pdfs) {
                addUnique(pdf);
            }
        } else if (absPath.endsWith(".pdf", Qt::CaseInsensitive)) {
            if (!info.exists()) {
                qWarning() << "[PdfDiscovery] Path does not exist:" << inputPath;
            }
            addUnique(absPath);
        } else {
            qWarning() << "[PdfDiscovery] Not a PDF file, skipping:" << inputPath;
        }
    }
    
    return results;
}

} // namespace BatchOps
