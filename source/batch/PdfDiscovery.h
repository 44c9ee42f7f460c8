#ifndef PDFDISCOVERY_H
#define PDFDISCOVERY_H

/**
 * @file PdfDiscovery.h
 * @brief Utilities for collecting the PDF inputs of an annotate batch.
 * 
 * Provides functions to:
 * - Find .pdf files in a directory
 * - Expand CLI input paths (files and directories) to a PDF list
 */

#include <QString>
#include <QStringList>

namespace BatchOps {

/**
 * @brief Find PDF files in a directory.
 * 
 * @param directory Directory to search
 * @param recursive Search subdirectories
 * @return List of .pdf file paths (absolute), sorted alphabetically
 */
QStringList discoverPdfs(const QString& directory, bool recursive = false);

/**
 * @brief Expand input paths to a PDF list.
 * 
 * - Explicit file paths ending in .pdf → included in command-line order,
 *   even when they do not exist (the batch reports them as failures)
 * - Directories → the .pdf files inside, sorted alphabetically
 * - Other files → skipped with warning
 * 
 * Duplicates are dropped; the first occurrence keeps its position.
 * 
 * @param inputPaths List of input paths from CLI
 * @param recursive Search subdirectories when input is a directory
 * @return List of PDF paths (absolute)
 */
QStringList expandPdfPaths(const QStringList& inputPaths, bool recursive = false);

} // namespace BatchOps

#endif // PDFDISCOVERY_H
