#pragma once

// ============================================================================
// PdfSupport - MuPDF plumbing shared by the builder and the annotator
// ============================================================================
// Context setup, serialization to memory, document metadata and the atomic
// commit of the serialized bytes to disk.
// ============================================================================

#include <QByteArray>
#include <QString>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;

namespace PdfSupport {

/// Producer string written into every output document.
QString producerString();

/**
 * @brief Create a MuPDF context with the document handlers registered.
 * @return Context (caller drops with fz_drop_context), or nullptr
 */
fz_context* newContext();

/**
 * @brief Create an empty output document in @p ctx.
 * @return Document (caller drops with pdf_drop_document), or nullptr
 */
pdf_document* newDocument(fz_context* ctx);

/**
 * @brief Set Producer (and Title, when non-empty) in the document Info.
 * @return false if the Info dictionary could not be written
 */
bool writeMetadata(fz_context* ctx, pdf_document* doc, const QString& title);

/**
 * @brief Serialize a document into memory with compressed streams.
 * @param out Receives the PDF bytes
 * @param errorMessage Receives MuPDF's message on failure (may be null)
 */
bool saveToBytes(fz_context* ctx, pdf_document* doc, QByteArray* out, QString* errorMessage);

/**
 * @brief Commit PDF bytes to @p path atomically.
 *
 * Data goes to a temporary file next to the destination that replaces it
 * only once fully written. On failure nothing is left at @p path.
 */
bool writeFileAtomically(const QByteArray& data, const QString& path, QString* errorMessage);

} // namespace PdfSupport
