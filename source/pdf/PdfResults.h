#pragma once

// ============================================================================
// PdfResults - Result types shared by the document pipelines
// ============================================================================
// Nothing in the pdf/ module throws: MuPDF exceptions are caught inside the
// module and reported through these structs.
// ============================================================================

#include <QByteArray>
#include <QString>

/**
 * @brief Category of a pipeline failure.
 */
enum class ErrorKind {
    None,           ///< No error
    InvalidInput,   ///< Rejected before any drawing (missing fields, no images)
    Io,             ///< Image unreadable/undecodable, destination not writable
    Format,         ///< Input document is not a usable PDF
    Internal        ///< PDF engine failure (context, serialization)
};

/**
 * @brief Short lowercase name of an error kind ("io", "format", ...).
 */
inline QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:         return QStringLiteral("none");
        case ErrorKind::InvalidInput: return QStringLiteral("invalid-input");
        case ErrorKind::Io:           return QStringLiteral("io");
        case ErrorKind::Format:       return QStringLiteral("format");
        case ErrorKind::Internal:     return QStringLiteral("internal");
    }
    return QStringLiteral("unknown");
}

/**
 * @brief Result of building a document from an image deck.
 */
struct DeckBuildResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;
    int pagesBuilt = 0;
    QByteArray pdfData;             ///< Serialized document (empty on failure)
    qint64 fileSizeBytes = 0;       ///< Set once the document is committed to disk
};

/**
 * @brief Result of stamping an overlay onto an existing document.
 */
struct AnnotateResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;
    int pagesAnnotated = 0;
    QByteArray pdfData;             ///< Serialized document (empty on failure)
    qint64 fileSizeBytes = 0;
};
