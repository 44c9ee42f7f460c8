// ============================================================================
// ClassReview - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QDebug>
#include <QTest>

#include "cli/CliParser.h"

// Test includes
#include "layout/TextWrapperTests.h"
#include "layout/PageGeometryTests.h"
#include "images/ImageSourceTests.h"
#include "deck/ImageDeckTests.h"
#include "pdf/DocumentBuilderTests.h"
#include "pdf/DocumentAnnotatorTests.h"
#include "batch/BatchOperationsTests.h"
#include "cli/CliHandlerTests.h"
#include "community/CommunityStoreTests.h"

// ============================================================================
// Test Runners
// ============================================================================

static QString testTypeFromArgs(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg.startsWith("--test-")) {
            return arg.mid(7);
        }
    }
    return QString();
}

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "wrap") {
        success = TextWrapperTests::runAllTests();
    } else if (testType == "geometry") {
        success = PageGeometryTests::runAllTests();
    } else if (testType == "image") {
        success = ImageSourceTests::runAllTests();
    } else if (testType == "deck") {
        success = ImageDeckTests::runAllTests();
    } else if (testType == "builder") {
        success = DocumentBuilderTests::runAllTests();
    } else if (testType == "annotator") {
        success = DocumentAnnotatorTests::runAllTests();
    } else if (testType == "batch") {
        success = BatchOperationsTests::runAllTests();
    } else if (testType == "cli") {
        success = CliHandlerTests::runAllTests();
    } else if (testType == "community") {
        // QTest parses its own arguments; don't hand it ours
        return runCommunityStoreTests();
    } else {
        qWarning() << "Unknown test suite:" << testType;
        return Cli::ExitCode::InvalidArgs;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("ClassReview");
    app.setApplicationName("ClassReview");
    app.setApplicationVersion(CLASSREVIEW_VERSION);

    const QString testToRun = testTypeFromArgs(argc, argv);
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    return Cli::run(app, argc, argv);
}
