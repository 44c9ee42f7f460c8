#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 * 
 * @see CliParser.h for API documentation
 */

namespace Cli {

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }
    
    const char* arg1 = argv[1];
    
    if (std::strcmp(arg1, "build") == 0) {
        return Command::Build;
    }
    if (std::strcmp(arg1, "annotate") == 0) {
        return Command::Annotate;
    }
    if (std::strcmp(arg1, "community") == 0) {
        return Command::Community;
    }
    
    // Check for global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }
    
    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Build:     return QStringLiteral("build");
        case Command::Annotate:  return QStringLiteral("annotate");
        case Command::Community: return QStringLiteral("community");
        case Command::Help:      return QStringLiteral("help");
        case Command::Version:   return QStringLiteral("version");
        default:                 return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addOutputOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show detailed progress")));
    
    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));
}

static void addStoreOption(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        QStringLiteral("communities"),
        QCoreApplication::translate("CLI", "Community store file (overrides the saved location)"),
        QStringLiteral("file")));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "ClassReview - Class photo review documents"));
    
    // Add standard help option (--help, -h)
    parser.addHelpOption();
    
    // Add version option (--version, -v)
    parser.addVersionOption();
    
    switch (cmd) {
        case Command::Build:
            parser.addPositionalArgument(
                QStringLiteral("images"),
                QCoreApplication::translate("CLI", "Image files, one page each, in page order"),
                QStringLiteral("<image...>"));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("date"),
                QCoreApplication::translate("CLI", "Class date"),
                QStringLiteral("date")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("class"),
                QCoreApplication::translate("CLI", "Class number"),
                QStringLiteral("N")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("community"),
                QCoreApplication::translate("CLI", "Community name"),
                QStringLiteral("name")));
            
            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output directory or .pdf file"),
                QStringLiteral("path")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("text"),
                QCoreApplication::translate("CLI", "Overlay text (instead of the community description)"),
                QStringLiteral("text")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("full-bleed"),
                QCoreApplication::translate("CLI", "Center images on the full page, no header band")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("move-up"),
                QCoreApplication::translate("CLI", "Swap image at position I with the previous one"),
                QStringLiteral("I")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("move-down"),
                QCoreApplication::translate("CLI", "Swap image at position I with the next one"),
                QStringLiteral("I")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("min-images"),
                QCoreApplication::translate("CLI", "Minimum number of images (default: 2)"),
                QStringLiteral("K"),
                QStringLiteral("2")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite an existing output file")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("dry-run"),
                QCoreApplication::translate("CLI", "Validate without creating files")));
            
            addStoreOption(parser);
            addOutputOptions(parser);
            break;
            
        case Command::Annotate:
            parser.addPositionalArgument(
                QStringLiteral("input"),
                QCoreApplication::translate("CLI", "PDF files or directories"),
                QStringLiteral("<input...>"));
            
            parser.addOption(QCommandLineOption(
                {QStringLiteral("d"), QStringLiteral("dest")},
                QCoreApplication::translate("CLI", "Destination directory"),
                QStringLiteral("path")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("community"),
                QCoreApplication::translate("CLI", "Community whose description is stamped"),
                QStringLiteral("name")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("text"),
                QCoreApplication::translate("CLI", "Overlay text"),
                QStringLiteral("text")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite existing output files")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("recursive"),
                QCoreApplication::translate("CLI", "Search input directories recursively")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("fail-fast"),
                QCoreApplication::translate("CLI", "Stop on first error")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("dry-run"),
                QCoreApplication::translate("CLI", "Report page counts without creating files")));
            
            addStoreOption(parser);
            addOutputOptions(parser);
            break;
            
        case Command::Community:
            parser.addPositionalArgument(
                QStringLiteral("action"),
                QCoreApplication::translate("CLI", "list, show, add, update or remove"),
                QStringLiteral("<action>"));
            
            parser.addPositionalArgument(
                QStringLiteral("name"),
                QCoreApplication::translate("CLI", "Community name"),
                QStringLiteral("[name]"));
            
            parser.addPositionalArgument(
                QStringLiteral("description"),
                QCoreApplication::translate("CLI", "Community description (add, update)"),
                QStringLiteral("[description]"));
            
            addStoreOption(parser);
            break;
            
        default:
            // No command-specific options for Help/Version/None
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);
    
    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: classreview <command> [options] [files...]\n"
            "\n"
            "ClassReview - Turn class photos into review documents.\n"
            "\n"
            "COMMANDS:\n"
            "  build           Build a review PDF from images, one page per image\n"
            "  annotate        Stamp the community header onto existing PDFs\n"
            "  community       List and edit community descriptions\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "QUICK START:\n"
            "  # Describe a community once\n"
            "  classreview community add \"Maple Street\" \"Welcome to Maple Street\"\n"
            "\n"
            "  # Build a review document\n"
            "  classreview build board.jpg group.jpg --date 2024-03-01 --class 7 \\\n"
            "      --community \"Maple Street\" -o ~/Reviews/\n"
            "\n"
            "  # Stamp existing handouts\n"
            "  classreview annotate ~/Handouts/ -d ~/Stamped/ --community \"Maple Street\"\n"
            "\n"
            "EXIT CODES:\n"
            "  0   All operations succeeded\n"
            "  1   Some files failed or were skipped\n"
            "  2   All files failed\n"
            "  3   Invalid arguments\n"
            "  4   Can't read or write files\n"
            "  5   Cancelled (Ctrl+C)\n"
            "\n"
            "Run 'classreview <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Build) {
        out << QCoreApplication::translate("CLI",
            "Usage: classreview build [OPTIONS] <image>... --date <D> --class <N> --community <NAME>\n"
            "\n"
            "Build a review PDF with one Letter page per image.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <image>...              Image files in page order\n"
            "\n"
            "REQUIRED:\n"
            "  --date <D>              Class date (used in the file name)\n"
            "  --class <N>             Class number (used in the file name)\n"
            "  --community <NAME>      Community name (file name and overlay text)\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <path>     Existing directory or .pdf file\n"
            "                          (default: last output directory, else current)\n"
            "  --overwrite             Overwrite an existing file\n"
            "\n"
            "PAGE OPTIONS:\n"
            "  --text <TEXT>           Overlay text instead of the community description\n"
            "  --full-bleed            Center images on the whole page, no header band\n"
            "  --move-up <I>           Swap image I (1-based) with the previous one\n"
            "  --move-down <I>         Swap image I (1-based) with the next one\n"
            "                          (repeatable, applied in the order given)\n"
            "  --min-images <K>        Minimum number of images (default: 2)\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --communities <file>    Community store to read\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  --dry-run               Validate without creating files\n"
            "  -h, --help              Show this help\n"
            "\n"
            "The file is named {date}_classreview_{community}_{class}.pdf.\n");
    } else if (cmd == Command::Annotate) {
        out << QCoreApplication::translate("CLI",
            "Usage: classreview annotate [OPTIONS] <input>... -d <dest> (--community <NAME> | --text <TEXT>)\n"
            "\n"
            "Stamp the header band and page captions onto copies of existing PDFs.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <input>...              PDF files or directories containing them\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -d, --dest <path>       Destination directory [required]\n"
            "  --overwrite             Overwrite existing files\n"
            "\n"
            "TEXT OPTIONS:\n"
            "  --community <NAME>      Use the community description\n"
            "  --text <TEXT>           Use this text\n"
            "\n"
            "DISCOVERY OPTIONS:\n"
            "  --recursive             Search directories recursively\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --communities <file>    Community store to read\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  --fail-fast             Stop on first error\n"
            "  --dry-run               Report page counts without creating files\n"
            "  -h, --help              Show this help\n"
            "\n"
            "Copies keep their original file names inside the destination.\n");
    } else if (cmd == Command::Community) {
        out << QCoreApplication::translate("CLI",
            "Usage: classreview community <action> [name] [description] [--communities <file>]\n"
            "\n"
            "List and edit community descriptions.\n"
            "\n"
            "ACTIONS:\n"
            "  list                    Show all community names\n"
            "  show <name>             Show the description of a community\n"
            "  add <name> <desc>       Add a community\n"
            "  update <name> <desc>    Replace the description of a community\n"
            "  remove <name>           Delete a community\n"
            "\n"
            "OPTIONS:\n"
            "  --communities <file>    Community store to use\n"
            "  -h, --help              Show this help\n");
    } else {
        // Fallback to parser's help text
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "ClassReview " << QCoreApplication::applicationVersion() << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)
    
    // Install signal handlers for graceful Ctrl+C handling
    installSignalHandlers();
    
    Command cmd = parseCommand(argc, argv);
    
    // Handle help and version immediately
    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }
    
    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }
    
    QCommandLineParser parser;
    setupParser(parser, cmd);
    
    // Build argument list without the command name
    // (QCommandLineParser doesn't understand subcommands)
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);  // Program name
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }
    
    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ") 
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }
    
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }
    
    switch (cmd) {
        case Command::Build:
            return handleBuild(parser);
        case Command::Annotate:
            return handleAnnotate(parser);
        case Command::Community:
            return handleCommunity(parser);
        default:
            // Help/Version/None handled above
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
