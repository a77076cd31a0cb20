#include "Application.hpp"

#include "../charclass/CharacterClassifier.hpp"
#include "../charclass/EscapeParser.hpp"
#include "../cleaning/BulkDecisionSource.hpp"
#include "../cleaning/CleaningEngine.hpp"
#include "../cleaning/InteractiveDecisionSource.hpp"
#include "../report/ReportBuilder.hpp"
#include "../report/ReportWriter.hpp"
#include "../scanning/CellScanner.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../workbook/Workbook.hpp"
#include "../workbook/XlsxReader.hpp"
#include "../workbook/XlsxWriter.hpp"

#include <cctype>
#include <cstring>
#include <iostream>
#include <memory>

#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#include <clocale>
#endif

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace app
{

namespace
{

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Accepts the value of "--flag value"; advances i
bool takeValue(int argc, char** argv, int& i, std::string& value, std::string& outError)
{
    if (i + 1 >= argc)
    {
        outError = std::string("Missing value for ") + argv[i];
        return false;
    }
    value = argv[++i];
    return true;
}

} // namespace

Application::Application(int argc, char** argv)
    : Application(argc, argv, std::cin, std::cout, std::cerr)
{
}

Application::Application(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err)
    : argc_(argc)
    , argv_(argv)
    , in_(in)
    , out_(out)
    , err_(err)
{
}

int Application::run()
{
    const char* program = argc_ > 0 ? argv_[0] : "charscan";

    std::string error;
    if (!parseArguments(argc_, argv_, options_, error))
    {
        err_ << "Error: " << error << "\n\n";
        printUsage(err_, program);
        return kExitUsage;
    }
    if (options_.show_help)
    {
        printUsage(out_, program);
        return kExitSuccess;
    }
    if (options_.show_version)
    {
        printVersion(out_);
        return kExitSuccess;
    }

    initializeConsole();
    if (!initializeLogging())
        err_ << "Warning: logging is unavailable for this run\n";

    if (!config_.load(options_.config_path))
        err_ << "Warning: " << config_.lastError() << " (using defaults)\n";
    output_dir_ = options_.output_dir.value_or(config_.output_dir);

    if (options_.workbook_path.empty() && !promptForInput())
    {
        out_ << "No file specified. Exiting.\n";
        return kExitUsage;
    }

    std::optional<charclass::TargetSet> targets;
    if (options_.chars && !options_.chars->empty())
    {
        charclass::TargetSet set;
        if (!charclass::parseTargetSpec(*options_.chars, set, error))
        {
            err_ << "Error: invalid character list '" << *options_.chars << "': " << error << "\n";
            return kExitUsage;
        }
        targets = std::move(set);
    }

    workbook::Workbook workbook(options_.workbook_path);
    if (!workbook::XlsxReader::open(options_.workbook_path, workbook, error))
    {
        ErrorReporter::ReportFatal(ErrorCategory::WorkbookOpen, "Cannot open workbook '" + options_.workbook_path + "'",
                                   error);
        err_ << "Error: " << error << "\n";
        return kExitOpenError;
    }

    charclass::CharacterClassifier classifier(config_.range);
    scanning::CellScanner scanner(classifier);
    const auto scan = scanner.scan(workbook, targets);
    PLOG_INFO << "Scan of " << options_.workbook_path << ": " << scan.findings.size() << " finding(s) in "
              << scan.cells_scanned << " text cell(s)";

    report::ReportBuilder builder({ .context_radius = config_.context_radius });
    const auto rendered = builder.build(scan.findings);
    report::ReportWriter writer(options_.workbook_path, output_dir_);

    if (scan.findings.empty())
    {
        out_ << "No problematic characters found in '" << options_.workbook_path << "'.\n";
        printSummary(scan);
        return kExitSuccess;
    }

    out_ << "\n" << rendered.console_text;

    if (config_.write_csv && writer.writeResultsCsv(rendered.rows))
        out_ << "Results saved to " << writer.resultsCsvPath() << "\n";
    if (config_.write_text && writer.writeFindingsReport(rendered))
        out_ << "Findings report saved to " << writer.findingsReportPath() << "\n";

    bool do_clean = false;
    if (options_.clean)
    {
        do_clean = true;
    }
    else if (!options_.no_clean)
    {
        out_ << "\nWould you like to clean the problematic characters?\n";
        out_ << "This will create a new copy of the Excel file with the problematic characters handled.\n";
        do_clean = askYesNo("Clean the file? (y/n): ");
    }

    int exit_code = kExitSuccess;
    if (do_clean)
        exit_code = clean(workbook, scan, classifier, targets, writer);
    else
        out_ << "No cleaning performed. You can manually edit the file using the scan results.\n";

    printSummary(scan);
    return exit_code;
}

int Application::clean(workbook::Workbook& workbook, const scanning::ScanResult& scan,
                       const charclass::CharacterClassifier& classifier,
                       const std::optional<charclass::TargetSet>& targets, const report::ReportWriter& writer)
{
    report::ReportBuilder renderer({ .context_radius = config_.context_radius });
    std::unique_ptr<cleaning::IDecisionSource> source;
    if (options_.clean)
    {
        cleaning::CleaningDecision decision;
        decision.operation = *options_.clean;
        decision.scope = options_.scope.value_or(cleaning::Scope::AllCellsAllProblematic);
        decision.replacement_text = options_.replacement;
        source = std::make_unique<cleaning::BulkDecisionSource>(decision);
    }
    else
    {
        source = std::make_unique<cleaning::InteractiveDecisionSource>(in_, out_, renderer);
    }

    cleaning::CleaningEngine engine(workbook, classifier, targets);
    const auto result = engine.run(scan.findings, *source);

    int exit_code = kExitSuccess;
    if (result.status == cleaning::EngineStatus::InvalidDecision)
    {
        err_ << "Error: cleaning aborted: " << result.error << "\n";
        exit_code = kExitInvalidDecision;
    }

    if (result.log.empty())
    {
        out_ << "No changes were made.\n";
        return exit_code;
    }

    const std::string cleaned_path = writer.cleanedWorkbookPath();
    std::string error;
    if (!writer.prepareOutputDirectory() || !workbook::XlsxWriter::save(workbook, cleaned_path, error))
    {
        ErrorReporter::ReportError(ErrorCategory::WorkbookWrite, "Cannot save cleaned workbook '" + cleaned_path + "'",
                                   error);
        err_ << "Error: cleaned workbook could not be saved: " << error << "\n";
        exit_code = kExitWriteError;
    }
    else
    {
        out_ << "\nCleaned " << workbook.modifiedCellCount() << " cells.\n";
        out_ << "Saved cleaned file as: " << cleaned_path << "\n";
    }

    if (writer.writeCleaningLog(result.log))
    {
        out_ << "Cleaning log saved as: " << writer.cleaningLogPath() << "\n";
    }
    else
    {
        out_ << "\nCleaning log could not be saved; changes made:\n";
        out_ << report::ReportWriter::renderCleaningLog(options_.workbook_path, result.log,
                                                        ErrorReporter::GetTimestamp());
    }

    return exit_code;
}

void Application::printSummary(const scanning::ScanResult& scan)
{
    out_ << "\nScanned " << scan.cells_scanned << " text cell(s) in " << scan.sheets_scanned << " sheet(s).\n";
    if (scan.sheets_skipped || scan.cells_skipped)
    {
        out_ << "Skipped " << scan.sheets_skipped << " unreadable sheet(s) and " << scan.cells_skipped
             << " unreadable cell(s).\n";
    }

    if (!ErrorReporter::HasPendingErrors())
        return;

    const auto pending = ErrorReporter::GetPendingErrors();
    out_ << "\n" << pending.size() << " problem(s) reported:\n";
    for (const auto& report : pending)
    {
        out_ << "  [" << ErrorReporter::SeverityToString(report.severity) << "] "
             << ErrorReporter::CategoryToString(report.category) << ": " << report.user_message << "\n";
    }
}

bool Application::parseArguments(int argc, char** argv, Options& options, std::string& outError)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string value;
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            options.show_help = true;
            return true;
        }
        else if (std::strcmp(argv[i], "--version") == 0)
        {
            options.show_version = true;
            return true;
        }
        else if (std::strcmp(argv[i], "--verbose") == 0)
        {
            options.verbose = true;
        }
        else if (std::strcmp(argv[i], "--no-clean") == 0)
        {
            options.no_clean = true;
        }
        else if (std::strcmp(argv[i], "--chars") == 0)
        {
            if (!takeValue(argc, argv, i, value, outError))
                return false;
            options.chars = value;
        }
        else if (std::strcmp(argv[i], "--clean") == 0)
        {
            if (!takeValue(argc, argv, i, value, outError))
                return false;
            cleaning::Operation op;
            if (!cleaning::parseOperation(value, op))
            {
                outError =
                    "Unknown cleaning operation '" + value + "' (expected delete, replace, skip or skip-all)";
                return false;
            }
            options.clean = op;
        }
        else if (std::strcmp(argv[i], "--scope") == 0)
        {
            if (!takeValue(argc, argv, i, value, outError))
                return false;
            cleaning::Scope scope;
            if (!cleaning::parseScope(value, scope))
            {
                outError = "Unknown scope '" + value + "' (expected cell, char or all)";
                return false;
            }
            options.scope = scope;
        }
        else if (std::strcmp(argv[i], "--replacement") == 0)
        {
            if (!takeValue(argc, argv, i, value, outError))
                return false;
            options.replacement = value;
        }
        else if (std::strcmp(argv[i], "--output-dir") == 0)
        {
            if (!takeValue(argc, argv, i, value, outError))
                return false;
            options.output_dir = value;
        }
        else if (std::strcmp(argv[i], "--config") == 0)
        {
            if (!takeValue(argc, argv, i, value, outError))
                return false;
            options.config_path = value;
        }
        else if (argv[i][0] == '-' && argv[i][1] != '\0')
        {
            outError = std::string("Unknown option ") + argv[i];
            return false;
        }
        else if (options.workbook_path.empty())
        {
            options.workbook_path = argv[i];
        }
        else
        {
            outError = std::string("Unexpected argument ") + argv[i];
            return false;
        }
    }

    if (options.clean && options.no_clean)
    {
        outError = "--clean and --no-clean cannot be combined";
        return false;
    }
    if ((options.scope || options.replacement) && !options.clean)
    {
        outError = "--scope and --replacement require --clean";
        return false;
    }
    if (options.replacement && *options.clean != cleaning::Operation::Replace)
    {
        outError = "--replacement is only valid with --clean replace";
        return false;
    }
    return true;
}

void Application::printUsage(std::ostream& out, const char* program_name)
{
    out << "Usage: " << program_name << " [OPTIONS] [WORKBOOK]\n";
    out << "Scan an Excel workbook for problematic characters and optionally clean them.\n\n";
    out << "Options:\n";
    out << "  --chars <spec>        Scan only these characters (e.g. \"\\x81\\x82\" or \"\\u00e9\")\n";
    out << "  --clean <op>          Clean without prompting: delete | replace | skip | skip-all\n";
    out << "  --scope <scope>       cell | char | all (default: all)\n";
    out << "  --replacement <text>  Replacement text for --clean replace\n";
    out << "  --no-clean            Scan and report only\n";
    out << "  --output-dir <dir>    Directory for reports and the cleaned workbook\n";
    out << "  --config <path>       Configuration file (default: config.toml)\n";
    out << "  --verbose             Print detailed workflow info\n";
    out << "  --version             Show version information\n";
    out << "  --help                Show this help message\n";
    out << "\nWithout WORKBOOK the path and characters are asked for on the console.\n";
    out << "\nExit codes: 0 success, 1 usage, 2 workbook cannot be opened,\n";
    out << "            3 cleaned workbook cannot be saved, 4 invalid cleaning decision\n";
}

void Application::printVersion(std::ostream& out)
{
    out << "charscan - Excel problematic character scanner\n";
    out << "Version: 1.0.0\n";
    out << "Platform: ";
#ifdef _WIN32
    out << "Windows\n";
#else
    out << "Linux\n";
#endif
    out << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool Application::initializeLogging()
{
    utils::Diagnostics::SetVerbose(options_.verbose);

    if (utils::LogManager::IsInitialized())
        return true;

    if (!utils::LogManager::Initialize(options_.config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterRunLoggers(options_.verbose);
}

void Application::initializeConsole()
{
#ifdef _WIN32
    // Set Windows console to UTF-8 so non-ASCII text displays correctly
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
    std::setlocale(LC_ALL, ".UTF-8");
#endif
}

bool Application::promptForInput()
{
    out_ << "No file specified via command line.\n";
    out_ << "Enter the path of the Excel file to scan: " << std::flush;
    std::string line;
    if (!std::getline(in_, line))
        return false;
    options_.workbook_path = trim(line);
    if (options_.workbook_path.empty())
        return false;

    out_ << "\nDo you want to scan for specific characters? (Leave blank to scan for all)\n";
    out_ << "Enter character or escape sequence (e.g., \\x81): " << std::flush;
    if (std::getline(in_, line))
    {
        line = trim(line);
        if (!line.empty())
            options_.chars = line;
    }
    return true;
}

bool Application::askYesNo(const char* prompt)
{
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line))
    {
        out_ << "\n";
        return false;
    }
    line = trim(line);
    for (auto& c : line)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return line == "y" || line == "yes";
}

} // namespace app
