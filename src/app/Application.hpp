#pragma once

#include "../cleaning/CleaningTypes.hpp"
#include "../config/ScanConfig.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace scanning
{
struct ScanResult;
}

namespace workbook
{
class Workbook;
}

namespace report
{
class ReportWriter;
}

namespace app
{

enum ExitCode : int
{
    kExitSuccess = 0,
    kExitUsage = 1,
    kExitOpenError = 2,
    kExitWriteError = 3,
    kExitInvalidDecision = 4
};

struct Options
{
    std::string workbook_path;
    std::optional<std::string> chars;
    std::optional<cleaning::Operation> clean;
    std::optional<cleaning::Scope> scope;
    std::optional<std::string> replacement;
    std::optional<std::string> output_dir;
    std::string config_path = "config.toml";
    bool no_clean = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

/// Console front end: scan, report, optionally clean, persist.
class Application
{
public:
    Application(int argc, char** argv);
    Application(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err);

    int run();

    static bool parseArguments(int argc, char** argv, Options& options, std::string& outError);
    static void printUsage(std::ostream& out, const char* program_name);
    static void printVersion(std::ostream& out);

private:
    bool initializeLogging();
    void initializeConsole();
    bool promptForInput();
    bool askYesNo(const char* prompt);

    int clean(workbook::Workbook& workbook, const scanning::ScanResult& scan,
              const charclass::CharacterClassifier& classifier,
              const std::optional<charclass::TargetSet>& targets, const report::ReportWriter& writer);
    void printSummary(const scanning::ScanResult& scan);

    int argc_;
    char** argv_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

    Options options_;
    config::ScanConfig config_;
    std::string output_dir_;
};

} // namespace app
