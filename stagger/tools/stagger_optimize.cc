/* stagger_optimize.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Rewrite a SQL dump with its single row INSERTs merged into multi row
   INSERTs.  The input may be plain, gzip or bzip2; the output is compressed
   according to its extension.
*/

#include <boost/program_options/cmdline.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include "stagger/import/import_orchestrator.h"
#include "stagger/import/statement_executor.h"
#include "stagger/arch/exception.h"
#include "stagger/arch/format.h"
#include "stagger/arch/timers.h"
#include "stagger/utils/config.h"
#include "stagger/utils/log.h"
#include <iostream>
#include <fstream>
#include <sys/stat.h>
#include <stdint.h>
#include <unordered_map>
#include <signal.h>

using namespace std;
using namespace STAGGER;

namespace {

constexpr int EXIT_USER_ERROR = 1;
constexpr int EXIT_RUNTIME_ERROR = 2;

constexpr double PROGRESS_INTERVAL = 2.0;

ImportOrchestrator * currentImport = nullptr;

void onInterrupt(int)
{
    if (currentImport)
        currentImport->requestStop();
}

std::string formatElapsed(double seconds)
{
    unsigned total = seconds;
    return format("%02u:%02u", total / 60, total % 60);
}

void printProgress(const ImportProgress & progress, bool compressed,
                   const SqlFileWriter & writer)
{
    if (compressed) {
        cerr << format("\r[%s] Lines: %llu | Statements: %llu | Read: %s",
                       formatElapsed(progress.elapsed).c_str(),
                       (unsigned long long)progress.line,
                       (unsigned long long)writer.statementsWritten(),
                       formatBytes(progress.offset).c_str());
    }
    else {
        int percent = progress.fileSize > 0
            ? 100.0 * progress.compressedBytesRead / progress.fileSize : 0;
        cerr << format("\r[%s] Lines: %llu | Statements: %llu | Progress: %d%%",
                       formatElapsed(progress.elapsed).c_str(),
                       (unsigned long long)progress.line,
                       (unsigned long long)writer.statementsWritten(),
                       percent);
    }
    cerr << flush;
}

bool exists(const std::string & filename)
{
    struct stat st;
    return ::stat(filename.c_str(), &st) == 0;
}

} // file scope

int main(int argc, char ** argv)
{
    using namespace boost::program_options;

    options_description configuration_options("Configuration options");

    std::string inputFile;
    std::string outputFile;
    std::string profileName = "conservative";
    size_t batchSize = 0;
    size_t maxBatchBytes = 0;
    bool force = false;
    std::string configFile;
    std::string logLevel;

    configuration_options.add_options()
        ("input,i", value(&inputFile),
         "Dump to read (.sql, .sql.gz or .sql.bz2)")
        ("output,o", value(&outputFile),
         "Dump to write; compressed if it ends in .gz or .bz2")
        ("profile,p", value(&profileName)->default_value(profileName),
         "Performance profile: conservative or aggressive")
        ("batch-size", value(&batchSize),
         "Rows per merged INSERT (default: from the profile)")
        ("max-batch-bytes", value(&maxBatchBytes),
         "Bytes per merged INSERT (default: from the profile)")
        ("force,f", bool_switch(&force),
         "Overwrite the output file if it exists")
        ("config-file", value(&configFile),
         "File with import.* and logging.* settings")
        ("log-level", value(&logLevel),
         "Log level: trace, debug, info, warn, error or off");

    options_description all_opt;
    all_opt
        .add(configuration_options);
    all_opt.add_options()
        ("help,h", "print this message");

    positional_options_description pos;
    pos.add("input", 1);
    pos.add("output", 1);
    variables_map vm;
    bool showHelp = false;

    try {
        parsed_options parsed = command_line_parser(argc, argv)
            .options(all_opt)
            .positional(pos)
            .run();
        store(parsed, vm);
        notify(vm);
    } catch (const std::exception & exc) {
        cerr << "command line parsing error: " << exc.what() << endl;
        showHelp = true;
    }

    if (showHelp || vm.count("help")) {
        cout << "Usage: stagger_optimize <input> <output> [options]\n\n"
             << all_opt << "\n";
        return showHelp ? EXIT_USER_ERROR : 0;
    }

    // Settings from the config file; the command line wins where both
    // give a value
    std::unordered_map<std::string, std::string> configMap;
    if (!configFile.empty()) {
        std::ifstream stream(configFile);
        if (!stream) {
            cerr << "Error: cannot open config file " << configFile << endl;
            return EXIT_USER_ERROR;
        }
        try {
            options_description none;
            parsed_options parsed
                = parse_config_file(stream, none, true /* allow unregistered */);
            for (auto & option: parsed.options) {
                if (!option.value.empty())
                    configMap[option.string_key] = option.value.front();
            }
        } catch (const std::exception & exc) {
            cerr << "Error: invalid config file " << configFile << ": "
                 << exc.what() << endl;
            return EXIT_USER_ERROR;
        }
    }
    if (!logLevel.empty())
        configMap["logging.level"] = logLevel;
    auto config = Config::createFromMap(configMap);

    if (inputFile.empty() || outputFile.empty()) {
        cerr << "Error: both an input and an output file are needed.\n"
             << "Use --help for usage information." << endl;
        return EXIT_USER_ERROR;
    }

    PerformanceProfile profile;
    try {
        profile = parsePerformanceProfile(profileName);
    } catch (const InvalidProfileError & exc) {
        cerr << "Error: " << exc.what() << endl;
        return EXIT_USER_ERROR;
    }

    if (vm.count("batch-size") && batchSize == 0) {
        cerr << "Error: --batch-size must be a positive integer" << endl;
        return EXIT_USER_ERROR;
    }
    if (vm.count("max-batch-bytes") && maxBatchBytes == 0) {
        cerr << "Error: --max-batch-bytes must be a positive integer" << endl;
        return EXIT_USER_ERROR;
    }

    if (!exists(inputFile)) {
        cerr << "Error: input file not found: " << inputFile << endl;
        return EXIT_USER_ERROR;
    }

    if (exists(outputFile) && !force) {
        cerr << "Error: output file already exists: " << outputFile << "\n"
             << "Use --force (-f) to overwrite." << endl;
        return EXIT_USER_ERROR;
    }

    const ProfileSettings & profileSettings = getProfileSettings(profile);

    ImportConfig importConfig = ImportConfig::fromConfig(*config);
    importConfig.linesPerSession = 0;
    importConfig.maxExecutionSeconds = 0;
    importConfig.insertBatching = true;
    importConfig.insertBatchSize
        = batchSize ? batchSize : profileSettings.insertBatchSize;
    importConfig.maxBatchBytes
        = maxBatchBytes ? maxBatchBytes : profileSettings.maxBatchBytes;
    // The profile was chosen explicitly
    importConfig.autoAggressiveThreshold = UINT64_MAX;

    Codec codec = codecForFilename(inputFile);
    bool compressed = codec != Codec::NONE;

    std::unique_ptr<SqlFileWriter> writer;
    try {
        writer.reset(new SqlFileWriter(outputFile, force));
    } catch (const std::exception & exc) {
        cerr << "Error: " << exc.what() << endl;
        return EXIT_USER_ERROR;
    }

    struct stat st;
    uint64_t inputSize = ::stat(inputFile.c_str(), &st) == 0 ? st.st_size : 0;

    cerr << "Stagger SQL optimizer\n"
         << "=====================\n"
         << "Input:   " << inputFile << " (" << formatBytes(inputSize)
         << (compressed ? ", " + codecName(codec) : std::string()) << ")\n"
         << "Output:  " << outputFile << " (" << writer->compression() << ")\n"
         << "Profile: " << profileSettings.name << " (batch size "
         << importConfig.insertBatchSize << ", "
         << formatBytes(importConfig.maxBatchBytes) << " per statement)\n\n";

    Timer timer;
    ImportOrchestrator orchestrator(importConfig, *writer);
    orchestrator.setProgress([&] (const ImportProgress & progress)
                             {
                                 printProgress(progress, compressed, *writer);
                             },
                             PROGRESS_INTERVAL);

    currentImport = &orchestrator;
    signal(SIGINT, onInterrupt);
    signal(SIGTERM, onInterrupt);

    InvocationResult result;
    try {
        result = orchestrator.runToCompletion(inputFile);
        if (result.session.status == ImportStatus::STOPPED)
            throw Exception("interrupted at line %llu",
                            (unsigned long long)result.session.currentLine);
        writer->finish();
    } catch (const std::exception & exc) {
        currentImport = nullptr;
        writer->abandon();
        cerr << "\n\nRuntime Error: " << exc.what() << "\n"
             << "Cleaned up partial output file." << endl;
        return EXIT_RUNTIME_ERROR;
    }
    currentImport = nullptr;

    const InsertBatcherStatistics & batching = result.batching;

    cerr << "\n\nComplete!\n"
         << "---------\n"
         << format("Input lines:     %llu\n",
                   (unsigned long long)result.session.currentLine)
         << format("Output queries:  %llu\n",
                   (unsigned long long)writer->statementsWritten());
    if (batching.rowsBatched > 0) {
        cerr << format("INSERTs batched: %llu -> %llu queries (%.1f:1 reduction)\n",
                       (unsigned long long)batching.rowsBatched,
                       (unsigned long long)batching.statementsEmitted,
                       batching.reductionRatio);
    }
    cerr << format("Time elapsed:    %.1f seconds\n", timer.elapsed_wall())
         << "Output size:     " << formatBytes(writer->bytesWritten()) << endl;

    return 0;
}
