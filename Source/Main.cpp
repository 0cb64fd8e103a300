/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "Comparator.hpp"
#include "Errors.hpp"
#include "FileStorage.hpp"
#include "JsonReportRenderer.hpp"
#include "Modules.hpp"
#include "ReportCommon.hpp"
#include "StreamStorage.hpp"
#include "TableReportRenderer.hpp"

#include <args.hxx>

#include <fmt/core.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>

#include <unistd.h>

namespace Std = StdLib;

namespace Format {
    static constexpr auto TABLE = "table";
    static constexpr auto JSON = "json";
} // namespace Format

Std::Optional<Std::String> fLoadDocument(Std::SharedPtr<Storage::IDataStorage> storage, const Std::String& label, const bool interactive) {
    if (interactive) {
        fmt::print("\nPlease enter your {} JSON:\n(Paste your JSON and press Enter twice to finish)\n", label);
    }

    auto data = storage->LoadData();
    if (!data.has_value()) {
        spdlog::error("Failed to load {} document from '{}'", label, storage->URI());
        return {};
    }

    return fToString(data.value());
}

int main(const int argc, const char* argv[]) {
    args::ArgumentParser argParser("JSON Request/Response Comparator",
        "Without --request/--response both documents are read from standard input, each one ends with a blank line.");
    args::HelpFlag help(argParser, "HELP", "Show this help menu", {'h', "help"});
    args::ValueFlag<Std::String> requestFilename(argParser, "REQUEST", "The request JSON file", { 'r', "request" });
    args::ValueFlag<Std::String> responseFilename(argParser, "RESPONSE", "The response JSON file", { 's', "response" });
    args::ValueFlag<Std::String> outputFormat(argParser, "FORMAT", "Report format: table or json", { 'f', "format" }, Format::TABLE);
    args::ValueFlag<Std::String> outputFilename(argParser, "OUTPUT", "Save the report into file instead of printing it", { 'o', "output" });
    args::ValueFlag<size_t> maxWidth(argParser, "WIDTH", "Values longer than WIDTH characters are truncated", { 'w', "max-width" },
        Comparison::ComparatorOptions::DEFAULT_MAX_DISPLAY_LENGTH);
    args::Flag noColor(argParser, "NO_COLOR", "Do not colorize the report", { "no-color" });
    args::ValueFlag<Std::String> logLevel(argParser, "LEVEL", "Log level: trace, debug, info, warning, error, critical or off", { 'l', "log-level" }, "error");
    args::ValueFlag<Std::String> logFilename(argParser, "LOG_FILE", "Also write logs into file", { "log-file" });
    try {
        argParser.ParseCLI(argc, argv);
    }
    catch (args::Help) {
        std::cout << argParser;
        ::exit(EXIT_SUCCESS);
    }
    catch (args::ParseError& e) {
        spdlog::error("{}", e.what());
        std::cerr << argParser;
        ::exit(EXIT_FAILURE);
    }
    catch (args::ValidationError& e) {
        spdlog::error("{}", e.what());
        std::cerr << argParser;
        ::exit(EXIT_FAILURE);
    }

    const auto format = args::get(outputFormat);
    if ((format != Format::TABLE) && (format != Format::JSON)) {
        spdlog::error("Unknown report format '{}'", format);
        std::cerr << argParser;
        ::exit(EXIT_FAILURE);
    }

    const auto level = spdlog::level::from_str(args::get(logLevel));
    // Logs go to stderr, stdout carries the report
    auto consoleLogSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleLogSink->set_level(level);
    consoleLogSink->set_pattern("%+");

    auto loggerRegistry = std::make_shared<Log::LoggerRegistry>(spdlog::sinks_init_list{consoleLogSink});
    if (logFilename) {
        try {
            auto fileLogSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(args::get(logFilename), true);
            fileLogSink->set_level(level);
            fileLogSink->set_pattern("%+");
            loggerRegistry->AddLogSink(fileLogSink);
        }
        catch (const spdlog::spdlog_ex& ex) {
            spdlog::error("Failed to open log file '{}'. Error: {}", args::get(logFilename), ex.what());
            ::exit(EXIT_FAILURE);
        }
    }

    loggerRegistry->SetLevel(level);
    loggerRegistry->RegisterModule(Module::Name::CLI);
    loggerRegistry->RegisterModule(Module::Name::COMPARATOR);
    loggerRegistry->RegisterModule(Module::Name::DATA_STORAGE);
    loggerRegistry->RegisterModule(Module::Name::FLATTENER);
    loggerRegistry->RegisterModule(Module::Name::JSON_PARSER);
    loggerRegistry->RegisterModule(Module::Name::REPORT);

    auto moduleRegistry = std::make_shared<ModuleRegistry>();
    moduleRegistry->SetLoggerRegistry(loggerRegistry);
    auto log = loggerRegistry->Logger(Module::Name::CLI);

    Comparison::ComparatorOptions comparatorOptions;
    comparatorOptions.MaxDisplayLength = args::get(maxWidth);

    const bool interactiveInput = (!requestFilename || !responseFilename) && ::isatty(STDIN_FILENO);
    Std::SharedPtr<Storage::IDataStorage> requestStorage;
    if (requestFilename) {
        requestStorage = std::make_shared<Storage::FileStorage>(args::get(requestFilename), moduleRegistry);
    }
    else {
        requestStorage = std::make_shared<Storage::StreamStorage>(comparatorOptions.LabelA, std::cin, moduleRegistry);
    }

    Std::SharedPtr<Storage::IDataStorage> responseStorage;
    if (responseFilename) {
        responseStorage = std::make_shared<Storage::FileStorage>(args::get(responseFilename), moduleRegistry);
    }
    else {
        responseStorage = std::make_shared<Storage::StreamStorage>(comparatorOptions.LabelB, std::cin, moduleRegistry);
    }

    auto requestJson = fLoadDocument(requestStorage, comparatorOptions.LabelA, interactiveInput && !requestFilename);
    if (!requestJson.has_value()) {
        ::exit(EXIT_FAILURE);
    }

    auto responseJson = fLoadDocument(responseStorage, comparatorOptions.LabelB, interactiveInput && !responseFilename);
    if (!responseJson.has_value()) {
        ::exit(EXIT_FAILURE);
    }

    Comparison::JsonComparator comparator(moduleRegistry, comparatorOptions);
    Comparison::ComparisonReport report;
    try {
        report = comparator.Compare(requestJson.value(), responseJson.value());
    }
    catch (const Errors::ParseError& ex) {
        std::cerr << Report::FormatParseError(ex, Report::UseColorFor(!noColor, STDERR_FILENO));
        ::exit(EXIT_FAILURE);
    }
    catch (const Errors::ComparatorError& ex) {
        log->critical("{}", ex.what());
        ::exit(EXIT_FAILURE);
    }

    const bool useColor = Report::UseColorFor(!noColor && !outputFilename, STDOUT_FILENO);

    Std::UniquePtr<Report::IReportRendering> renderer;
    if (format == Format::JSON) {
        renderer = std::make_unique<Report::JsonReportRenderer>(moduleRegistry);
    }
    else {
        renderer = std::make_unique<Report::TableReportRenderer>(useColor, moduleRegistry);
    }

    const auto rendered = renderer->Render(report);
    if (outputFilename) {
        Storage::FileStorage reportStorage(args::get(outputFilename), moduleRegistry);
        if (!reportStorage.SaveData(fToByteStream(rendered))) {
            log->error("Failed to save report into file '{}'", reportStorage.URI());
            ::exit(EXIT_FAILURE);
        }

        log->info("Saved report into file '{}'", reportStorage.URI());
        ::exit(EXIT_SUCCESS);
    }

    fmt::print("{}\n", rendered);
    ::exit(EXIT_SUCCESS);
}
