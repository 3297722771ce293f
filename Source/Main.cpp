/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#include "Common.hpp"
#include "CompareJob.hpp"
#include "Modules.hpp"
#include "Lib/ModuleRegistry.hpp"

#include <args.hxx>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>

namespace Std = StdLib;

namespace {
const Std::Vector<Std::String> MODULE_NAMES = {
    Module::Name::COMPARE_JOB,
    Module::Name::DATA_STORAGE,
    Module::Name::DIFF_ENGINE,
    Module::Name::RENDERER,
    Module::Name::VALUE_CONV,
};

Log::Level fVerbosityToLevel(const int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}
} // namespace

int main(const int argc, const char* argv[]) {
    // The report goes to stdout, every diagnostic goes to stderr
    auto consoleLogSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleLogSink->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("json-diff", consoleLogSink));

    args::ArgumentParser argParser("Find the differences between two input json files");
    args::HelpFlag help(argParser, "HELP", "Show this help menu", {'h', "help"});
    args::Flag color(argParser, "COLOR", "Colored output", {'c', "color"});
    args::Flag rawJson(argParser, "RAW", "Display raw JSON encoding of the diff", {'j', "raw-json"});
    args::Flag keysOnly(argParser, "KEYS", "Compare only the keys, ignore the differences in values", {'k', "keys-only"});
    args::ValueFlag<Std::String> outputDir(argParser, "OUTPUT", "Output directory", {'o', "output"});
    args::ValueFlag<size_t> threads(argParser, "THREADS", "Number of worker threads, 0 or 1 compares on a single thread", {'t', "threads"});
    args::ValueFlag<size_t> parallelThreshold(argParser, "COUNT", "Minimum number of members of one container compared in parallel", {"parallel-threshold"});
    args::ValueFlag<size_t> maxDepth(argParser, "DEPTH", "Maximum accepted nesting depth of the documents", {"max-depth"});
    args::CounterFlag verbose(argParser, "VERBOSE", "Verbose diagnostics, repeat for more", {'v', "verbose"});
    args::Positional<Std::String> firstJson(argParser, "first-json", "Old json file or directory");
    args::Positional<Std::String> secondJson(argParser, "second-json", "New json file or directory");
    try {
        argParser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << argParser;
        return EXIT_SUCCESS;
    }
    catch (const args::ParseError& e) {
        spdlog::error("{}", e.what());
        std::cerr << argParser;
        return Exit::FAILURE;
    }
    catch (const args::ValidationError& e) {
        spdlog::error("{}", e.what());
        std::cerr << argParser;
        return Exit::FAILURE;
    }

    if (!firstJson || !secondJson) {
        spdlog::error("Both the first and the second JSON path are required");
        std::cerr << argParser;
        return Exit::FAILURE;
    }

    const auto level = fVerbosityToLevel(args::get(verbose));
    spdlog::set_level(level);
    auto loggerRegistry = std::make_shared<Log::LoggerRegistry>(spdlog::sinks_init_list{consoleLogSink});
    for (const auto& moduleName : MODULE_NAMES) {
        loggerRegistry->RegisterModule(moduleName);
    }

    loggerRegistry->SetLevel(level);

    auto moduleRegistry = std::make_shared<ModuleRegistry>();
    moduleRegistry->SetLoggerRegistry(loggerRegistry);

    const size_t threadCount = threads ? args::get(threads) : static_cast<size_t>(std::thread::hardware_concurrency());
    if (threadCount > 1) {
        moduleRegistry->SetWorkerPool(std::make_shared<Concurrency::WorkerPool>(threadCount));
        spdlog::debug("Started worker pool with {} threads", threadCount);
    }

    Cli::CompareConfig config;
    config.Color = args::get(color);
    config.RawJson = args::get(rawJson);
    config.KeysOnly = args::get(keysOnly);
    if (outputDir) {
        config.OutputDir = args::get(outputDir);
    }

    if (parallelThreshold) {
        config.ParallelThreshold = args::get(parallelThreshold);
    }

    if (maxDepth) {
        config.MaxDepth = args::get(maxDepth);
    }

    try {
        Cli::CompareJob job(config, moduleRegistry);
        return job.Run(args::get(firstJson), args::get(secondJson), std::cout);
    }
    catch (const Std::Exception& ex) {
        spdlog::error("Failed to compare '{}' and '{}'. Error: {}", args::get(firstJson), args::get(secondJson), ex.what());
    }

    return Exit::FAILURE;
}
