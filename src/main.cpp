#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "orchestrator.hpp"
#include "pipeline.hpp"
#include "report_writer.hpp"
#include "util.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::string              configPath;
    std::vector<std::string> keywords;
    std::string              start;
    std::string              end;
    int                      maxResults = -1;   // -1 = keep config value
    std::string              outputDir;
    bool                     verbose = false;
};

bili_trends::CancellationToken gCancel;

extern "C" void onInterrupt(int) {
    gCancel.requestCancel();
}

void printUsage() {
    std::cout
        << "Usage: bili_trends [options]\n\n"
        << "Options:\n"
        << "  --config PATH      JSON config file            (default: built-in settings)\n"
        << "  --keyword K        Search keyword, repeatable  (replaces configured keywords)\n"
        << "  --start YYYY-MM-DD First publish date          (default: 2019-01-01)\n"
        << "  --end YYYY-MM-DD   Last publish date           (default: 2025-12-31)\n"
        << "  --max-results N    Result cap per keyword      (default: 1000, 0 = unlimited)\n"
        << "  --output-dir DIR   Output directory            (default: output)\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--keyword" && i + 1 < argc) {
            opts.keywords.emplace_back(argv[++i]);
        } else if (arg == "--start" && i + 1 < argc) {
            opts.start = argv[++i];
        } else if (arg == "--end" && i + 1 < argc) {
            opts.end = argv[++i];
        } else if (arg == "--max-results" && i + 1 < argc) {
            opts.maxResults = std::stoi(argv[++i]);
        } else if (arg == "--output-dir" && i + 1 < argc) {
            opts.outputDir = argv[++i];
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return opts;
}

/// Config file (or defaults) with command-line overrides applied, validated.
bili_trends::AppConfig buildConfig(const CliOptions& opts) {
    using namespace bili_trends;

    AppConfig cfg = opts.configPath.empty() ? defaultConfig() : loadConfigFile(opts.configPath);

    if (!opts.keywords.empty()) cfg.collection.keywords = opts.keywords;
    if (opts.maxResults >= 0)   cfg.collection.maxResultsPerKeyword = opts.maxResults;
    if (!opts.outputDir.empty()) cfg.outputDir = opts.outputDir;
    if (opts.verbose)           cfg.verbose = true;

    const auto offset = cfg.analysis.utcOffsetSeconds;
    if (!opts.start.empty()) {
        cfg.collection.dateRange.start = dateRangeFromStrings(opts.start, opts.start, offset).start;
    }
    if (!opts.end.empty()) {
        cfg.collection.dateRange.end = dateRangeFromStrings(opts.end, opts.end, offset).end;
    }

    validateConfig(cfg);
    return cfg;
}

void printSummary(const bili_trends::Report& report, const std::string& outputDir) {
    using bili_trends::formatIsoUtc;

    const auto& s = report.summary;
    std::cout
        << "\n=== Summary Report ===\n"
        << "Unique videos:       " << s.totalRecords  << "\n"
        << "Raw records:         " << s.rawRecords    << "\n"
        << "Units:               " << s.totalUnits
                                   << " (failed " << s.failedUnits
                                   << ", partial " << s.partialUnits
                                   << ", cancelled " << s.cancelledUnits << ")\n"
        << "Total requests:      " << s.totalRequests << "\n"
        << "Total retries:       " << s.totalRetries  << "\n"
        << "Total views:         " << s.totalViews    << "\n"
        << "Avg views:           " << std::fixed << std::setprecision(2) << s.avgViews << "\n"
        << "Total engagement:    " << std::setprecision(0) << s.totalEngagement << "\n"
        << "Avg engagement rate: " << std::setprecision(3) << s.avgEngagementRate << "\n"
        << std::defaultfloat << std::setprecision(6);
    if (s.coveredRange) {
        std::cout << "Covered range:       " << formatIsoUtc(s.coveredRange->start)
                  << " .. " << formatIsoUtc(s.coveredRange->end) << "\n";
    }
    if (!s.failedKeywords.empty()) {
        std::cout << "Failed keywords:    ";
        for (const auto& k : s.failedKeywords) std::cout << " " << k;
        std::cout << "\n";
    }

    std::cout << "\n--- Aggregates ---\n";
    for (const auto& [name, table] : report.tables) {
        std::cout << "  " << std::left << std::setw(24) << name << std::right;
        if (table.degraded) {
            std::cout << "DEGRADED: " << table.error << "\n";
        } else {
            std::cout << table.rows.size() << " rows, " << table.excluded << " excluded\n";
        }
    }

    std::cout << "\nOutputs written to " << outputDir << "\n"
              << "======================\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace bili_trends;

    std::string stage = "config";
    std::size_t retained = 0;

    try {
        CliOptions opts = parseArgs(argc, argv);
        AppConfig cfg = buildConfig(opts);

        std::cout
            << "=== bili_trends ===\n"
            << "Endpoint:    " << cfg.api.endpoint << "\n"
            << "Keywords:    " << cfg.collection.keywords.size() << "\n"
            << "Date range:  " << formatIsoUtc(cfg.collection.dateRange.start)
                               << " .. " << formatIsoUtc(cfg.collection.dateRange.end) << "\n"
            << "Max results: " << cfg.collection.maxResultsPerKeyword << " per keyword\n"
            << "Interval:    " << cfg.collection.requestIntervalMs << " ms\n"
            << "Output dir:  " << cfg.outputDir << "\n"
            << "Verbose:     " << (cfg.verbose ? "yes" : "no") << "\n"
            << "===================\n\n";

        // Built before collection so a bad lexicon fails fast.
        AnalysisPipeline pipeline(cfg, cfg.verbose);

        stage = "collection";
        std::signal(SIGINT, onInterrupt);

        HttpClient http(cfg.api.endpoint, cfg.api.timeoutMs);
        http.setVerbose(cfg.verbose);
        BilibiliApiClient client(http, cfg.api, cfg.collection.pageSize, cfg.verbose);
        SteadyClock clock;

        CollectionOrchestrator orchestrator(client, clock, cfg);
        auto collected = orchestrator.run(gCancel);
        retained = collected.merged.size();

        auto summary = summarize(collected, cfg);
        summary.generatedAt = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        stage = "analysis";
        const auto report = pipeline.run(collected.merged, std::move(summary));

        stage = "output";
        std::filesystem::create_directories(cfg.outputDir);
        const auto dir = std::filesystem::path(cfg.outputDir);
        writeReportJson(report, (dir / "analysis_report.json").string());
        writeDatasetCsv(report.records, (dir / "analyzed_data.csv").string());

        printSummary(report, cfg.outputDir);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error [" << stage << "]: " << e.what() << "\n";
        if (stage != "config") {
            std::cerr << "Partial records retained: " << retained << "\n";
        }
        return 1;
    }
}
