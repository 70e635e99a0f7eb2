#include "collector.hpp"
#include "config.hpp"
#include "csv_export.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "retry_client.hpp"
#include "session_runner.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using namespace audit_collector;

namespace {

struct CliOptions {
    std::string command;
    std::string name;
    std::string dateFrom;
    std::string dateTo;
    std::string envFile = ".env";
    std::string exportPath;   // collect: optional CSV after success
    std::string logPath;      // export
    std::string outPath;      // export
    bool        verbose = false;
};

constexpr int kExitFailure       = 1;
constexpr int kExitConfigMissing = 2;

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  audit_collector collect --name NAME --from YYYY-MM-DD --to YYYY-MM-DD\n"
        << "                          [--env FILE] [--export CSV] [--verbose]\n"
        << "  audit_collector export --log LOG --out CSV\n\n"
        << "Options:\n"
        << "  --name NAME      Session name; the log is LOGS_DIR/NAME.log\n"
        << "  --from DATE      First day of the window (UTC+9)\n"
        << "  --to DATE        Last day of the window  (UTC+9)\n"
        << "  --env FILE       dotenv file with ORG_ID, API_TOKEN, ... "
           "(default: .env)\n"
        << "  --export CSV     Convert the log to CSV after a successful run\n"
        << "  --log LOG        Session log to convert\n"
        << "  --out CSV        CSV file to write\n"
        << "  --verbose        Enable verbose diagnostics on stderr\n"
        << "  --help, -h       Show this message\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    int i = 1;
    if (argc > 1 && argv[1][0] != '-') {
        opts.command = argv[1];
        i = 2;
    }

    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--name" && i + 1 < argc) {
            opts.name = argv[++i];
        } else if (arg == "--from" && i + 1 < argc) {
            opts.dateFrom = argv[++i];
        } else if (arg == "--to" && i + 1 < argc) {
            opts.dateTo = argv[++i];
        } else if (arg == "--env" && i + 1 < argc) {
            opts.envFile = argv[++i];
        } else if (arg == "--export" && i + 1 < argc) {
            opts.exportPath = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            opts.logPath = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            opts.outPath = argv[++i];
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(kExitFailure);
        }
    }
    return opts;
}

std::string stripLogSuffix(std::string name) {
    const std::string suffix = ".log";
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.erase(name.size() - suffix.size());
    }
    return name;
}

int runExport(const std::string& logPath, const std::string& csvPath) {
    const auto count = exportLogToCsv(logPath, csvPath);
    std::cout << "Saved " << count << " records to " << csvPath << "\n";
    return 0;
}

int runCollect(const CliOptions& opts) {
    const std::string name = stripLogSuffix(opts.name);
    if (name.empty() || opts.dateFrom.empty() || opts.dateTo.empty()) {
        std::cerr << "collect needs --name, --from and --to\n\n";
        printUsage();
        return kExitFailure;
    }

    const auto from = parseCalendarDate(opts.dateFrom);
    const auto to   = parseCalendarDate(opts.dateTo);
    if (!from || !to) {
        std::cerr << "Dates must be given as YYYY-MM-DD\n";
        return kExitFailure;
    }

    CollectionRequest request;
    request.sessionName   = name;
    request.windowStartMs = startOfDayMs(*from);
    request.windowEndMs   = endOfDayMs(*to);
    if (request.windowStartMs > request.windowEndMs) {
        std::cerr << "--from must not be after --to\n";
        return kExitFailure;
    }

    const Settings settings = loadSettingsFromEnvironment(opts.envFile);

    std::cout
        << "=== audit_collector ===\n"
        << "Endpoint:   " << settings.eventsEndpoint()          << "\n"
        << "Window:     " << request.windowStartMs << " .. "
                          << request.windowEndMs                 << "\n"
        << "Page size:  " << settings.pageSize                   << "\n"
        << "Retries:    " << settings.maxRetries                 << " (base "
                          << settings.retryBaseSeconds           << " s)\n"
        << "Timeout:    " << settings.requestTimeoutSeconds      << " s\n"
        << "Output:     " << Collector::logPathFor(settings, name) << "\n"
        << "=======================\n\n";

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds(settings.requestTimeoutSeconds));
    HttpClient client(settings.apiToken, static_cast<int>(timeout.count()));
    client.setVerbose(opts.verbose);

    ProgressChannel progress;
    RetryClient     retryClient(client, settings, progress, {}, opts.verbose);
    Collector       collector(retryClient, settings, progress, opts.verbose);
    SessionRunner   runner(collector, progress);

    if (!runner.start(request)) {
        std::cerr << "A collection session is already running\n";
        return kExitFailure;
    }

    // Drain the channel on our own schedule until the terminal signal.
    bool finished = false;
    while (!finished) {
        for (const auto& event : progress.drain()) {
            std::cout << renderProgressLine(event) << "\n";
            finished = finished || event.isTerminal();
        }
        std::cout.flush();
        if (!finished) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    const auto outcome = runner.wait();
    if (!outcome || outcome->state != Collector::State::Done) {
        return kExitFailure;
    }

    std::cout
        << "\n=== Summary Report ===\n"
        << "Records saved:       " << outcome->totalRecords            << "\n"
        << "Total requests:      " << outcome->stats.totalRequests     << "\n"
        << "Total retries:       " << outcome->stats.totalRetries      << "\n"
        << "Rate limited:        " << outcome->stats.rateLimited       << "\n"
        << "Total sleep (s):     " << std::fixed << std::setprecision(2)
                                   << outcome->stats.totalSleepSeconds << "\n"
        << "======================\n";

    if (!opts.exportPath.empty()) {
        return runExport(outcome->logPath, opts.exportPath);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CliOptions opts = parseArgs(argc, argv);

        if (opts.command == "collect") {
            return runCollect(opts);
        }
        if (opts.command == "export") {
            if (opts.logPath.empty() || opts.outPath.empty()) {
                std::cerr << "export needs --log and --out\n\n";
                printUsage();
                return kExitFailure;
            }
            return runExport(opts.logPath, opts.outPath);
        }

        printUsage();
        return kExitFailure;

    } catch (const ConfigMissing& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return kExitConfigMissing;
    } catch (const CorruptLog& e) {
        std::cerr << "Export failed: " << e.what() << "\n";
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}
