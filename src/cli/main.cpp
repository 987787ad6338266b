// =============================================================================
// regmetrics CLI - Unified Command-Line Interface
// =============================================================================
//
// Usage:
//   regmetrics [global options] <command> [options]
//
// Commands:
//   convert     Convert bulk markup into the per-title JSON store + index
//   lookup      Print one section from the store
//   metrics     Walk version histories and store per-version metrics
//   version     Show version information
//   help        Show this help message
//
// Exit codes: 0 ok, 1 usage or configuration error, 2 some work failed,
// 3 run aborted (interrupt or index inconsistency).
//
// Examples:
//   regmetrics convert --input bulk --output json_cfr --workers 8
//   regmetrics lookup 2023 1 1 1.1
//   regmetrics metrics --sink jsonl --out metrics.jsonl listings/
//
// =============================================================================

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "regmetrics/config.hpp"
#include "regmetrics/db/metrics_sink.hpp"
#include "regmetrics/error.hpp"
#include "regmetrics/history/history_runner.hpp"
#include "regmetrics/history/version_listing.hpp"
#include "regmetrics/ingest/coordinator.hpp"
#include "regmetrics/logging.hpp"
#include "regmetrics/markup/discovery.hpp"
#include "regmetrics/store/index.hpp"
#include "regmetrics/store/title_store.hpp"
#include "regmetrics/util/threading.hpp"

namespace regmetrics::cli {
    int cmd_convert(int argc, char* argv[]);
    int cmd_lookup(int argc, char* argv[]);
    int cmd_metrics(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define REGMETRICS_VERSION_MAJOR 1
#define REGMETRICS_VERSION_MINOR 0
#define REGMETRICS_VERSION_PATCH 0
#define REGMETRICS_VERSION_STRING "1.0.0"

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_PARTIAL = 2,
    EXIT_ABORTED = 3
};

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"convert", "Convert bulk markup files into the JSON store and index", regmetrics::cli::cmd_convert},
    {"lookup",  "Print one section: lookup <year> <title> <part> <section>", regmetrics::cli::cmd_lookup},
    {"metrics", "Compute historical metrics from version listings", regmetrics::cli::cmd_metrics},
    {"version", "Show version information", regmetrics::cli::cmd_version},
    {"help",    "Show this help message", regmetrics::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "regmetrics.env";
    bool verbose = false;
    bool quiet = false;
    std::vector<std::pair<std::string, std::string>> overrides;  // config key -> value
};

static GlobalOptions g_options;
static regmetrics::CancellationToken g_cancel;

extern "C" void handle_interrupt(int) {
    g_cancel.cancel();
}

static bool parse_count(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v < 0 || v > 1'000'000) return false;
    out = static_cast<int>(v);
    return true;
}

namespace regmetrics::cli {

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "regmetrics - regulation extraction and historical metrics\n";
    std::cout << "Version " << REGMETRICS_VERSION_STRING << "\n\n";
    std::cout << "Usage: regmetrics [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key=value config file (default: regmetrics.env)\n";
    std::cout << "  -d, --database <name>   Database name\n";
    std::cout << "  -U, --user <user>       Database user\n";
    std::cout << "  -h, --host <host>       Database host\n";
    std::cout << "  -p, --port <port>       Database port\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  REGM_INPUT_DIR, REGM_STORE_DIR, REGM_WORKERS, REGM_WRITE_RETRIES,\n";
    std::cout << "  REGM_HISTORY_WORKERS, REGM_LOG_LEVEL, REGM_LOG_FILE,\n";
    std::cout << "  REGM_DB_HOST, REGM_DB_PORT, REGM_DB_USER, REGM_DB_PASS, REGM_DB_NAME\n";
    std::cout << "\nExit codes: 0 ok, 1 usage/config, 2 partial failure, 3 aborted\n";
    return EXIT_OK;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "regmetrics " << REGMETRICS_VERSION_STRING << "\n";
    return EXIT_OK;
}

// =============================================================================
// Convert
// =============================================================================

int cmd_convert(int argc, char* argv[]) {
    Config& config = Config::getInstance();
    std::string input = config.get<std::string>("input.dir", "bulk");
    std::string output = config.get<std::string>("store.dir", "json_cfr");
    int workers = config.get<int>("ingest.workers", 0);
    int retries = config.get<int>("ingest.write_retries", 2);

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output = argv[++i];
        } else if ((arg == "-j" || arg == "--workers") && i + 1 < argc) {
            if (!parse_count(argv[++i], workers)) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
        } else if ((arg == "-r" || arg == "--retries") && i + 1 < argc) {
            if (!parse_count(argv[++i], retries)) {
                std::cerr << "Invalid retry count: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
        } else {
            std::cerr << "Usage: regmetrics convert [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -i, --input <dir>       Bulk markup directory (input.dir)\n";
            std::cerr << "  -o, --output <dir>      Store directory (store.dir)\n";
            std::cerr << "  -j, --workers <n>       Worker threads, 0 = all cores (ingest.workers)\n";
            std::cerr << "  -r, --retries <n>       Extra write attempts per title (ingest.write_retries)\n";
            return EXIT_USAGE;
        }
    }

    markup::DiscoveryResult discovered = markup::discover_sources(input);
    if (discovered.sources.empty()) {
        std::cerr << "No CFR-<year>-title<n>-vol<m>*.xml files found under " << input << "\n";
        return EXIT_USAGE;
    }

    store::TitleStore store(output);
    ingest::CoordinatorOptions options;
    options.workers = static_cast<size_t>(workers);
    options.write_retries = retries;
    options.output_dir = output;
    options.cancel = &g_cancel;

    ingest::ConversionSummary summary;
    try {
        ingest::IngestionCoordinator coordinator(options, store);
        summary = coordinator.run(discovered.sources);
    } catch (const IndexInconsistencyError& e) {
        LOG_ERROR("Conversion aborted: ", e.what());
        return EXIT_ABORTED;
    }

    std::cout << "Units: " << summary.units_succeeded << " written, "
              << summary.units_failed << " failed, " << summary.units_skipped << " skipped\n";
    std::cout << "Files: " << summary.files_total << " total, " << summary.files_failed
              << " failed, " << discovered.ignored.size() << " ignored\n";
    std::cout << "Sections: " << summary.sections << "\n";
    for (const auto& err : summary.file_errors) {
        std::cout << "  [" << error_code_name(err.code) << "] " << err.path.string()
                  << ": " << err.message << "\n";
    }
    for (const auto& unit : summary.units) {
        if (unit.failed()) {
            std::cout << "  [failed] title " << unit.title_number << " (" << unit.year
                      << "): " << unit.write_error << "\n";
        }
    }

    if (summary.cancelled) {
        std::cout << "Interrupted: index not written\n";
        return EXIT_ABORTED;
    }
    std::cout << "Index: " << store::StoreIndex::path_in(output).string() << " ("
              << summary.index_entries << " sections)\n";
    return summary.all_succeeded() ? EXIT_OK : EXIT_PARTIAL;
}

// =============================================================================
// Lookup
// =============================================================================

static void print_list(const char* label, const std::vector<std::string>& items) {
    std::cout << label;
    for (size_t i = 0; i < items.size(); ++i) {
        std::cout << (i ? ", " : " ") << items[i];
    }
    std::cout << "\n";
}

int cmd_lookup(int argc, char* argv[]) {
    std::string store_dir = Config::getInstance().get<std::string>("store.dir", "json_cfr");
    std::vector<std::string> positional;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-s" || arg == "--store") && i + 1 < argc) {
            store_dir = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 4) {
        std::cerr << "Usage: regmetrics lookup [--store <dir>] <year> <title> <part> <section>\n";
        return EXIT_USAGE;
    }
    const std::string& year = positional[0];
    const std::string& title = positional[1];
    const std::string& part = positional[2];
    const std::string& section = positional[3];

    store::SectionLookup lookup(store_dir);
    auto record = lookup.lookup(year, title, part, section);
    if (record) {
        std::cout << "Year: " << record->year << "\n";
        std::cout << "Title: " << record->title_number << "\n";
        std::cout << "Part " << record->part_number << ": " << record->part_title << "\n";
        std::cout << "Section " << record->section_number << ": " << record->section_title << "\n\n";
        std::cout << (record->content_empty ? "[no body text]" : record->content) << "\n";
        return EXIT_OK;
    }

    std::cout << "Section not found: " << year << " / title " << title << " / part " << part
              << " / section " << section << "\n";
    const store::StoreIndex& index = lookup.index();
    if (index.titles(year).empty()) {
        print_list("Available years:", index.years());
    } else if (index.parts(year, title).empty()) {
        print_list("Available titles:", index.titles(year));
    } else if (index.sections(year, title, part).empty()) {
        print_list("Available parts:", index.parts(year, title));
    } else {
        print_list("Available sections:", index.sections(year, title, part));
    }
    return EXIT_PARTIAL;
}

// =============================================================================
// Metrics
// =============================================================================

int cmd_metrics(int argc, char* argv[]) {
    Config& config = Config::getInstance();
    std::string sink_kind = "postgres";
    std::string out_path;
    std::string listing;
    int workers = config.get<int>("history.workers", 2);
    bool snapshot = config.get<bool>("history.snapshot", true);

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--sink" && i + 1 < argc) {
            sink_kind = argv[++i];
        } else if ((arg == "-o" || arg == "--out") && i + 1 < argc) {
            out_path = argv[++i];
        } else if ((arg == "-j" || arg == "--workers") && i + 1 < argc) {
            if (!parse_count(argv[++i], workers) || workers == 0) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
        } else if (arg == "--no-snapshot") {
            snapshot = false;
        } else if (!arg.empty() && arg[0] != '-' && listing.empty()) {
            listing = arg;
        } else {
            listing.clear();
            break;
        }
    }

    if (listing.empty() || (sink_kind != "postgres" && sink_kind != "jsonl")) {
        std::cerr << "Usage: regmetrics metrics [options] <listing.json | listing_dir>\n";
        std::cerr << "Options:\n";
        std::cerr << "  --sink <postgres|jsonl>  Destination (default: postgres)\n";
        std::cerr << "  -o, --out <file>         JSON-lines output file (default: stdout)\n";
        std::cerr << "  -j, --workers <n>        Parallel documents, max 10 (history.workers)\n";
        std::cerr << "  --no-snapshot            Do not store content snapshots\n";
        return EXIT_USAGE;
    }

    history::ListingLoadResult loaded = history::load_version_listings(listing);
    for (const auto& err : loaded.errors) {
        std::cerr << "  [listing] " << err << "\n";
    }

    std::unique_ptr<db::MetricsSink> sink;
    if (sink_kind == "jsonl") {
        if (out_path.empty()) {
            sink = std::make_unique<db::JsonLinesMetricsSink>(std::cout);
        } else {
            sink = std::make_unique<db::JsonLinesMetricsSink>(out_path);
        }
    } else {
        auto pg = std::make_unique<db::PostgresMetricsSink>();
        pg->ensure_schema();
        sink = std::move(pg);
    }

    history::HistoryOptions options;
    options.workers = static_cast<size_t>(workers);
    options.keep_snapshot = snapshot;
    options.cancel = &g_cancel;

    history::HistoryRunner runner(options, *sink);
    history::HistorySummary summary = runner.run(std::move(loaded.histories));

    std::ostream& report = (sink_kind == "jsonl" && out_path.empty()) ? std::cerr : std::cout;
    report << "Documents: " << summary.documents << " (" << summary.documents_failed
           << " failed, " << summary.documents_skipped << " skipped)\n";
    report << "Records: " << summary.records_stored << " stored, "
           << summary.records_already_stored << " already present, "
           << summary.versions_skipped << " versions skipped\n";

    if (summary.cancelled) return EXIT_ABORTED;
    if (!summary.all_succeeded() || !loaded.errors.empty()) return EXIT_PARTIAL;
    return EXIT_OK;
}

}  // namespace regmetrics::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            g_options.overrides.emplace_back("db.name", argv[++i]);
        } else if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
            g_options.overrides.emplace_back("db.user", argv[++i]);
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            g_options.overrides.emplace_back("db.host", argv[++i]);
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            g_options.overrides.emplace_back("db.port", argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        regmetrics::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    const Command* selected = nullptr;
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            selected = cmd;
            break;
        }
    }
    if (!selected) {
        std::cerr << "Unknown command: " << cmd_name << "\n";
        std::cerr << "Run 'regmetrics help' for usage.\n";
        return EXIT_USAGE;
    }

    try {
        regmetrics::init_config(g_options.config_file);
        regmetrics::Config& config = regmetrics::Config::getInstance();
        for (const auto& [key, value] : g_options.overrides) {
            config.set(key, value);
        }
        if (g_options.verbose) regmetrics::set_log_level(regmetrics::LogLevel::DEBUG);
        if (g_options.quiet) regmetrics::set_log_level(regmetrics::LogLevel::WARN);
        if (g_options.verbose) config.print();
    } catch (const regmetrics::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    try {
        return selected->handler(argc, argv);
    } catch (const regmetrics::RegMetricsException& e) {
        LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        if (!e.suggestion().empty()) {
            std::cerr << "Hint: " << e.suggestion() << "\n";
        }
        return e.code() == regmetrics::ErrorCode::CONFIG_INVALID ||
               e.code() == regmetrics::ErrorCode::INVALID_ARGUMENT ? EXIT_USAGE : EXIT_PARTIAL;
    }
}
