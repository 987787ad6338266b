#include "regmetrics/ingest/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <map>
#include <thread>

#include "regmetrics/logging.hpp"
#include "regmetrics/markup/hierarchy.hpp"
#include "regmetrics/markup/record_builder.hpp"
#include "regmetrics/store/index.hpp"
#include "regmetrics/thread_pool.hpp"
#include "regmetrics/util/text.hpp"

namespace fs = std::filesystem;

namespace regmetrics::ingest {

IngestionCoordinator::IngestionCoordinator(CoordinatorOptions options,
                                           store::TitleFileWriter& writer)
    : options_(std::move(options)), writer_(writer) {
    REGMETRICS_CHECK_ARGUMENT(options_.write_retries >= 0, "write_retries must be >= 0");
}

std::vector<IngestUnit> IngestionCoordinator::partition(
        const std::vector<markup::MarkupSource>& sources) {
    struct KeyLess {
        bool operator()(const std::pair<std::string, std::string>& a,
                        const std::pair<std::string, std::string>& b) const {
            int c = util::compare_numbering(a.first, b.first);
            if (c != 0) return c < 0;
            return util::compare_numbering(a.second, b.second) < 0;
        }
    };
    std::map<std::pair<std::string, std::string>, IngestUnit, KeyLess> groups;

    for (const auto& src : sources) {
        IngestUnit& unit = groups[{src.year, src.title_number}];
        unit.year = src.year;
        unit.title_number = src.title_number;
        unit.files.push_back(src);
    }

    std::vector<IngestUnit> units;
    units.reserve(groups.size());
    for (auto& [key, unit] : groups) {
        std::sort(unit.files.begin(), unit.files.end(),
                  [](const markup::MarkupSource& a, const markup::MarkupSource& b) {
                      int c = util::compare_numbering(a.volume, b.volume);
                      if (c != 0) return c < 0;
                      return a.path < b.path;
                  });
        units.push_back(std::move(unit));
    }
    return units;
}

UnitResult IngestionCoordinator::process_unit(const IngestUnit& unit) const {
    UnitResult result;
    result.year = unit.year;
    result.title_number = unit.title_number;
    result.files = unit.files.size();

    if (cancelled()) {
        result.skipped = true;
        return result;
    }

    markup::HierarchyParser parser;
    TitleFile title;
    title.year = unit.year;
    title.title_number = unit.title_number;

    for (const auto& src : unit.files) {
        if (cancelled()) {
            result.skipped = true;
            LOG_WARN("Cancelled while converting title ", unit.title_number, " (", unit.year,
                     "); nothing written for this unit");
            return result;
        }

        try {
            markup::ParseOutcome outcome = parser.parse_file(src.path);
            if (!outcome.ok()) {
                std::string message = outcome.error.value_or("unknown parse failure");
                LOG_ERROR("Failed to parse ", src.path.string(), ": ", message);
                result.file_errors.push_back({src.path, outcome.error_code, message});
                continue;
            }

            auto records = markup::build_section_records(*outcome.root, unit.year, unit.title_number);
            auto stats = markup::merge_into_title_file(title, records, src.volume);

            ++result.files_parsed;
            result.anomalies += outcome.anomalies;
            result.duplicates += stats.duplicates + stats.replaced;
            result.volumes.push_back(src.volume);
            LOG_DEBUG("Parsed ", src.path.filename().string(), ": ", records.size(),
                      " sections, ", outcome.anomalies, " anomalies");
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to convert ", src.path.string(), ": ", e.what());
            result.file_errors.push_back({src.path, ErrorCode::INTERNAL_ERROR, e.what()});
        }
    }

    if (result.files_parsed == 0) {
        result.write_error = "no file of this unit could be parsed";
        LOG_ERROR("Title ", unit.title_number, " (", unit.year, "): ", result.write_error);
        return result;
    }

    result.sections = title.section_count();

    const int max_attempts = 1 + options_.write_retries;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        result.write_attempts = attempt;
        store::WriteResult wr;
        try {
            wr = writer_.write(title);
        } catch (const std::exception& e) {
            wr.ok = false;
            wr.error = e.what();
        }
        if (wr.ok) {
            result.written = true;
            result.write_error.clear();
            result.receipt = std::move(wr.receipt);
            break;
        }
        result.write_error = wr.error;
        if (attempt < max_attempts) {
            LOG_WARN("Write of title ", unit.title_number, " (", unit.year, ") failed, attempt ",
                     attempt, "/", max_attempts, ": ", wr.error);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * attempt));
        }
    }

    if (!result.written) {
        LOG_ERROR("Giving up on title ", unit.title_number, " (", unit.year, ") after ",
                  max_attempts, " attempts: ", result.write_error);
    }
    return result;
}

ConversionSummary IngestionCoordinator::run(const std::vector<markup::MarkupSource>& sources) {
    ConversionSummary summary;
    summary.files_total = sources.size();

    // A run that never reaches the barrier must not leave a stale index behind
    std::error_code ec;
    fs::remove(store::StoreIndex::path_in(options_.output_dir), ec);
    if (ec) {
        LOG_WARN("Could not remove previous index: ", ec.message());
    }

    std::vector<IngestUnit> units = partition(sources);
    summary.units_total = units.size();

    ProgressTracker progress(units.size(), 10);
    ThreadPool pool(options_.workers);
    LOG_INFO("Converting ", sources.size(), " files in ", units.size(), " units with ",
             pool.num_threads(), " workers");

    std::vector<std::future<UnitResult>> futures;
    futures.reserve(units.size());
    for (const auto& unit : units) {
        futures.push_back(pool.submit([this, &unit, &progress]() {
            UnitResult r = process_unit(unit);
            size_t done = progress.increment();
            if (progress.should_report(done)) {
                LOG_INFO("Progress: ", done, "/", progress.total(), " units");
            }
            return r;
        }));
    }

    // Barrier: every unit has finished before the index is touched
    for (auto& f : futures) {
        summary.units.push_back(f.get());
    }

    std::vector<store::WriteReceipt> receipts;
    for (const auto& unit : summary.units) {
        summary.files_failed += unit.file_errors.size();
        summary.file_errors.insert(summary.file_errors.end(), unit.file_errors.begin(),
                                   unit.file_errors.end());
        if (unit.written) {
            ++summary.units_succeeded;
            summary.sections += unit.sections;
            receipts.push_back(unit.receipt);
        } else if (unit.skipped) {
            ++summary.units_skipped;
        } else {
            ++summary.units_failed;
        }
    }

    summary.cancelled = cancelled();
    if (summary.cancelled) {
        LOG_WARN("Conversion cancelled: ", summary.units_succeeded, " units written, ",
                 summary.units_skipped, " skipped; index not built");
        return summary;
    }

    store::StoreIndex index = store::StoreIndex::build(receipts, options_.output_dir);
    index.save(options_.output_dir);
    summary.index_built = true;
    summary.index_entries = index.size();

    LOG_INFO("Conversion finished: ", summary.units_succeeded, " units written, ",
             summary.units_failed, " failed, ", summary.files_failed, " file errors, ",
             summary.sections, " sections indexed");
    return summary;
}

} // namespace regmetrics::ingest
