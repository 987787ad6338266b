/**
 * @file coordinator.hpp
 * @brief Parallel Ingestion Coordinator
 *
 * Partitions discovered markup files by (year, title) into units and runs
 * the units on a bounded ThreadPool. A unit parses its files in volume
 * order, merges them into one TitleFile and writes it with bounded retries.
 *
 * run() blocks until every unit has finished, then builds and saves the
 * index exactly once from the receipts of the units that were written.
 * A cancelled run skips pending units and builds no index; TitleFiles that
 * were already written stay valid.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "regmetrics/error.hpp"
#include "regmetrics/markup/discovery.hpp"
#include "regmetrics/store/title_store.hpp"
#include "regmetrics/util/threading.hpp"

namespace regmetrics::ingest {

struct CoordinatorOptions {
    size_t workers = 0;                       // 0 = hardware concurrency
    int write_retries = 2;                    // extra attempts after the first
    std::filesystem::path output_dir;         // store root; index.json goes here
    const CancellationToken* cancel = nullptr;
};

struct FileError {
    std::filesystem::path path;
    ErrorCode code = ErrorCode::PARSE_ERROR;
    std::string message;
};

// All files of one (year, title), volume order
struct IngestUnit {
    std::string year;
    std::string title_number;
    std::vector<markup::MarkupSource> files;
};

struct UnitResult {
    std::string year;
    std::string title_number;
    std::vector<std::string> volumes;

    size_t files = 0;
    size_t files_parsed = 0;
    size_t sections = 0;
    size_t anomalies = 0;
    size_t duplicates = 0;

    int write_attempts = 0;
    bool written = false;
    bool skipped = false;  // cancelled before it ran
    std::string write_error;

    std::vector<FileError> file_errors;
    store::WriteReceipt receipt;

    bool failed() const { return !written && !skipped; }
};

struct ConversionSummary {
    size_t units_total = 0;
    size_t units_succeeded = 0;
    size_t units_failed = 0;
    size_t units_skipped = 0;
    size_t files_total = 0;
    size_t files_failed = 0;
    size_t sections = 0;

    bool cancelled = false;
    bool index_built = false;
    size_t index_entries = 0;

    std::vector<UnitResult> units;       // in (year, title) order
    std::vector<FileError> file_errors;  // all units, in unit order

    bool all_succeeded() const { return units_failed == 0 && files_failed == 0 && !cancelled; }
};

class IngestionCoordinator {
public:
    IngestionCoordinator(CoordinatorOptions options, store::TitleFileWriter& writer);

    // Throws IndexInconsistencyError if the index cannot be backed by the
    // written TitleFiles and StoreError if index.json cannot be saved; every
    // other failure is reported in the summary.
    ConversionSummary run(const std::vector<markup::MarkupSource>& sources);

    // Groups by (year, title); files inside a unit sorted by volume then path
    static std::vector<IngestUnit> partition(const std::vector<markup::MarkupSource>& sources);

private:
    UnitResult process_unit(const IngestUnit& unit) const;
    bool cancelled() const { return options_.cancel && options_.cancel->is_cancelled(); }

    CoordinatorOptions options_;
    store::TitleFileWriter& writer_;
};

} // namespace regmetrics::ingest
