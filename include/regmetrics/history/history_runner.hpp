/**
 * @file history_runner.hpp
 * @brief Runs one VersionWalker per document in parallel and feeds a MetricsSink
 *
 * Walks are independent and run on a ThreadPool (history.workers, capped at
 * kMaxWorkers). Each walk is sequential; sink writes are serialized.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "regmetrics/db/metrics_sink.hpp"
#include "regmetrics/types.hpp"
#include "regmetrics/util/threading.hpp"

namespace regmetrics::history {

struct HistoryOptions {
    size_t workers = 2;
    bool keep_snapshot = true;
    const CancellationToken* cancel = nullptr;
};

struct DocumentOutcome {
    std::string document_id;
    size_t versions = 0;
    size_t computed = 0;
    size_t stored = 0;
    size_t already_stored = 0;
    size_t skipped_missing = 0;
    size_t skipped_malformed = 0;
    bool skipped = false;   // cancelled before it ran
    std::string error;      // sink failure; records after it were not stored
};

struct HistorySummary {
    size_t documents = 0;
    size_t records_computed = 0;
    size_t records_stored = 0;
    size_t records_already_stored = 0;
    size_t versions_skipped = 0;
    size_t documents_failed = 0;
    size_t documents_skipped = 0;
    bool cancelled = false;

    std::vector<DocumentOutcome> outcomes;  // input order

    bool all_succeeded() const { return documents_failed == 0 && !cancelled; }
};

class HistoryRunner {
public:
    static constexpr size_t kMaxWorkers = 10;

    HistoryRunner(HistoryOptions options, db::MetricsSink& sink);

    HistorySummary run(std::vector<DocumentHistory> histories);

    size_t workers() const { return workers_; }

private:
    DocumentOutcome process(DocumentHistory history);

    HistoryOptions options_;
    db::MetricsSink& sink_;
    size_t workers_;
    std::mutex sink_mutex_;
};

} // namespace regmetrics::history
