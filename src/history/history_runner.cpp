#include "regmetrics/history/history_runner.hpp"

#include <algorithm>
#include <exception>
#include <future>

#include "regmetrics/history/version_walker.hpp"
#include "regmetrics/logging.hpp"
#include "regmetrics/thread_pool.hpp"

namespace regmetrics::history {

HistoryRunner::HistoryRunner(HistoryOptions options, db::MetricsSink& sink)
    : options_(options), sink_(sink),
      workers_(std::clamp<size_t>(options.workers, 1, kMaxWorkers)) {
    if (options.workers > kMaxWorkers) {
        LOG_WARN("history.workers=", options.workers, " capped at ", kMaxWorkers);
    }
}

DocumentOutcome HistoryRunner::process(DocumentHistory history) {
    DocumentOutcome outcome;
    outcome.document_id = history.document_id;
    outcome.versions = history.versions.size();

    if (options_.cancel && options_.cancel->is_cancelled()) {
        outcome.skipped = true;
        return outcome;
    }

    try {
        VersionWalker walker(std::move(history), WalkerOptions{options_.keep_snapshot});
        std::vector<MetricsRecord> records = walker.walk();
        outcome.computed = walker.computed();
        outcome.skipped_missing = walker.skipped_missing();
        outcome.skipped_malformed = walker.skipped_malformed();

        std::lock_guard<std::mutex> lock(sink_mutex_);
        for (const auto& record : records) {
            if (sink_.write(record)) {
                ++outcome.stored;
            } else {
                ++outcome.already_stored;
            }
        }
        sink_.flush();
    } catch (const std::exception& e) {
        outcome.error = e.what();
        LOG_ERROR("Document ", outcome.document_id, " failed: ", e.what());
    }
    return outcome;
}

HistorySummary HistoryRunner::run(std::vector<DocumentHistory> histories) {
    HistorySummary summary;
    summary.documents = histories.size();

    // Outlives the pool: queued tasks still report into it while the pool drains
    ProgressTracker progress(histories.size(), 25);
    ThreadPool pool(workers_);
    LOG_INFO("Walking ", histories.size(), " document histories with ", workers_, " workers");

    std::vector<std::future<DocumentOutcome>> futures;
    futures.reserve(histories.size());
    for (auto& history : histories) {
        futures.push_back(pool.submit([this, &progress, h = std::move(history)]() mutable {
            DocumentOutcome outcome = process(std::move(h));
            size_t done = progress.increment();
            if (progress.should_report(done)) {
                LOG_INFO("Progress: ", done, "/", progress.total(), " documents");
            }
            return outcome;
        }));
    }

    for (auto& f : futures) {
        DocumentOutcome outcome = f.get();
        summary.records_computed += outcome.computed;
        summary.records_stored += outcome.stored;
        summary.records_already_stored += outcome.already_stored;
        summary.versions_skipped += outcome.skipped_missing + outcome.skipped_malformed;
        if (outcome.skipped) {
            ++summary.documents_skipped;
        } else if (!outcome.error.empty()) {
            ++summary.documents_failed;
        }
        summary.outcomes.push_back(std::move(outcome));
    }
    summary.cancelled = options_.cancel && options_.cancel->is_cancelled();

    LOG_INFO("History run finished: ", summary.records_stored, " records stored, ",
             summary.records_already_stored, " already present, ", summary.versions_skipped,
             " versions skipped, ", summary.documents_failed, " documents failed");
    return summary;
}

} // namespace regmetrics::history
