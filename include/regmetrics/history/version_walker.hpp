/**
 * @file version_walker.hpp
 * @brief Version History Walker: newest-first version list -> MetricsRecords
 *
 * States: AT_LATEST (list loaded, nothing processed), WALKING (one version
 * per step, newest to oldest) and DONE (terminal).
 *
 * The walker is built in two passes. The first pass runs on construction:
 * every version is validated (missing text, bad or out-of-order dates,
 * markup that does not parse). Date order is judged over the whole list: the
 * longest strictly descending run of dates is kept and every other dated
 * version is out of order and the author sets of the valid versions are
 * folded oldest -> newest into a cumulative count per version. The walk then
 * attaches that count to each version's MetricsRecord, so total_authors is
 * correct even though versions are visited newest first.
 *
 * A skipped version produces no record and contributes no authors.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "regmetrics/history/metrics_calculator.hpp"
#include "regmetrics/types.hpp"

namespace regmetrics::history {

enum class WalkState {
    AtLatest,
    Walking,
    Done
};

const char* walk_state_name(WalkState state);

enum class VersionStatus {
    Valid,
    Missing,    // no text supplied
    Malformed   // bad date, out of order, duplicate, or unparseable markup
};

struct WalkerOptions {
    bool keep_snapshot = true;  // copy body text into MetricsRecord::content_snapshot
};

class VersionWalker {
public:
    explicit VersionWalker(DocumentHistory history, WalkerOptions options = {});

    WalkState state() const { return state_; }

    // Processes the next version. Returns its record, or nullopt when the
    // version was skipped or the walker is DONE.
    std::optional<MetricsRecord> step();

    // Steps until DONE; records come back newest first
    std::vector<MetricsRecord> walk();

    const std::string& document_id() const { return history_.document_id; }
    size_t version_count() const { return history_.versions.size(); }
    size_t position() const { return position_; }

    VersionStatus status(size_t index) const { return prepared_.at(index).status; }
    // Cumulative unique authors of the valid versions up to and including `index`
    size_t cumulative_authors(size_t index) const { return prepared_.at(index).cumulative_authors; }

    size_t computed() const { return computed_; }
    size_t skipped_missing() const { return skipped_missing_; }
    size_t skipped_malformed() const { return skipped_malformed_; }

private:
    struct PreparedVersion {
        VersionStatus status = VersionStatus::Valid;
        std::string reason;
        std::string body;
        StructureCounts structure;
        size_t cumulative_authors = 0;
    };

    void prepare();
    std::vector<bool> ordered_dates() const;
    void prepare_body(const VersionRecord& version, PreparedVersion& out) const;

    DocumentHistory history_;
    WalkerOptions options_;
    std::vector<PreparedVersion> prepared_;

    WalkState state_ = WalkState::AtLatest;
    size_t position_ = 0;
    size_t computed_ = 0;
    size_t skipped_missing_ = 0;
    size_t skipped_malformed_ = 0;
};

} // namespace regmetrics::history
