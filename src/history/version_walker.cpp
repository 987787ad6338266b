#include "regmetrics/history/version_walker.hpp"

#include <algorithm>
#include <set>

#include "regmetrics/logging.hpp"
#include "regmetrics/markup/hierarchy.hpp"
#include "regmetrics/util/text.hpp"

namespace regmetrics::history {

const char* walk_state_name(WalkState state) {
    switch (state) {
        case WalkState::AtLatest: return "AT_LATEST";
        case WalkState::Walking:  return "WALKING";
        case WalkState::Done:     return "DONE";
    }
    return "UNKNOWN";
}

VersionWalker::VersionWalker(DocumentHistory history, WalkerOptions options)
    : history_(std::move(history)), options_(options) {
    prepare();
}

void VersionWalker::prepare_body(const VersionRecord& version, PreparedVersion& out) const {
    const std::string& text = *version.raw_text;
    size_t first = text.find_first_not_of(" \t\r\n");
    bool is_markup = first != std::string::npos && text[first] == '<';

    if (!is_markup) {
        out.body = text;
        return;
    }

    markup::HierarchyParser parser;
    markup::ParseOutcome outcome =
        parser.parse_string(text, history_.document_id + "@" + version.version_date);
    if (!outcome.ok()) {
        out.status = VersionStatus::Malformed;
        out.reason = "markup does not parse: " + outcome.error.value_or("unknown error");
        return;
    }
    out.body = markup::extract_text(*outcome.root);
    out.structure.sections = markup::count_nodes(*outcome.root, markup::NodeKind::Section);
    out.structure.subparts = markup::count_nodes(*outcome.root, markup::NodeKind::Subpart);
}

// Marks the longest run of versions whose dates strictly decrease in
// list order. Ties go to the newest positions, so a clean history keeps every
// version and a single mistyped date costs only that version.
std::vector<bool> VersionWalker::ordered_dates() const {
    const auto& versions = history_.versions;
    const size_t n = versions.size();

    // chain[i]: length of the longest descending run starting at i
    std::vector<size_t> chain(n, 0);
    for (size_t i = n; i-- > 0;) {
        if (!util::is_iso_date(versions[i].version_date)) continue;
        chain[i] = 1;
        for (size_t j = i + 1; j < n; ++j) {
            if (chain[j] > 0 && versions[j].version_date < versions[i].version_date) {
                chain[i] = std::max(chain[i], chain[j] + 1);
            }
        }
    }

    std::vector<bool> in_order(n, false);
    size_t want = n == 0 ? 0 : *std::max_element(chain.begin(), chain.end());
    const std::string* newer = nullptr;
    for (size_t i = 0; i < n && want > 0; ++i) {
        if (chain[i] != want) continue;
        if (newer && !(versions[i].version_date < *newer)) continue;
        in_order[i] = true;
        newer = &versions[i].version_date;
        --want;
    }
    return in_order;
}

void VersionWalker::prepare() {
    const auto& versions = history_.versions;
    prepared_.resize(versions.size());

    // Validation, newest -> oldest
    const std::vector<bool> in_order = ordered_dates();
    std::set<std::string> accepted_dates;
    for (size_t i = 0; i < versions.size(); ++i) {
        if (in_order[i]) accepted_dates.insert(versions[i].version_date);
    }

    for (size_t i = 0; i < versions.size(); ++i) {
        const VersionRecord& v = versions[i];
        PreparedVersion& p = prepared_[i];

        if (!util::is_iso_date(v.version_date)) {
            p.status = VersionStatus::Malformed;
            p.reason = "invalid version date '" + v.version_date + "'";
        } else if (!in_order[i] && accepted_dates.count(v.version_date)) {
            p.status = VersionStatus::Malformed;
            p.reason = "duplicate version date " + v.version_date;
        } else if (!in_order[i]) {
            p.status = VersionStatus::Malformed;
            p.reason = "version " + v.version_date + " is out of order";
        } else if (!v.raw_text) {
            p.status = VersionStatus::Missing;
            p.reason = "no text for version " + v.version_date;
        } else {
            prepare_body(v, p);
        }

        if (p.status != VersionStatus::Valid) {
            LOG_WARN("Skipping version ", i, " of document ", history_.document_id, ": ", p.reason);
        }
    }

    // Author fold, oldest -> newest
    std::set<std::string> seen;
    for (size_t i = versions.size(); i-- > 0;) {
        if (prepared_[i].status == VersionStatus::Valid) {
            seen.insert(versions[i].revision_author_ids.begin(),
                        versions[i].revision_author_ids.end());
        }
        prepared_[i].cumulative_authors = seen.size();
    }
}

std::optional<MetricsRecord> VersionWalker::step() {
    if (state_ == WalkState::Done) {
        return std::nullopt;
    }
    if (state_ == WalkState::AtLatest) {
        state_ = WalkState::Walking;
    }
    if (position_ >= history_.versions.size()) {
        state_ = WalkState::Done;
        return std::nullopt;
    }

    const size_t index = position_++;
    const VersionRecord& version = history_.versions[index];
    const PreparedVersion& prepared = prepared_[index];

    std::optional<MetricsRecord> record;
    switch (prepared.status) {
        case VersionStatus::Missing:
            ++skipped_missing_;
            break;
        case VersionStatus::Malformed:
            ++skipped_malformed_;
            break;
        case VersionStatus::Valid: {
            MetricsRecord m = compute_metrics(prepared.body, prepared.structure,
                                              prepared.cumulative_authors,
                                              version.revision_author_ids.size());
            m.document_id = history_.document_id;
            m.metrics_date = version.version_date;
            if (options_.keep_snapshot) {
                m.content_snapshot = prepared.body;
            }
            ++computed_;
            record = std::move(m);
            break;
        }
    }

    if (position_ >= history_.versions.size()) {
        state_ = WalkState::Done;
    }
    return record;
}

std::vector<MetricsRecord> VersionWalker::walk() {
    std::vector<MetricsRecord> records;
    while (state_ != WalkState::Done) {
        if (auto record = step()) {
            records.push_back(std::move(*record));
        }
    }
    LOG_DEBUG("Document ", history_.document_id, ": ", computed_, " versions computed, ",
              skipped_missing_, " missing, ", skipped_malformed_, " malformed");
    return records;
}

} // namespace regmetrics::history
