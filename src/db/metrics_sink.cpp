#include "regmetrics/db/metrics_sink.hpp"

#include <cstdio>
#include <optional>
#include <vector>

#include <boost/json.hpp>

#include "regmetrics/db/helpers.hpp"
#include "regmetrics/error.hpp"
#include "regmetrics/logging.hpp"

namespace json = boost::json;

namespace regmetrics::db {

namespace {

std::string format_double(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

const char* kCreateTable = R"SQL(
CREATE TABLE IF NOT EXISTS agency_regulation_document_historical_metrics (
    id                          BIGSERIAL PRIMARY KEY,
    document_id                 TEXT NOT NULL,
    metrics_date                DATE NOT NULL,
    word_count                  INTEGER NOT NULL,
    paragraph_count             INTEGER NOT NULL,
    sentence_count              INTEGER,
    section_count               INTEGER,
    subpart_count               INTEGER,
    language_complexity_score   DOUBLE PRECISION,
    readability_score           DOUBLE PRECISION,
    average_sentence_length     DOUBLE PRECISION,
    average_word_length         DOUBLE PRECISION,
    total_authors               INTEGER,
    revision_authors            INTEGER,
    simplicity_score            DOUBLE PRECISION,
    flesch_reading_ease         DOUBLE PRECISION,
    smog_index                  DOUBLE PRECISION,
    automated_readability_index DOUBLE PRECISION,
    content_snapshot            TEXT,
    CONSTRAINT uix_document_date UNIQUE (document_id, metrics_date)
);
CREATE INDEX IF NOT EXISTS ix_historical_metrics_date
    ON agency_regulation_document_historical_metrics (metrics_date);
)SQL";

const char* kInsert = R"SQL(
INSERT INTO agency_regulation_document_historical_metrics (
    document_id, metrics_date, word_count, paragraph_count, sentence_count,
    section_count, subpart_count, language_complexity_score, readability_score,
    average_sentence_length, average_word_length, total_authors, revision_authors,
    simplicity_score, flesch_reading_ease, smog_index, automated_readability_index,
    content_snapshot)
VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18)
ON CONFLICT (document_id, metrics_date) DO NOTHING
)SQL";

} // namespace

// =============================================================================
// PostgresMetricsSink
// =============================================================================

PostgresMetricsSink::PostgresMetricsSink(const ConnectionConfig& config) : conn_(config) {
    if (!conn_.ok()) {
        throw DatabaseError(std::string("connection failed: ") + conn_.error(),
                            "host=" + config.host + " dbname=" + config.dbname,
                            ErrorCode::CONNECTION_FAILED);
    }
}

void PostgresMetricsSink::ensure_schema() {
    Result res = exec(conn_, kCreateTable);
    if (!res.ok()) {
        throw DatabaseError("cannot create metrics table: " + res.error_message(), kTable);
    }
}

bool PostgresMetricsSink::exists(const std::string& document_id, const std::string& metrics_date) {
    Result res = exec_params(conn_,
        "SELECT 1 FROM agency_regulation_document_historical_metrics "
        "WHERE document_id = $1 AND metrics_date = $2::date",
        {document_id, metrics_date});
    if (!res.ok()) {
        throw DatabaseError("existence check failed: " + res.error_message(), document_id);
    }
    return res.has_rows();
}

bool PostgresMetricsSink::write(const MetricsRecord& r) {
    std::vector<std::optional<std::string>> params = {
        r.document_id,
        r.metrics_date,
        std::to_string(r.word_count),
        std::to_string(r.paragraph_count),
        std::to_string(r.sentence_count),
        std::to_string(r.section_count),
        std::to_string(r.subpart_count),
        format_double(r.language_complexity_score),
        format_double(r.readability_score),
        format_double(r.average_sentence_length),
        format_double(r.average_word_length),
        std::to_string(r.total_authors),
        std::to_string(r.revision_authors),
        format_double(r.simplicity_score),
        format_double(r.flesch_reading_ease),
        format_double(r.smog_index),
        format_double(r.automated_readability_index),
        r.content_snapshot.empty() ? std::nullopt : std::optional<std::string>(r.content_snapshot),
    };

    Result res = exec_params(conn_, kInsert, params);
    if (!res.ok()) {
        throw DatabaseError("insert failed: " + res.error_message(),
                            r.document_id + "@" + r.metrics_date);
    }
    bool inserted = res.affected() > 0;
    if (!inserted) {
        LOG_DEBUG("Metrics for ", r.document_id, " on ", r.metrics_date, " already stored");
    }
    return inserted;
}

// =============================================================================
// JsonLinesMetricsSink
// =============================================================================

std::string metrics_to_json(const MetricsRecord& r) {
    json::object obj;
    obj["document_id"] = r.document_id;
    obj["metrics_date"] = r.metrics_date;
    obj["word_count"] = r.word_count;
    obj["sentence_count"] = r.sentence_count;
    obj["paragraph_count"] = r.paragraph_count;
    obj["section_count"] = r.section_count;
    obj["subpart_count"] = r.subpart_count;
    obj["total_authors"] = r.total_authors;
    obj["revision_authors"] = r.revision_authors;
    obj["language_complexity_score"] = r.language_complexity_score;
    obj["readability_score"] = r.readability_score;
    obj["average_sentence_length"] = r.average_sentence_length;
    obj["average_word_length"] = r.average_word_length;
    obj["simplicity_score"] = r.simplicity_score;
    obj["flesch_reading_ease"] = r.flesch_reading_ease;
    obj["smog_index"] = r.smog_index;
    obj["automated_readability_index"] = r.automated_readability_index;
    if (!r.content_snapshot.empty()) {
        obj["content_snapshot"] = r.content_snapshot;
    }
    return json::serialize(obj);
}

JsonLinesMetricsSink::JsonLinesMetricsSink(std::ostream& out) : out_(&out) {}

JsonLinesMetricsSink::JsonLinesMetricsSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app), out_(&file_) {
    if (!file_) {
        throw StoreError(ErrorCode::STORE_WRITE_FAILED, "cannot open metrics output", path);
    }
}

bool JsonLinesMetricsSink::write(const MetricsRecord& record) {
    if (!written_.emplace(record.document_id, record.metrics_date).second) {
        return false;
    }
    *out_ << metrics_to_json(record) << '\n';
    if (!*out_) {
        throw StoreError(ErrorCode::STORE_WRITE_FAILED, "metrics output stream failed",
                         record.document_id);
    }
    return true;
}

void JsonLinesMetricsSink::flush() {
    out_->flush();
}

} // namespace regmetrics::db
