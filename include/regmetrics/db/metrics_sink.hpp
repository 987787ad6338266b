/**
 * @file metrics_sink.hpp
 * @brief Destinations for computed MetricsRecords
 *
 * A sink stores at most one record per (document_id, metrics_date); a second
 * write of the same key is ignored and reported by returning false.
 */

#pragma once

#include <fstream>
#include <ostream>
#include <set>
#include <string>
#include <utility>

#include "regmetrics/db/connection.hpp"
#include "regmetrics/types.hpp"

namespace regmetrics::db {

class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    // true = stored, false = key already present. Throws on storage failure.
    virtual bool write(const MetricsRecord& record) = 0;

    virtual void flush() {}
};

/**
 * @brief Table agency_regulation_document_historical_metrics via libpq
 *
 * Inserts use ON CONFLICT (document_id, metrics_date) DO NOTHING, so
 * re-running a history walk never duplicates rows.
 */
class PostgresMetricsSink : public MetricsSink {
public:
    static constexpr const char* kTable = "agency_regulation_document_historical_metrics";

    // Throws DatabaseError(CONNECTION_FAILED)
    explicit PostgresMetricsSink(const ConnectionConfig& config = ConnectionConfig());

    // CREATE TABLE IF NOT EXISTS; throws DatabaseError
    void ensure_schema();

    bool write(const MetricsRecord& record) override;

    bool exists(const std::string& document_id, const std::string& metrics_date);

private:
    Connection conn_;
};

/**
 * @brief One JSON object per line
 */
class JsonLinesMetricsSink : public MetricsSink {
public:
    explicit JsonLinesMetricsSink(std::ostream& out);
    // Appends to `path`; throws StoreError if it cannot be opened
    explicit JsonLinesMetricsSink(const std::string& path);

    bool write(const MetricsRecord& record) override;
    void flush() override;

private:
    std::ofstream file_;
    std::ostream* out_;
    std::set<std::pair<std::string, std::string>> written_;
};

std::string metrics_to_json(const MetricsRecord& record);

} // namespace regmetrics::db
