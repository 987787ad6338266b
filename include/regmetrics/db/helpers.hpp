/**
 * @file helpers.hpp
 * @brief RAII PGresult wrapper and query execution helpers
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace regmetrics::db {

// =============================================================================
// RAII Result
// =============================================================================

class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    bool has_rows() const {
        return res_ && PQresultStatus(res_) == PGRES_TUPLES_OK && PQntuples(res_) > 0;
    }

    // Rows affected by INSERT/UPDATE/DELETE
    int64_t affected() const {
        if (!res_) return 0;
        const char* n = PQcmdTuples(res_);
        return (n && *n) ? std::strtoll(n, nullptr, 10) : 0;
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

private:
    PGresult* res_;
};

// =============================================================================
// Query Execution
// =============================================================================

inline Result exec(PGconn* conn, const std::string& sql) {
    return Result(PQexec(conn, sql.c_str()));
}

// Text-format parameters; std::nullopt binds SQL NULL
inline Result exec_params(PGconn* conn, const std::string& sql,
                          const std::vector<std::optional<std::string>>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }
    return Result(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0));
}

} // namespace regmetrics::db
