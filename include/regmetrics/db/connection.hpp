#pragma once

#include <string>
#include <libpq-fe.h>

#include "regmetrics/config.hpp"

namespace regmetrics::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;
    int connect_timeout = 10;  // seconds

    // Defaults come from the loaded Config (db.* keys, REGM_DB_* env vars)
    ConnectionConfig() {
        const Config& cfg = Config::getInstance();
        dbname = cfg.get<std::string>("db.name", "regmetrics");
        host = cfg.get<std::string>("db.host", "localhost");
        port = cfg.get<std::string>("db.port", "5432");
        user = cfg.get<std::string>("db.user", "postgres");
        password = cfg.get<std::string>("db.password", "");
    }

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + quote(dbname);
        if (!host.empty()) conninfo += " host=" + quote(host);
        if (!port.empty()) conninfo += " port=" + quote(port);
        if (!user.empty()) conninfo += " user=" + quote(user);
        if (!password.empty()) conninfo += " password=" + quote(password);
        if (connect_timeout > 0) conninfo += " connect_timeout=" + std::to_string(connect_timeout);
        return conninfo;
    }

private:
    // conninfo value quoting: 'a b' with \ and ' escaped
    static std::string quote(const std::string& value) {
        std::string out = "'";
        for (char c : value) {
            if (c == '\\' || c == '\'') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('\'');
        return out;
    }
};

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const ConnectionConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

} // namespace regmetrics::db
