#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace tenantcore {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null");
    }
    return consume(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    // Text-format parameters, server infers types
    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
        nullptr, values.data(), nullptr, nullptr, 0);
    return consume(res);
}

DbResultSet PgConnection::consume(PGresult* res) {
    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    DbResultSet result;
    result.success = false;
    const char* msg = PQresultErrorMessage(res);
    result.error_message = (msg && *msg) ? msg : PQerrorMessage(conn_);
    if (const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE)) {
        result.sqlstate = state;
    }
    if (const char* constraint = PQresultErrorField(res, PG_DIAG_CONSTRAINT_NAME)) {
        result.constraint_name = constraint;
    }
    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            const char* val = PQgetvalue(res, i, j);
            row.emplace_back(val ? val : "");
        }
        result.rows.push_back(std::move(row));
    }
    result.affected_rows = static_cast<uint64_t>(nrows);

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected, uint64_t{0});
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

ErrorCode PgConnectionFactory::classify_connect_error(const std::string& message) {
    const auto msg = utils::to_lower(message);

    // FATAL:  database "x" does not exist (SQLSTATE 3D000)
    if (utils::contains(msg, "database \"") && utils::contains(msg, "does not exist")) {
        return ErrorCode::TENANT_DATABASE_NOT_FOUND;
    }

    // 28P01 / 28000, unknown role, malformed conninfo
    if (utils::contains(msg, "password authentication failed") ||
        utils::contains(msg, "no pg_hba.conf entry") ||
        utils::contains(msg, "role \"") ||
        utils::contains(msg, "password is required") ||
        utils::contains(msg, "invalid connection option") ||
        utils::contains(msg, "missing \"=\"") ||
        utils::contains(msg, "invalid sslmode") ||
        utils::contains(msg, "invalid integer value")) {
        return ErrorCode::TENANT_CONFIG_INVALID;
    }

    return ErrorCode::TENANT_UNREACHABLE;
}

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const std::string& connection_string) {

    using ConnResult = Result<std::unique_ptr<IDbConnection>>;

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return ConnResult::error(ErrorCode::TENANT_UNREACHABLE, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        const std::string message = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        const ErrorCode code = classify_connect_error(message);
        utils::log::error(std::format("Failed to connect ({}): {}", error_code_to_string(code), message));
        return ConnResult::error(code, message);
    }

    return ConnResult::ok(std::make_unique<PgConnection>(conn));
}

} // namespace tenantcore
