#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tenantcore {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // Diagnostics for failed statements (PG_DIAG_SQLSTATE, PG_DIAG_CONSTRAINT_NAME)
    std::string sqlstate;
    std::string constraint_name;

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(std::string message, std::string state = {}) {
        DbResultSet r;
        r.success = false;
        r.error_message = std::move(message);
        r.sqlstate = std::move(state);
        return r;
    }

    [[nodiscard]] bool empty() const { return rows.empty(); }

    /**
     * @brief First column of the first row, or empty string
     */
    [[nodiscard]] std::string scalar() const {
        if (rows.empty() || rows.front().empty()) return {};
        return rows.front().front();
    }
};

/// Bound parameter; nullopt is sent as SQL NULL.
using SqlParam = std::optional<std::string>;

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement (may contain several statements)
     * @param sql SQL text
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a single parameterized statement ($1, $2, ...)
     * @param sql SQL text with positional placeholders
     * @param params Values bound in order
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<SqlParam>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace tenantcore
