#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <string>
#include <vector>

namespace tenantcore {

/**
 * @brief Run one statement, converting a failed DbResultSet into an error
 *
 * The error is QUERY_FAILED, message is the server message and context is
 * the SQLSTATE (empty if the failure happened client-side).
 */
[[nodiscard]] Result<DbResultSet> run_sql(IDbConnection& conn, const std::string& sql);
[[nodiscard]] Result<DbResultSet> run_sql(IDbConnection& conn, const std::string& sql,
                                          const std::vector<SqlParam>& params);

/**
 * @brief RAII transaction on one connection
 *
 * BEGIN on begin(), COMMIT on commit(); if neither commit() nor rollback()
 * ran, the destructor rolls back, so every early return undoes the work.
 * Savepoints isolate sub-units (one team member, one optional step) so a
 * failure inside them does not abort the enclosing transaction.
 */
class ScopedTransaction {
public:
    explicit ScopedTransaction(IDbConnection& conn);
    ~ScopedTransaction();

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    [[nodiscard]] Result<void> begin();
    [[nodiscard]] Result<void> commit();
    Result<void> rollback();

    /**
     * @param name Validated identifier; quoted before use
     */
    [[nodiscard]] Result<void> savepoint(const std::string& name);
    [[nodiscard]] Result<void> release_savepoint(const std::string& name);
    Result<void> rollback_to_savepoint(const std::string& name);

    [[nodiscard]] bool active() const { return active_; }

private:
    Result<void> simple(const std::string& sql);

    IDbConnection& conn_;
    bool active_ = false;
};

} // namespace tenantcore
