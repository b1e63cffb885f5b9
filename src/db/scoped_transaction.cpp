#include "db/scoped_transaction.hpp"
#include "db/identifier.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantcore {

namespace {

Result<DbResultSet> to_result(DbResultSet rs) {
    if (!rs.success) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_FAILED,
            utils::trim(rs.error_message), rs.sqlstate);
    }
    return Result<DbResultSet>::ok(std::move(rs));
}

} // namespace

Result<DbResultSet> run_sql(IDbConnection& conn, const std::string& sql) {
    return to_result(conn.execute(sql));
}

Result<DbResultSet> run_sql(IDbConnection& conn, const std::string& sql,
                            const std::vector<SqlParam>& params) {
    return to_result(conn.execute(sql, params));
}

ScopedTransaction::ScopedTransaction(IDbConnection& conn)
    : conn_(conn) {}

ScopedTransaction::~ScopedTransaction() {
    if (active_) {
        const auto rolled_back = rollback();
        if (rolled_back.is_error()) {
            utils::log::warn(std::format("Implicit ROLLBACK failed: {}", rolled_back.error_message()));
        }
    }
}

Result<void> ScopedTransaction::simple(const std::string& sql) {
    const auto res = run_sql(conn_, sql);
    if (res.is_error()) {
        return Result<void>::error_from(res);
    }
    return Result<void>::ok();
}

Result<void> ScopedTransaction::begin() {
    if (active_) {
        return Result<void>::error(ErrorCode::INTERNAL_ERROR, "Transaction already active");
    }
    auto res = simple("BEGIN");
    if (res.is_ok()) {
        active_ = true;
    }
    return res;
}

Result<void> ScopedTransaction::commit() {
    if (!active_) {
        return Result<void>::error(ErrorCode::INTERNAL_ERROR, "COMMIT without active transaction");
    }
    auto res = simple("COMMIT");
    if (res.is_error()) {
        // Server aborts the transaction on a failed COMMIT; make sure it is closed
        const auto rb = rollback();
        if (rb.is_error()) {
            utils::log::warn(std::format("ROLLBACK after failed COMMIT failed: {}", rb.error_message()));
        }
        return res;
    }
    active_ = false;
    return res;
}

Result<void> ScopedTransaction::rollback() {
    if (!active_) {
        return Result<void>::ok();
    }
    active_ = false;
    return simple("ROLLBACK");
}

Result<void> ScopedTransaction::savepoint(const std::string& name) {
    const auto valid = identifier::validate_identifier(name);
    if (valid.is_error()) {
        return Result<void>::error_from(valid);
    }
    return simple(std::format("SAVEPOINT {}", identifier::quote_identifier(valid.value())));
}

Result<void> ScopedTransaction::release_savepoint(const std::string& name) {
    const auto valid = identifier::validate_identifier(name);
    if (valid.is_error()) {
        return Result<void>::error_from(valid);
    }
    return simple(std::format("RELEASE SAVEPOINT {}", identifier::quote_identifier(valid.value())));
}

Result<void> ScopedTransaction::rollback_to_savepoint(const std::string& name) {
    const auto valid = identifier::validate_identifier(name);
    if (valid.is_error()) {
        return Result<void>::error_from(valid);
    }
    return simple(std::format("ROLLBACK TO SAVEPOINT {}", identifier::quote_identifier(valid.value())));
}

} // namespace tenantcore
