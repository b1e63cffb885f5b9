#include "db/cluster_admin.hpp"
#include "db/scoped_transaction.hpp"
#include "core/utils.hpp"

#include <format>

namespace tenantcore {

// ============================================================================
// AdminSession
// ============================================================================

AdminSession::AdminSession(std::unique_ptr<IDbConnection> conn, std::string admin_database)
    : conn_(std::move(conn)), admin_database_(std::move(admin_database)) {}

AdminSession::~AdminSession() {
    if (conn_) {
        conn_->close();
    }
}

Result<bool> AdminSession::database_exists(const std::string& database) {
    const auto res = run_sql(*conn_,
        "SELECT EXISTS (SELECT 1 FROM pg_database WHERE datname = $1)", {database});
    if (res.is_error()) {
        return Result<bool>::error_from(res);
    }
    return Result<bool>::ok(res.value().scalar() == "t");
}

Result<size_t> AdminSession::terminate_connections(const std::string& database) {
    const auto res = run_sql(*conn_,
        "SELECT pg_terminate_backend(pid) FROM pg_stat_activity "
        "WHERE datname = $1 AND pid <> pg_backend_pid()", {database});
    if (res.is_error()) {
        return Result<size_t>::error_from(res);
    }
    return Result<size_t>::ok(res.value().rows.size());
}

Result<void> AdminSession::create_database(const std::string& database) {
    const auto name = identifier::validate_database_name(database);
    if (name.is_error()) {
        return Result<void>::error_from(name);
    }
    const auto res = run_sql(*conn_,
        std::format("CREATE DATABASE {}", identifier::quote_identifier(name.value())));
    if (res.is_error()) {
        return Result<void>::error_from(res);
    }
    utils::log::info(std::format("Created database '{}'", name.value()));
    return Result<void>::ok();
}

Result<void> AdminSession::drop_database(const std::string& database) {
    const auto name = identifier::validate_database_name(database);
    if (name.is_error()) {
        return Result<void>::error_from(name);
    }
    if (name.value() == admin_database_) {
        return Result<void>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Refusing to drop the admin database '{}'", name.value()));
    }

    const auto terminated = terminate_connections(name.value());
    if (terminated.is_error()) {
        utils::log::warn(std::format("Could not terminate connections to '{}': {}",
            name.value(), terminated.error_message()));
    } else if (terminated.value() > 0) {
        utils::log::info(std::format("Terminated {} connection(s) to '{}'",
            terminated.value(), name.value()));
    }

    const auto res = run_sql(*conn_,
        std::format("DROP DATABASE IF EXISTS {}", identifier::quote_identifier(name.value())));
    if (res.is_error()) {
        return Result<void>::error_from(res);
    }
    utils::log::info(std::format("Dropped database '{}'", name.value()));
    return Result<void>::ok();
}

// ============================================================================
// ClusterAdmin
// ============================================================================

ClusterAdmin::ClusterAdmin(Config config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)), factory_(std::move(factory)) {}

Result<AdminSession> ClusterAdmin::open_session() {
    auto conn = connect(config_.admin_database, config_.admin_statement_timeout_ms);
    if (conn.is_error()) {
        return Result<AdminSession>::error_from(conn);
    }
    return Result<AdminSession>::ok(AdminSession(std::move(conn.value()), config_.admin_database));
}

Result<std::unique_ptr<IDbConnection>> ClusterAdmin::connect(
    const std::string& database, uint32_t statement_timeout_ms) {

    using ConnResult = Result<std::unique_ptr<IDbConnection>>;

    const auto target = identifier::build_target(config_.cluster, database);
    if (target.is_error()) {
        return ConnResult::error_from(target);
    }

    auto conn = factory_->create(target.value().connection_string);
    if (conn.is_error()) {
        return conn;
    }
    if (statement_timeout_ms > 0 && !conn.value()->set_query_timeout(statement_timeout_ms)) {
        return ConnResult::error(ErrorCode::TENANT_UNREACHABLE,
            std::format("Failed to set statement_timeout on connection to '{}'", database));
    }
    return conn;
}

} // namespace tenantcore
