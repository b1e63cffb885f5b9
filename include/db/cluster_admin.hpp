#pragma once

#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/identifier.hpp"

#include <memory>
#include <string>

namespace tenantcore {

/**
 * @brief Privileged, short-lived session on the cluster's admin database
 *
 * Owns one connection that is closed when the session goes out of scope.
 * Never pooled: CREATE/DROP DATABASE sessions are opened for one phase and
 * released immediately.
 */
class AdminSession {
public:
    AdminSession(std::unique_ptr<IDbConnection> conn, std::string admin_database);
    ~AdminSession();

    AdminSession(AdminSession&&) noexcept = default;
    AdminSession& operator=(AdminSession&&) noexcept = default;
    AdminSession(const AdminSession&) = delete;
    AdminSession& operator=(const AdminSession&) = delete;

    [[nodiscard]] Result<bool> database_exists(const std::string& database);

    /**
     * @brief Terminate every backend connected to the database except ours
     * @return Number of backends signalled
     */
    Result<size_t> terminate_connections(const std::string& database);

    [[nodiscard]] Result<void> create_database(const std::string& database);

    /**
     * @brief Terminate connections, then DROP DATABASE IF EXISTS
     */
    Result<void> drop_database(const std::string& database);

private:
    std::unique_ptr<IDbConnection> conn_;
    std::string admin_database_;
};

/**
 * @brief Opens administrative sessions and dedicated (unpooled) connections
 */
class ClusterAdmin {
public:
    struct Config {
        ClusterCoordinates cluster;
        std::string admin_database = "postgres";
        uint32_t admin_statement_timeout_ms = 60000;
    };

    ClusterAdmin(Config config, std::shared_ptr<IConnectionFactory> factory);

    /**
     * @brief Open a privileged session with the admin statement timeout applied
     */
    [[nodiscard]] Result<AdminSession> open_session();

    /**
     * @brief Open a dedicated connection to one database, outside any pool
     * @param statement_timeout_ms Applied with SET statement_timeout when non-zero
     */
    [[nodiscard]] Result<std::unique_ptr<IDbConnection>> connect(
        const std::string& database, uint32_t statement_timeout_ms = 0);

    [[nodiscard]] const ClusterCoordinates& cluster() const { return config_.cluster; }
    [[nodiscard]] const std::shared_ptr<IConnectionFactory>& factory() const { return factory_; }

private:
    Config config_;
    std::shared_ptr<IConnectionFactory> factory_;
};

} // namespace tenantcore
