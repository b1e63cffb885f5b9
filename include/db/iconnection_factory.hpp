#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace tenantcore {

/**
 * @brief Abstract factory for creating database connections
 *
 * The PostgreSQL backend wraps PQconnectdb. Failures are classified so
 * callers can tell a missing database (TENANT_DATABASE_NOT_FOUND) from a
 * bad credential or conninfo (TENANT_CONFIG_INVALID) and from a transient
 * network failure (TENANT_UNREACHABLE).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string libpq conninfo string
     * @return New connection, or a classified error
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const std::string& connection_string) = 0;
};

} // namespace tenantcore
