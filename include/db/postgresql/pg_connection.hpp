#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace tenantcore {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute(const std::string& sql, const std::vector<SqlParam>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /**
     * @brief Convert a PGresult into a DbResultSet (takes ownership of res)
     */
    DbResultSet consume(PGresult* res);

    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    static DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb. libpq reports
 * connection-time failures only as text, so the classification into
 * ErrorCode is done here, once, against the server's FATAL messages.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;

    /**
     * @brief Map a PQconnectdb error message to an ErrorCode
     */
    [[nodiscard]] static ErrorCode classify_connect_error(const std::string& message);
};

} // namespace tenantcore
