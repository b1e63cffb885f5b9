#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>
#include <string>

namespace tenantcore {

/**
 * @brief RAII borrow of one connection from one tenant pool
 *
 * The connection goes back to its pool when the borrow ends, on every exit
 * path. A borrow marked with discard() is closed instead of reused, for
 * connections left in an unknown transaction state.
 */
class PooledConnection {
public:
    /**
     * @brief Receives the connection and whether it may be handed out again
     */
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::string database, std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    /**
     * @brief Tenant database this connection belongs to
     */
    const std::string& database() const { return database_; }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    void discard() { reusable_ = false; }

    /**
     * @brief End the borrow now instead of at scope exit
     */
    void release();

private:
    std::string database_;
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool reusable_ = true;
};

} // namespace tenantcore
