#include "db/pooled_connection.hpp"

namespace tenantcore {

PooledConnection::PooledConnection(std::string database, std::unique_ptr<IDbConnection> conn,
                                   ReturnFunc return_fn)
    : database_(std::move(database)), conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : database_(std::move(other.database_)),
      conn_(std::move(other.conn_)),
      return_fn_(std::move(other.return_fn_)),
      reusable_(other.reusable_) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        database_ = std::move(other.database_);
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
        reusable_ = other.reusable_;
    }
    return *this;
}

void PooledConnection::release() {
    if (conn_ && return_fn_) {
        const bool reusable = reusable_ && conn_->is_connected();
        return_fn_(std::move(conn_), reusable);
    }
    conn_.reset();
}

} // namespace tenantcore
