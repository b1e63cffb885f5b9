#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tenantcore {

/**
 * @brief Coordinates of the PostgreSQL cluster hosting the tenant databases
 */
struct ClusterCoordinates {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user = "postgres";
    std::string password;
    std::string sslmode = "prefer";
    uint32_t connect_timeout_seconds = 2;
    std::string application_name = "tenantcore";
};

/**
 * @brief A validated database plus the libpq conninfo that reaches it
 */
struct ConnectionTarget {
    std::string database;
    std::string connection_string;
};

namespace identifier {

/// PostgreSQL truncates identifiers longer than NAMEDATALEN-1 bytes.
inline constexpr size_t kMaxIdentifierBytes = 63;

inline constexpr std::string_view kDatabasePrefix = "agency_";
inline constexpr size_t kTenantIdSuffixChars = 8;

/**
 * @brief Validate a database name before it is used as a key or embedded in DDL
 *
 * 1..63 bytes, first character a letter or underscore, then letters,
 * digits, underscores or hyphens; reserved SQL keywords are rejected.
 */
[[nodiscard]] Result<std::string> validate_database_name(std::string_view name);

/**
 * @brief Validate a table/column/savepoint name (same charset, no keyword check)
 */
[[nodiscard]] Result<std::string> validate_identifier(std::string_view name);

/**
 * @brief Validate the canonical 8-4-4-4-12 hex UUID text form
 */
[[nodiscard]] bool is_valid_uuid(std::string_view uuid);

/**
 * @brief Double-quote an identifier, doubling embedded quotes
 *
 * Callers validate first; quoting is still safe on its own.
 */
[[nodiscard]] std::string quote_identifier(std::string_view name);

/**
 * @brief Normalize a requested domain to its subdomain prefix
 *
 * "Acme.Example.com " -> "acme"
 */
[[nodiscard]] std::string subdomain_of(std::string_view domain);

/**
 * @brief Lowercase, map non-alphanumerics to '_', collapse and trim '_'
 * @return "agency" if nothing survives
 */
[[nodiscard]] std::string sanitize_label(std::string_view label);

/**
 * @brief Derive the immutable tenant database name
 *
 * agency_<sanitized subdomain>_<first 8 chars of tenant id>, with the
 * subdomain portion truncated so the result never exceeds 63 bytes.
 */
[[nodiscard]] Result<std::string> derive_database_name(
    std::string_view domain, std::string_view tenant_id);

/**
 * @brief Quote a value for a libpq conninfo string ('...' with \ escapes)
 */
[[nodiscard]] std::string conninfo_value(std::string_view value);

/**
 * @brief Build the connection target for one database on the cluster
 * @param statement_timeout_ms Passed as a startup option when non-zero
 */
[[nodiscard]] Result<ConnectionTarget> build_target(
    const ClusterCoordinates& cluster, std::string_view database,
    uint32_t statement_timeout_ms = 0);

} // namespace identifier

} // namespace tenantcore
