#include "db/identifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <format>

namespace tenantcore::identifier {

namespace {

// PostgreSQL reserved key words
constexpr std::string_view kReservedKeywords[] = {
    "all", "analyse", "analyze", "and", "any", "array", "as", "asc", "asymmetric",
    "authorization", "binary", "both", "case", "cast", "check", "collate", "column",
    "constraint", "create", "cross", "current_catalog", "current_date", "current_role",
    "current_schema", "current_time", "current_timestamp", "current_user", "default",
    "deferrable", "desc", "distinct", "do", "else", "end", "except", "false", "fetch",
    "for", "foreign", "from", "grant", "group", "having", "in", "initially", "intersect",
    "into", "lateral", "leading", "left", "like", "limit", "localtime", "localtimestamp",
    "not", "null", "offset", "on", "only", "or", "order", "outer", "over", "overlaps",
    "placing", "primary", "references", "returning", "right", "select", "session_user",
    "similar", "some", "symmetric", "table", "then", "to", "trailing", "true", "union",
    "unique", "user", "using", "variadic", "verbose", "when", "where", "window", "with",
};

bool is_reserved(const std::string& lower) {
    return std::find(std::begin(kReservedKeywords), std::end(kReservedKeywords), lower)
        != std::end(kReservedKeywords);
}

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9') || c == '-';
}

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

Result<std::string> check_charset(std::string_view name, std::string_view what) {
    const std::string trimmed = utils::trim(std::string(name));

    if (trimmed.empty() || trimmed.size() > kMaxIdentifierBytes) {
        return Result<std::string>::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("{} must be between 1 and {} characters", what, kMaxIdentifierBytes));
    }
    if (!is_ident_start(trimmed.front()) ||
        !std::all_of(trimmed.begin(), trimmed.end(), is_ident_char)) {
        return Result<std::string>::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("{} '{}' contains invalid characters; only letters, digits, '_' and '-' "
                        "are allowed and it must start with a letter or '_'", what, trimmed));
    }
    return Result<std::string>::ok(trimmed);
}

} // namespace

Result<std::string> validate_database_name(std::string_view name) {
    auto checked = check_charset(name, "Database name");
    if (checked.is_error()) {
        return checked;
    }
    if (is_reserved(utils::to_lower(checked.value()))) {
        return Result<std::string>::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("Database name cannot be a reserved keyword: {}", checked.value()));
    }
    return checked;
}

Result<std::string> validate_identifier(std::string_view name) {
    return check_charset(name, "Identifier");
}

bool is_valid_uuid(std::string_view uuid) {
    if (uuid.size() != 36) return false;
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (uuid[i] != '-') return false;
        } else if (!is_hex(uuid[i])) {
            return false;
        }
    }
    return true;
}

std::string quote_identifier(std::string_view name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (const char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string subdomain_of(std::string_view domain) {
    const std::string normalized = utils::to_lower(utils::trim(std::string(domain)));
    const auto dot = normalized.find('.');
    return dot == std::string::npos ? normalized : normalized.substr(0, dot);
}

std::string sanitize_label(std::string_view label) {
    std::string out;
    out.reserve(label.size());
    for (const char raw : label) {
        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum) {
            out += c;
        } else if (out.empty() || out.back() != '_') {
            out += '_';
        }
    }

    const auto first = out.find_first_not_of('_');
    if (first == std::string::npos) {
        return "agency";
    }
    const auto last = out.find_last_not_of('_');
    return out.substr(first, last - first + 1);
}

Result<std::string> derive_database_name(std::string_view domain, std::string_view tenant_id) {
    if (tenant_id.size() < kTenantIdSuffixChars) {
        return Result<std::string>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Tenant id '{}' is too short to derive a database name", tenant_id));
    }

    const std::string suffix = "_" + utils::to_lower(std::string(tenant_id.substr(0, kTenantIdSuffixChars)));
    const size_t max_label = std::max<size_t>(1,
        kMaxIdentifierBytes - kDatabasePrefix.size() - suffix.size());

    std::string label = sanitize_label(subdomain_of(domain));
    if (label.size() > max_label) {
        label.resize(max_label);
    }

    std::string name;
    name.reserve(kDatabasePrefix.size() + label.size() + suffix.size());
    name += kDatabasePrefix;
    name += label;
    name += suffix;
    return validate_database_name(name);
}

std::string conninfo_value(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

Result<ConnectionTarget> build_target(
    const ClusterCoordinates& cluster, std::string_view database,
    uint32_t statement_timeout_ms) {

    auto db = validate_database_name(database);
    if (db.is_error()) {
        return Result<ConnectionTarget>::error_from(db);
    }
    if (cluster.host.empty() || cluster.user.empty()) {
        return Result<ConnectionTarget>::error(ErrorCode::TENANT_CONFIG_INVALID,
            "Cluster host and user must be configured");
    }

    std::string conninfo = std::format("host={} port={} dbname={} user={}",
        conninfo_value(cluster.host), cluster.port, conninfo_value(db.value()),
        conninfo_value(cluster.user));
    if (!cluster.password.empty()) {
        conninfo += std::format(" password={}", conninfo_value(cluster.password));
    }
    if (!cluster.sslmode.empty()) {
        conninfo += std::format(" sslmode={}", conninfo_value(cluster.sslmode));
    }
    if (cluster.connect_timeout_seconds > 0) {
        conninfo += std::format(" connect_timeout={}", cluster.connect_timeout_seconds);
    }
    if (!cluster.application_name.empty()) {
        conninfo += std::format(" application_name={}", conninfo_value(cluster.application_name));
    }
    if (statement_timeout_ms > 0) {
        conninfo += std::format(" options={}",
            conninfo_value(std::format("-c statement_timeout={}", statement_timeout_ms)));
    }

    return Result<ConnectionTarget>::ok(ConnectionTarget{
        .database = std::move(db.value()),
        .connection_string = std::move(conninfo),
    });
}

} // namespace tenantcore::identifier
