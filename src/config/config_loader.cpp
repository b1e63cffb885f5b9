#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace tenantcore {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {


/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

ClusterConfig extract_cluster(const toml::table& root) {
    ClusterConfig cfg;
    const auto* cluster = root["cluster"].as_table();
    if (!cluster) return cfg;
    const auto& c = *cluster;

    auto& coords = cfg.coordinates;
    coords.host = c["host"].value_or(coords.host);
    coords.port = static_cast<uint16_t>(c["port"].value_or(int64_t{coords.port}));
    coords.user = c["user"].value_or(coords.user);
    coords.password = c["password"].value_or(""s);
    coords.sslmode = c["sslmode"].value_or(coords.sslmode);
    coords.connect_timeout_seconds = static_cast<uint32_t>(
        c["connect_timeout_seconds"].value_or(int64_t{coords.connect_timeout_seconds}));
    coords.application_name = c["application_name"].value_or(coords.application_name);
    cfg.admin_database = c["admin_database"].value_or(cfg.admin_database);
    cfg.main_database = c["main_database"].value_or(cfg.main_database);
    return cfg;
}

PoolsConfig extract_pools(const toml::table& root) {
    PoolsConfig cfg;
    const auto* pools = root["pools"].as_table();
    if (!pools) return cfg;
    const auto& p = *pools;

    auto& r = cfg.registry;
    r.max_connections_per_pool = static_cast<size_t>(
        p["max_connections_per_pool"].value_or(int64_t(r.max_connections_per_pool)));
    r.min_connections = static_cast<size_t>(p["min_connections"].value_or(int64_t(r.min_connections)));
    r.max_pools = static_cast<size_t>(p["max_pools"].value_or(int64_t(r.max_pools)));
    r.acquire_timeout = std::chrono::milliseconds(
        p["acquire_timeout_ms"].value_or(int64_t(r.acquire_timeout.count())));
    r.idle_pool_timeout = std::chrono::seconds(
        p["idle_pool_timeout_seconds"].value_or(int64_t(r.idle_pool_timeout.count())));
    r.drain_timeout = std::chrono::milliseconds(
        p["drain_timeout_ms"].value_or(int64_t(r.drain_timeout.count())));
    r.statement_timeout_ms = static_cast<uint32_t>(
        p["statement_timeout_ms"].value_or(int64_t{r.statement_timeout_ms}));
    cfg.main_pool_max_connections = static_cast<size_t>(
        p["main_pool_max_connections"].value_or(int64_t(cfg.main_pool_max_connections)));
    return cfg;
}

ProvisioningConfig extract_provisioning(const toml::table& root) {
    ProvisioningConfig cfg;
    const auto* provisioning = root["provisioning"].as_table();
    if (!provisioning) return cfg;
    const auto& p = *provisioning;

    cfg.admin_statement_timeout_ms = static_cast<uint32_t>(
        p["admin_statement_timeout_ms"].value_or(int64_t{cfg.admin_statement_timeout_ms}));
    auto& o = cfg.orchestrator;
    o.schema_statement_timeout_ms = static_cast<uint32_t>(
        p["schema_statement_timeout_ms"].value_or(int64_t{o.schema_statement_timeout_ms}));
    if (p["required_tables"].as_array()) {
        o.required_tables = toml_string_array(p, "required_tables");
    }
    o.default_plan = p["default_plan"].value_or(o.default_plan);
    return cfg;
}

SchemaRepairEngine::Config extract_schema_repair(const toml::table& root) {
    SchemaRepairEngine::Config cfg;
    const auto* repair = root["schema_repair"].as_table();
    if (!repair) return cfg;
    const auto& s = *repair;

    cfg.reactive_enabled = s["reactive_enabled"].value_or(cfg.reactive_enabled);
    cfg.cooldown = std::chrono::seconds(s["cooldown_seconds"].value_or(int64_t(cfg.cooldown.count())));
    cfg.failure_cooldown = std::chrono::seconds(
        s["failure_cooldown_seconds"].value_or(int64_t(cfg.failure_cooldown.count())));
    cfg.lock_wait_attempts = static_cast<uint32_t>(
        s["lock_wait_attempts"].value_or(int64_t{cfg.lock_wait_attempts}));
    cfg.lock_wait_interval = std::chrono::milliseconds(
        s["lock_wait_interval_ms"].value_or(int64_t(cfg.lock_wait_interval.count())));
    if (s["critical_tables"].as_array()) {
        cfg.critical_tables = toml_string_array(s, "critical_tables");
    }
    return cfg;
}

SessionPolicy extract_policy(const toml::table& t, SessionPolicy base) {
    base.max_concurrent_sessions = static_cast<uint32_t>(
        t["max_concurrent_sessions"].value_or(int64_t{base.max_concurrent_sessions}));
    base.session_timeout = std::chrono::seconds(
        t["session_timeout_seconds"].value_or(int64_t(base.session_timeout.count())));
    base.idle_timeout = std::chrono::seconds(
        t["idle_timeout_seconds"].value_or(int64_t(base.idle_timeout.count())));
    return base;
}

SessionsConfig extract_sessions(const toml::table& root) {
    SessionsConfig cfg;
    const auto* sessions = root["sessions"].as_table();
    if (!sessions) return cfg;
    const auto& s = *sessions;

    auto& g = cfg.governor;
    g.defaults = extract_policy(s, g.defaults);
    g.cache.enabled = s["cache_enabled"].value_or(g.cache.enabled);
    g.cache.max_entries = static_cast<size_t>(
        s["cache_max_entries"].value_or(int64_t(g.cache.max_entries)));
    g.cache.ttl = std::chrono::seconds(s["cache_ttl_seconds"].value_or(int64_t(g.cache.ttl.count())));

    if (const auto* tenants = s["tenants"].as_array()) {
        for (const auto& elem : *tenants) {
            const auto* t = elem.as_table();
            if (!t) continue;
            cfg.tenants.push_back(TenantSessionPolicy{
                .database = (*t)["database"].value_or(""s),
                .policy = extract_policy(*t, g.defaults),
            });
        }
    }
    return cfg;
}

TenantCoreConfig extract_all_sections(const toml::table& tbl) {
    TenantCoreConfig config;
    config.cluster = extract_cluster(tbl);
    config.pools = extract_pools(tbl);
    config.provisioning = extract_provisioning(tbl);
    config.schema_repair = extract_schema_repair(tbl);
    config.sessions = extract_sessions(tbl);
    return config;
}

std::vector<std::string> validate_policy(const std::string& where, const SessionPolicy& policy) {
    std::vector<std::string> errors;
    if (policy.max_concurrent_sessions == 0) {
        errors.push_back(std::format("{}.max_concurrent_sessions must be > 0", where));
    }
    if (policy.session_timeout.count() <= 0) {
        errors.push_back(std::format("{}.session_timeout_seconds must be > 0", where));
    }
    if (policy.idle_timeout.count() <= 0) {
        errors.push_back(std::format("{}.idle_timeout_seconds must be > 0", where));
    }
    return errors;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(TenantCoreConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TenantCoreConfig& config) {
    std::vector<std::string> errors;

    const auto& coords = config.cluster.coordinates;
    if (coords.host.empty()) {
        errors.push_back("cluster.host must not be empty");
    }
    if (!utils::in_range<1, 65535>(coords.port)) {
        errors.push_back(std::format("cluster.port must be 1-65535, got {}", coords.port));
    }
    if (coords.user.empty()) {
        errors.push_back("cluster.user must not be empty");
    }
    if (identifier::validate_database_name(config.cluster.admin_database).is_error()) {
        errors.push_back(std::format("cluster.admin_database '{}' is not a valid database name",
                                     config.cluster.admin_database));
    }
    if (identifier::validate_database_name(config.cluster.main_database).is_error()) {
        errors.push_back(std::format("cluster.main_database '{}' is not a valid database name",
                                     config.cluster.main_database));
    }

    const auto& pools = config.pools.registry;
    if (pools.max_connections_per_pool == 0) {
        errors.push_back("pools.max_connections_per_pool must be > 0");
    }
    if (pools.min_connections > pools.max_connections_per_pool) {
        errors.push_back(std::format("pools.min_connections ({}) > max_connections_per_pool ({})",
                                     pools.min_connections, pools.max_connections_per_pool));
    }
    if (pools.max_pools == 0) {
        errors.push_back("pools.max_pools must be > 0");
    }
    if (config.pools.main_pool_max_connections == 0) {
        errors.push_back("pools.main_pool_max_connections must be > 0");
    }

    if (config.provisioning.orchestrator.required_tables.empty()) {
        errors.push_back("provisioning.required_tables must not be empty");
    }
    const auto plan = utils::to_lower(config.provisioning.orchestrator.default_plan);
    if (plan != "starter" && plan != "professional" && plan != "enterprise") {
        errors.push_back(std::format("provisioning.default_plan '{}' must be starter, professional or enterprise",
                                     config.provisioning.orchestrator.default_plan));
    }

    if (config.schema_repair.cooldown.count() < 0 || config.schema_repair.failure_cooldown.count() < 0) {
        errors.push_back("schema_repair cooldowns must not be negative");
    }
    if (config.schema_repair.lock_wait_attempts == 0) {
        errors.push_back("schema_repair.lock_wait_attempts must be > 0");
    }

    for (auto& e : validate_policy("sessions", config.sessions.governor.defaults)) {
        errors.push_back(std::move(e));
    }
    for (size_t i = 0; i < config.sessions.tenants.size(); ++i) {
        const auto& t = config.sessions.tenants[i];
        if (identifier::validate_database_name(t.database).is_error()) {
            errors.push_back(std::format("sessions.tenants[{}].database '{}' is not a valid database name",
                                         i, t.database));
        }
        for (auto& e : validate_policy(std::format("sessions.tenants[{}]", i), t.policy)) {
            errors.push_back(std::move(e));
        }
    }

    return errors;
}

} // namespace tenantcore
