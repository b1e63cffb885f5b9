#pragma once

#include "db/identifier.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_repair_engine.hpp"
#include "session/session_governor.hpp"
#include "tenant/provisioning_orchestrator.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tenantcore {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct ClusterConfig {
    ClusterCoordinates coordinates;
    std::string admin_database = "postgres";
    std::string main_database = "tenantcore";
};

struct PoolsConfig {
    TenantPoolRegistry::Config registry;
    size_t main_pool_max_connections = 20;
};

struct ProvisioningConfig {
    uint32_t admin_statement_timeout_ms = 60000;
    ProvisioningOrchestrator::Config orchestrator;
};

struct TenantSessionPolicy {
    std::string database;
    SessionPolicy policy;
};

struct SessionsConfig {
    SessionGovernor::Config governor;
    std::vector<TenantSessionPolicy> tenants;
};

// ============================================================================
// TenantCoreConfig - Complete parsed configuration
// ============================================================================

struct TenantCoreConfig {
    ClusterConfig cluster;
    PoolsConfig pools;
    ProvisioningConfig provisioning;
    SchemaRepairEngine::Config schema_repair;
    SessionsConfig sessions;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads tenantcore.toml
 *
 * Strings may reference ${ENV_VAR}; `include = ["other.toml"]` merges other
 * files underneath the including one. Missing keys keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        TenantCoreConfig config;

        static LoadResult ok(TenantCoreConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem found, one message each; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const TenantCoreConfig& config);

private:
    static LoadResult validate_and_return(TenantCoreConfig config);
};

} // namespace tenantcore
