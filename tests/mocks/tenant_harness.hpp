#pragma once

#include "db/cluster_admin.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_repair_engine.hpp"
#include "tenant/provisioning_orchestrator.hpp"
#include "mocks/fake_cluster.hpp"
#include "mocks/fake_tenant_directory.hpp"

#include <memory>

namespace tenantcore::testing {

/**
 * @brief Engine settings that keep lock waits in the millisecond range
 */
inline SchemaRepairEngine::Config fast_engine_config() {
    SchemaRepairEngine::Config cfg;
    cfg.lock_wait_attempts = 5;
    cfg.lock_wait_interval = std::chrono::milliseconds{5};
    return cfg;
}

/**
 * @brief The provisioning stack wired over a FakeCluster
 */
struct TenantHarness {
    std::shared_ptr<FakeCluster> cluster = std::make_shared<FakeCluster>();
    std::shared_ptr<ClusterAdmin> admin;
    std::shared_ptr<TenantPoolRegistry> registry;
    std::shared_ptr<SchemaRepairEngine> engine;
    std::shared_ptr<FakeTenantDirectory> directory = std::make_shared<FakeTenantDirectory>();
    std::shared_ptr<ProvisioningOrchestrator> orchestrator;

    explicit TenantHarness(SchemaRepairEngine::Config engine_config = fast_engine_config()) {
        ClusterAdmin::Config admin_config;
        admin_config.admin_statement_timeout_ms = 5000;
        admin = std::make_shared<ClusterAdmin>(admin_config, cluster);

        TenantPoolRegistry::Config pool_config;
        pool_config.max_connections_per_pool = 3;
        pool_config.acquire_timeout = std::chrono::milliseconds{100};
        pool_config.drain_timeout = std::chrono::milliseconds{20};
        registry = std::make_shared<TenantPoolRegistry>(pool_config,
            TenantPoolRegistry::make_pool_factory(admin_config.cluster, cluster, pool_config));

        engine = std::make_shared<SchemaRepairEngine>(std::move(engine_config), admin, registry);
        orchestrator = std::make_shared<ProvisioningOrchestrator>(
            ProvisioningOrchestrator::Config{}, admin, registry, engine, directory);
    }

    [[nodiscard]] static CreateTenantRequest request(const std::string& domain,
                                                     const std::string& name = "Acme Studio") {
        CreateTenantRequest req;
        req.agency_name = name;
        req.domain = domain;
        req.admin_name = "Ada Lovelace";
        req.admin_email = "ada@" + domain;
        req.admin_password_hash = "pbkdf2_sha256$100000$c2FsdA$aGFzaA";
        return req;
    }
};

} // namespace tenantcore::testing
