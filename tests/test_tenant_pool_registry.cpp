#include <catch2/catch_test_macros.hpp>
#include "db/tenant_pool_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "mocks/fake_cluster.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace tenantcore;
using tenantcore::testing::FakeCluster;

namespace {

TenantPoolRegistry::Config small_config() {
    TenantPoolRegistry::Config cfg;
    cfg.max_connections_per_pool = 2;
    cfg.min_connections = 1;
    cfg.max_pools = 10;
    cfg.acquire_timeout = std::chrono::milliseconds{50};
    cfg.drain_timeout = std::chrono::milliseconds{20};
    return cfg;
}

std::shared_ptr<TenantPoolRegistry> make_registry(const std::shared_ptr<FakeCluster>& cluster,
                                                  TenantPoolRegistry::Config cfg = small_config()) {
    return std::make_shared<TenantPoolRegistry>(
        cfg, TenantPoolRegistry::make_pool_factory(ClusterCoordinates{}, cluster, cfg));
}

} // namespace

// ---------------------------------------------------------------------------
// Lookup and creation
// ---------------------------------------------------------------------------

TEST_CASE("TenantPoolRegistry: first acquire creates the pool, later ones reuse it",
          "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_acme_1a2b3c4d");
    auto registry = make_registry(cluster);

    auto pool1 = registry->get_pool("agency_acme_1a2b3c4d");
    auto pool2 = registry->get_pool("agency_acme_1a2b3c4d");
    REQUIRE(pool1.is_ok());
    REQUIRE(pool2.is_ok());
    CHECK(pool1.value().get() == pool2.value().get());
    CHECK(pool1.value()->name() == "agency_acme_1a2b3c4d");
    CHECK(registry->get_stats().pools_created == 1);
    CHECK(registry->contains("agency_acme_1a2b3c4d"));
}

TEST_CASE("TenantPoolRegistry: acquired connection reaches the named database",
          "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_acme_1a2b3c4d");
    auto registry = make_registry(cluster);

    auto conn = registry->acquire("agency_acme_1a2b3c4d");
    REQUIRE(conn.is_ok());
    auto rs = (*conn.value())->execute("SELECT 1");
    CHECK(rs.success);
    CHECK(cluster->count_statements("SELECT 1", "agency_acme_1a2b3c4d") == 1);
}

TEST_CASE("TenantPoolRegistry: invalid names never reach the factory", "[tenant_pool_registry]") {
    std::atomic<int> factory_calls{0};
    TenantPoolRegistry registry(small_config(), [&](const std::string&, size_t) {
        ++factory_calls;
        return TenantPoolRegistry::PoolResult::error(ErrorCode::INTERNAL_ERROR, "unused");
    });

    auto r = registry.acquire("acme; DROP DATABASE x");
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::INVALID_IDENTIFIER);
    CHECK(factory_calls == 0);
}

TEST_CASE("TenantPoolRegistry: missing database fails and is not cached", "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    auto registry = make_registry(cluster);

    auto r = registry->acquire("agency_late_00000000");
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::TENANT_DATABASE_NOT_FOUND);
    CHECK_FALSE(registry->contains("agency_late_00000000"));
    CHECK(registry->get_stats().creation_failures == 1);

    // The database appears later; the next acquire retries
    cluster->add_database("agency_late_00000000");
    CHECK(registry->acquire("agency_late_00000000").is_ok());
}

TEST_CASE("TenantPoolRegistry: unreachable cluster is reported as retryable", "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_down_00000000");
    cluster->set_unreachable("agency_down_00000000", true);
    auto registry = make_registry(cluster);

    auto r = registry->acquire("agency_down_00000000");
    REQUIRE(r.is_error());
    CHECK(r.error_code() == ErrorCode::TENANT_UNREACHABLE);
    CHECK(is_retryable(r.error_code()));
}

TEST_CASE("TenantPoolRegistry: concurrent first acquires build one pool", "[tenant_pool_registry]") {
    std::atomic<int> factory_calls{0};
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_busy_00000000");
    auto cfg = small_config();
    cfg.max_connections_per_pool = 16;
    auto inner = TenantPoolRegistry::make_pool_factory(ClusterCoordinates{}, cluster, cfg);

    TenantPoolRegistry registry(cfg, [&](const std::string& db, size_t max_conn) {
        ++factory_calls;
        std::this_thread::sleep_for(std::chrono::milliseconds{30});
        return inner(db, max_conn);
    });

    constexpr int kThreads = 12;
    std::vector<std::thread> threads;
    std::vector<IConnectionPool*> seen(kThreads, nullptr);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto pool = registry.get_pool("agency_busy_00000000");
            if (pool.is_ok()) seen[i] = pool.value().get();
        });
    }
    for (auto& t : threads) t.join();

    CHECK(factory_calls == 1);
    for (auto* p : seen) {
        CHECK(p != nullptr);
        CHECK(p == seen.front());
    }
    CHECK(registry.get_stats().pools_created == 1);
}

TEST_CASE("TenantPoolRegistry: slow creation for one tenant does not block another",
          "[tenant_pool_registry]") {
    std::atomic<bool> release_slow{false};
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_slow_00000000");
    cluster->add_database("agency_fast_00000000");
    auto cfg = small_config();
    auto inner = TenantPoolRegistry::make_pool_factory(ClusterCoordinates{}, cluster, cfg);

    TenantPoolRegistry registry(cfg, [&](const std::string& db, size_t max_conn) {
        if (db == "agency_slow_00000000") {
            while (!release_slow) std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return inner(db, max_conn);
    });

    std::thread slow([&] { (void)registry.get_pool("agency_slow_00000000"); });
    std::this_thread::sleep_for(std::chrono::milliseconds{10});

    auto fast = registry.get_pool("agency_fast_00000000");
    const bool slow_still_pending = !release_slow;
    release_slow = true;
    slow.join();

    REQUIRE(fast.is_ok());
    CHECK(slow_still_pending);
}

// ---------------------------------------------------------------------------
// Ceilings
// ---------------------------------------------------------------------------

TEST_CASE("TenantPoolRegistry: per-tenant ceiling ends in POOL_SATURATED", "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_acme_1a2b3c4d");
    auto registry = make_registry(cluster);

    auto a = registry->acquire("agency_acme_1a2b3c4d");
    auto b = registry->acquire("agency_acme_1a2b3c4d");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    auto c = registry->acquire("agency_acme_1a2b3c4d");
    REQUIRE(c.is_error());
    CHECK(c.error_code() == ErrorCode::POOL_SATURATED);

    registry->release(std::move(a.value()));
    CHECK(registry->acquire("agency_acme_1a2b3c4d").is_ok());
}

TEST_CASE("TenantPoolRegistry: set_tenant_limit overrides the default ceiling", "[tenant_pool_registry]") {
    std::atomic<size_t> seen_max{0};
    TenantPoolRegistry registry(small_config(), [&](const std::string& db, size_t max_conn) {
        seen_max = max_conn;
        auto cluster = std::make_shared<FakeCluster>();
        PoolConfig pc;
        pc.connection_string = identifier::build_target(ClusterCoordinates{}, db).value().connection_string;
        pc.max_connections = max_conn;
        return TenantPoolRegistry::PoolResult::ok(
            std::make_shared<GenericConnectionPool>(db, pc, cluster));
    });

    registry.set_tenant_limit("tenantcore", 20);
    REQUIRE(registry.get_pool("tenantcore").is_ok());
    CHECK(seen_max == 20);

    REQUIRE(registry.get_pool("postgres").is_ok());
    CHECK(seen_max == 2);
}

TEST_CASE("TenantPoolRegistry: max_pools evicts the least recently used idle pool",
          "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    for (const auto* db : {"agency_a_00000000", "agency_b_00000000", "agency_c_00000000"}) {
        cluster->add_database(db);
    }
    auto cfg = small_config();
    cfg.max_pools = 2;
    auto registry = make_registry(cluster, cfg);

    REQUIRE(registry->get_pool("agency_a_00000000").is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    REQUIRE(registry->get_pool("agency_b_00000000").is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    REQUIRE(registry->get_pool("agency_c_00000000").is_ok());

    CHECK_FALSE(registry->contains("agency_a_00000000"));
    CHECK(registry->contains("agency_b_00000000"));
    CHECK(registry->contains("agency_c_00000000"));
    CHECK(registry->get_stats().total_pools == 2);
}

// ---------------------------------------------------------------------------
// Eviction
// ---------------------------------------------------------------------------

TEST_CASE("TenantPoolRegistry: evict closes the pool and the next acquire builds a new one",
          "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_acme_1a2b3c4d");
    auto registry = make_registry(cluster);

    auto first = registry->get_pool("agency_acme_1a2b3c4d");
    REQUIRE(first.is_ok());

    const auto evicted = registry->evict("agency_acme_1a2b3c4d");
    CHECK(evicted.found);
    CHECK(evicted.outstanding == 0);
    CHECK_FALSE(registry->contains("agency_acme_1a2b3c4d"));
    CHECK(cluster->open_connections() == 0);

    auto stale = first.value()->acquire(std::chrono::milliseconds{10});
    REQUIRE(stale.is_error());
    CHECK(stale.error_code() == ErrorCode::TENANT_UNREACHABLE);

    auto second = registry->get_pool("agency_acme_1a2b3c4d");
    REQUIRE(second.is_ok());
    CHECK(second.value().get() != first.value().get());
}

TEST_CASE("TenantPoolRegistry: evict of an unknown name is a no-op", "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    auto registry = make_registry(cluster);
    CHECK_FALSE(registry->evict("agency_none_00000000").found);
}

TEST_CASE("TenantPoolRegistry: borrowed connections outlive eviction and close on return",
          "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_acme_1a2b3c4d");
    auto registry = make_registry(cluster);

    auto conn = registry->acquire("agency_acme_1a2b3c4d");
    REQUIRE(conn.is_ok());

    const auto evicted = registry->evict("agency_acme_1a2b3c4d");
    CHECK(evicted.outstanding == 1);
    CHECK((*conn.value())->execute("SELECT 1").success);

    conn.value().reset();
    CHECK(cluster->open_connections() == 0);
}

TEST_CASE("TenantPoolRegistry: idle sweep removes unused pools only", "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_idle_00000000");
    cluster->add_database("agency_used_00000000");
    auto cfg = small_config();
    cfg.idle_pool_timeout = std::chrono::seconds{0};
    auto registry = make_registry(cluster, cfg);

    REQUIRE(registry->get_pool("agency_idle_00000000").is_ok());
    auto held = registry->acquire("agency_used_00000000");
    REQUIRE(held.is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{2});

    CHECK(registry->sweep_idle_pools() == 1);
    CHECK_FALSE(registry->contains("agency_idle_00000000"));
    CHECK(registry->contains("agency_used_00000000"));
}

TEST_CASE("TenantPoolRegistry: close_all empties the registry", "[tenant_pool_registry]") {
    auto cluster = std::make_shared<FakeCluster>();
    cluster->add_database("agency_a_00000000");
    cluster->add_database("agency_b_00000000");
    auto registry = make_registry(cluster);

    REQUIRE(registry->get_pool("agency_a_00000000").is_ok());
    REQUIRE(registry->get_pool("agency_b_00000000").is_ok());
    registry->close_all();

    const auto stats = registry->get_stats();
    CHECK(stats.total_pools == 0);
    CHECK(stats.pools_evicted == 2);
    CHECK(cluster->open_connections() == 0);
}
