#include "auth/credentials.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/cluster_admin.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/tenant_pool_registry.hpp"
#include "schema/schema_repair_engine.hpp"
#include "session/session_governor.hpp"
#include "tenant/provisioning_orchestrator.hpp"
#include "tenant/tenant_directory.hpp"
#include "tenant/tenant_setup_service.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

using namespace tenantcore;

// Global instance for signal handling
std::shared_ptr<TenantPoolRegistry> g_registry;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_registry) {
        g_registry->close_all();
    }
    exit(1);
}

namespace {

constexpr const char* kUsage =
    "Usage: tenantcore [--config <file>] [--verbose] <command> [options]\n"
    "\n"
    "Commands:\n"
    "  create        --name <agency> --domain <domain> --admin-name <name>\n"
    "                --admin-email <email> [--admin-password <pw>] [--plan <plan>]\n"
    "                [--industry <v>] [--phone <v>] [--address <v>] [--employee-count <v>]\n"
    "                [--country <v>] [--timezone <v>] [--currency <v>] [--language <v>]\n"
    "                [--enable-gst] [--pages <id,id,...>]\n"
    "  setup         --database <db> --settings <file.json> [--csv <out.csv>]\n"
    "  setup-status  --database <db>\n"
    "  repair        --database <db>\n"
    "  delete        --database <db>\n"
    "  check-domain  --domain <domain>\n"
    "  sessions      --database <db> --user <uuid>\n"
    "  revoke-sessions --database <db> --user <uuid> [--except <session id>]\n"
    "  cleanup-sessions --database <db>\n";

struct CommandLine {
    std::string config_file = "config/tenantcore.toml";
    std::string command;
    bool verbose = false;
    std::unordered_map<std::string, std::string> options;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        const auto it = options.find(key);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }
    [[nodiscard]] bool flag(const std::string& key) const { return options.contains(key); }
};

Result<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            cl.verbose = true;
        } else if (arg.starts_with("--")) {
            const std::string key = arg.substr(2);
            const bool has_value = i + 1 < argc && !std::string(argv[i + 1]).starts_with("--");
            const std::string value = has_value ? argv[++i] : "";
            if (key == "config") {
                cl.config_file = value;
            } else {
                cl.options[key] = value;
            }
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            return Result<CommandLine>::error(ErrorCode::INVALID_ARGUMENT,
                std::format("Unexpected argument '{}'", arg));
        }
    }
    if (cl.command.empty()) {
        return Result<CommandLine>::error(ErrorCode::INVALID_ARGUMENT, "No command given");
    }
    return Result<CommandLine>::ok(std::move(cl));
}

Result<std::string> require(const CommandLine& cl, const std::string& key) {
    auto v = cl.get(key);
    if (!v || v->empty()) {
        return Result<std::string>::error(ErrorCode::INVALID_ARGUMENT,
            std::format("--{} is required for '{}'", key, cl.command));
    }
    return Result<std::string>::ok(std::move(*v));
}

struct Services {
    std::shared_ptr<TenantPoolRegistry> registry;
    std::shared_ptr<SchemaRepairEngine> engine;
    std::shared_ptr<PgTenantDirectory> directory;
    std::shared_ptr<ProvisioningOrchestrator> orchestrator;
    std::shared_ptr<TenantSetupService> setup;
    std::shared_ptr<SessionGovernor> sessions;
};

Services build_services(const TenantCoreConfig& cfg) {
    auto factory = std::make_shared<PgConnectionFactory>();

    auto admin = std::make_shared<ClusterAdmin>(ClusterAdmin::Config{
        .cluster = cfg.cluster.coordinates,
        .admin_database = cfg.cluster.admin_database,
        .admin_statement_timeout_ms = cfg.provisioning.admin_statement_timeout_ms,
    }, factory);

    Services s;
    s.registry = std::make_shared<TenantPoolRegistry>(cfg.pools.registry,
        TenantPoolRegistry::make_pool_factory(cfg.cluster.coordinates, factory, cfg.pools.registry));
    s.registry->set_tenant_limit(cfg.cluster.main_database, cfg.pools.main_pool_max_connections);

    s.engine = std::make_shared<SchemaRepairEngine>(cfg.schema_repair, admin, s.registry);
    s.directory = std::make_shared<PgTenantDirectory>(s.registry, cfg.cluster.main_database);
    s.orchestrator = std::make_shared<ProvisioningOrchestrator>(
        cfg.provisioning.orchestrator, admin, s.registry, s.engine, s.directory);
    s.setup = std::make_shared<TenantSetupService>(
        s.registry, s.directory, s.engine, std::make_shared<Pbkdf2PasswordHasher>());

    s.sessions = std::make_shared<SessionGovernor>(cfg.sessions.governor,
        std::make_shared<PgSessionStore>(s.registry, s.engine));
    for (const auto& t : cfg.sessions.tenants) {
        const auto applied = s.sessions->set_tenant_policy(t.database, t.policy);
        if (applied.is_error()) {
            utils::log::warn(std::format("Ignoring session policy for {}: {}",
                                         t.database, applied.error_message()));
        }
    }
    return s;
}

nlohmann::json error_json(ErrorCode code, const std::string& message, const std::string& context) {
    nlohmann::json j = {
        {"ok", false},
        {"error", error_code_to_string(code)},
        {"message", message},
    };
    if (!context.empty()) j["context"] = context;
    return j;
}

template<typename T>
nlohmann::json error_json(const Result<T>& r) {
    return error_json(r.error_code(), r.error_message(), r.error_context());
}

nlohmann::json run_create(Services& s, const CommandLine& cl) {
    CreateTenantRequest req;
    for (const auto& [key, field] : {std::pair{"name", &req.agency_name},
                                     std::pair{"domain", &req.domain},
                                     std::pair{"admin-name", &req.admin_name},
                                     std::pair{"admin-email", &req.admin_email}}) {
        auto v = require(cl, key);
        if (v.is_error()) return error_json(v);
        *field = v.value();
    }

    // Without a password the admin gets a generated one, printed once
    std::string password = cl.get("admin-password").value_or("");
    const bool generated = password.empty();
    if (generated) {
        auto tmp = Credentials::temporary_password();
        if (tmp.is_error()) return error_json(tmp);
        password = tmp.value();
    }
    Pbkdf2PasswordHasher hasher;
    auto hashed = hasher.hash(password);
    if (hashed.is_error()) return error_json(hashed);
    req.admin_password_hash = hashed.value();

    if (auto plan = cl.get("plan")) req.subscription_plan = *plan;
    auto& m = req.metadata;
    m.industry = cl.get("industry");
    m.phone = cl.get("phone");
    m.address_text = cl.get("address");
    m.employee_count = cl.get("employee-count");
    m.country = cl.get("country");
    m.timezone = cl.get("timezone");
    m.currency = cl.get("currency");
    m.language = cl.get("language");
    m.enable_gst = cl.flag("enable-gst");
    if (auto pages = cl.get("pages")) {
        for (auto& id : utils::split(*pages, ',')) {
            if (!utils::trim(id).empty()) m.page_ids.push_back(utils::trim(id));
        }
    }

    const auto result = s.orchestrator->create_tenant(req);
    if (result.is_error()) return error_json(result);

    const auto& t = result.value();
    nlohmann::json j = {
        {"ok", true},
        {"tenant_id", t.tenant_id},
        {"database", t.database_name},
        {"admin_user_id", t.admin_user_id},
        {"reused_existing", t.reused_existing},
        {"domain_conflict_resolved", t.domain_conflict_resolved},
        {"subscription_plan", t.subscription_plan},
        {"max_users", t.max_users},
    };
    if (generated && !t.reused_existing) {
        j["admin_temporary_password"] = password;
    }
    return j;
}

nlohmann::json run_setup(Services& s, const CommandLine& cl) {
    auto database = require(cl, "database");
    if (database.is_error()) return error_json(database);
    auto file = require(cl, "settings");
    if (file.is_error()) return error_json(file);

    std::ifstream in(file.value());
    if (!in) {
        return error_json(ErrorCode::INVALID_ARGUMENT,
                          std::format("Cannot open {}", file.value()), "");
    }
    const auto parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        return error_json(ErrorCode::INVALID_ARGUMENT,
                          std::format("{} is not valid JSON", file.value()), "");
    }
    auto settings = extended_settings_from_json(parsed);
    if (settings.is_error()) return error_json(settings);

    const auto result = s.setup->complete_tenant_setup(database.value(), settings.value());
    if (result.is_error()) return error_json(result);
    const auto& manifest = result.value();

    if (auto csv = cl.get("csv"); csv && !manifest.created.empty()) {
        std::ofstream out(*csv);
        if (!out) {
            return error_json(ErrorCode::INTERNAL_ERROR, std::format("Cannot write {}", *csv), "");
        }
        out << manifest.to_csv();
    }

    nlohmann::json created = nlohmann::json::array();
    for (const auto& c : manifest.created) {
        created.push_back({{"name", c.name}, {"email", c.email}, {"role", c.role},
                           {"department", c.department}, {"employee_id", c.employee_id}});
    }
    nlohmann::json failed = nlohmann::json::array();
    for (const auto& f : manifest.failed) {
        failed.push_back({{"email", f.email}, {"error", error_code_to_string(f.code)},
                          {"message", f.message}});
    }
    return {
        {"ok", true},
        {"created", created},
        {"skipped", manifest.skipped},
        {"failed", failed},
    };
}

nlohmann::json run_repair(Services& s, const CommandLine& cl) {
    auto database = require(cl, "database");
    if (database.is_error()) return error_json(database);

    const auto result = s.orchestrator->repair_tenant_schema(database.value());
    if (result.is_error()) return error_json(result);
    const auto& r = result.value();
    return {
        {"ok", true},
        {"database", r.database},
        {"tables_before", r.tables_before},
        {"tables_after", r.tables_after},
        {"tables_added", r.tables_added},
    };
}

nlohmann::json session_json(const SessionRecord& r) {
    const auto epoch = [](SessionClock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    };
    nlohmann::json j = {
        {"id", r.id},
        {"user_id", r.user_id},
        {"device_info", r.device_info},
        {"last_activity_at", epoch(r.last_activity_at)},
        {"expires_at", epoch(r.expires_at)},
        {"created_at", epoch(r.created_at)},
    };
    if (r.ip_address) j["ip_address"] = *r.ip_address;
    if (r.user_agent) j["user_agent"] = *r.user_agent;
    return j;
}

nlohmann::json run_sessions(Services& s, const CommandLine& cl) {
    auto database = require(cl, "database");
    if (database.is_error()) return error_json(database);

    if (cl.command == "cleanup-sessions") {
        const auto removed = s.sessions->cleanup_expired_sessions(database.value());
        if (removed.is_error()) return error_json(removed);
        return {{"ok", true}, {"database", database.value()}, {"removed", removed.value()}};
    }

    auto user = require(cl, "user");
    if (user.is_error()) return error_json(user);

    if (cl.command == "revoke-sessions") {
        const auto revoked = s.sessions->revoke_all_user_sessions(
            database.value(), user.value(), cl.get("except").value_or(""));
        if (revoked.is_error()) return error_json(revoked);
        return {{"ok", true}, {"database", database.value()}, {"revoked", revoked.value()}};
    }

    const auto active = s.sessions->list_active_sessions(database.value(), user.value());
    if (active.is_error()) return error_json(active);
    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : active.value()) list.push_back(session_json(r));
    return {
        {"ok", true},
        {"database", database.value()},
        {"max_concurrent_sessions", s.sessions->policy_for(database.value()).max_concurrent_sessions},
        {"sessions", list},
    };
}

nlohmann::json dispatch(Services& s, const CommandLine& cl) {
    if (cl.command == "create") return run_create(s, cl);
    if (cl.command == "setup") return run_setup(s, cl);
    if (cl.command == "repair") return run_repair(s, cl);
    if (cl.command == "sessions" || cl.command == "revoke-sessions" || cl.command == "cleanup-sessions") {
        return run_sessions(s, cl);
    }

    if (cl.command == "setup-status") {
        auto database = require(cl, "database");
        if (database.is_error()) return error_json(database);
        const auto done = s.setup->is_setup_complete(database.value());
        if (done.is_error()) return error_json(done);
        return {{"ok", true}, {"database", database.value()}, {"setup_complete", done.value()}};
    }
    if (cl.command == "delete") {
        auto database = require(cl, "database");
        if (database.is_error()) return error_json(database);
        const auto deleted = s.orchestrator->delete_tenant(database.value());
        if (deleted.is_error()) return error_json(deleted);
        return {{"ok", true}, {"database", database.value()}};
    }
    if (cl.command == "check-domain") {
        auto domain = require(cl, "domain");
        if (domain.is_error()) return error_json(domain);
        const auto available = s.orchestrator->check_domain_available(domain.value());
        if (available.is_error()) return error_json(available);
        return {{"ok", true}, {"domain", domain.value()}, {"available", available.value()}};
    }

    return error_json(ErrorCode::INVALID_ARGUMENT,
                      std::format("Unknown command '{}'", cl.command), "");
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto cl = parse_command_line(argc, argv);
        if (cl.is_error()) {
            std::cerr << cl.error_message() << "\n\n" << kUsage;
            return 2;
        }

        if (cl.value().verbose) {
            utils::log::set_level(utils::log::Level::DEBUG);
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        utils::log::info(std::format("Loading configuration from {}", cl.value().config_file));
        const auto config_result = ConfigLoader::load_from_file(cl.value().config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 2;
        }

        auto services = build_services(config_result.config);
        g_registry = services.registry;

        const auto output = dispatch(services, cl.value());
        services.registry->close_all();

        std::cout << output.dump(2) << std::endl;
        return output.value("ok", false) ? 0 : 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
