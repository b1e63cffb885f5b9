#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tenantcore {

using SessionClock = std::chrono::system_clock;

/**
 * @brief Row of public.user_sessions in a tenant database
 *
 * The raw token never leaves the governor; only its SHA-256 hex is stored.
 */
struct SessionRecord {
    std::string id;
    std::string user_id;
    std::string token_hash;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
    nlohmann::json device_info = nlohmann::json::object();
    bool is_active = true;
    SessionClock::time_point last_activity_at{};
    SessionClock::time_point expires_at{};
    SessionClock::time_point created_at{};
    std::optional<SessionClock::time_point> revoked_at;
    std::optional<std::string> revoke_reason;

    /**
     * @brief Active, not revoked and not past its hard expiry
     */
    [[nodiscard]] bool is_live(SessionClock::time_point now) const {
        return is_active && !revoked_at && expires_at > now;
    }
};

struct CreateSessionOptions {
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
    nlohmann::json device_info = nlohmann::json::object();
};

/**
 * @brief Per-tenant session limits
 */
struct SessionPolicy {
    uint32_t max_concurrent_sessions = 5;
    std::chrono::seconds session_timeout{24 * 60 * 60};
    std::chrono::seconds idle_timeout{30 * 60};
};

} // namespace tenantcore
