#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tenantcore {

// OpenSSL-backed primitives for tokens and first-login credentials
class Credentials {
public:
    // Alphabet for generated passwords (no 0/O, 1/l/I)
    static constexpr std::string_view kPasswordAlphabet =
        "ABCDEFGHJKLMNPQRSTUVWXYZabcdefghjkmnpqrstuvwxyz23456789!@#$%^&*";
    static constexpr size_t kTemporaryPasswordLength = 14;

    // Cryptographically secure random bytes (RAND_bytes)
    [[nodiscard]] static Result<std::vector<uint8_t>> random_bytes(size_t count);

    // Password drawn uniformly from kPasswordAlphabet (rejection sampling)
    [[nodiscard]] static Result<std::string> temporary_password(
        size_t length = kTemporaryPasswordLength);

    // SHA-256 of data, lowercase hex
    [[nodiscard]] static Result<std::string> sha256_hex(std::string_view data);

    // PBKDF2-HMAC-SHA-256
    [[nodiscard]] static Result<std::vector<uint8_t>> pbkdf2_sha256(
        std::string_view password,
        const std::vector<uint8_t>& salt,
        uint32_t iterations);
};

/**
 * @brief Hashes first-login passwords before they are stored
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;
    [[nodiscard]] virtual Result<std::string> hash(std::string_view password) = 0;
};

/**
 * @brief "pbkdf2_sha256$<iterations>$<salt hex>$<hash hex>"
 */
class Pbkdf2PasswordHasher : public IPasswordHasher {
public:
    explicit Pbkdf2PasswordHasher(uint32_t iterations = 100000) : iterations_(iterations) {}

    Result<std::string> hash(std::string_view password) override;

    // Constant-time check of a password against an encoded hash
    [[nodiscard]] static bool verify(std::string_view password, std::string_view encoded);

private:
    uint32_t iterations_;
};

} // namespace tenantcore
