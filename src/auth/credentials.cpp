#include "auth/credentials.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <format>

namespace tenantcore {

namespace {

constexpr std::string_view kPbkdf2Prefix = "pbkdf2_sha256";
constexpr size_t kSaltBytes = 16;

std::vector<uint8_t> from_hex(std::string_view hex) {
    std::vector<uint8_t> out;
    if (hex.size() % 2 != 0) return out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int v = utils::parse_int_base<int>(hex.substr(i, 2), 16, -1);
        if (v < 0) return {};
        out.push_back(static_cast<uint8_t>(v));
    }
    return out;
}

} // namespace

Result<std::vector<uint8_t>> Credentials::random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::INTERNAL_ERROR, "RAND_bytes failed");
    }
    return Result<std::vector<uint8_t>>::ok(std::move(bytes));
}

Result<std::string> Credentials::temporary_password(size_t length) {
    const size_t n = kPasswordAlphabet.size();
    // Largest multiple of n below 256 keeps the draw unbiased
    const size_t limit = 256 - (256 % n);

    std::string password;
    password.reserve(length);
    while (password.size() < length) {
        auto batch = random_bytes(length * 2);
        if (batch.is_error()) {
            return Result<std::string>::error_from(batch);
        }
        for (const uint8_t b : batch.value()) {
            if (b >= limit) continue;
            password += kPasswordAlphabet[b % n];
            if (password.size() == length) break;
        }
    }
    return Result<std::string>::ok(std::move(password));
}

Result<std::string> Credentials::sha256_hex(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        return Result<std::string>::error(ErrorCode::INTERNAL_ERROR, "EVP_Digest(SHA-256) failed");
    }
    return Result<std::string>::ok(utils::to_hex(digest, len));
}

Result<std::vector<uint8_t>> Credentials::pbkdf2_sha256(
    std::string_view password,
    const std::vector<uint8_t>& salt,
    uint32_t iterations) {
    std::vector<uint8_t> result(SHA256_DIGEST_LENGTH);
    if (PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            salt.data(), static_cast<int>(salt.size()),
            static_cast<int>(iterations),
            EVP_sha256(),
            SHA256_DIGEST_LENGTH, result.data()) != 1) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::INTERNAL_ERROR, "PKCS5_PBKDF2_HMAC failed");
    }
    return Result<std::vector<uint8_t>>::ok(std::move(result));
}

Result<std::string> Pbkdf2PasswordHasher::hash(std::string_view password) {
    const auto salt = Credentials::random_bytes(kSaltBytes);
    if (salt.is_error()) {
        return Result<std::string>::error_from(salt);
    }
    const auto derived = Credentials::pbkdf2_sha256(password, salt.value(), iterations_);
    if (derived.is_error()) {
        return Result<std::string>::error_from(derived);
    }
    return Result<std::string>::ok(std::format("{}${}${}${}",
        kPbkdf2Prefix, iterations_,
        utils::to_hex(salt.value().data(), salt.value().size()),
        utils::to_hex(derived.value().data(), derived.value().size())));
}

bool Pbkdf2PasswordHasher::verify(std::string_view password, std::string_view encoded) {
    const auto parts = utils::split(std::string(encoded), '$');
    if (parts.size() != 4 || parts[0] != kPbkdf2Prefix) {
        return false;
    }
    const auto iterations = utils::try_parse_int<uint32_t>(parts[1]);
    const auto salt = from_hex(parts[2]);
    const auto expected = from_hex(parts[3]);
    if (!iterations || *iterations == 0 || salt.empty() || expected.empty()) {
        return false;
    }
    const auto derived = Credentials::pbkdf2_sha256(password, salt, *iterations);
    if (derived.is_error() || derived.value().size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(derived.value().data(), expected.data(), expected.size()) == 0;
}

} // namespace tenantcore
