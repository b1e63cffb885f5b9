#include <catch2/catch_test_macros.hpp>
#include "auth/credentials.hpp"

#include <set>

using namespace tenantcore;

TEST_CASE("Credentials: random_bytes returns the requested length", "[auth][credentials]") {
    auto a = Credentials::random_bytes(32);
    auto b = Credentials::random_bytes(32);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value().size() == 32);
    CHECK(a.value() != b.value());

    auto none = Credentials::random_bytes(0);
    REQUIRE(none.is_ok());
    CHECK(none.value().empty());
}

TEST_CASE("Credentials: temporary passwords use the unambiguous alphabet", "[auth][credentials]") {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto pw = Credentials::temporary_password();
        REQUIRE(pw.is_ok());
        CHECK(pw.value().size() == Credentials::kTemporaryPasswordLength);
        for (const char c : pw.value()) {
            CHECK(Credentials::kPasswordAlphabet.find(c) != std::string_view::npos);
        }
        CHECK(pw.value().find_first_of("0O1lI") == std::string::npos);
        seen.insert(pw.value());
    }
    CHECK(seen.size() == 50);

    CHECK(Credentials::temporary_password(32).value().size() == 32);
}

TEST_CASE("Credentials: sha256_hex matches known digests", "[auth][credentials]") {
    CHECK(Credentials::sha256_hex("").value() ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(Credentials::sha256_hex("abc").value() ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Pbkdf2PasswordHasher: hash then verify", "[auth][credentials]") {
    Pbkdf2PasswordHasher hasher(1000);
    auto encoded = hasher.hash("correct horse");
    REQUIRE(encoded.is_ok());
    CHECK(encoded.value().starts_with("pbkdf2_sha256$1000$"));

    CHECK(Pbkdf2PasswordHasher::verify("correct horse", encoded.value()));
    CHECK_FALSE(Pbkdf2PasswordHasher::verify("wrong horse", encoded.value()));

    // Fresh salt each time
    CHECK(hasher.hash("correct horse").value() != encoded.value());
}

TEST_CASE("Pbkdf2PasswordHasher: malformed hashes never verify", "[auth][credentials]") {
    CHECK_FALSE(Pbkdf2PasswordHasher::verify("pw", ""));
    CHECK_FALSE(Pbkdf2PasswordHasher::verify("pw", "bcrypt$10$abcd$ef01"));
    CHECK_FALSE(Pbkdf2PasswordHasher::verify("pw", "pbkdf2_sha256$0$abcd$ef01"));
    CHECK_FALSE(Pbkdf2PasswordHasher::verify("pw", "pbkdf2_sha256$1000$zz$ef01"));
    CHECK_FALSE(Pbkdf2PasswordHasher::verify("pw", "pbkdf2_sha256$1000$abcd"));
}
