#include <catch2/catch_test_macros.hpp>
#include "core/secure_wipe.hpp"

#include <string>

using namespace logshield;

TEST_CASE("SecureWipe: clears string and keeps buffer", "[wipe]") {
    std::string secret = "correct horse battery staple, long enough for the heap";
    const auto capacity = secret.capacity();

    secure_wipe(secret);
    CHECK(secret.empty());
    CHECK(secret.capacity() == capacity);
}

TEST_CASE("SecureWipe: empty and short strings", "[wipe]") {
    std::string empty;
    CHECK_NOTHROW(secure_wipe(empty));
    CHECK(empty.empty());

    std::string short_secret = "pin";
    secure_wipe(short_secret);
    CHECK(short_secret.empty());
}

TEST_CASE("SecureWipe: shrunk string is wiped to its full capacity", "[wipe]") {
    std::string secret(200, 's');
    secret.resize(10);
    const auto capacity = secret.capacity();
    REQUIRE(capacity >= 200);

    secure_wipe(secret);
    CHECK(secret.empty());
    CHECK(secret.capacity() == capacity);

    // Nothing of the secret is readable through the string afterwards
    secret.resize(capacity);
    CHECK(secret.find('s') == std::string::npos);
}
