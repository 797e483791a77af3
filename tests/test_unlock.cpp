#include <catch2/catch.hpp>
#include "AuthError.hpp"
#include "KeyUnlock.hpp"
#include "PasswordHash.hpp"
#include "Session.hpp"
#include "helpers.hpp"

using namespace MailAuth;
using test_helpers::errc_of;

namespace {

const Bytes kKeySalt = {0x21, 0x43, 0x65, 0x87, 0xa9, 0xcb, 0xed, 0x0f,
                        0x10, 0x32, 0x54, 0x76, 0x98, 0xba, 0xdc, 0xfe};

SessionCredentials single_password_credentials(const test_helpers::FakeOpenPGP& pgp) {
    SessionCredentials credentials;
    credentials.user_id = "uid-1";
    credentials.access_token = "token";
    credentials.password_mode = PasswordMode::SinglePassword;
    credentials.encrypted_private_key = pgp.armored_ring;
    credentials.key_salt = Utils::base64_encode(kKeySalt);
    return credentials;
}

} // namespace

TEST_CASE("Single-password unlock", "[unlock]") {
    test_helpers::FakeOpenPGP pgp;
    std::string passphrase = PasswordHash::compute_key_password("login password", kKeySalt);
    pgp.ring_passphrases = {passphrase, passphrase};
    SessionCredentials credentials = single_password_credentials(pgp);
    KeyUnlocker unlocker(pgp);

    SECTION("the login password unlocks every key") {
        UnlockedIdentity identity = unlocker.unlock(credentials, "login password");
        REQUIRE(identity.user_id == "uid-1");
        REQUIRE(identity.key_ring);
        REQUIRE(identity.key_ring->entry_count() == 2);
        auto* ring = dynamic_cast<test_helpers::FakeKeyRing*>(identity.key_ring.get());
        REQUIRE(ring != nullptr);
        REQUIRE(ring->all_unlocked());
    }

    SECTION("any other password fails to decrypt") {
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login passwore"); }) ==
                AuthErrc::DecryptionFailed);
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, ""); }) == AuthErrc::DecryptionFailed);
    }

    SECTION("one entry rejecting the passphrase fails the whole ring") {
        pgp.ring_passphrases = {passphrase, "something else"};
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login password"); }) ==
                AuthErrc::DecryptionFailed);
    }

    SECTION("salt problems") {
        credentials.key_salt = "%%%";
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login password"); }) ==
                AuthErrc::InvalidKeySalt);

        credentials.key_salt = Utils::base64_encode(Bytes(8, 0x01));
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login password"); }) ==
                AuthErrc::InvalidKeySalt);
    }

    SECTION("unparsable or empty key ring") {
        credentials.encrypted_private_key = "garbage";
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login password"); }) ==
                AuthErrc::MalformedKeyRing);

        credentials.encrypted_private_key = pgp.armored_ring;
        pgp.ring_passphrases.clear();
        REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login password"); }) ==
                AuthErrc::MalformedKeyRing);
    }
}

TEST_CASE("Two-password unlock", "[unlock]") {
    test_helpers::FakeOpenPGP pgp;
    pgp.ring_passphrases = {"mailbox password"};
    SessionCredentials credentials = single_password_credentials(pgp);
    credentials.password_mode = PasswordMode::TwoPasswords;
    // The key salt plays no part
    credentials.key_salt.clear();
    KeyUnlocker unlocker(pgp);

    REQUIRE(unlocker.unlock(credentials, "mailbox password").key_ring);
    REQUIRE(errc_of([&] { unlocker.unlock(credentials, "login password"); }) ==
            AuthErrc::DecryptionFailed);
}

TEST_CASE("Session commit", "[unlock][session]") {
    test_helpers::FakeOpenPGP pgp;
    pgp.ring_passphrases = {"mailbox password"};
    SessionCredentials credentials = single_password_credentials(pgp);
    credentials.password_mode = PasswordMode::TwoPasswords;

    Session session;
    REQUIRE_FALSE(session.is_unlocked());

    KeyUnlocker unlocker(pgp);
    session.commit(credentials, unlocker.unlock(credentials, "mailbox password"));
    REQUIRE(session.is_unlocked());
    REQUIRE(session.user_id() == "uid-1");
    REQUIRE(session.access_token() == "token");
    REQUIRE(session.key_ring()->entry_count() == 1);

    session.clear();
    REQUIRE_FALSE(session.is_unlocked());
    REQUIRE(session.access_token().empty());
    REQUIRE(session.user_id().empty());
}
