#include <catch2/catch.hpp>
#include "AuthError.hpp"
#include "OpenPGP.hpp"
#include "SRPAuth.hpp"
#include "helpers.hpp"

using namespace MailAuth;
using test_helpers::errc_of;

TEST_CASE("Clear-signed message parsing", "[clearsign]") {

    SECTION("splits text, hash header and signature") {
        auto msg = ClearSignedMessage::parse(test_helpers::signed_message("line one  \n- -dashed\nline three"));
        REQUIRE(msg.has_value());
        REQUIRE(msg->hash_header == "SHA256");
        REQUIRE(msg->plaintext == "line one  \n-dashed\nline three");
        REQUIRE(msg->signed_text == "line one\r\n-dashed\r\nline three");
        REQUIRE(msg->armored_signature.rfind("-----BEGIN PGP SIGNATURE-----", 0) == 0);
        REQUIRE(msg->armored_signature.find("-----END PGP SIGNATURE-----") != std::string::npos);
    }

    SECTION("CRLF input parses the same way") {
        std::string text = test_helpers::signed_message("body");
        std::string crlf;
        for (char c : text) {
            if (c == '\n') crlf += '\r';
            crlf += c;
        }
        auto msg = ClearSignedMessage::parse(crlf);
        REQUIRE(msg.has_value());
        REQUIRE(msg->plaintext == "body");
    }

    SECTION("rejects broken framing") {
        REQUIRE_FALSE(ClearSignedMessage::parse("just text").has_value());
        REQUIRE_FALSE(ClearSignedMessage::parse("-----BEGIN PGP SIGNED MESSAGE-----\nHash: SHA256\n\nbody\n")
                          .has_value());
        REQUIRE_FALSE(ClearSignedMessage::parse(test_helpers::signed_message("-----unescaped")).has_value());

        std::string unterminated = test_helpers::signed_message("body");
        unterminated.erase(unterminated.find("-----END PGP SIGNATURE-----"));
        REQUIRE_FALSE(ClearSignedMessage::parse(unterminated).has_value());
    }

    SECTION("rejects data after the signature") {
        std::string text = test_helpers::signed_message("body") + "trailing garbage\n";
        REQUIRE_FALSE(ClearSignedMessage::parse(text).has_value());
        REQUIRE(ClearSignedMessage::parse(test_helpers::signed_message("body") + "\n\n").has_value());
    }
}

TEST_CASE("Reading the signed modulus", "[clearsign][modulus]") {
    test_helpers::FakeOpenPGP pgp;
    Bytes modulus = test_helpers::safe_prime_le();

    SECTION("verified modulus is decoded") {
        Bytes read = read_signed_modulus(test_helpers::signed_modulus(modulus), pgp);
        REQUIRE(read == modulus);
        REQUIRE(pgp.verify_calls == 1);
        REQUIRE(pgp.last_signed_text == Utils::base64_encode(modulus));
    }

    SECTION("bad signature") {
        pgp.signatures_valid = false;
        REQUIRE(errc_of([&] { read_signed_modulus(test_helpers::signed_modulus(modulus), pgp); }) ==
                AuthErrc::InvalidModulus);
    }

    SECTION("not clear-signed at all") {
        REQUIRE(errc_of([&] { read_signed_modulus(Utils::base64_encode(modulus), pgp); }) ==
                AuthErrc::InvalidModulus);
        REQUIRE(pgp.verify_calls == 0);
    }

    SECTION("body is not base64") {
        REQUIRE(errc_of([&] { read_signed_modulus(test_helpers::signed_message("not*base64!"), pgp); }) ==
                AuthErrc::InvalidModulus);
    }
}
