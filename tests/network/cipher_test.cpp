#include <cstdint>
#include <vector>
#include <catch2/catch.hpp>
#include "network/cipher.hpp"

TEST_CASE("cfb8 decrypts what it encrypted in stream order", "[network][cipher]")
{
    std::vector<uint8_t> secret = random_bytes(SHARED_SECRET_LENGTH);
    StreamCipher encryptor(secret.data(), CIPHER_ENCRYPT);
    StreamCipher decryptor(secret.data(), CIPHER_DECRYPT);

    std::vector<uint8_t> plain(1000);
    for (size_t i = 0; i < plain.size(); ++i)
    {
        plain[i] = static_cast<uint8_t>(i);
    }

    std::vector<uint8_t> data = plain;
    // split the stream unevenly on both sides
    encryptor.update(data.data(), 7);
    encryptor.update(data.data() + 7, 500);
    encryptor.update(data.data() + 507, data.size() - 507);

    REQUIRE(data != plain);

    decryptor.update(data.data(), 300);
    decryptor.update(data.data() + 300, 0);
    decryptor.update(data.data() + 300, data.size() - 300);

    REQUIRE(data == plain);
}

TEST_CASE("cfb8 state carries from one call to the next", "[network][cipher]")
{
    std::vector<uint8_t> secret(SHARED_SECRET_LENGTH, 0x11);
    StreamCipher first(secret.data(), CIPHER_ENCRYPT);
    StreamCipher second(secret.data(), CIPHER_ENCRYPT);

    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};

    first.update(a.data(), a.size());
    // the same bytes again continue from the first call's state
    first.update(b.data(), b.size());

    std::vector<uint8_t> c = {1, 2, 3, 4};
    second.update(c.data(), c.size());

    REQUIRE(a == c);
    REQUIRE(b != c);
}

TEST_CASE("the key pair decrypts what its public key encrypted", "[network][cipher]")
{
    KeyPair keys;
    std::vector<uint8_t> secret = random_bytes(SHARED_SECRET_LENGTH);
    std::vector<uint8_t> out;

    REQUIRE_FALSE(keys.public_der().empty());
    // DER SEQUENCE
    REQUIRE(keys.public_der()[0] == 0x30);

    std::vector<uint8_t> ciphertext = keys.encrypt(secret);
    REQUIRE(ciphertext.size() == RSA_KEY_BITS / 8);
    REQUIRE(keys.decrypt(ciphertext, out));
    REQUIRE(out == secret);
}

TEST_CASE("garbage does not decrypt", "[network][cipher]")
{
    KeyPair keys;
    std::vector<uint8_t> out;

    // longer than the modulus
    REQUIRE_FALSE(keys.decrypt(std::vector<uint8_t>(RSA_KEY_BITS / 8 + 1, 0xFF), out));
}

TEST_CASE("random bytes have the requested size", "[network][cipher]")
{
    REQUIRE(random_bytes(VERIFY_TOKEN_LENGTH).size() == VERIFY_TOKEN_LENGTH);
    REQUIRE(random_bytes(0).empty());
    REQUIRE(random_bytes(32) != random_bytes(32));
}
