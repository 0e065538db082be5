#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include "network/cipher.hpp"
#include "exceptions.hpp"

KeyPair::KeyPair() : key(nullptr)
{
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);

    if (!ctx)
    {
        throw BasaltException("EVP_PKEY_CTX_new_id failed");
    }

    if (EVP_PKEY_keygen_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, RSA_KEY_BITS) <= 0 ||
        EVP_PKEY_keygen(ctx, &key) <= 0)
    {
        EVP_PKEY_CTX_free(ctx);
        throw BasaltException("Public encryption key generation failed");
    }
    EVP_PKEY_CTX_free(ctx);

    // Convert public key to DER format
    unsigned char* der_buf = nullptr;
    int der_len = i2d_PUBKEY(key, &der_buf);

    if (der_len <= 0)
    {
        EVP_PKEY_free(key);
        throw BasaltException("ASN.1 DER public encryption key conversion failed");
    }

    der.assign(der_buf, der_buf + der_len);
    OPENSSL_free(der_buf);
}

KeyPair::~KeyPair()
{
    EVP_PKEY_free(key);
}

bool KeyPair::decrypt(const std::vector<uint8_t>& ciphertext, std::vector<uint8_t>& out) const
{
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key, nullptr);
    size_t out_len = 0;
    bool ok = false;

    if (ctx &&
        EVP_PKEY_decrypt_init(ctx) > 0 &&
        EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) > 0 &&
        EVP_PKEY_decrypt(ctx, nullptr, &out_len, ciphertext.data(), ciphertext.size()) > 0)
    {
        out.resize(out_len);
        if (EVP_PKEY_decrypt(ctx, out.data(), &out_len, ciphertext.data(), ciphertext.size()) > 0)
        {
            out.resize(out_len);
            ok = true;
        }
    }

    EVP_PKEY_CTX_free(ctx);
    return ok;
}

std::vector<uint8_t> KeyPair::encrypt(const std::vector<uint8_t>& plaintext) const
{
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key, nullptr);
    std::vector<uint8_t> out;
    size_t out_len = 0;

    if (!ctx ||
        EVP_PKEY_encrypt_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) <= 0 ||
        EVP_PKEY_encrypt(ctx, nullptr, &out_len, plaintext.data(), plaintext.size()) <= 0)
    {
        EVP_PKEY_CTX_free(ctx);
        throw BasaltException("RSA encryption setup failed");
    }

    out.resize(out_len);
    if (EVP_PKEY_encrypt(ctx, out.data(), &out_len, plaintext.data(), plaintext.size()) <= 0)
    {
        EVP_PKEY_CTX_free(ctx);
        throw BasaltException("RSA encryption failed");
    }
    EVP_PKEY_CTX_free(ctx);

    out.resize(out_len);
    return out;
}

StreamCipher::StreamCipher(const uint8_t* secret, CipherDirection direction) : ctx(EVP_CIPHER_CTX_new())
{
    if (!ctx)
    {
        throw BasaltException("EVP_CIPHER_CTX_new failed");
    }

    // the shared secret is both the key and the initial vector
    if (EVP_CipherInit_ex(ctx, EVP_aes_128_cfb8(), nullptr, secret, secret, direction == CIPHER_ENCRYPT ? 1 : 0) != 1)
    {
        EVP_CIPHER_CTX_free(ctx);
        throw BasaltException("AES-128-CFB8 initialisation failed");
    }
}

StreamCipher::~StreamCipher()
{
    EVP_CIPHER_CTX_free(ctx);
}

void StreamCipher::update(uint8_t* data, size_t size)
{
    int out_len = 0;

    // CFB8 is a stream mode, so the output is always the same size and can overwrite the input
    if (size && EVP_CipherUpdate(ctx, data, &out_len, data, static_cast<int>(size)) != 1)
    {
        throw BasaltException("AES-128-CFB8 update failed");
    }
}

std::vector<uint8_t> random_bytes(size_t size)
{
    std::vector<uint8_t> bytes(size);

    if (RAND_bytes(bytes.data(), static_cast<int>(size)) != 1)
    {
        throw BasaltException("RAND_bytes failed");
    }
    return bytes;
}
