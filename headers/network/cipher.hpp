#ifndef BASALT_CIPHER_HPP
#define BASALT_CIPHER_HPP


#include <cstddef>
#include <cstdint>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;
typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

#define RSA_KEY_BITS (1024)
#define SHARED_SECRET_LENGTH (16)
#define VERIFY_TOKEN_LENGTH (4)

/**
 * The server's RSA key pair used for the login key exchange.
 */
class KeyPair
{
public:
    /**
     * Generates a fresh RSA_KEY_BITS key.
     * @throws BasaltException if OpenSSL cannot generate the key
     */
    KeyPair();

    ~KeyPair();

    KeyPair(const KeyPair&) = delete;

    KeyPair& operator=(const KeyPair&) = delete;

    /**
     * @return ASN.1 DER SubjectPublicKeyInfo, as sent in the encryption request.
     */
    [[nodiscard]] inline const std::vector<uint8_t>& public_der() const { return der; }

    /**
     * PKCS#1 v1.5 decryption with the private key.
     * @return false if the ciphertext does not decrypt.
     */
    bool decrypt(const std::vector<uint8_t>& ciphertext, std::vector<uint8_t>& out) const;

    /**
     * PKCS#1 v1.5 encryption with the public key, which is what a client does with public_der().
     */
    [[nodiscard]] std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) const;
private:
    EVP_PKEY* key;
    std::vector<uint8_t> der;
};

enum CipherDirection
{
    CIPHER_ENCRYPT, CIPHER_DECRYPT
};

/**
 * AES-128-CFB8 keyed and seeded with the shared secret. One instance per direction; the
 * cipher state carries across calls, so bytes must be passed through in stream order.
 */
class StreamCipher
{
public:
    StreamCipher(const uint8_t* secret, CipherDirection direction);

    ~StreamCipher();

    StreamCipher(const StreamCipher&) = delete;

    StreamCipher& operator=(const StreamCipher&) = delete;

    /**
     * Transforms size bytes in place.
     */
    void update(uint8_t* data, size_t size);
private:
    EVP_CIPHER_CTX* ctx;
};

std::vector<uint8_t> random_bytes(size_t size);


#endif //BASALT_CIPHER_HPP
