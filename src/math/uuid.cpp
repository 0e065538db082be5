#include <cstdio>
#include <openssl/evp.h>
#include "math/uuid.hpp"
#include "exceptions.hpp"

UUID::UUID() : most(0), least(0)
{}

UUID::UUID(uint64_t most, uint64_t least) : most(most), least(least)
{}

UUID UUID::offline(const std::string& username)
{
    std::string name = "OfflinePlayer:" + username;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!EVP_Digest(name.data(), name.size(), digest, &digest_len, EVP_md5(), nullptr))
    {
        throw BasaltException("EVP_Digest(md5) failed");
    }

    // set the version to 3 and the variant to IETF
    digest[6] = (digest[6] & 0x0f) | 0x30;
    digest[8] = (digest[8] & 0x3f) | 0x80;

    uint64_t most = 0;
    uint64_t least = 0;

    for (int i = 0; i < 8; ++i)
    {
        most = (most << 8) | digest[i];
        least = (least << 8) | digest[i + 8];
    }

    return {most, least};
}

std::string UUID::to_string() const
{
    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
             static_cast<unsigned int>(most >> 32),
             static_cast<unsigned int>((most >> 16) & 0xffff),
             static_cast<unsigned int>(most & 0xffff),
             static_cast<unsigned int>(least >> 48),
             static_cast<unsigned long long>(least & 0xffffffffffffULL));
    return buf;
}

std::ostream& operator<<(std::ostream& os, const UUID& uuid)
{
    return os << uuid.to_string();
}
