#include <cstdint>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include "compression/compression.hpp"
#include "exceptions.hpp"

static std::vector<uint8_t> sample_bytes(size_t size)
{
    std::vector<uint8_t> bytes(size);

    for (size_t i = 0; i < size; ++i)
    {
        bytes[i] = static_cast<uint8_t>((i * 31) % 17);
    }
    return bytes;
}

TEST_CASE("every available scheme round trips", "[compression]")
{
    std::vector<uint8_t> bytes = sample_bytes(100000);

    for (CompressionScheme scheme : {COMPRESSION_NONE, COMPRESSION_DEFLATE, COMPRESSION_GZIP, COMPRESSION_ZSTD})
    {
        if (!scheme_available(scheme))
        {
            continue;
        }

        INFO("scheme " << scheme_name(scheme));
        std::vector<uint8_t> packed = compress(scheme, bytes);
        REQUIRE(decompress(scheme, packed, bytes.size(), bytes.size()) == bytes);
        REQUIRE(decompress(scheme, packed, std::nullopt, bytes.size()) == bytes);
    }
}

TEST_CASE("empty input round trips", "[compression]")
{
    std::vector<uint8_t> empty;

    REQUIRE(decompress(COMPRESSION_DEFLATE, compress(COMPRESSION_DEFLATE, empty), 0, 16).empty());
    REQUIRE(decompress(COMPRESSION_GZIP, compress(COMPRESSION_GZIP, empty), std::nullopt, 16).empty());
}

TEST_CASE("deflate is the zlib container and gzip carries its magic", "[compression]")
{
    std::vector<uint8_t> bytes = sample_bytes(64);

    std::vector<uint8_t> zlib = compress(COMPRESSION_DEFLATE, bytes);
    REQUIRE(zlib[0] == 0x78);

    std::vector<uint8_t> gzip = compress(COMPRESSION_GZIP, bytes);
    REQUIRE(gzip[0] == 0x1F);
    REQUIRE(gzip[1] == 0x8B);
}

TEST_CASE("a length other than the declared one is a mismatch", "[compression]")
{
    std::vector<uint8_t> bytes = sample_bytes(1000);
    std::vector<uint8_t> packed = compress(COMPRESSION_DEFLATE, bytes);

    REQUIRE_THROWS_AS(decompress(COMPRESSION_DEFLATE, packed, 999, 4096), CompressionMismatchException);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_DEFLATE, packed, 1001, 4096), CompressionMismatchException);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_NONE, bytes, 10, 4096), CompressionMismatchException);
}

TEST_CASE("output beyond the maximum is refused", "[compression]")
{
    // a megabyte of zeros compresses to about a kilobyte
    std::vector<uint8_t> zeros(1024 * 1024, 0);
    std::vector<uint8_t> packed = compress(COMPRESSION_DEFLATE, zeros);

    REQUIRE(packed.size() < 16 * 1024);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_DEFLATE, packed, std::nullopt, 64 * 1024), LengthOverflowException);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_NONE, zeros, std::nullopt, 1024), LengthOverflowException);
}

TEST_CASE("malformed streams are corrupt", "[compression]")
{
    std::vector<uint8_t> garbage = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x11};
    REQUIRE_THROWS_AS(decompress(COMPRESSION_DEFLATE, garbage, std::nullopt, 4096), CorruptStreamException);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_GZIP, garbage, std::nullopt, 4096), CorruptStreamException);

    std::vector<uint8_t> packed = compress(COMPRESSION_DEFLATE, sample_bytes(5000));

    std::vector<uint8_t> cut(packed.begin(), packed.begin() + static_cast<std::ptrdiff_t>(packed.size() / 2));
    REQUIRE_THROWS_AS(decompress(COMPRESSION_DEFLATE, cut, std::nullopt, 1 << 20), CorruptStreamException);

    std::vector<uint8_t> trailing = packed;
    trailing.push_back(0x42);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_DEFLATE, trailing, std::nullopt, 1 << 20), CorruptStreamException);
}

TEST_CASE("schemes parse from their names and tags", "[compression]")
{
    CompressionScheme scheme;

    REQUIRE(parse_scheme("deflate", scheme));
    REQUIRE(scheme == COMPRESSION_DEFLATE);
    REQUIRE(parse_scheme("none", scheme));
    REQUIRE(scheme == COMPRESSION_NONE);
    REQUIRE(parse_scheme("zstd", scheme));
    REQUIRE(scheme == COMPRESSION_ZSTD);
    REQUIRE_FALSE(parse_scheme("lz4", scheme));

    REQUIRE(scheme_from_tag(1, scheme));
    REQUIRE(scheme == COMPRESSION_GZIP);
    REQUIRE_FALSE(scheme_from_tag(REGION_SCHEME_LZ4, scheme));
    REQUIRE_FALSE(scheme_from_tag(0, scheme));

    REQUIRE(scheme_available(COMPRESSION_DEFLATE));
    REQUIRE(scheme_available(COMPRESSION_GZIP));
    REQUIRE(scheme_available(COMPRESSION_NONE));
}

#ifdef BASALT_HAVE_ZSTD
TEST_CASE("zstd refuses trailing bytes", "[compression][zstd]")
{
    std::vector<uint8_t> packed = compress(COMPRESSION_ZSTD, sample_bytes(5000));

    packed.push_back(0x00);
    REQUIRE_THROWS_AS(decompress(COMPRESSION_ZSTD, packed, std::nullopt, 1 << 20), CorruptStreamException);
}
#else
TEST_CASE("zstd is unavailable without libzstd", "[compression][zstd]")
{
    REQUIRE_FALSE(scheme_available(COMPRESSION_ZSTD));
    REQUIRE_THROWS_AS(compress(COMPRESSION_ZSTD, sample_bytes(16)), BasaltException);
}
#endif
