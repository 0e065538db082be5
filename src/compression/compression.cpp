#include <algorithm>
#include <memory>
#include <zlib.h>
#ifdef BASALT_HAVE_ZSTD
#include <zstd.h>
#endif
#include "compression/compression.hpp"
#include "exceptions.hpp"

#define ZLIB_WINDOW_BITS (15)
#define GZIP_WINDOW_BITS (15 + 16)
#define INFLATE_CHUNK (16384)

const char* scheme_name(CompressionScheme scheme)
{
    switch (scheme)
    {
        case COMPRESSION_GZIP:
            return "gzip";
        case COMPRESSION_DEFLATE:
            return "deflate";
        case COMPRESSION_NONE:
            return "none";
        case COMPRESSION_ZSTD:
            return "zstd";
    }
    return "unknown";
}

bool scheme_from_tag(uint8_t tag, CompressionScheme& out)
{
    switch (tag)
    {
        case COMPRESSION_GZIP:
        case COMPRESSION_DEFLATE:
        case COMPRESSION_NONE:
        case COMPRESSION_ZSTD:
            out = static_cast<CompressionScheme>(tag);
            return true;
        default:
            return false;
    }
}

bool parse_scheme(const std::string& name, CompressionScheme& out)
{
    for (CompressionScheme scheme : {COMPRESSION_GZIP, COMPRESSION_DEFLATE, COMPRESSION_NONE, COMPRESSION_ZSTD})
    {
        if (name == scheme_name(scheme))
        {
            out = scheme;
            return true;
        }
    }
    return false;
}

bool scheme_available([[maybe_unused]] CompressionScheme scheme)
{
#ifdef BASALT_HAVE_ZSTD
    return true;
#else
    return scheme != COMPRESSION_ZSTD;
#endif
}

static std::vector<uint8_t> zlib_compress(const uint8_t* data, size_t size, int window_bits)
{
    z_stream stream{};

    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    {
        throw BasaltException("deflateInit2 failed");
    }

    std::vector<uint8_t> out(deflateBound(&stream, size));
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&stream, Z_FINISH);
    size_t produced = stream.total_out;
    deflateEnd(&stream);

    if (ret != Z_STREAM_END)
    {
        throw BasaltException("deflate failed with " + std::to_string(ret));
    }
    out.resize(produced);
    return out;
}

/**
 * Owns an inflate stream for the duration of one decompression.
 */
struct InflateStream
{
    z_stream stream{};

    explicit InflateStream(int window_bits)
    {
        if (inflateInit2(&stream, window_bits) != Z_OK)
        {
            throw BasaltException("inflateInit2 failed");
        }
    }

    ~InflateStream()
    {
        inflateEnd(&stream);
    }
};

static std::vector<uint8_t> zlib_decompress(const uint8_t* data, size_t size, int window_bits,
                                            std::optional<size_t> expected_size, size_t max_size)
{
    InflateStream inflater(window_bits);
    z_stream& stream = inflater.stream;
    std::vector<uint8_t> out;
    uint8_t chunk[INFLATE_CHUNK];
    int ret;

    if (expected_size)
    {
        out.reserve(std::min(*expected_size, max_size));
    }

    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);

    do
    {
        stream.next_out = chunk;
        stream.avail_out = sizeof(chunk);
        ret = inflate(&stream, Z_NO_FLUSH);

        switch (ret)
        {
            case Z_OK:
            case Z_STREAM_END:
                break;
            case Z_BUF_ERROR:
                throw CorruptStreamException("compressed stream ends early");
            default:
                throw CorruptStreamException(std::string("inflate failed: ") + (stream.msg ? stream.msg : "unknown error"));
        }

        size_t produced = sizeof(chunk) - stream.avail_out;
        if (out.size() + produced > max_size)
        {
            throw LengthOverflowException("decompressed size exceeds " + std::to_string(max_size));
        }
        out.insert(out.end(), chunk, chunk + produced);
    } while (ret != Z_STREAM_END);

    if (stream.avail_in)
    {
        throw CorruptStreamException(std::to_string(stream.avail_in) + " bytes after the end of the compressed stream");
    }
    return out;
}

#ifdef BASALT_HAVE_ZSTD
static std::vector<uint8_t> zstd_compress(const uint8_t* data, size_t size)
{
    std::vector<uint8_t> out(ZSTD_compressBound(size));
    size_t produced = ZSTD_compress(out.data(), out.size(), data, size, ZSTD_CLEVEL_DEFAULT);

    if (ZSTD_isError(produced))
    {
        throw BasaltException(std::string("zstd compression failed: ") + ZSTD_getErrorName(produced));
    }
    out.resize(produced);
    return out;
}

static std::vector<uint8_t> zstd_decompress(const uint8_t* data, size_t size, size_t max_size)
{
    std::unique_ptr<ZSTD_DCtx, size_t (*)(ZSTD_DCtx*)> context(ZSTD_createDCtx(), ZSTD_freeDCtx);
    ZSTD_inBuffer input{data, size, 0};
    std::vector<uint8_t> out;
    uint8_t chunk[INFLATE_CHUNK];

    if (!context)
    {
        throw BasaltException("ZSTD_createDCtx failed");
    }

    while (true)
    {
        ZSTD_outBuffer output{chunk, sizeof(chunk), 0};
        size_t ret = ZSTD_decompressStream(context.get(), &output, &input);

        if (ZSTD_isError(ret))
        {
            throw CorruptStreamException(std::string("zstd: ") + ZSTD_getErrorName(ret));
        }
        if (out.size() + output.pos > max_size)
        {
            throw LengthOverflowException("decompressed size exceeds " + std::to_string(max_size));
        }
        out.insert(out.end(), chunk, chunk + output.pos);

        if (ret == 0)
        {
            break;
        }
        if (input.pos == input.size && output.pos < output.size)
        {
            throw CorruptStreamException("compressed stream ends early");
        }
    }

    if (input.pos != input.size)
    {
        throw CorruptStreamException(std::to_string(input.size - input.pos) + " bytes after the end of the compressed stream");
    }
    return out;
}
#endif

std::vector<uint8_t> compress(CompressionScheme scheme, const uint8_t* data, size_t size)
{
    switch (scheme)
    {
        case COMPRESSION_GZIP:
            return zlib_compress(data, size, GZIP_WINDOW_BITS);
        case COMPRESSION_DEFLATE:
            return zlib_compress(data, size, ZLIB_WINDOW_BITS);
        case COMPRESSION_NONE:
            return {data, data + size};
        case COMPRESSION_ZSTD:
#ifdef BASALT_HAVE_ZSTD
            return zstd_compress(data, size);
#else
            break;
#endif
    }
    throw BasaltException(std::string("compression scheme ") + scheme_name(scheme) + " is not available");
}

std::vector<uint8_t> decompress(CompressionScheme scheme, const uint8_t* data, size_t size,
                                std::optional<size_t> expected_size, size_t max_size)
{
    std::vector<uint8_t> out;

    switch (scheme)
    {
        case COMPRESSION_GZIP:
            out = zlib_decompress(data, size, GZIP_WINDOW_BITS, expected_size, max_size);
            break;
        case COMPRESSION_DEFLATE:
            out = zlib_decompress(data, size, ZLIB_WINDOW_BITS, expected_size, max_size);
            break;
        case COMPRESSION_NONE:
            if (size > max_size)
            {
                throw LengthOverflowException("decompressed size exceeds " + std::to_string(max_size));
            }
            out.assign(data, data + size);
            break;
        case COMPRESSION_ZSTD:
#ifdef BASALT_HAVE_ZSTD
            out = zstd_decompress(data, size, max_size);
            break;
#else
            throw BasaltException("compression scheme zstd is not available");
#endif
        default:
            throw CorruptStreamException("unknown compression scheme " + std::to_string(scheme));
    }

    if (expected_size && out.size() != *expected_size)
    {
        throw CompressionMismatchException("stream decompressed to " + std::to_string(out.size()) +
                                           " bytes but " + std::to_string(*expected_size) + " were declared");
    }
    return out;
}
