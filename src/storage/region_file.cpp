#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "storage/region_file.hpp"
#include "exceptions.hpp"
#include "loggerimpl.hpp"
#include "world/chunk_codec.hpp"

static uint32_t get_be32(const uint8_t* in)
{
    return static_cast<uint32_t>(in[0]) << 24 |
           static_cast<uint32_t>(in[1]) << 16 |
           static_cast<uint32_t>(in[2]) << 8 |
           static_cast<uint32_t>(in[3]);
}

bool parse_region_name(const std::string& path, int32_t& rx, int32_t& rz)
{
    size_t slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    int x, z;
    int consumed = 0;

    if (sscanf(name.c_str(), "r.%d.%d.mca%n", &x, &z, &consumed) != 2 || static_cast<size_t>(consumed) != name.size())
    {
        return false;
    }

    rx = x;
    rz = z;
    return true;
}

static std::vector<uint8_t> read_file(const std::string& path)
{
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);

    if (fd == -1)
    {
        throw StoreException("open " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd, &st) == -1)
    {
        std::string message = "stat " + path + ": " + strerror(errno);
        close(fd);
        throw StoreException(message);
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(st.st_size));
    size_t done = 0;

    while (done < bytes.size())
    {
        ssize_t res = read(fd, bytes.data() + done, bytes.size() - done);

        if (res == -1 && errno == EINTR)
        {
            continue;
        }
        if (res <= 0)
        {
            std::string message = "read " + path + ": " + (res == 0 ? "unexpected end of file" : strerror(errno));
            close(fd);
            throw StoreException(message);
        }
        done += res;
    }

    close(fd);
    return bytes;
}

/**
 * Validates and decodes entry i of the region.
 * @return An empty string with out filled in, or the reason the entry was rejected.
 */
static std::string read_entry(const std::vector<uint8_t>& file, int i, int32_t cx, int32_t cz, Tag& out)
{
    uint32_t location = get_be32(file.data() + i * 4);
    size_t offset = location >> 8;
    size_t sectors = location & 0xFF;

    if (offset < 2)
    {
        return "sector offset " + std::to_string(offset) + " points into the header";
    }
    // the last sector of a file may be cut short, so only the length field has to fit here
    if (offset * REGION_SECTOR_SIZE + 4 > file.size())
    {
        return "sector offset " + std::to_string(offset) + " is past the end of the file";
    }

    const uint8_t* start = file.data() + offset * REGION_SECTOR_SIZE;
    size_t length = get_be32(start);

    if (length == 0)
    {
        return "chunk length is zero";
    }
    if (offset * REGION_SECTOR_SIZE + 4 + length > file.size())
    {
        return "chunk length " + std::to_string(length) + " exceeds the file size";
    }
    if (length + 4 > sectors * REGION_SECTOR_SIZE)
    {
        return "chunk length " + std::to_string(length) + " exceeds its " + std::to_string(sectors) + " sectors";
    }

    uint8_t tag = start[4];
    CompressionScheme scheme;

    if (tag & REGION_EXTERNAL_FLAG)
    {
        return "chunk is stored in an external file";
    }
    if (tag == REGION_SCHEME_LZ4)
    {
        return "lz4 compressed chunks are not supported";
    }
    if (tag == REGION_SCHEME_EXTERNAL)
    {
        return "custom compressed chunks are not supported";
    }
    if (!scheme_from_tag(tag, scheme) || !scheme_available(scheme))
    {
        return "unknown compression scheme " + std::to_string(tag);
    }

    try
    {
        out = decode_chunk(StoredChunk{scheme, std::vector<uint8_t>(start + 5, start + 4 + length)});
    } catch (const DecodeException& e)
    {
        return e.what();
    }

    if (out.type() != TAG_COMPOUND)
    {
        return "chunk root is not a compound";
    }

    const Tag* x = out.as_compound().get("xPos");
    const Tag* z = out.as_compound().get("zPos");
    if (x && z && x->type() == TAG_INT && z->type() == TAG_INT && (x->as_int() != cx || z->as_int() != cz))
    {
        return "chunk claims position [" + std::to_string(x->as_int()) + ", " + std::to_string(z->as_int()) +
               "] but sits at [" + std::to_string(cx) + ", " + std::to_string(cz) + "]";
    }
    return "";
}

ImportReport import_region_file(ChunkStore& store, const std::string& path, const std::string& dimension)
{
    ImportReport report;
    int32_t rx, rz;

    if (!parse_region_name(path, rx, rz))
    {
        report.warnings.push_back({-1, "file name is not r.<x>.<z>.mca"});
        logger().warn("Import %s: %s", path.c_str(), report.warnings.back().reason.c_str());
        return report;
    }

    std::vector<uint8_t> file = read_file(path);

    if (file.size() < REGION_HEADER_SIZE)
    {
        report.warnings.push_back({-1, "file is shorter than the region header"});
        logger().warn("Import %s: %s", path.c_str(), report.warnings.back().reason.c_str());
        return report;
    }

    std::vector<std::pair<ChunkPosition, StoredChunk>> batch;

    for (int i = 0; i < REGION_CHUNKS; ++i)
    {
        uint32_t location = get_be32(file.data() + i * 4);

        // absent chunk
        if ((location >> 8) == 0 || (location & 0xFF) == 0)
        {
            continue;
        }

        int32_t cx = rx * 32 + (i & 31);
        int32_t cz = rz * 32 + (i >> 5);
        Tag root;
        std::string reason = read_entry(file, i, cx, cz, root);

        if (!reason.empty())
        {
            logger().warn("Import %s: chunk %i [%i, %i]: %s", path.c_str(), i, cx, cz, reason.c_str());
            report.warnings.push_back({i, std::move(reason)});
            continue;
        }

        batch.emplace_back(ChunkPosition{dimension, cx, cz}, encode_chunk(root, store.scheme()));
    }

    store.put_batch(batch);
    report.imported = batch.size();

    logger().info("Imported %zu chunks from %s (%zu warnings)", report.imported, path.c_str(), report.warnings.size());
    return report;
}

ImportReport import_region_directory(ChunkStore& store, const std::string& dir, const std::string& dimension)
{
    ImportReport total;
    DIR* handle = opendir(dir.c_str());

    if (!handle)
    {
        throw StoreException("open " + dir + ": " + strerror(errno));
    }

    std::vector<std::string> files;
    dirent* entry;
    while ((entry = readdir(handle)))
    {
        std::string name = entry->d_name;

        if (name.size() > 4 && name.compare(name.size() - 4, 4, ".mca") == 0)
        {
            files.push_back(dir + "/" + name);
        }
    }
    closedir(handle);

    std::sort(files.begin(), files.end());

    for (const auto& file : files)
    {
        ImportReport report = import_region_file(store, file, dimension);

        total.imported += report.imported;
        total.warnings.insert(total.warnings.end(), report.warnings.begin(), report.warnings.end());
    }
    return total;
}
