#include <filesystem>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include "exceptions.hpp"
#include "storage/region_file.hpp"
#include "test_util.hpp"
#include "world/chunk_codec.hpp"

#define OVERWORLD "minecraft:overworld"

static Tag region_chunk(int32_t cx, int32_t cz)
{
    TagCompound root;

    root.put("DataVersion", Tag::of_int(4325));
    root.put("xPos", Tag::of_int(cx));
    root.put("zPos", Tag::of_int(cz));
    root.put("Status", Tag::of_string("minecraft:full"));
    return Tag::of_compound(std::move(root));
}

/**
 * Builds an Anvil region file in memory: an 8 KiB header of locations and timestamps, then
 * sector aligned chunks of u32 length, scheme byte and compressed data.
 */
class RegionBuilder
{
public:
    RegionBuilder() : file(REGION_HEADER_SIZE, 0)
    {}

    void add(int index, const Tag& root, CompressionScheme scheme)
    {
        add_raw(index, scheme, encode_chunk(root, scheme).data);
    }

    /**
     * @param declared_length Length field to write, 0 for the real one.
     */
    void add_raw(int index, uint8_t tag, const std::vector<uint8_t>& data, uint32_t declared_length = 0)
    {
        size_t offset = file.size() / REGION_SECTOR_SIZE;
        uint32_t length = declared_length ? declared_length : static_cast<uint32_t>(data.size() + 1);

        put_be32(length);
        file.push_back(tag);
        file.insert(file.end(), data.begin(), data.end());

        size_t used = file.size() - offset * REGION_SECTOR_SIZE;
        size_t sectors = (used + REGION_SECTOR_SIZE - 1) / REGION_SECTOR_SIZE;
        file.resize((offset + sectors) * REGION_SECTOR_SIZE, 0);

        uint32_t location = static_cast<uint32_t>(offset << 8 | sectors);
        file[index * 4] = static_cast<uint8_t>(location >> 24);
        file[index * 4 + 1] = static_cast<uint8_t>(location >> 16);
        file[index * 4 + 2] = static_cast<uint8_t>(location >> 8);
        file[index * 4 + 3] = static_cast<uint8_t>(location);
    }

    std::vector<uint8_t> file;
private:
    void put_be32(uint32_t x)
    {
        file.push_back(static_cast<uint8_t>(x >> 24));
        file.push_back(static_cast<uint8_t>(x >> 16));
        file.push_back(static_cast<uint8_t>(x >> 8));
        file.push_back(static_cast<uint8_t>(x));
    }
};

TEST_CASE("region names carry the region coordinates", "[storage][region]")
{
    int32_t rx = 0;
    int32_t rz = 0;

    REQUIRE(parse_region_name("r.0.0.mca", rx, rz));
    REQUIRE(rx == 0);
    REQUIRE(rz == 0);

    REQUIRE(parse_region_name("/srv/world/region/r.-1.12.mca", rx, rz));
    REQUIRE(rx == -1);
    REQUIRE(rz == 12);

    REQUIRE_FALSE(parse_region_name("r.1.mca", rx, rz));
    REQUIRE_FALSE(parse_region_name("r.1.2.mcr", rx, rz));
    REQUIRE_FALSE(parse_region_name("r.1.2.mca.bak", rx, rz));
    REQUIRE_FALSE(parse_region_name("level.dat", rx, rz));
}

TEST_CASE("valid region chunks are imported and broken ones reported", "[storage][region]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    RegionBuilder region;

    region.add(0, region_chunk(0, 0), COMPRESSION_DEFLATE);
    region.add(1, region_chunk(1, 0), COMPRESSION_GZIP);
    region.add(33, region_chunk(1, 1), COMPRESSION_NONE);
    // claims to be somewhere else
    region.add(4, region_chunk(7, 7), COMPRESSION_DEFLATE);
    region.add_raw(3, REGION_SCHEME_LZ4, {1, 2, 3});
    region.add_raw(5, COMPRESSION_DEFLATE, {0xDE, 0xAD, 0xBE, 0xEF});
    region.add_raw(6, COMPRESSION_DEFLATE | REGION_EXTERNAL_FLAG, {});
    // the length field runs far past the end of the file
    region.add_raw(2, COMPRESSION_DEFLATE, {0x78, 0x9C}, 1000000);

    std::string path = dir.file("r.0.0.mca");
    write_file(path, region.file);

    ImportReport report = import_region_file(store, path, OVERWORLD);

    REQUIRE(report.imported == 3);
    REQUIRE(store.count() == 3);

    std::vector<int> warned;
    for (const auto& warning : report.warnings)
    {
        INFO(warning.reason);
        REQUIRE_FALSE(warning.reason.empty());
        warned.push_back(warning.index);
    }
    REQUIRE(warned == std::vector<int>{2, 3, 4, 5, 6});

    // imported chunks are recompressed with the store's scheme and keep their tag tree
    std::optional<StoredChunk> stored = store.get(ChunkPosition{OVERWORLD, 1, 0});
    REQUIRE(stored);
    REQUIRE(stored->scheme == store.scheme());
    REQUIRE(decode_chunk(*stored) == region_chunk(1, 0));
    REQUIRE(decode_chunk(*store.get(ChunkPosition{OVERWORLD, 1, 1})) == region_chunk(1, 1));
    REQUIRE_FALSE(store.contains(ChunkPosition{OVERWORLD, 4, 0}));
}

TEST_CASE("region coordinates offset the chunk positions", "[storage][region]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    RegionBuilder region;

    // local (31, 1) of region (-1, 2)
    region.add(31 + 32, region_chunk(-1, 65), COMPRESSION_DEFLATE);

    std::string path = dir.file("r.-1.2.mca");
    write_file(path, region.file);

    ImportReport report = import_region_file(store, path, OVERWORLD);
    REQUIRE(report.imported == 1);
    REQUIRE(report.warnings.empty());
    REQUIRE(store.contains(ChunkPosition{OVERWORLD, -1, 65}));
}

TEST_CASE("whole-file problems are single warnings", "[storage][region]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));

    std::string short_file = dir.file("r.0.0.mca");
    write_file(short_file, std::vector<uint8_t>(100, 0));
    ImportReport cut = import_region_file(store, short_file, OVERWORLD);
    REQUIRE(cut.imported == 0);
    REQUIRE(cut.warnings.size() == 1);
    REQUIRE(cut.warnings[0].index == -1);

    std::string badly_named = dir.file("region.mca");
    write_file(badly_named, std::vector<uint8_t>(REGION_HEADER_SIZE, 0));
    REQUIRE(import_region_file(store, badly_named, OVERWORLD).warnings.size() == 1);

    // an empty region has nothing to import and nothing to complain about
    std::string empty = dir.file("r.5.5.mca");
    write_file(empty, std::vector<uint8_t>(REGION_HEADER_SIZE, 0));
    ImportReport nothing = import_region_file(store, empty, OVERWORLD);
    REQUIRE(nothing.imported == 0);
    REQUIRE(nothing.warnings.empty());

    REQUIRE_THROWS_AS(import_region_file(store, dir.file("r.9.9.mca"), OVERWORLD), StoreException);
    REQUIRE(store.count() == 0);
}

TEST_CASE("directories import every region file in them", "[storage][region]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    std::filesystem::create_directory(dir.file("region"));

    RegionBuilder first;
    first.add(0, region_chunk(0, 0), COMPRESSION_DEFLATE);
    first.add(1, region_chunk(1, 0), COMPRESSION_DEFLATE);
    write_file(dir.file("region/r.0.0.mca"), first.file);

    RegionBuilder second;
    second.add(31, region_chunk(-1, 0), COMPRESSION_GZIP);
    second.add_raw(0, REGION_SCHEME_LZ4, {1});
    write_file(dir.file("region/r.-1.0.mca"), second.file);

    write_file(dir.file("region/notes.txt"), {'h', 'i'});

    ImportReport report = import_region_directory(store, dir.file("region"), OVERWORLD);

    REQUIRE(report.imported == 3);
    REQUIRE(report.warnings.size() == 1);
    REQUIRE(store.count() == 3);
    REQUIRE(store.contains(ChunkPosition{OVERWORLD, -1, 0}));

    REQUIRE_THROWS_AS(import_region_directory(store, dir.file("missing"), OVERWORLD), StoreException);
}
