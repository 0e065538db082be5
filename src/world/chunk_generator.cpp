#include "world/chunk_generator.hpp"

/**
 * Palette index bits per block in the bottom section.
 */
#define FLAT_BITS_PER_BLOCK (4)
#define BLOCKS_PER_LAYER (256)

static TagCompound block_state(const char* name)
{
    TagCompound state;
    state.put("Name", Tag::of_string(name));
    return state;
}

static Tag single_palette(const char* name)
{
    TagList palette(TAG_COMPOUND);
    palette.push(Tag::of_compound(block_state(name)));

    TagCompound container;
    container.put("palette", Tag::of_list(std::move(palette)));
    return Tag::of_compound(std::move(container));
}

/**
 * Palette is bedrock, dirt, grass, air. Layer 0 is bedrock, layers 1 and 2 dirt, layer 3 grass.
 */
static Tag layered_block_states()
{
    static const int64_t layer_fill[] = {0, 0x1111111111111111LL, 0x1111111111111111LL, 0x2222222222222222LL};

    TagList palette(TAG_COMPOUND);
    palette.push(Tag::of_compound(block_state("minecraft:bedrock")));
    palette.push(Tag::of_compound(block_state("minecraft:dirt")));
    palette.push(Tag::of_compound(block_state("minecraft:grass_block")));
    palette.push(Tag::of_compound(block_state("minecraft:air")));

    // 16 entries of 4 bits per long, so one layer of 256 blocks fills 16 longs
    const int longs_per_layer = BLOCKS_PER_LAYER * FLAT_BITS_PER_BLOCK / 64;
    std::vector<int64_t> data(SECTION_BLOCKS * FLAT_BITS_PER_BLOCK / 64, 0x3333333333333333LL);

    for (int layer = 0; layer < 4; ++layer)
    {
        for (int i = 0; i < longs_per_layer; ++i)
        {
            data[layer * longs_per_layer + i] = layer_fill[layer];
        }
    }

    TagCompound container;
    container.put("palette", Tag::of_list(std::move(palette)));
    container.put("data", Tag::of_long_array(std::move(data)));
    return Tag::of_compound(std::move(container));
}

Tag FlatChunkGenerator::generate(const ChunkPosition& pos)
{
    TagList sections(TAG_COMPOUND);

    for (int i = 0; i < CHUNK_SECTION_COUNT; ++i)
    {
        TagCompound section;
        section.put("Y", Tag::of_byte(static_cast<int8_t>(CHUNK_MIN_SECTION + i)));
        section.put("block_states", i == 0 ? layered_block_states() : single_palette("minecraft:air"));

        TagList biomes(TAG_STRING);
        biomes.push(Tag::of_string("minecraft:plains"));
        TagCompound biome_container;
        biome_container.put("palette", Tag::of_list(std::move(biomes)));
        section.put("biomes", Tag::of_compound(std::move(biome_container)));

        sections.push(Tag::of_compound(std::move(section)));
    }

    TagCompound root;
    root.put("DataVersion", Tag::of_int(CHUNK_DATA_VERSION));
    root.put("xPos", Tag::of_int(pos.x));
    root.put("zPos", Tag::of_int(pos.z));
    root.put("yPos", Tag::of_int(CHUNK_MIN_SECTION));
    root.put("Status", Tag::of_string("minecraft:full"));
    root.put("sections", Tag::of_list(std::move(sections)));
    return Tag::of_compound(std::move(root));
}
