#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include "exceptions.hpp"
#include "storage/log_store.hpp"
#include "test_util.hpp"

static Bytes b(const std::string& text)
{
    return {text.begin(), text.end()};
}

static void append_to_file(const std::string& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::app);

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    REQUIRE(out.good());
}

TEST_CASE("values read back and overwrite", "[storage][log]")
{
    TempDir dir;
    LogStore store(dir.file("kv.bslt"));

    REQUIRE(store.size() == 0);
    REQUIRE(store.file_size() == FILE_HEADER_SIZE);
    REQUIRE_FALSE(store.get(b("missing")));

    store.put(b("alpha"), b("one"));
    store.put(b("beta"), b(""));
    store.put(b("alpha"), b("two"));

    REQUIRE(*store.get(b("alpha")) == b("two"));
    REQUIRE(store.get(b("beta"))->empty());
    REQUIRE(store.contains(b("beta")));
    REQUIRE(store.size() == 2);
}

TEST_CASE("put if absent leaves existing values alone", "[storage][log]")
{
    TempDir dir;
    LogStore store(dir.file("kv.bslt"));

    REQUIRE(store.put_if_absent(b("k"), b("first")));
    uint64_t size = store.file_size();

    REQUIRE_FALSE(store.put_if_absent(b("k"), b("second")));
    REQUIRE(*store.get(b("k")) == b("first"));
    REQUIRE(store.file_size() == size);
}

TEST_CASE("reopening replays every record", "[storage][log]")
{
    TempDir dir;
    std::string path = dir.file("kv.bslt");

    {
        LogStore store(path);
        store.put(b("a"), b("1"));
        store.put(b("b"), b("2"));
        store.put(b("a"), b("3"));
    }

    LogStore store(path);
    REQUIRE(store.recovery().records == 3);
    REQUIRE(store.recovery().truncated_bytes == 0);
    REQUIRE(*store.get(b("a")) == b("3"));
    REQUIRE(*store.get(b("b")) == b("2"));
}

TEST_CASE("a torn tail is truncated on open", "[storage][log][recovery]")
{
    TempDir dir;
    std::string path = dir.file("kv.bslt");
    uint64_t intact;

    {
        LogStore store(path);
        store.put(b("kept"), b("value"));
        intact = store.file_size();
        store.put(b("torn"), Bytes(100, 0x42));
    }

    SECTION("record cut short")
    {
        std::filesystem::resize_file(path, std::filesystem::file_size(path) - 10);
    }

    SECTION("checksum mismatch")
    {
        std::vector<uint8_t> bytes = read_file(path);
        bytes[bytes.size() - 1] ^= 0xFF;
        write_file(path, bytes);
    }

    SECTION("garbage header")
    {
        std::vector<uint8_t> bytes = read_file(path);
        // the record magic of the second record
        bytes[intact] ^= 0xFF;
        write_file(path, bytes);
    }

    {
        LogStore store(path);

        REQUIRE(store.recovery().records == 1);
        REQUIRE(store.recovery().truncated_bytes > 0);
        REQUIRE(store.file_size() == intact);
        REQUIRE(*store.get(b("kept")) == b("value"));
        REQUIRE_FALSE(store.get(b("torn")));

        // appends continue from the last good record
        store.put(b("after"), b("x"));
    }

    REQUIRE(std::filesystem::file_size(path) > intact);

    LogStore store(path);
    REQUIRE(store.recovery().truncated_bytes == 0);
    REQUIRE(*store.get(b("after")) == b("x"));
    REQUIRE(*store.get(b("kept")) == b("value"));
}

TEST_CASE("trailing bytes shorter than a record header are dropped", "[storage][log][recovery]")
{
    TempDir dir;
    std::string path = dir.file("kv.bslt");

    {
        LogStore store(path);
        store.put(b("k"), b("v"));
    }
    append_to_file(path, {0xAB, 0xAB, 0xAB, 0xAB, 0xAB, 0xAB, 0xAB});

    LogStore store(path);
    REQUIRE(store.recovery().truncated_bytes == 7);
    REQUIRE(*store.get(b("k")) == b("v"));
}

TEST_CASE("batches survive a crash whole or not at all", "[storage][log][recovery]")
{
    TempDir dir;
    std::string path = dir.file("kv.bslt");

    {
        LogStore store(path);
        store.put(b("before"), b("0"));

        WriteBatch batch;
        batch.put(b("x"), b("1"));
        batch.put(b("y"), b("2"));
        batch.put(b("z"), b("3"));
        REQUIRE(batch.size() == 3);
        store.write(batch);

        REQUIRE(store.size() == 4);
    }

    SECTION("intact")
    {
        LogStore store(path);
        REQUIRE(*store.get(b("x")) == b("1"));
        REQUIRE(*store.get(b("y")) == b("2"));
        REQUIRE(*store.get(b("z")) == b("3"));
    }

    SECTION("last byte lost")
    {
        std::filesystem::resize_file(path, std::filesystem::file_size(path) - 1);

        LogStore store(path);
        REQUIRE(*store.get(b("before")) == b("0"));
        REQUIRE_FALSE(store.contains(b("x")));
        REQUIRE_FALSE(store.contains(b("y")));
        REQUIRE_FALSE(store.contains(b("z")));
    }
}

TEST_CASE("empty batches write nothing", "[storage][log]")
{
    TempDir dir;
    LogStore store(dir.file("kv.bslt"));

    store.write(WriteBatch());
    REQUIRE(store.file_size() == FILE_HEADER_SIZE);
}

TEST_CASE("scans visit keys in order within their bounds", "[storage][log]")
{
    TempDir dir;
    LogStore store(dir.file("kv.bslt"));

    for (const char* key : {"d", "b", "a", "c", "e"})
    {
        store.put(b(key), b(std::string(key) + key));
    }

    std::vector<Bytes> seen;
    store.scan(b("b"), b("e"), [&](const Bytes& key, const Bytes& value) {
        REQUIRE(value.size() == 2);
        seen.push_back(key);
        return true;
    });
    REQUIRE(seen == std::vector<Bytes>{b("b"), b("c"), b("d")});

    seen.clear();
    store.scan(b(""), b("z"), [&](const Bytes& key, const Bytes&) {
        seen.push_back(key);
        return seen.size() < 2;
    });
    REQUIRE(seen == std::vector<Bytes>{b("a"), b("b")});
}

TEST_CASE("compaction keeps live values and shrinks the file", "[storage][log]")
{
    TempDir dir;
    std::string path = dir.file("kv.bslt");

    {
        LogStore store(path);

        for (int i = 0; i < 20; ++i)
        {
            store.put(b("hot"), Bytes(1000, static_cast<uint8_t>(i)));
        }
        store.put(b("cold"), b("still here"));

        uint64_t before = store.file_size();
        store.compact();

        REQUIRE(store.file_size() < before);
        REQUIRE(store.file_size() == std::filesystem::file_size(path));
        REQUIRE(*store.get(b("hot")) == Bytes(1000, 19));
        REQUIRE(*store.get(b("cold")) == b("still here"));
        REQUIRE_FALSE(std::filesystem::exists(path + ".compact"));

        // the compacted file takes appends
        store.put(b("new"), b("1"));
    }

    LogStore store(path);
    REQUIRE(store.size() == 3);
    REQUIRE(*store.get(b("hot")) == Bytes(1000, 19));
    REQUIRE(*store.get(b("new")) == b("1"));
}

TEST_CASE("files that are not stores are refused", "[storage][log]")
{
    TempDir dir;
    std::string path = dir.file("other.bin");

    write_file(path, {'N', 'O', 'T', 'A', 'S', 'T', 'O', 'R', 'E', '!'});
    REQUIRE_THROWS_AS(LogStore(path), StoreException);

    // the file is left as it was
    REQUIRE(std::filesystem::file_size(path) == 10);

    std::string versioned = dir.file("v9.bslt");
    write_file(versioned, {'B', 'S', 'L', 'T', 0, 0, 0, 9});
    REQUIRE_THROWS_AS(LogStore(versioned), StoreException);

    REQUIRE_THROWS_AS(LogStore(dir.file("no/such/dir/kv.bslt")), StoreException);
}

TEST_CASE("a header cut short starts a fresh store", "[storage][log][recovery]")
{
    TempDir dir;
    std::string path = dir.file("kv.bslt");

    write_file(path, {'B', 'S', 'L'});

    LogStore store(path);
    REQUIRE(store.size() == 0);
    REQUIRE(std::filesystem::file_size(path) == FILE_HEADER_SIZE);
}
