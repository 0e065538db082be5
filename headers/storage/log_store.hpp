#ifndef BASALT_LOG_STORE_HPP
#define BASALT_LOG_STORE_HPP


#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#define LOG_STORE_MAGIC "BSLT"
#define LOG_STORE_VERSION (1)
/**
 * Marks the start of every record.
 */
#define RECORD_MAGIC (0xB5A17C0Du)
#define RECORD_HEADER_SIZE (12)
#define FILE_HEADER_SIZE (8)

using Bytes = std::vector<uint8_t>;

/**
 * Puts applied by LogStore::write as one record, so either all of them survive a crash or none do.
 */
class WriteBatch
{
public:
    void put(Bytes key, Bytes value);

    [[nodiscard]] inline size_t size() const { return puts.size(); }

    [[nodiscard]] inline bool empty() const { return puts.empty(); }

    [[nodiscard]] inline const std::vector<std::pair<Bytes, Bytes>>& entries() const { return puts; }

    void clear();
private:
    std::vector<std::pair<Bytes, Bytes>> puts;
};

struct LogStoreOptions
{
    /**
     * fdatasync after every committed record.
     */
    bool sync = false;
};

struct RecoveryInfo
{
    uint64_t records = 0;
    uint64_t truncated_bytes = 0;
};

/**
 * Embedded ordered key-value store: an append-only file of CRC protected records and an
 * in-memory ordered index of where each key's latest value lives. Readers run concurrently
 * (pread under a shared lock); writers are serialized.
 *
 * File layout:
 *   "BSLT" u32 version
 *   record*: u32 magic, u32 payload length, u32 crc32(payload), payload
 *   payload: varint count, (varint key length, key, varint value length, value) * count
 *
 * All integers are big-endian. A record that is cut short or fails its CRC ends the log; it
 * and anything after it is truncated when the store is opened.
 */
class LogStore
{
public:
    /**
     * Opens the store at path, creating it if it does not exist, and replays its records.
     * @throws StoreException if the file cannot be opened, read or is not a store
     */
    explicit LogStore(std::string path, LogStoreOptions options = {});

    ~LogStore();

    LogStore(const LogStore&) = delete;

    LogStore& operator=(const LogStore&) = delete;

    /**
     * @throws StoreException on a read error
     */
    [[nodiscard]] std::optional<Bytes> get(const Bytes& key) const;

    [[nodiscard]] bool contains(const Bytes& key) const;

    /**
     * @throws StoreException if the record cannot be written (nothing is applied)
     */
    void put(Bytes key, Bytes value);

    /**
     * @return false, writing nothing, if the key already has a value.
     */
    bool put_if_absent(Bytes key, Bytes value);

    void write(const WriteBatch& batch);

    /**
     * Visits keys in [begin, end) in order. The visitor returns false to stop early and must not
     * write to this store.
     */
    void scan(const Bytes& begin, const Bytes& end,
              const std::function<bool(const Bytes& key, const Bytes& value)>& visitor) const;

    /**
     * Rewrites the live value of every key into a new file and atomically replaces the old one.
     */
    void compact();

    /**
     * @return Number of live keys.
     */
    [[nodiscard]] size_t size() const;

    [[nodiscard]] uint64_t file_size() const;

    [[nodiscard]] inline const std::string& path() const { return file_path; }

    [[nodiscard]] inline const RecoveryInfo& recovery() const { return recovered; }
private:
    struct ValueRef
    {
        uint64_t offset;
        uint32_t length;
    };

    using Index = std::map<Bytes, ValueRef>;

    void replay();

    /**
     * Appends one record holding the puts to fd at end, updating index.
     */
    static void append(int fd, uint64_t& end, Index& index, const std::vector<std::pair<Bytes, Bytes>>& puts,
                       bool sync, const std::string& path);

    Bytes read_value(const ValueRef& ref) const;

    std::string file_path;
    LogStoreOptions options;
    int fd;
    uint64_t end_offset;
    Index index;
    RecoveryInfo recovered;
    mutable std::shared_mutex mutex;
};


#endif //BASALT_LOG_STORE_HPP
