#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>
#include <zlib.h>
#include "storage/log_store.hpp"
#include "codec/readbuffer.hpp"
#include "codec/writebuffer.hpp"
#include "exceptions.hpp"
#include "loggerimpl.hpp"

#define COMPACT_RECORD_BYTES (4 * 1024 * 1024)

static std::string io_error(const char* what, const std::string& path)
{
    return std::string(what) + " " + path + ": " + strerror(errno);
}

static void put_be32(uint8_t* out, uint32_t x)
{
    out[0] = static_cast<uint8_t>(x >> 24);
    out[1] = static_cast<uint8_t>(x >> 16);
    out[2] = static_cast<uint8_t>(x >> 8);
    out[3] = static_cast<uint8_t>(x);
}

static uint32_t get_be32(const uint8_t* in)
{
    return static_cast<uint32_t>(in[0]) << 24 |
           static_cast<uint32_t>(in[1]) << 16 |
           static_cast<uint32_t>(in[2]) << 8 |
           static_cast<uint32_t>(in[3]);
}

static uint32_t checksum(const uint8_t* data, size_t size)
{
    return static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0), data, static_cast<uInt>(size)));
}

/**
 * writev until every iovec is on disk.
 * @return false with errno set if the kernel refused.
 */
static bool write_fully(int fd, iovec* iov, int iov_size)
{
    int iov_cursor = 0;

    while (iov_cursor < iov_size)
    {
        ssize_t res = writev(fd, iov + iov_cursor, iov_size - iov_cursor);

        if (res == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }

        // skip every iovec that was written completely
        while (iov_cursor < iov_size && static_cast<size_t>(res) >= iov[iov_cursor].iov_len)
        {
            res -= static_cast<ssize_t>(iov[iov_cursor].iov_len);
            ++iov_cursor;
        }

        if (iov_cursor < iov_size)
        {
            iov[iov_cursor].iov_len -= res;
            iov[iov_cursor].iov_base = static_cast<uint8_t*>(iov[iov_cursor].iov_base) + res;
        }
    }
    return true;
}

static bool pread_fully(int fd, uint8_t* out, size_t size, uint64_t offset)
{
    while (size)
    {
        ssize_t res = pread(fd, out, size, static_cast<off_t>(offset));

        if (res == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (res == 0)
        {
            errno = EIO;
            return false;
        }

        out += res;
        size -= res;
        offset += res;
    }
    return true;
}

static void write_file_header(int fd, const std::string& path)
{
    uint8_t header[FILE_HEADER_SIZE];

    memcpy(header, LOG_STORE_MAGIC, 4);
    put_be32(header + 4, LOG_STORE_VERSION);

    iovec iov{header, sizeof(header)};
    if (!write_fully(fd, &iov, 1))
    {
        throw StoreException(io_error("write header of", path));
    }
}

void WriteBatch::put(Bytes key, Bytes value)
{
    puts.emplace_back(std::move(key), std::move(value));
}

void WriteBatch::clear()
{
    puts.clear();
}

LogStore::LogStore(std::string path, LogStoreOptions options) : file_path(std::move(path)),
                                                                  options(options),
                                                                  fd(-1),
                                                                  end_offset(0)
{
    fd = open(file_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);

    if (fd == -1)
    {
        throw StoreException(io_error("open", file_path));
    }

    try
    {
        replay();
    } catch (const BasaltException&)
    {
        close(fd);
        throw;
    }
}

LogStore::~LogStore()
{
    if (fd != -1)
    {
        close(fd);
    }
}

void LogStore::replay()
{
    struct stat st{};

    if (fstat(fd, &st) == -1)
    {
        throw StoreException(io_error("stat", file_path));
    }

    auto size = static_cast<uint64_t>(st.st_size);

    if (size < FILE_HEADER_SIZE)
    {
        // new file, or a crash before the header was complete
        if (size && ftruncate(fd, 0) == -1)
        {
            throw StoreException(io_error("truncate", file_path));
        }
        write_file_header(fd, file_path);
        end_offset = FILE_HEADER_SIZE;
        return;
    }

    uint8_t header[FILE_HEADER_SIZE];
    if (!pread_fully(fd, header, sizeof(header), 0))
    {
        throw StoreException(io_error("read header of", file_path));
    }
    if (memcmp(header, LOG_STORE_MAGIC, 4) != 0)
    {
        throw StoreException(file_path + " is not a chunk store");
    }
    if (get_be32(header + 4) != LOG_STORE_VERSION)
    {
        throw StoreException(file_path + " has unsupported store version " + std::to_string(get_be32(header + 4)));
    }

    uint64_t pos = FILE_HEADER_SIZE;
    const char* stop_reason = nullptr;

    while (pos < size)
    {
        uint8_t record_header[RECORD_HEADER_SIZE];

        if (size - pos < RECORD_HEADER_SIZE)
        {
            stop_reason = "torn record header";
            break;
        }
        if (!pread_fully(fd, record_header, sizeof(record_header), pos))
        {
            throw StoreException(io_error("read", file_path));
        }

        uint32_t magic = get_be32(record_header);
        uint32_t length = get_be32(record_header + 4);
        uint32_t crc = get_be32(record_header + 8);

        if (magic != RECORD_MAGIC)
        {
            stop_reason = "bad record magic";
            break;
        }
        if (length > size - pos - RECORD_HEADER_SIZE)
        {
            stop_reason = "torn record payload";
            break;
        }

        Bytes payload(length);
        if (!pread_fully(fd, payload.data(), length, pos + RECORD_HEADER_SIZE))
        {
            throw StoreException(io_error("read", file_path));
        }
        if (checksum(payload.data(), payload.size()) != crc)
        {
            stop_reason = "record checksum mismatch";
            break;
        }

        std::vector<std::pair<Bytes, ValueRef>> refs;
        try
        {
            ReadBuffer rbuf(payload);
            int32_t count = rbuf.read_varint();

            for (int32_t i = 0; i < count; ++i)
            {
                int32_t key_size = rbuf.read_varint();
                if (key_size < 0 || static_cast<size_t>(key_size) > rbuf.remaining())
                {
                    throw LengthOverflowException("key length " + std::to_string(key_size));
                }
                Bytes key(key_size);
                rbuf.read_bytes(key.data(), key.size());

                int32_t value_size = rbuf.read_varint();
                if (value_size < 0)
                {
                    throw LengthOverflowException("negative value length");
                }
                ValueRef ref{pos + RECORD_HEADER_SIZE + rbuf.position(), static_cast<uint32_t>(value_size)};
                rbuf.skip(value_size);
                refs.emplace_back(std::move(key), ref);
            }
            rbuf.expect_end();
        } catch (const DecodeException& e)
        {
            logger().warn("Store %s: unreadable record at offset %llu: %s", file_path.c_str(),
                          static_cast<unsigned long long>(pos), e.what());
            stop_reason = "malformed record payload";
            break;
        }

        for (auto& [key, ref] : refs)
        {
            index[std::move(key)] = ref;
        }

        ++recovered.records;
        pos += RECORD_HEADER_SIZE + length;
    }

    if (stop_reason)
    {
        recovered.truncated_bytes = size - pos;
        logger().warn("Store %s: %s, truncating %llu bytes at offset %llu", file_path.c_str(), stop_reason,
                      static_cast<unsigned long long>(recovered.truncated_bytes),
                      static_cast<unsigned long long>(pos));

        if (ftruncate(fd, static_cast<off_t>(pos)) == -1)
        {
            throw StoreException(io_error("truncate", file_path));
        }
    }

    if (lseek(fd, static_cast<off_t>(pos), SEEK_SET) == -1)
    {
        throw StoreException(io_error("seek", file_path));
    }

    end_offset = pos;
    logger().info("Store %s: replayed %llu records, %zu keys", file_path.c_str(),
                  static_cast<unsigned long long>(recovered.records), index.size());
}

void LogStore::append(int fd, uint64_t& end, Index& index, const std::vector<std::pair<Bytes, Bytes>>& puts,
                      bool sync, const std::string& path)
{
    WriteBuffer payload(256);
    std::vector<size_t> value_offsets;

    value_offsets.reserve(puts.size());
    payload.write_varint(static_cast<int32_t>(puts.size()));

    for (const auto& [key, value] : puts)
    {
        payload.write_varint(static_cast<int32_t>(key.size()));
        payload.write_bytes(key);
        payload.write_varint(static_cast<int32_t>(value.size()));
        value_offsets.push_back(payload.size());
        payload.write_bytes(value);
    }

    uint8_t header[RECORD_HEADER_SIZE];
    put_be32(header, RECORD_MAGIC);
    put_be32(header + 4, static_cast<uint32_t>(payload.size()));
    put_be32(header + 8, checksum(payload.data(), payload.size()));

    iovec iov[2];
    iov[0].iov_base = header;
    iov[0].iov_len = sizeof(header);
    iov[1].iov_base = const_cast<uint8_t*>(payload.data());
    iov[1].iov_len = payload.size();

    if (!write_fully(fd, iov, 2) || (sync && fdatasync(fd) == -1))
    {
        std::string message = io_error("append to", path);

        // drop whatever part of the record made it out so the next append starts clean
        if (ftruncate(fd, static_cast<off_t>(end)) == -1 || lseek(fd, static_cast<off_t>(end), SEEK_SET) == -1)
        {
            logger().err("Store %s: could not roll back a failed append: %s", path.c_str(), strerror(errno));
        }
        throw StoreException(message);
    }

    for (size_t i = 0; i < puts.size(); ++i)
    {
        index[puts[i].first] = ValueRef{end + RECORD_HEADER_SIZE + value_offsets[i],
                                        static_cast<uint32_t>(puts[i].second.size())};
    }
    end += RECORD_HEADER_SIZE + payload.size();
}

Bytes LogStore::read_value(const ValueRef& ref) const
{
    Bytes value(ref.length);

    if (!pread_fully(fd, value.data(), value.size(), ref.offset))
    {
        throw StoreException(io_error("read", file_path));
    }
    return value;
}

std::optional<Bytes> LogStore::get(const Bytes& key) const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = index.find(key);

    if (it == index.end())
    {
        return std::nullopt;
    }
    return read_value(it->second);
}

bool LogStore::contains(const Bytes& key) const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return index.contains(key);
}

void LogStore::put(Bytes key, Bytes value)
{
    std::vector<std::pair<Bytes, Bytes>> puts;
    puts.emplace_back(std::move(key), std::move(value));

    std::unique_lock<std::shared_mutex> lock(mutex);
    append(fd, end_offset, index, puts, options.sync, file_path);
}

bool LogStore::put_if_absent(Bytes key, Bytes value)
{
    std::unique_lock<std::shared_mutex> lock(mutex);

    if (index.contains(key))
    {
        return false;
    }

    std::vector<std::pair<Bytes, Bytes>> puts;
    puts.emplace_back(std::move(key), std::move(value));
    append(fd, end_offset, index, puts, options.sync, file_path);
    return true;
}

void LogStore::write(const WriteBatch& batch)
{
    if (batch.empty())
    {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    append(fd, end_offset, index, batch.entries(), options.sync, file_path);
}

void LogStore::scan(const Bytes& begin, const Bytes& end,
                    const std::function<bool(const Bytes&, const Bytes&)>& visitor) const
{
    std::shared_lock<std::shared_mutex> lock(mutex);

    for (auto it = index.lower_bound(begin); it != index.end() && it->first < end; ++it)
    {
        if (!visitor(it->first, read_value(it->second)))
        {
            break;
        }
    }
}

void LogStore::compact()
{
    std::unique_lock<std::shared_mutex> lock(mutex);
    std::string tmp_path = file_path + ".compact";
    int tmp_fd = open(tmp_path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);

    if (tmp_fd == -1)
    {
        throw StoreException(io_error("open", tmp_path));
    }

    Index fresh;
    uint64_t tmp_end = FILE_HEADER_SIZE;
    uint64_t before = end_offset;

    try
    {
        write_file_header(tmp_fd, tmp_path);

        std::vector<std::pair<Bytes, Bytes>> pending;
        size_t pending_bytes = 0;

        for (const auto& [key, ref] : index)
        {
            pending.emplace_back(key, read_value(ref));
            pending_bytes += key.size() + ref.length;

            if (pending_bytes >= COMPACT_RECORD_BYTES)
            {
                append(tmp_fd, tmp_end, fresh, pending, false, tmp_path);
                pending.clear();
                pending_bytes = 0;
            }
        }
        if (!pending.empty())
        {
            append(tmp_fd, tmp_end, fresh, pending, false, tmp_path);
        }

        if (fdatasync(tmp_fd) == -1)
        {
            throw StoreException(io_error("sync", tmp_path));
        }
        if (rename(tmp_path.c_str(), file_path.c_str()) == -1)
        {
            throw StoreException(io_error("rename", tmp_path));
        }
    } catch (const StoreException&)
    {
        close(tmp_fd);
        unlink(tmp_path.c_str());
        throw;
    }

    close(fd);
    fd = tmp_fd;
    index = std::move(fresh);
    end_offset = tmp_end;

    logger().info("Store %s: compacted %llu bytes to %llu", file_path.c_str(),
                  static_cast<unsigned long long>(before), static_cast<unsigned long long>(end_offset));
}

size_t LogStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return index.size();
}

uint64_t LogStore::file_size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return end_offset;
}
