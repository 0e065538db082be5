#ifndef BASALT_FRAME_HPP
#define BASALT_FRAME_HPP


#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include "codec/varint.hpp"
#include "codec/writebuffer.hpp"

/**
 * Largest outer frame length accepted, the most a 3 byte varint can express.
 */
#define MAX_FRAME_LENGTH (2097151)
/**
 * Largest decompressed payload a compressed frame may declare.
 */
#define MAX_UNCOMPRESSED_LENGTH (8388608)

/**
 * Per-connection framing parameters. A negative threshold means compression is off
 * and frames carry no inner data length.
 */
struct FrameSettings
{
    int compression_threshold = -1;
    size_t max_frame_length = MAX_FRAME_LENGTH;
    size_t max_uncompressed_length = MAX_UNCOMPRESSED_LENGTH;

    [[nodiscard]] inline bool compressed() const { return compression_threshold >= 0; }
};

/**
 * Frames the payload held by the buffer. Uncompressed frames are built in place
 * using the buffer's headroom.
 */
std::vector<uint8_t> encode_frame(WriteBuffer& payload, const FrameSettings& settings);

std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload, const FrameSettings& settings);

/**
 * Incremental frame splitter. Bytes are fed as they arrive from the socket and whole
 * payloads (packet id + fields, decompressed) come out of next().
 */
class FrameDecoder
{
public:
    void feed(const uint8_t* data, size_t size);

    /**
     * @return The next complete payload, or nullopt if more bytes are needed.
     * @throws FrameTooLargeException as soon as a declared length exceeds settings.max_frame_length
     * @throws MalformedVarintException if a length prefix is not a valid varint
     * @throws CompressionMismatchException if a compressed frame declares a size below the threshold
     *         or decompresses to a size other than the one declared
     * @throws LengthOverflowException if a compressed frame declares more than settings.max_uncompressed_length
     * @throws CorruptStreamException if a compressed body does not inflate
     */
    std::optional<std::vector<uint8_t>> next(const FrameSettings& settings);

    /**
     * Validates the length prefix of the next pending frame without consuming anything.
     * @return The decoded prefix, or nullopt if it has not fully arrived.
     * @throws FrameTooLargeException if the declared length exceeds settings.max_frame_length
     * @throws MalformedVarintException if the prefix is not a valid varint
     */
    std::optional<VarintResult> check(const FrameSettings& settings) const;

    /**
     * Applies transform to every byte that was fed but not yet consumed by next(). Used when
     * a stream cipher is switched on while bytes sent after the switch are already buffered.
     */
    void transform_pending(const std::function<void(uint8_t*, size_t)>& transform);

    [[nodiscard]] inline size_t pending() const { return buffer.size() - offset; }
private:
    std::vector<uint8_t> buffer;
    size_t offset = 0;
};


#endif //BASALT_FRAME_HPP
