#ifndef BASALT_EXCEPTIONS_HPP
#define BASALT_EXCEPTIONS_HPP


#include <exception>
#include <string>

class BasaltException : public std::exception
{
public:
    explicit BasaltException(std::string message);

    [[nodiscard]] const char* what() const noexcept override;
private:
    std::string message;
};

/**
 * Base of every error raised while turning peer bytes into packets. These are
 * fatal to the connection they occurred on and to nothing else.
 */
class DecodeException : public BasaltException
{
public:
    using BasaltException::BasaltException;
};

/**
 * A varint ran past its maximum width (5 bytes for 32-bit values, 10 for 64-bit)
 * or carried bits that do not fit the value.
 */
class MalformedVarintException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

/**
 * A declared length is negative or exceeds the configured maximum.
 */
class LengthOverflowException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

/**
 * Thrown when a read runs off the end of the bytes that were available.
 */
class TruncatedException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class TrailingBytesException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class FrameTooLargeException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class CompressionMismatchException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class CorruptStreamException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class UnknownTagIdException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class DepthExceededException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

class UnknownPacketException : public DecodeException
{
public:
    UnknownPacketException(int phase, int packet_id);

    [[nodiscard]] inline int phase() const { return _phase; }

    [[nodiscard]] inline int packet_id() const { return _packet_id; }
private:
    int _phase;
    int _packet_id;
};

class ProtocolViolationException : public DecodeException
{
public:
    using DecodeException::DecodeException;
};

/**
 * Raised by the persistent store when the operating system refuses an I/O
 * operation. Never retried by the store itself.
 */
class StoreException : public BasaltException
{
public:
    using BasaltException::BasaltException;
};


#endif //BASALT_EXCEPTIONS_HPP
