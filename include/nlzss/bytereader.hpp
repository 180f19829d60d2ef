/**
 * @file bytereader.hpp
 * @brief Sequential byte sources for compressed data.
 *
 * A byte source is any type exposing
 * `Error read_u8(std::uint8_t& value)` that advances strictly forward.
 * ByteReader covers in-memory buffers and StreamReader covers std::istream.
 * The multi-byte helpers below work with either.
 */

#ifndef NLZSS_BYTEREADER_HPP
#define NLZSS_BYTEREADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <istream>

namespace nlzss {

/**
 * @brief Sequential byte reader over a memory buffer.
 *
 * Tracks position within a byte buffer. Does not own the data.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a single byte.
     *
     * @param[out] value Byte read (unchanged on failure)
     * @return Error::Ok, or Error::UnexpectedEof if no bytes remain
     */
    inline Error read_u8(std::uint8_t& value) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::UnexpectedEof;
        }
        value = data_[pos_++];
        return Error::Ok;
    }

    /**
     * @brief Get current byte position.
     *
     * @return Number of bytes already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

/**
 * @brief Sequential byte reader over a std::istream.
 *
 * Reads one byte at a time so that nothing past the last byte the decoder
 * needs is taken from the stream.
 */
class StreamReader {
public:
    explicit StreamReader(std::istream& in) noexcept : in_(in), pos_(0) {}

    Error read_u8(std::uint8_t& value) {
        std::istream::int_type c = in_.get();
        if (c == std::istream::traits_type::eof()) {
            return Error::UnexpectedEof;
        }
        value = static_cast<std::uint8_t>(c);
        ++pos_;
        return Error::Ok;
    }

    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

private:
    std::istream& in_;
    std::size_t pos_;
};

/**
 * @brief Read a 16-bit big-endian value.
 *
 * LZSS10 back-reference tokens are stored in this order.
 */
template <typename Source> Error read_u16_be(Source& source, std::uint16_t& value) {
    std::uint8_t hi = 0;
    std::uint8_t lo = 0;
    Error status = source.read_u8(hi);
    if (status != Error::Ok) {
        return status;
    }
    status = source.read_u8(lo);
    if (status != Error::Ok) {
        return status;
    }
    value = static_cast<std::uint16_t>((static_cast<unsigned>(hi) << 8) | lo);
    return Error::Ok;
}

/**
 * @brief Read an unsigned little-endian value of @p num_bytes bytes (1-4).
 */
template <typename Source>
Error read_le(Source& source, std::size_t num_bytes, std::uint32_t& value) {
    std::uint32_t result = 0;
    for (std::size_t i = 0; i < num_bytes; ++i) {
        std::uint8_t byte = 0;
        Error status = source.read_u8(byte);
        if (status != Error::Ok) {
            return status;
        }
        result |= static_cast<std::uint32_t>(byte) << (8 * i);
    }
    value = result;
    return Error::Ok;
}

/// 24-bit little-endian (header length field)
template <typename Source> Error read_u24_le(Source& source, std::uint32_t& value) {
    return read_le(source, 3, value);
}

/// 32-bit little-endian (extended header length field)
template <typename Source> Error read_u32_le(Source& source, std::uint32_t& value) {
    return read_le(source, 4, value);
}

} // namespace nlzss

#endif // NLZSS_BYTEREADER_HPP
