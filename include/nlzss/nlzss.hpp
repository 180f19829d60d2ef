/**
 * @file nlzss.hpp
 * @brief High-level nlzss decompression API.
 *
 * Provides decompress() for in-memory buffers and std::istream sources,
 * and read_header() for inspecting a stream without decoding it.
 *
 * @see https://github.com/magical/nlzss
 */

#ifndef NLZSS_HPP
#define NLZSS_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "decompressor.hpp"
#include "error.hpp"
#include "header.hpp"
#include "token.hpp"
#include "window.hpp"

#include <istream>
#include <vector>

namespace nlzss {

/**
 * @brief Decompress an LZSS10/LZSS11 stream held in memory.
 *
 * @param data Compressed stream, starting with the header
 * @param size Number of bytes available at @p data
 * @param[out] output Decompressed data, exactly the declared length on success
 * @return Error::Ok on success
 */
inline Error decompress(const std::uint8_t* data, std::size_t size,
                        std::vector<std::uint8_t>& output) {
    ByteReader reader(data, size);
    Decompressor decomp;
    return decomp.decompress(reader, output);
}

/**
 * @brief Decompress an LZSS10/LZSS11 stream read from @p input.
 *
 * On success the stream is left positioned just after the last byte
 * the decoder needed.
 *
 * @param input Stream positioned at the header
 * @param[out] output Decompressed data
 * @return Error::Ok on success
 */
inline Error decompress(std::istream& input, std::vector<std::uint8_t>& output) {
    StreamReader reader(input);
    Decompressor decomp;
    return decomp.decompress(reader, output);
}

/**
 * @brief Parse only the header of an in-memory stream.
 *
 * @param data Compressed stream
 * @param size Number of bytes available at @p data
 * @param[out] header Variant and declared decompressed length
 * @return Error::Ok, Error::InvalidHeader or Error::UnexpectedEof
 */
inline Error read_header(const std::uint8_t* data, std::size_t size, Header& header) {
    ByteReader reader(data, size);
    return parse_header(reader, header);
}

#if !NLZSS_NO_EXCEPTIONS

/**
 * @brief Decompress an in-memory stream, throwing on failure.
 *
 * @throws InvalidHeaderException, UnexpectedEofException,
 *         InvalidBackReferenceException
 */
inline std::vector<std::uint8_t> decompress(const std::uint8_t* data, std::size_t size) {
    std::vector<std::uint8_t> output;
    ByteReader reader(data, size);
    Decompressor decomp;
    Error status = decomp.decompress(reader, output);
    if (status != Error::Ok) {
        throw_on_error(status, "LZSS decompression failed at input offset " +
                                   std::to_string(reader.position()));
    }
    return output;
}

/**
 * @brief Decompress a stream read from @p input, throwing on failure.
 */
inline std::vector<std::uint8_t> decompress(std::istream& input) {
    std::vector<std::uint8_t> output;
    StreamReader reader(input);
    Decompressor decomp;
    Error status = decomp.decompress(reader, output);
    if (status != Error::Ok) {
        throw_on_error(status, "LZSS decompression failed at input offset " +
                                   std::to_string(reader.position()));
    }
    return output;
}

#endif // !NLZSS_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace nlzss

#endif // NLZSS_HPP
