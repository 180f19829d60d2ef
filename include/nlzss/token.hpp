/**
 * @file token.hpp
 * @brief Back-reference token decoding for LZSS10 and LZSS11.
 *
 * LZSS10 tokens are always 2 bytes:
 * - LLLL DDDD DDDD DDDD: length = L + 3, distance = D + 1
 *
 * LZSS11 tokens select their width from the high nibble of the first byte:
 * - nibble >= 2 (2 bytes): LLLL DDDD DDDD DDDD,
 *   length = L + 1
 * - nibble == 0 (3 bytes): 0000 LLLL LLLL DDDD DDDD DDDD,
 *   length = L + 0x11
 * - nibble == 1 (4 bytes): 0001 LLLL LLLL LLLL LLLL DDDD DDDD DDDD,
 *   length = L + 0x111
 *
 * In every shape the trailing 12 bits hold distance - 1.
 */

#ifndef NLZSS_TOKEN_HPP
#define NLZSS_TOKEN_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "header.hpp"

namespace nlzss {

/**
 * @brief Decoded back-reference: copy @c length bytes starting
 *        @c distance bytes behind the end of the output.
 */
struct BackReference {
    std::uint32_t length = 0;
    std::uint32_t distance = 0;
};

/**
 * @brief LZSS11 token shapes, valued by their size in bytes.
 */
enum class TokenShape : std::uint8_t {
    Short = 2,    ///< 4-bit length
    Extended = 3, ///< 8-bit length
    Wide = 4      ///< 16-bit length
};

/**
 * @brief Select the LZSS11 token shape from its first byte.
 */
constexpr TokenShape lzss11_shape(std::uint8_t first) noexcept {
    switch (first >> 4) {
    case 0:
        return TokenShape::Extended;
    case 1:
        return TokenShape::Wide;
    default:
        return TokenShape::Short;
    }
}

namespace detail {

/// 12-bit distance field split as (low nibble of @p hi) : @p lo
constexpr std::uint32_t distance_field(std::uint8_t hi, std::uint8_t lo) noexcept {
    return ((static_cast<std::uint32_t>(hi) & 0x0FU) << 8) | lo;
}

} // namespace detail

/**
 * @brief Decode a 2-byte LZSS10 back-reference token.
 *
 * @param source Byte source positioned at the token
 * @param[out] ref Decoded back-reference
 * @return Error::Ok, or Error::UnexpectedEof if the token is truncated
 */
template <typename Source> Error decode_lzss10_token(Source& source, BackReference& ref) {
    std::uint16_t v = 0;
    Error status = read_u16_be(source, v);
    if (status != Error::Ok) {
        return status;
    }

    ref.length = (static_cast<std::uint32_t>(v) >> 12) + LZSS10_LENGTH_BIAS;
    ref.distance = (static_cast<std::uint32_t>(v) & 0x0FFFU) + DISTANCE_BIAS;
    return Error::Ok;
}

/**
 * @brief Decode a 2, 3 or 4-byte LZSS11 back-reference token.
 *
 * @param source Byte source positioned at the token
 * @param[out] ref Decoded back-reference
 * @return Error::Ok, or Error::UnexpectedEof if the token is truncated
 */
template <typename Source> Error decode_lzss11_token(Source& source, BackReference& ref) {
    std::uint8_t b[4] = {0, 0, 0, 0};
    Error status = source.read_u8(b[0]);
    if (status != Error::Ok) {
        return status;
    }

    const TokenShape shape = lzss11_shape(b[0]);
    const std::size_t width = static_cast<std::size_t>(shape);
    for (std::size_t i = 1; i < width; ++i) {
        status = source.read_u8(b[i]);
        if (status != Error::Ok) {
            return status;
        }
    }

    switch (shape) {
    case TokenShape::Extended:
        ref.length = (((static_cast<std::uint32_t>(b[0]) & 0x0FU) << 4) |
                      (static_cast<std::uint32_t>(b[1]) >> 4)) +
                     LZSS11_EXTENDED_BIAS;
        ref.distance = detail::distance_field(b[1], b[2]) + DISTANCE_BIAS;
        break;

    case TokenShape::Wide:
        ref.length = (((static_cast<std::uint32_t>(b[0]) & 0x0FU) << 12) |
                      (static_cast<std::uint32_t>(b[1]) << 4) |
                      (static_cast<std::uint32_t>(b[2]) >> 4)) +
                     LZSS11_WIDE_BIAS;
        ref.distance = detail::distance_field(b[2], b[3]) + DISTANCE_BIAS;
        break;

    case TokenShape::Short:
    default:
        ref.length = (static_cast<std::uint32_t>(b[0]) >> 4) + LZSS11_SHORT_BIAS;
        ref.distance = detail::distance_field(b[0], b[1]) + DISTANCE_BIAS;
        break;
    }

    return Error::Ok;
}

/**
 * @brief Decode one back-reference token for the given variant.
 */
template <typename Source>
Error decode_token(Variant variant, Source& source, BackReference& ref) {
    if (variant == Variant::Lzss11) {
        return decode_lzss11_token(source, ref);
    }
    return decode_lzss10_token(source, ref);
}

} // namespace nlzss

#endif // NLZSS_TOKEN_HPP
