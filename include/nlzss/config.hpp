/**
 * @file config.hpp
 * @brief nlzss compile-time configuration and format constants.
 *
 * Nintendo LZSS10 (tag 0x10) and LZSS11 (tag 0x11) decompression, as found
 * in GBA and NDS ROM assets.
 *
 * @see https://github.com/magical/nlzss
 * @see https://problemkaputt.de/gbatek.htm#biosdecompressionfunctions
 */

#ifndef NLZSS_CONFIG_HPP
#define NLZSS_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace nlzss {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup format Stream Format Constants
 * @{
 */

/// Format tags (header byte 0)
inline constexpr std::uint8_t TAG_LZSS10 = 0x10U;
inline constexpr std::uint8_t TAG_LZSS11 = 0x11U;

/// Header sizes: tag + 24-bit length, optionally followed by a 32-bit length
inline constexpr std::size_t HEADER_SIZE = 4U;
inline constexpr std::size_t EXTENDED_HEADER_SIZE = 8U;

/// Tokens governed by one flag byte
inline constexpr std::size_t FLAG_BITS = 8U;

/// Stored distances are biased by one
inline constexpr std::uint32_t DISTANCE_BIAS = 1U;
inline constexpr std::uint32_t WINDOW_SIZE = 0x1000U;

/// LZSS10: 4-bit length field, biased by 3
inline constexpr std::uint32_t LZSS10_LENGTH_BIAS = 3U;
inline constexpr std::uint32_t LZSS10_MAX_LENGTH = 0xFU + LZSS10_LENGTH_BIAS;

/// LZSS11: 2-byte token, length = nibble + 1 (nibble >= 2)
inline constexpr std::uint32_t LZSS11_SHORT_BIAS = 1U;
inline constexpr std::uint32_t LZSS11_SHORT_MAX_LENGTH = 0xFU + LZSS11_SHORT_BIAS;

/// LZSS11: 3-byte token, 8-bit length field
inline constexpr std::uint32_t LZSS11_EXTENDED_BIAS = 0x11U;
inline constexpr std::uint32_t LZSS11_EXTENDED_MAX_LENGTH = 0xFFU + LZSS11_EXTENDED_BIAS;

/// LZSS11: 4-byte token, 16-bit length field
inline constexpr std::uint32_t LZSS11_WIDE_BIAS = 0x111U;
inline constexpr std::uint32_t LZSS11_WIDE_MAX_LENGTH = 0xFFFFU + LZSS11_WIDE_BIAS;

/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Upper bound for the up-front output reservation (bytes)
#ifndef NLZSS_MAX_PREALLOCATION
#define NLZSS_MAX_PREALLOCATION (16U * 1024U * 1024U)
#endif

inline constexpr std::size_t MAX_PREALLOCATION = NLZSS_MAX_PREALLOCATION;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define NLZSS_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef NLZSS_NO_EXCEPTIONS
#define NLZSS_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace nlzss

#endif // NLZSS_CONFIG_HPP
