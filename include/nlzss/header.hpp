/**
 * @file header.hpp
 * @brief LZSS stream header parsing.
 *
 * Layout (little-endian):
 * - byte 0: format tag (0x10 = LZSS10, 0x11 = LZSS11)
 * - bytes 1-3: decompressed length
 * - bytes 4-7: decompressed length, present only when bytes 1-3 are zero
 */

#ifndef NLZSS_HEADER_HPP
#define NLZSS_HEADER_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

namespace nlzss {

/**
 * @brief Compression variant selected by the format tag.
 */
enum class Variant : std::uint8_t {
    Lzss10 = TAG_LZSS10, ///< 2-byte tokens, lengths 3-18
    Lzss11 = TAG_LZSS11  ///< 2/3/4-byte tokens, lengths 3-65808
};

inline const char* variant_name(Variant variant) noexcept {
    switch (variant) {
    case Variant::Lzss10:
        return "LZSS10";
    case Variant::Lzss11:
        return "LZSS11";
    default:
        return "unknown";
    }
}

/**
 * @brief Check whether a byte is a recognised format tag.
 */
constexpr bool is_valid_tag(std::uint8_t tag) noexcept {
    return tag == TAG_LZSS10 || tag == TAG_LZSS11;
}

/**
 * @brief Parsed stream header.
 */
struct Header {
    Variant variant = Variant::Lzss10;
    std::uint32_t target_len = 0; ///< Declared decompressed length
    bool extended = false;        ///< Length came from the 32-bit field

    /// Number of header bytes in the stream
    [[nodiscard]] std::size_t size() const noexcept {
        return extended ? EXTENDED_HEADER_SIZE : HEADER_SIZE;
    }
};

/**
 * @brief Parse a stream header.
 *
 * The tag is checked before anything else is read, so an unknown tag
 * consumes exactly one byte.
 *
 * @param source Byte source positioned at the start of the stream
 * @param[out] header Parsed header (valid only on Error::Ok)
 * @return Error::Ok, Error::InvalidHeader or Error::UnexpectedEof
 */
template <typename Source> Error parse_header(Source& source, Header& header) {
    std::uint8_t tag = 0;
    Error status = source.read_u8(tag);
    if (status != Error::Ok) {
        return status;
    }
    if (!is_valid_tag(tag)) {
        return Error::InvalidHeader;
    }

    std::uint32_t length = 0;
    status = read_u24_le(source, length);
    if (status != Error::Ok) {
        return status;
    }

    bool extended = false;
    if (length == 0) {
        // 24-bit field too small: the real length follows as 32 bits
        status = read_u32_le(source, length);
        if (status != Error::Ok) {
            return status;
        }
        extended = true;
    }

    header.variant = static_cast<Variant>(tag);
    header.target_len = length;
    header.extended = extended;
    return Error::Ok;
}

} // namespace nlzss

#endif // NLZSS_HEADER_HPP
