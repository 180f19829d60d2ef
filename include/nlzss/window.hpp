/**
 * @file window.hpp
 * @brief Back-reference expansion into the output buffer.
 *
 * The output buffer is its own sliding window: a back-reference copies
 * from bytes already written to it, never from the input.
 */

#ifndef NLZSS_WINDOW_HPP
#define NLZSS_WINDOW_HPP

#include "config.hpp"
#include "error.hpp"
#include "token.hpp"

#include <vector>

namespace nlzss {

/**
 * @brief Expand a back-reference at the end of @p output.
 *
 * Copies one byte at a time from the front of the reference, so when
 * distance < length the bytes written earlier in the same copy are read
 * again and the last @c distance bytes repeat periodically.
 *
 * The copy stops once @p output holds @p limit bytes; the rest of the
 * reference is dropped.
 *
 * @param output Decoded data so far (extended in place)
 * @param ref Back-reference to expand
 * @param limit Maximum size of @p output
 * @return Error::Ok, or Error::InvalidBackReference if the reference
 *         starts before the beginning of @p output
 */
inline Error copy_back_reference(std::vector<std::uint8_t>& output, const BackReference& ref,
                                 std::size_t limit) {
    if (ref.distance == 0 || ref.distance > output.size()) {
        return Error::InvalidBackReference;
    }

    std::size_t src = output.size() - ref.distance;
    for (std::uint32_t i = 0; i < ref.length && output.size() < limit; ++i) {
        // Index, not iterator: push_back may reallocate
        std::uint8_t byte = output[src++];
        output.push_back(byte);
    }

    return Error::Ok;
}

} // namespace nlzss

#endif // NLZSS_WINDOW_HPP
