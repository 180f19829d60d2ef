/**
 * @file decompressor.hpp
 * @brief LZSS10/LZSS11 decompression state machine.
 *
 * After the header, the stream is a sequence of groups: one flag byte
 * followed by up to eight items. Flag bits are read MSB first; a 0 bit
 * means the next item is a literal byte, a 1 bit means it is a
 * back-reference token. Decoding stops as soon as the declared length
 * has been produced, even in the middle of a group.
 *
 * @see https://github.com/magical/nlzss
 */

#ifndef NLZSS_DECOMPRESSOR_HPP
#define NLZSS_DECOMPRESSOR_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "header.hpp"
#include "token.hpp"
#include "window.hpp"

#include <algorithm>
#include <vector>

namespace nlzss {

/**
 * @brief LZSS stream decompressor.
 *
 * Holds the decode state for one stream at a time. The output buffer
 * belongs to the caller for the duration of decompress() and doubles as
 * the back-reference window.
 */
class Decompressor {
public:
    /**
     * @brief Decode loop states.
     */
    enum class State {
        NeedFlagByte, ///< Next input byte is a flag byte
        ProcessBit,   ///< bit_index() selects the next item's kind
        Done          ///< Target length reached
    };

    Decompressor() noexcept {
        reset();
    }

    /**
     * @brief Reset decompressor to initial state.
     */
    void reset() noexcept {
        header_ = Header{};
        state_ = State::NeedFlagByte;
        flags_ = 0;
        bit_ = 0;
        flag_count_ = 0;
        literal_count_ = 0;
        reference_count_ = 0;
    }

    /**
     * @brief Decompress one complete stream.
     *
     * Reads the header and then the body from @p source. Bytes after the
     * one that completes the target length are left unread.
     *
     * @tparam Source Byte source (see bytereader.hpp)
     * @param source Source positioned at the header
     * @param[out] output Decompressed data; empty unless Error::Ok
     * @return Error::Ok on success, otherwise the first fault encountered
     */
    template <typename Source> Error decompress(Source& source, std::vector<std::uint8_t>& output) {
        reset();
        output.clear();

        Error status = parse_header(source, header_);
        if (status != Error::Ok) {
            return status;
        }

        output.reserve(std::min<std::size_t>(header_.target_len, MAX_PREALLOCATION));
        if (header_.target_len == 0) {
            state_ = State::Done;
        }

        while (state_ != State::Done) {
            status = step(source, output);
            if (status != Error::Ok) {
                output.clear();
                return status;
            }
        }

        return Error::Ok;
    }

    /**
     * @brief Get the header of the last stream.
     */
    const Header& header() const noexcept {
        return header_;
    }

    State state() const noexcept {
        return state_;
    }

    /**
     * @brief Index (0-7) of the next flag bit to process.
     */
    std::size_t bit_index() const noexcept {
        return bit_;
    }

    /// Flag bytes read so far
    std::size_t flag_count() const noexcept {
        return flag_count_;
    }

    /// Literal bytes emitted so far
    std::size_t literal_count() const noexcept {
        return literal_count_;
    }

    /// Back-references expanded so far
    std::size_t reference_count() const noexcept {
        return reference_count_;
    }

private:
    /**
     * @brief Advance the state machine by one transition.
     */
    template <typename Source> Error step(Source& source, std::vector<std::uint8_t>& output) {
        switch (state_) {
        case State::NeedFlagByte: {
            Error status = source.read_u8(flags_);
            if (status != Error::Ok) {
                return status;
            }
            ++flag_count_;
            bit_ = 0;
            state_ = State::ProcessBit;
            return Error::Ok;
        }

        case State::ProcessBit: {
            // MSB-first: bit 0 of the group is bit 7 of the flag byte
            const bool is_reference = ((flags_ >> (FLAG_BITS - 1 - bit_)) & 1U) != 0;

            if (is_reference) {
                BackReference ref;
                Error status = decode_token(header_.variant, source, ref);
                if (status != Error::Ok) {
                    return status;
                }
                status = copy_back_reference(output, ref, header_.target_len);
                if (status != Error::Ok) {
                    return status;
                }
                ++reference_count_;
            } else {
                std::uint8_t literal = 0;
                Error status = source.read_u8(literal);
                if (status != Error::Ok) {
                    return status;
                }
                output.push_back(literal);
                ++literal_count_;
            }

            if (output.size() >= header_.target_len) {
                // Remaining flag bits and input are never looked at
                state_ = State::Done;
            } else if (++bit_ == FLAG_BITS) {
                state_ = State::NeedFlagByte;
            }
            return Error::Ok;
        }

        case State::Done:
        default:
            return Error::Ok;
        }
    }

    Header header_;
    State state_ = State::NeedFlagByte;

    // Current flag byte and cursor
    std::uint8_t flags_ = 0;
    std::size_t bit_ = 0;

    std::size_t flag_count_ = 0;
    std::size_t literal_count_ = 0;
    std::size_t reference_count_ = 0;
};

} // namespace nlzss

#endif // NLZSS_DECOMPRESSOR_HPP
