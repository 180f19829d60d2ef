/**
 * @file error.hpp
 * @brief nlzss error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef NLZSS_ERROR_HPP
#define NLZSS_ERROR_HPP

#include "config.hpp"

#if !NLZSS_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace nlzss {

/**
 * @brief Error codes for error-code-based error handling.
 *
 * Every decoding function returns one of these. Any value other than
 * Error::Ok is terminal for the current decompress call.
 */
enum class Error {
    Ok = 0,                   ///< Success
    InvalidHeader = -1,       ///< Format tag is neither 0x10 nor 0x11
    UnexpectedEof = -2,       ///< Input ended before the target length was produced
    InvalidBackReference = -3 ///< Back-reference reaches before the start of output
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidHeader:
        return "Invalid header (unknown format tag)";
    case Error::UnexpectedEof:
        return "Unexpected end of input";
    case Error::InvalidBackReference:
        return "Back-reference distance exceeds decoded output";
    default:
        return "Unknown error";
    }
}

#if !NLZSS_NO_EXCEPTIONS

/**
 * @brief Base exception for nlzss errors.
 */
class LzssException : public std::runtime_error {
public:
    explicit LzssException(const std::string& message, Error code = Error::InvalidHeader)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for an unrecognised format tag.
 */
class InvalidHeaderException : public LzssException {
public:
    explicit InvalidHeaderException(const std::string& message)
        : LzssException(message, Error::InvalidHeader) {}
};

/**
 * @brief Exception for truncated input.
 */
class UnexpectedEofException : public LzssException {
public:
    explicit UnexpectedEofException(const std::string& message)
        : LzssException(message, Error::UnexpectedEof) {}
};

/**
 * @brief Exception for a back-reference outside the decoded window.
 */
class InvalidBackReferenceException : public LzssException {
public:
    explicit InvalidBackReferenceException(const std::string& message)
        : LzssException(message, Error::InvalidBackReference) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code returned by a decoding function
 * @param context Prefix for the exception message (may be empty)
 */
inline void throw_on_error(Error error, const std::string& context = std::string()) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = context.empty() ? std::string(error_string(error))
                                          : context + ": " + error_string(error);

    switch (error) {
    case Error::InvalidHeader:
        throw InvalidHeaderException(message);
    case Error::UnexpectedEof:
        throw UnexpectedEofException(message);
    case Error::InvalidBackReference:
        throw InvalidBackReferenceException(message);
    default:
        throw LzssException(message, error);
    }
}

#endif // !NLZSS_NO_EXCEPTIONS

} // namespace nlzss

#endif // NLZSS_ERROR_HPP
