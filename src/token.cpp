/**
 * @file token.cpp
 * @brief Token decoder compilation unit.
 *
 * The LZSS10 and LZSS11 token decoders are templates over the byte
 * source type. This unit exists so that token.hpp and window.hpp are
 * compiled standalone as part of the library.
 *
 * @see include/nlzss/token.hpp
 * @see include/nlzss/window.hpp
 */

#include <nlzss/token.hpp>
#include <nlzss/window.hpp>

// All implementation is in the headers
