/**
 * @file decompressor.cpp
 * @brief Decompressor compilation unit.
 *
 * Decompressor::decompress() is a member template parameterized by the
 * byte source, so the state machine is defined in the header. The
 * high-level API in nlzss.hpp is included here as well so the whole
 * public surface is compiled when the library is built.
 *
 * @see include/nlzss/decompressor.hpp
 * @see include/nlzss/nlzss.hpp
 */

#include <nlzss/decompressor.hpp>
#include <nlzss/nlzss.hpp>

// All implementation is in the headers
