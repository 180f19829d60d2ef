/**
 * @file bytereader.cpp
 * @brief ByteReader / StreamReader compilation unit.
 *
 * Both readers are small enough to live entirely in the header, where
 * the per-byte read can be inlined into the decode loop. This unit
 * compiles the header in isolation as part of the static library.
 *
 * @see include/nlzss/bytereader.hpp for the full implementation
 */

#include <nlzss/bytereader.hpp>

// All implementation is in the header (inline functions)
