/**
 * @file header.cpp
 * @brief Header parser compilation unit.
 *
 * parse_header() is a template over the byte source type and therefore
 * lives in the header.
 *
 * @see include/nlzss/header.hpp for the full implementation
 */

#include <nlzss/header.hpp>

// All implementation is in the header (templates)
