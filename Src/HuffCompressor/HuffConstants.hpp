#pragma once
#ifndef HUFFCPP_HUFFCONSTANTS_HPP
#define HUFFCPP_HUFFCONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace huffcpp
{
    constexpr int BITS_PER_WORD = 8;
    constexpr int BITS_PER_INT = 32;

    constexpr int ALPH_SIZE = 1 << BITS_PER_WORD;           // 256 byte values
    constexpr int PSEUDO_EOF = ALPH_SIZE;                   // end-of-stream symbol
    constexpr size_t SYMBOL_SPACE_SIZE = ALPH_SIZE + 1;     // 257

    // leaves store 9 bits so the pseudo-EOF fits
    constexpr int LEAF_VALUE_BITS = BITS_PER_WORD + 1;

    constexpr uint32_t HUFF_NUMBER = 0xface8200;
    constexpr uint32_t HUFF_TREE = HUFF_NUMBER | 1;

    // no optimal tree over SYMBOL_SPACE_SIZE leaves is deeper than this
    constexpr size_t MAX_TREE_DEPTH = SYMBOL_SPACE_SIZE - 1;

    constexpr const char* COMPRESSED_EXTENSION = ".hf";
    constexpr const char* DECOMPRESSED_EXTENSION = ".uhf";
}

#endif // HUFFCPP_HUFFCONSTANTS_HPP
