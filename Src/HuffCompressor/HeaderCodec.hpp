#pragma once
#ifndef HUFFCPP_HEADERCODEC_HPP
#define HUFFCPP_HEADERCODEC_HPP

#include "CodeTree.hpp"
#include "../BitStream/IBitInputStream.hpp"
#include "../BitStream/IBitOutputStream.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    /* Preorder tree encoding: an internal node is a 0 bit followed by its
       left and right subtrees, a leaf is a 1 bit followed by its symbol in
       LEAF_VALUE_BITS bits. */
    struct HeaderCodec
    {
        static void write(
            const CodeTree& tree,
            bitstream::IBitOutputStream& output
        );

        static Result<CodeTree> read(bitstream::IBitInputStream& input);
    };
}

#endif // HUFFCPP_HEADERCODEC_HPP
