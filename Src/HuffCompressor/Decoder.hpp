#pragma once
#ifndef HUFFCPP_DECODER_HPP
#define HUFFCPP_DECODER_HPP

#include "CompressionStats.hpp"
#include "../BitStream/IBitInputStream.hpp"
#include "../BitStream/IBitOutputStream.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    struct Decoder
    {
        /* Fails with MalformedStream on a foreign magic number or when the
           data ends before the end-of-stream code, and with MalformedHeader
           when the tree header cannot be parsed. Output written before a
           failure must be discarded by the caller. */
        static Result<CompressionStats> decompress(
            bitstream::IBitInputStream& input,
            bitstream::IBitOutputStream& output,
            bool verbose = false
        );
    };
}

#endif // HUFFCPP_DECODER_HPP
