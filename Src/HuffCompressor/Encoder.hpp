#pragma once
#ifndef HUFFCPP_ENCODER_HPP
#define HUFFCPP_ENCODER_HPP

#include "CodeTable.hpp"
#include "CompressionStats.hpp"
#include "../BitStream/IBitInputStream.hpp"
#include "../BitStream/IBitOutputStream.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    struct Encoder
    {
        /* Two passes over input: one to count symbols, one to emit codes.
           The input has to be rewindable. Closes output on success. */
        static Result<CompressionStats> compress(
            bitstream::IBitInputStream& input,
            bitstream::IBitOutputStream& output,
            bool verbose = false
        );

        // Emits path[0] first; paths longer than 32 bits take several writes.
        static void writeCode(
            const CodePath& path,
            bitstream::IBitOutputStream& output
        );
    };
}

#endif // HUFFCPP_ENCODER_HPP
