#pragma once
#ifndef HUFFCPP_HUFFMAN_HPP
#define HUFFCPP_HUFFMAN_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "CompressionStats.hpp"
#include "../Helpers/Result.hpp"

namespace huffcpp::algorithms
{
    /* Entry points over byte buffers and files. On failure nothing is
       returned, and a partially written output file is removed. */
    struct Huffman
    {
        static Result<std::vector<uint8_t>> compress(
            const std::vector<uint8_t>& input,
            bool verbose = false
        );

        static Result<std::vector<uint8_t>> decompress(
            const std::vector<uint8_t>& input,
            bool verbose = false
        );

        static Result<CompressionStats> compressFile(
            const std::string& inputPath,
            const std::string& outputPath,
            bool verbose = false
        );

        static Result<CompressionStats> decompressFile(
            const std::string& inputPath,
            const std::string& outputPath,
            bool verbose = false
        );
    };
}

#endif // HUFFCPP_HUFFMAN_HPP
