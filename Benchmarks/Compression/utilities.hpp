#pragma once
#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

namespace benchmark
{
    namespace utilities
    {
        std::vector<uint8_t> GenerateInput(
            const std::string& kind,
            size_t size
        );

        std::vector<uint8_t> HuffmanCompress(
            const std::vector<uint8_t>& input
        );

        std::vector<uint8_t> HuffmanDecompress(
            const std::vector<uint8_t>& input
        );

        inline std::string GetBenchmarkName(
            const std::string& prefix,
            const std::string& kind,
            size_t size
        ) {
            return prefix + "/" + kind + "/" + std::to_string(size);
        }
    }
}
