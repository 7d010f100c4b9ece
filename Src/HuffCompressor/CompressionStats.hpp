#pragma once
#include <cstddef>
#include <cstdint>
#include <iostream>

namespace huffcpp::algorithms
{
    struct CompressionStats
    {
        uint64_t bitsRead = 0;
        uint64_t bitsWritten = 0;
        uint64_t headerBits = 0;
        uint64_t symbolCount = 0;   // payload bytes, pseudo-EOF excluded
        size_t leafCount = 0;

        void log() const
        {
            std::cout << "Compression statistics:\n"
                      << " - bits read: " << bitsRead << "\n"
                      << " - bits written: " << bitsWritten << "\n"
                      << " - header bits: " << headerBits << "\n"
                      << " - symbols: " << symbolCount << "\n"
                      << " - tree leaves: " << leafCount << std::endl;
        }
    };
}
