#pragma once
#ifndef HUFFCPP_FREQUENCYTABLE_HPP
#define HUFFCPP_FREQUENCYTABLE_HPP

#include <array>
#include <cstdint>
#include "HuffConstants.hpp"
#include "../BitStream/IBitInputStream.hpp"

namespace huffcpp::algorithms
{
    using FrequencyCounts = std::array<uint64_t, SYMBOL_SPACE_SIZE>;

    struct FrequencyTable
    {
        // Consumes the whole input. counts[PSEUDO_EOF] is always 1.
        static FrequencyCounts collect(
            bitstream::IBitInputStream& input,
            bool verbose = false
        );
    };

    void printFrequencyTable(const FrequencyCounts& counts);
}

#endif // HUFFCPP_FREQUENCYTABLE_HPP
