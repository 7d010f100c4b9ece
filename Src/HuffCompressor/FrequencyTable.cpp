#include "FrequencyTable.hpp"
#include <iostream>

huffcpp::algorithms::FrequencyCounts huffcpp::algorithms::FrequencyTable::collect(
    bitstream::IBitInputStream& input,
    bool verbose
) {
    FrequencyCounts counts{};

    while (true)
    {
        const int64_t symbol = input.readBits(BITS_PER_WORD);
        if (symbol == -1) break;
        counts[static_cast<size_t>(symbol)]++;
    }
    counts[PSEUDO_EOF] = 1;

    if (verbose) printFrequencyTable(counts);
    return counts;
}

void huffcpp::algorithms::printFrequencyTable(const FrequencyCounts& counts)
{
    std::cout << "Frequency table (non zero):" << std::endl;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] == 0) continue;
        if (static_cast<int>(i) == PSEUDO_EOF) {
            std::cout << "Symbol " << i << " <EOF>: " << counts[i] << std::endl;
        }
        else {
            std::cout << "Symbol " << i << ": " << counts[i] << std::endl;
        }
    }
    std::cout << std::endl;
}
