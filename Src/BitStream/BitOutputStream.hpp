#pragma once
#ifndef HUFFCPP_BITOUTPUTSTREAM_HPP
#define HUFFCPP_BITOUTPUTSTREAM_HPP

#include <cstdint>
#include <ostream>
#include "IBitOutputStream.hpp"

namespace huffcpp::bitstream
{
    class BitOutputStream : public IBitOutputStream
    {
      private:
        std::ostream& output;
        uint64_t bitBuffer = 0;
        int bitCount = 0;
        uint64_t bitsWrittenCount = 0;
        bool closed = false;

      public:
        explicit BitOutputStream(std::ostream& out);
        ~BitOutputStream() override;

        BitOutputStream(const BitOutputStream&) = delete;
        BitOutputStream& operator=(const BitOutputStream&) = delete;

        void writeBits(int howManyBits, uint32_t value) override;
        void close() override;
        uint64_t bitsWritten() const override;
    };
}

#endif // HUFFCPP_BITOUTPUTSTREAM_HPP
