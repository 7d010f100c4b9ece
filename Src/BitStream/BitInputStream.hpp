#pragma once
#ifndef HUFFCPP_BITINPUTSTREAM_HPP
#define HUFFCPP_BITINPUTSTREAM_HPP

#include <cstdint>
#include <istream>
#include "IBitInputStream.hpp"

namespace huffcpp::bitstream
{
    constexpr int MAX_BITS_PER_CALL = 32;

    /* Reads bits MSB-first from a byte-oriented std::istream. The stream is
       rewindable when it reported a valid position at construction. */
    class BitInputStream : public IBitInputStream
    {
      private:
        std::istream& input;
        std::streampos startPosition;
        bool rewindable;
        uint64_t bitBuffer = 0;
        int bitCount = 0;
        uint64_t bitsReadCount = 0;

      public:
        explicit BitInputStream(std::istream& in);

        int64_t readBits(int howManyBits) override;
        bool isRewindable() const override;
        void reset() override;
        uint64_t bitsRead() const override;
    };
}

#endif // HUFFCPP_BITINPUTSTREAM_HPP
