#pragma once
#include <cstdint>

namespace huffcpp::bitstream
{
    class IBitOutputStream
    {
    public:
        // Writes the low howManyBits bits of value, most significant first.
        virtual void writeBits(int howManyBits, uint32_t value) = 0;
        // Pads the last byte with zero bits and flushes. Safe to call twice.
        virtual void close() = 0;
        virtual uint64_t bitsWritten() const = 0;
        virtual ~IBitOutputStream() = default;
    };
}
