#pragma once
#include <cstdint>

namespace huffcpp::bitstream
{
    class IBitInputStream
    {
    public:
        // Returns the next howManyBits bits (MSB first), or -1 when fewer remain.
        virtual int64_t readBits(int howManyBits) = 0;
        virtual bool isRewindable() const = 0;
        virtual void reset() = 0;
        virtual uint64_t bitsRead() const = 0;
        virtual ~IBitInputStream() = default;
    };
}
