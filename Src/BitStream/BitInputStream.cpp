#include "BitInputStream.hpp"
#include <stdexcept>
#include <string>

huffcpp::bitstream::BitInputStream::BitInputStream(std::istream& in)
    : input(in)
    , startPosition(in.tellg())
    , rewindable(startPosition != std::streampos(-1))
{
    if (!rewindable) {
        // tellg() on an unseekable stream sets failbit
        input.clear();
    }
}

int64_t huffcpp::bitstream::BitInputStream::readBits(int howManyBits)
{
    if (howManyBits < 1 || howManyBits > MAX_BITS_PER_CALL)
        throw std::invalid_argument("readBits: bit count must be between 1 and 32, got " + std::to_string(howManyBits));

    while (bitCount < howManyBits)
    {
        const int next = input.get();
        if (next == std::char_traits<char>::eof()) {
            if (input.bad())
                throw std::runtime_error("BitInputStream: read failed");
            return -1;
        }
        bitBuffer = (bitBuffer << 8) | static_cast<uint8_t>(next);
        bitCount += 8;
    }

    bitCount -= howManyBits;
    const uint64_t value = (bitBuffer >> bitCount) & ((1ULL << howManyBits) - 1);
    bitsReadCount += static_cast<uint64_t>(howManyBits);
    return static_cast<int64_t>(value);
}

bool huffcpp::bitstream::BitInputStream::isRewindable() const
{
    return rewindable;
}

void huffcpp::bitstream::BitInputStream::reset()
{
    if (!rewindable)
        throw std::runtime_error("BitInputStream: underlying stream cannot be rewound");

    input.clear();
    input.seekg(startPosition);
    if (!input)
        throw std::runtime_error("BitInputStream: failed to seek to start of stream");

    bitBuffer = 0;
    bitCount = 0;
}

uint64_t huffcpp::bitstream::BitInputStream::bitsRead() const
{
    return bitsReadCount;
}
