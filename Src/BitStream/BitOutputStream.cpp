#include "BitOutputStream.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

huffcpp::bitstream::BitOutputStream::BitOutputStream(std::ostream& out)
    : output(out)
{}

huffcpp::bitstream::BitOutputStream::~BitOutputStream()
{
    if (closed) return;
    try {
        close();
    }
    catch (const std::exception& e) {
        std::cerr << "BitOutputStream: failed to flush on destruction: " << e.what() << std::endl;
    }
}

void huffcpp::bitstream::BitOutputStream::writeBits(int howManyBits, uint32_t value)
{
    if (closed)
        throw std::runtime_error("BitOutputStream: write after close");
    if (howManyBits < 1 || howManyBits > 32)
        throw std::invalid_argument("writeBits: bit count must be between 1 and 32, got " + std::to_string(howManyBits));

    const uint64_t masked = static_cast<uint64_t>(value) & ((1ULL << howManyBits) - 1);
    bitBuffer = (bitBuffer << howManyBits) | masked;
    bitCount += howManyBits;

    while (bitCount >= 8)
    {
        bitCount -= 8;
        output.put(static_cast<char>((bitBuffer >> bitCount) & 0xFF));
    }

    if (!output)
        throw std::runtime_error("BitOutputStream: underlying stream write failed");

    bitsWrittenCount += static_cast<uint64_t>(howManyBits);
}

void huffcpp::bitstream::BitOutputStream::close()
{
    if (closed) return;
    closed = true;

    if (bitCount > 0)
    {
        output.put(static_cast<char>((bitBuffer << (8 - bitCount)) & 0xFF));
        bitCount = 0;
    }
    output.flush();

    if (!output)
        throw std::runtime_error("BitOutputStream: failed to flush underlying stream");
}

uint64_t huffcpp::bitstream::BitOutputStream::bitsWritten() const
{
    return bitsWrittenCount;
}
