#pragma once
#include "../../../Src/BitStream/IBitInputStream.hpp"
#include "../../../Src/BitStream/IBitOutputStream.hpp"
#include <cstdint>
#include <ios>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

/* Bit streams over plain bit vectors, without touching std::iostream */
class MockBitInputStream : public huffcpp::bitstream::IBitInputStream
{
  private:
    std::vector<bool> bits;
    size_t position = 0;
    bool rewindable;
    uint64_t readCount = 0;

  public:
    explicit MockBitInputStream(std::vector<bool> inputBits, bool canRewind = true)
        : bits(std::move(inputBits))
        , rewindable(canRewind)
    {}

    static MockBitInputStream fromBytes(const std::vector<uint8_t>& bytes, bool canRewind = true)
    {
        std::vector<bool> bits;
        for (uint8_t byte : bytes) {
            for (int i = 7; i >= 0; --i) bits.push_back(((byte >> i) & 1) != 0);
        }
        return MockBitInputStream(bits, canRewind);
    }

    // "0110..." with any other character ignored
    static MockBitInputStream fromString(const std::string& bitString, bool canRewind = true)
    {
        std::vector<bool> bits;
        for (char c : bitString) {
            if (c == '0' || c == '1') bits.push_back(c == '1');
        }
        return MockBitInputStream(bits, canRewind);
    }

    int64_t readBits(int howManyBits) override
    {
        if (howManyBits < 1 || howManyBits > 32)
            throw std::invalid_argument("MockBitInputStream: bad bit count");
        if (position + static_cast<size_t>(howManyBits) > bits.size()) return -1;

        int64_t value = 0;
        for (int i = 0; i < howManyBits; ++i) {
            value = (value << 1) | (bits[position++] ? 1 : 0);
        }
        readCount += static_cast<uint64_t>(howManyBits);
        return value;
    }

    bool isRewindable() const override
    {
        return rewindable;
    }

    void reset() override
    {
        if (!rewindable) throw std::runtime_error("MockBitInputStream: not rewindable");
        position = 0;
    }

    uint64_t bitsRead() const override
    {
        return readCount;
    }

    size_t remaining() const
    {
        return bits.size() - position;
    }
};

class MockBitOutputStream : public huffcpp::bitstream::IBitOutputStream
{
  private:
    std::vector<bool> bits;
    bool closed = false;

  public:
    void writeBits(int howManyBits, uint32_t value) override
    {
        if (closed) throw std::runtime_error("MockBitOutputStream: write after close");
        if (howManyBits < 1 || howManyBits > 32)
            throw std::invalid_argument("MockBitOutputStream: bad bit count");
        for (int i = howManyBits - 1; i >= 0; --i) {
            bits.push_back(((value >> i) & 1u) != 0);
        }
    }

    void close() override
    {
        closed = true;
    }

    uint64_t bitsWritten() const override
    {
        return bits.size();
    }

    bool isClosed() const
    {
        return closed;
    }

    const std::vector<bool>& getBits() const
    {
        return bits;
    }

    std::string bitString() const
    {
        std::string result;
        for (bool bit : bits) result.push_back(bit ? '1' : '0');
        return result;
    }

    // zero padded to whole bytes
    std::vector<uint8_t> bytes() const
    {
        std::vector<uint8_t> result((bits.size() + 7) / 8, 0);
        for (size_t i = 0; i < bits.size(); ++i) {
            if (bits[i]) result[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
        return result;
    }
};

/* A read-only stream buffer without seek support, like a pipe */
class ForwardOnlyBuffer : public std::streambuf
{
  private:
    std::string data;

  public:
    explicit ForwardOnlyBuffer(std::string content)
        : data(std::move(content))
    {
        char* begin = data.empty() ? nullptr : &data[0];
        setg(begin, begin, begin + data.size());
    }
};

/* Seekable read buffer whose underflow() throws once its content is used up,
   like a device that fails part way through a read */
class FailingReadBuffer : public std::streambuf
{
  private:
    std::string data;

  public:
    explicit FailingReadBuffer(std::string content)
        : data(std::move(content))
    {
        char* begin = data.empty() ? nullptr : &data[0];
        setg(begin, begin, begin + data.size());
    }

  protected:
    int_type underflow() override
    {
        throw std::runtime_error("FailingReadBuffer: device read error");
    }

    pos_type seekoff(off_type offset, std::ios_base::seekdir direction, std::ios_base::openmode) override
    {
        off_type target = offset;
        if (direction == std::ios_base::cur) target += gptr() - eback();
        else if (direction == std::ios_base::end) target += static_cast<off_type>(data.size());
        if (target < 0 || target > static_cast<off_type>(data.size())) return pos_type(off_type(-1));

        setg(eback(), eback() + target, egptr());
        return pos_type(target);
    }

    pos_type seekpos(pos_type position, std::ios_base::openmode which) override
    {
        return seekoff(off_type(position), std::ios_base::beg, which);
    }
};
