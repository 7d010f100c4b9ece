#include "Decoder.hpp"
#include "CodeTree.hpp"
#include "HeaderCodec.hpp"
#include <iomanip>
#include <sstream>
#include <string>

namespace
{
    std::string toHex(int64_t value)
    {
        if (value < 0) return std::to_string(value);
        std::ostringstream stream;
        stream << "0x" << std::hex << std::setw(8) << std::setfill('0') << value;
        return stream.str();
    }
}

Result<huffcpp::algorithms::CompressionStats> huffcpp::algorithms::Decoder::decompress(
    bitstream::IBitInputStream& input,
    bitstream::IBitOutputStream& output,
    bool verbose
) {
    CompressionStats stats;
    try {
        //  1. Magic number
        const int64_t magic = input.readBits(BITS_PER_INT);
        if (magic != static_cast<int64_t>(HUFF_TREE)) {
            return makeError<CompressionStats>(
                ErrorCode::MalformedStream,
                "Illegal header starts with " + toHex(magic)
            );
        }

        //  2. Tree header
        Result<CodeTree> treeResult = HeaderCodec::read(input);
        if (!treeResult.success()) {
            return forwardError<CompressionStats>(treeResult);
        }
        const CodeTree tree = treeResult.takeValue();
        stats.headerBits = input.bitsRead() - BITS_PER_INT;
        stats.leafCount = tree.leafCount();

        if (verbose) {
            std::cout << "Tree leaves: " << stats.leafCount
                      << ", depth: " << tree.depth()
                      << ", header bits: " << stats.headerBits << std::endl;
        }

        //  3. Walk the tree until the end-of-stream leaf
        const HuffNode* current = &tree.root();
        while (!(current->isLeaf() && current->symbol() == PSEUDO_EOF))
        {
            if (!current->isLeaf())
            {
                const int64_t bit = input.readBits(1);
                if (bit == -1) {
                    return makeError<CompressionStats>(
                        ErrorCode::MalformedStream,
                        "Compressed data ended before the end-of-stream code after "
                            + std::to_string(stats.symbolCount) + " symbols"
                    );
                }
                current = (bit == 0) ? &current->left() : &current->right();
                continue;
            }

            output.writeBits(BITS_PER_WORD, static_cast<uint32_t>(current->symbol()));
            ++stats.symbolCount;
            current = &tree.root();
        }

        output.close();
    }
    catch (const std::exception& e) {
        return makeError<CompressionStats>(
            ErrorCode::IoError,
            std::string("Decompression failed: ") + e.what()
        );
    }

    stats.bitsRead = input.bitsRead();
    stats.bitsWritten = output.bitsWritten();
    if (verbose) stats.log();

    return makeResult<CompressionStats>(stats);
}
