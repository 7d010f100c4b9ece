#include "Encoder.hpp"
#include "CodeTable.hpp"
#include "CodeTree.hpp"
#include "FrequencyTable.hpp"
#include "HeaderCodec.hpp"
#include <algorithm>
#include <string>

void huffcpp::algorithms::Encoder::writeCode(
    const CodePath& path,
    bitstream::IBitOutputStream& output
) {
    size_t position = 0;
    while (position < path.size())
    {
        const size_t chunk = std::min<size_t>(BITS_PER_INT, path.size() - position);
        uint32_t value = 0;
        for (size_t i = 0; i < chunk; ++i) {
            value = (value << 1) | (path[position + i] ? 1u : 0u);
        }
        output.writeBits(static_cast<int>(chunk), value);
        position += chunk;
    }
}

Result<huffcpp::algorithms::CompressionStats> huffcpp::algorithms::Encoder::compress(
    bitstream::IBitInputStream& input,
    bitstream::IBitOutputStream& output,
    bool verbose
) {
    if (!input.isRewindable()) {
        return makeError<CompressionStats>(
            ErrorCode::UnsupportedInput,
            "Compression needs a rewindable input stream"
        );
    }

    CompressionStats stats;
    try {
        //  1. Count symbols and derive the code
        const FrequencyCounts counts = FrequencyTable::collect(input, verbose);
        const CodeTree tree = CodeTree::build(counts);
        const CodeTable table = CodeTable::derive(tree);
        if (verbose) printCodeTable(table);

        //  2. Magic number and tree header
        output.writeBits(BITS_PER_INT, HUFF_TREE);
        const uint64_t headerStart = output.bitsWritten();
        HeaderCodec::write(tree, output);
        stats.headerBits = output.bitsWritten() - headerStart;

        //  3. Second pass over the input
        input.reset();
        while (true)
        {
            const int64_t symbol = input.readBits(BITS_PER_WORD);
            if (symbol == -1) break;
            writeCode(table.codeFor(static_cast<int>(symbol)), output);
            ++stats.symbolCount;
        }
        writeCode(table.codeFor(PSEUDO_EOF), output);
        output.close();

        stats.leafCount = tree.leafCount();
    }
    catch (const std::exception& e) {
        return makeError<CompressionStats>(
            ErrorCode::IoError,
            std::string("Compression failed: ") + e.what()
        );
    }

    stats.bitsRead = input.bitsRead();
    stats.bitsWritten = output.bitsWritten();
    if (verbose) stats.log();

    return makeResult<CompressionStats>(stats);
}
