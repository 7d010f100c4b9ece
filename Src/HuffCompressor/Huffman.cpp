#include "Huffman.hpp"
#include "Decoder.hpp"
#include "Encoder.hpp"
#include "../BitStream/BitInputStream.hpp"
#include "../BitStream/BitOutputStream.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{
    using huffcpp::algorithms::CompressionStats;
    using huffcpp::bitstream::BitInputStream;
    using huffcpp::bitstream::BitOutputStream;
    using huffcpp::bitstream::IBitInputStream;
    using huffcpp::bitstream::IBitOutputStream;

    using StreamCodec = Result<CompressionStats> (*)(IBitInputStream&, IBitOutputStream&, bool);

    Result<std::vector<uint8_t>> runOnBuffer(
        StreamCodec codec,
        const std::vector<uint8_t>& input,
        bool verbose
    ) {
        std::istringstream in(std::string(input.begin(), input.end()), std::ios::binary);
        std::ostringstream out(std::ios::binary);

        {
            BitInputStream bitInput(in);
            BitOutputStream bitOutput(out);
            Result<CompressionStats> result = codec(bitInput, bitOutput, verbose);
            if (!result.success()) {
                return forwardError<std::vector<uint8_t>>(result);
            }
        }

        const std::string bytes = out.str();
        return makeResult<std::vector<uint8_t>>(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }

    void discardOutput(const std::string& outputPath, Result<CompressionStats>& result)
    {
        std::error_code errorCode;
        std::filesystem::remove(outputPath, errorCode);
        if (errorCode) {
            result.addWarning("Could not remove partial output " + outputPath + ": " + errorCode.message());
        }
    }

    Result<CompressionStats> runOnFiles(
        StreamCodec codec,
        const std::string& inputPath,
        const std::string& outputPath,
        bool verbose
    ) {
        std::error_code errorCode;
        if (std::filesystem::exists(outputPath, errorCode)
            && std::filesystem::equivalent(inputPath, outputPath, errorCode)) {
            return makeError<CompressionStats>(
                ErrorCode::IoError,
                "Input and output refer to the same file: " + inputPath
            );
        }

        if (!std::filesystem::is_regular_file(inputPath, errorCode)) {
            return makeError<CompressionStats>(ErrorCode::IoError, "Input is not a regular file: " + inputPath);
        }

        std::ifstream in(inputPath, std::ios::binary);
        if (!in) {
            return makeError<CompressionStats>(ErrorCode::IoError, "Cannot open input file " + inputPath);
        }
        std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return makeError<CompressionStats>(ErrorCode::IoError, "Cannot open output file " + outputPath);
        }

        Result<CompressionStats> result;
        {
            BitInputStream bitInput(in);
            BitOutputStream bitOutput(out);
            result = codec(bitInput, bitOutput, verbose);
        }
        out.close();

        if (!result.success()) {
            discardOutput(outputPath, result);
        }
        return result;
    }
}

Result<std::vector<uint8_t>> huffcpp::algorithms::Huffman::compress(
    const std::vector<uint8_t>& input,
    bool verbose
) {
    return runOnBuffer(&Encoder::compress, input, verbose);
}

Result<std::vector<uint8_t>> huffcpp::algorithms::Huffman::decompress(
    const std::vector<uint8_t>& input,
    bool verbose
) {
    return runOnBuffer(&Decoder::decompress, input, verbose);
}

Result<huffcpp::algorithms::CompressionStats> huffcpp::algorithms::Huffman::compressFile(
    const std::string& inputPath,
    const std::string& outputPath,
    bool verbose
) {
    return runOnFiles(&Encoder::compress, inputPath, outputPath, verbose);
}

Result<huffcpp::algorithms::CompressionStats> huffcpp::algorithms::Huffman::decompressFile(
    const std::string& inputPath,
    const std::string& outputPath,
    bool verbose
) {
    return runOnFiles(&Decoder::decompress, inputPath, outputPath, verbose);
}
