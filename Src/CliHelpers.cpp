#include "CliHelpers.hpp"
#include "HuffCompressor/HuffConstants.hpp"
#include "HuffCompressor/Huffman.hpp"

namespace
{
    bool endsWith(const std::string& value, const std::string& suffix)
    {
        return value.size() >= suffix.size()
            && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

void printUsage(std::ostream& out, const std::string& programName)
{
    out << "Usage: " << programName << " [-c|-d] [-v] <input> [output]\n"
        << "  -c  compress (default unless input ends in " << huffcpp::COMPRESSED_EXTENSION << ")\n"
        << "  -d  decompress\n"
        << "  -v  print frequency table, code table and statistics" << std::endl;
}

Result<CliOptions> parseCommandLineArgs(const std::vector<std::string>& args)
{
    CliOptions options;
    bool modeGiven = false;
    std::vector<std::string> positional;

    for (const std::string& arg : args)
    {
        if (arg == "-c" || arg == "--compress") {
            if (modeGiven && options.mode != CliMode::Compress)
                return makeError<CliOptions>(ErrorCode::InvalidArgument, "Options -c and -d are mutually exclusive");
            options.mode = CliMode::Compress;
            modeGiven = true;
        }
        else if (arg == "-d" || arg == "--decompress") {
            if (modeGiven && options.mode != CliMode::Decompress)
                return makeError<CliOptions>(ErrorCode::InvalidArgument, "Options -c and -d are mutually exclusive");
            options.mode = CliMode::Decompress;
            modeGiven = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            return makeError<CliOptions>(ErrorCode::InvalidArgument, "Unknown option " + arg);
        }
        else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return makeError<CliOptions>(ErrorCode::InvalidArgument, "Expected an input path and an optional output path");
    }

    options.inputPath = positional[0];
    if (!modeGiven) {
        options.mode = endsWith(options.inputPath, huffcpp::COMPRESSED_EXTENSION)
            ? CliMode::Decompress
            : CliMode::Compress;
    }
    options.outputPath = positional.size() == 2
        ? positional[1]
        : defaultOutputPath(options.mode, options.inputPath);

    return makeResult<CliOptions>(options);
}

std::string defaultOutputPath(CliMode mode, const std::string& inputPath)
{
    if (mode == CliMode::Compress) {
        return inputPath + huffcpp::COMPRESSED_EXTENSION;
    }

    std::string base = inputPath;
    const std::string compressedExtension = huffcpp::COMPRESSED_EXTENSION;
    if (endsWith(base, compressedExtension)) {
        base.erase(base.size() - compressedExtension.size());
    }
    return base + huffcpp::DECOMPRESSED_EXTENSION;
}

Result<huffcpp::algorithms::CompressionStats> runCommand(const CliOptions& options)
{
    using huffcpp::algorithms::Huffman;

    if (options.mode == CliMode::Compress) {
        return Huffman::compressFile(options.inputPath, options.outputPath, options.verbose);
    }
    return Huffman::decompressFile(options.inputPath, options.outputPath, options.verbose);
}
