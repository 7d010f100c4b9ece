#pragma once
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "Helpers/Result.hpp"
#include "HuffCompressor/CompressionStats.hpp"

enum class CliMode
{
    Compress,
    Decompress
};

struct CliOptions
{
    CliMode mode = CliMode::Compress;
    bool verbose = false;
    std::string inputPath;
    std::string outputPath;
};

void printUsage(std::ostream& out, const std::string& programName);

// args excludes the program name
Result<CliOptions> parseCommandLineArgs(const std::vector<std::string>& args);

std::string defaultOutputPath(CliMode mode, const std::string& inputPath);

Result<huffcpp::algorithms::CompressionStats> runCommand(const CliOptions& options);

template<typename T>
int handleResult(
    const Result<T>& result,
    const std::chrono::high_resolution_clock::time_point& start,
    const std::chrono::high_resolution_clock::time_point& end
) {
    for (const auto& warning : result.warnings)
    {
        std::cerr << "Warning: " << warning << std::endl;
    }

    if (!result.success())
    {
        std::cerr << "Error: " << result.getError()
                  << " (" << errorCodeToString(result.getErrorCode()) << ")" << std::endl;
        return 1;
    }

    auto timeDiff = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Success in " << std::to_string(timeDiff * 0.000000001) << " s." << std::endl;
    return 0;
}
