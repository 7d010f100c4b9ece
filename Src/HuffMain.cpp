#include "CliHelpers.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv)
{
    const std::string programName = argc > 0 ? argv[0] : "huffcpp";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    Result<CliOptions> optionsResult = parseCommandLineArgs(args);
    if (!optionsResult.success())
    {
        std::cerr << "Error: " << optionsResult.getError() << std::endl;
        printUsage(std::cerr, programName);
        return 2;
    }
    const CliOptions& options = optionsResult.getValue();

    std::cout << (options.mode == CliMode::Compress ? "Compressing " : "Decompressing ")
              << options.inputPath << " -> " << options.outputPath << std::endl;

    const std::chrono::high_resolution_clock::time_point start = std::chrono::high_resolution_clock::now();
    Result<huffcpp::algorithms::CompressionStats> result = runCommand(options);
    const std::chrono::high_resolution_clock::time_point end = std::chrono::high_resolution_clock::now();

    const int exitCode = handleResult(result, start, end);
    if (exitCode == 0)
    {
        const auto& stats = result.getValue();
        std::cout << "Read " << stats.bitsRead / 8 << " bytes, wrote "
                  << (stats.bitsWritten + 7) / 8 << " bytes." << std::endl;
    }
    return exitCode;
}
