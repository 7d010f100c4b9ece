#include "utilities.hpp"
#include "../../Src/HuffCompressor/Huffman.hpp"
#include "config.hpp"
#include <iostream>
#include <random>
#include <stdexcept>

std::vector<uint8_t> benchmark::utilities::GenerateInput(
    const std::string& kind,
    size_t size
) {
    std::mt19937 generator(RandomSeed);
    std::vector<uint8_t> data(size);

    if (kind == "uniform")
    {
        std::uniform_int_distribution<int> distribution(0, 255);
        for (auto& byte : data) byte = static_cast<uint8_t>(distribution(generator));
        return data;
    }

    static const std::string alphabet = "etaoinshrdlcumwfgypbvkjxqz ,.\n";
    std::vector<double> weights;
    for (size_t i = 0; i < alphabet.size(); ++i)
    {
        weights.push_back(1.0 / static_cast<double>(i + 1));
    }
    std::discrete_distribution<size_t> distribution(weights.begin(), weights.end());
    for (auto& byte : data) byte = static_cast<uint8_t>(alphabet[distribution(generator)]);
    return data;
}

std::vector<uint8_t> benchmark::utilities::HuffmanCompress(
    const std::vector<uint8_t>& input
) {
    Result<std::vector<uint8_t>> result = huffcpp::algorithms::Huffman::compress(input, VerboseCodec);
    if (!result.success())
    {
        std::cerr << "Error during compression: " << result.getError() << std::endl;
        throw std::runtime_error(result.getError());
    }
    return result.takeValue();
}

std::vector<uint8_t> benchmark::utilities::HuffmanDecompress(
    const std::vector<uint8_t>& input
) {
    Result<std::vector<uint8_t>> result = huffcpp::algorithms::Huffman::decompress(input, VerboseCodec);
    if (!result.success())
    {
        std::cerr << "Error during decompression: " << result.getError() << std::endl;
        throw std::runtime_error(result.getError());
    }
    return result.takeValue();
}
