#include "unitTestHelpers.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

std::string tempFilePath(const std::string& name)
{
    return (std::filesystem::temp_directory_path() / ("huffcpp_test_" + name)).string();
}

std::string createTempFile(const std::string& name, const std::vector<uint8_t>& content)
{
    std::string filename = tempFilePath(name);
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    file.close();
    return filename;
}

std::vector<uint8_t> readFileBytes(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
}

std::vector<uint8_t> toBytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> genRandomBytes(size_t size, unsigned seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    std::vector<uint8_t> res;
    res.reserve(size);
    for (size_t i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(distribution(generator)));
    }
    return res;
}
