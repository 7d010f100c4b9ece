#pragma once
#include <cstddef>
#include <string>
#include <vector>

const int IterationTimes = 5;

const unsigned RandomSeed = 42;

// input sizes in bytes
const std::vector<size_t> InputSizes = {
    1 << 10,
    1 << 14,
    1 << 17,
    1 << 20,
    1 << 22
};

// "text" draws from a skewed English-like alphabet, "uniform" from all 256 bytes
const std::vector<std::string> InputKinds = {
    "text",
    "uniform"
};

const bool VerboseCodec = false;
