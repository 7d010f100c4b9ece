#include "utilities.hpp"
#include "config.hpp"
#include <benchmark/benchmark.h>
#include <iostream>
#include <string>
#include <vector>

static void BM_Huffman_Compress(benchmark::State& state, const std::string& kind)
{
    const size_t size = static_cast<size_t>(state.range(0));
    const std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, size);

    std::vector<uint8_t> compressed;
    for (auto _ : state)
    {
        compressed = benchmark::utilities::HuffmanCompress(input);
        benchmark::DoNotOptimize(compressed.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(size));
    state.counters["CompressedBytes"] = static_cast<double>(compressed.size());
    state.counters["Ratio"] = size == 0 ? 0.0
        : static_cast<double>(compressed.size()) / static_cast<double>(size);
}

static void BM_Huffman_Decompress(benchmark::State& state, const std::string& kind)
{
    const size_t size = static_cast<size_t>(state.range(0));
    const std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, size);
    const std::vector<uint8_t> compressed = benchmark::utilities::HuffmanCompress(input);

    for (auto _ : state)
    {
        std::vector<uint8_t> restored = benchmark::utilities::HuffmanDecompress(compressed);
        benchmark::DoNotOptimize(restored.data());
        if (restored.size() != size)
        {
            state.SkipWithError("Decompressed size does not match input size");
            break;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(size));
}

int main(int argc, char** argv)
{
    benchmark::Initialize(&argc, argv);

    for (const std::string& kind : InputKinds)
    {
        for (size_t size : InputSizes)
        {
            benchmark::RegisterBenchmark(
                benchmark::utilities::GetBenchmarkName("BM_Huffman_Compress", kind, size).c_str(),
                &BM_Huffman_Compress,
                kind
            )->Arg(static_cast<int64_t>(size))->Iterations(IterationTimes)->Unit(benchmark::kMillisecond);

            benchmark::RegisterBenchmark(
                benchmark::utilities::GetBenchmarkName("BM_Huffman_Decompress", kind, size).c_str(),
                &BM_Huffman_Decompress,
                kind
            )->Arg(static_cast<int64_t>(size))->Iterations(IterationTimes)->Unit(benchmark::kMillisecond);
        }
    }

    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
