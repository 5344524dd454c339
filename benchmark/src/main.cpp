#include <cborkit/cbor_wrapper.hpp>
#include <cborkit/decoder.hpp>
#include <cborkit/encoder.hpp>
#include <cborkit/utils.hpp>
#include <cborkit/value.hpp>

#include <benchmark/benchmark.h>
#include <boost/program_options.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static cborkit::Bytes g_data;
static cborkit::Value g_value;

namespace bm = benchmark;

static void value_to_serialized(bm::State& state)
{
    for (auto _ : state)  // NOLINT clang-analyzer-deadcode.DeadStores
    {
        cborkit::Encoder encoder;
        encoder.write_data_item(g_value);
        bm::DoNotOptimize(encoder.get_encoded_data().data());
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * g_data.size()));
}
BENCHMARK(value_to_serialized);  // NOLINT cert-err58-cpp

static void serialized_to_value(bm::State& state)
{
    for (auto _ : state)  // NOLINT clang-analyzer-deadcode.DeadStores
    {
        cborkit::Decoder decoder(g_data);
        cborkit::Value value = decoder.pop_next_data_item();
        bm::DoNotOptimize(value);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * g_data.size()));
}
BENCHMARK(serialized_to_value);  // NOLINT cert-err58-cpp

static void serialized_skip(bm::State& state)
{
    for (auto _ : state)  // NOLINT clang-analyzer-deadcode.DeadStores
    {
        cborkit::Decoder decoder(g_data);
        decoder.consume_next_data_item();
        bm::DoNotOptimize(decoder.get_remaining_bytes_len());
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * g_data.size()));
}
BENCHMARK(serialized_skip);  // NOLINT cert-err58-cpp

static void serialized_to_libcbor_dom(bm::State& state)
{
    for (auto _ : state)  // NOLINT clang-analyzer-deadcode.DeadStores
    {
        cborkit::libcbor::Item dom(g_data);
        bm::DoNotOptimize(dom);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * g_data.size()));
}
BENCHMARK(serialized_to_libcbor_dom);  // NOLINT cert-err58-cpp

int main(int argc, char** argv) try
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    namespace po = boost::program_options;
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,H",                                                      "Print this message")
        ("input,I",             po::value<std::string>()->required(),   "Filename with test data")
        ("benchmark_filter",    po::value<std::string>(),               "Regex that specifies what benchmarks to run")
        ;

    po::variables_map vm;
    try
    {
        po::store(parse_command_line(argc, argv, desc), vm);
        if (vm.contains("help"))
        {
            std::cout << desc << "\n";
            return 0;
        }
        po::notify(vm);
    }
    catch (const po::error& error)
    {
        std::cerr << "Error while parsing command-line arguments: "
                  << error.what() << "\nPlease use --help to see help message\n";
        return 1;
    }

    std::string in_file_name = vm["input"].as<std::string>();
    std::ifstream in_file(in_file_name, std::ios_base::binary | std::ios_base::ate);
    if (!in_file.is_open())
        throw std::runtime_error("Error while opening input file");
    std::streamsize size = in_file.tellg();
    in_file.seekg(0, std::ios::beg);

    g_data.resize(static_cast<std::size_t>(size));
    cborkit::logger()->info("Reading data from file \"{}\"...", in_file_name);
    if (!in_file.read(reinterpret_cast<char*>(g_data.data()), size))
        throw std::runtime_error("Error while reading from file");

    cborkit::Decoder decoder(g_data);
    g_value = decoder.pop_next_data_item();
    if (decoder.get_remaining_bytes_len() != 0)
        throw std::runtime_error("Test data must hold exactly one top-level data item");
    cborkit::logger()->info("Decoded {} bytes, starting benchmarks...", g_data.size());

    bm::Initialize(&argc, argv);
    bm::RunSpecifiedBenchmarks();
}
catch (const std::exception& e)
{
    cborkit::logger()->critical("{}", e.what());
    return 1;
}
