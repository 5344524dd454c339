#include <cborkit/encoder.hpp>
#include <cborkit/utils.hpp>
#include <cborkit/value.hpp>

#include <boost/program_options.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <span>
#include <string>
#include <utility>

static std::mt19937_64 g_prng;

static std::string generate_text(std::size_t t_size)
{
    static std::uniform_int_distribution<int> dist(0x20, 0x7e);
    std::string ans;
    ans.reserve(t_size);
    for (std::size_t i = 0; i < t_size; ++i)
        ans.push_back(static_cast<char>(dist(g_prng)));

    return ans;
}

static cborkit::Bytes generate_bytes(std::size_t t_size)
{
    static std::uniform_int_distribution<int> dist(std::numeric_limits<cborkit::byte_t>::min(),
                                                   std::numeric_limits<cborkit::byte_t>::max());
    cborkit::Bytes ans;
    ans.reserve(t_size);
    for (std::size_t i = 0; i < t_size; ++i)
        ans.push_back(static_cast<cborkit::byte_t>(dist(g_prng)));

    return ans;
}

static cborkit::Value generate_scalar()
{
    static std::uniform_int_distribution<int> kind_dist(0, 7);
    static std::uniform_int_distribution<std::int64_t> int_dist(std::numeric_limits<std::int64_t>::min(),
                                                                std::numeric_limits<std::int64_t>::max());
    static std::uniform_int_distribution<std::size_t> size_dist(0, 64);
    static std::normal_distribution<double> float_dist(0, 1e6);

    switch (kind_dist(g_prng))
    {
    case 0:
        return cborkit::Value(int_dist(g_prng));
    case 1:
        return cborkit::Value(int_dist(g_prng) % 1000);
    case 2:
        return cborkit::Value(float_dist(g_prng));
    case 3:
        return cborkit::Value(generate_text(size_dist(g_prng)));
    case 4:
        return cborkit::Value(generate_bytes(size_dist(g_prng)));
    case 5:
        return cborkit::Value(std::bernoulli_distribution(0.5)(g_prng));
    case 6:
        return cborkit::Value(cborkit::Null{});
    default:
    {
        // beyond 64 bits, so the bignum path gets exercised
        cborkit::Integer value = int_dist(g_prng);
        value *= cborkit::Integer(1) << 70;
        return cborkit::Value(std::move(value));
    }
    }
}

static cborkit::Value generate_item(std::size_t t_depth)
{
    static std::uniform_int_distribution<int> shape_dist(0, 3);
    static std::uniform_int_distribution<std::size_t> width_dist(0, 8);

    if (t_depth == 0)
        return generate_scalar();

    switch (shape_dist(g_prng))
    {
    case 0:
    {
        cborkit::Array array;
        std::size_t width = width_dist(g_prng);
        array.reserve(width);
        for (std::size_t i = 0; i < width; ++i)
            array.push_back(generate_item(t_depth - 1));
        return cborkit::Value(std::move(array));
    }
    case 1:
    {
        cborkit::Map map;
        std::size_t width = width_dist(g_prng);
        map.reserve(width);
        for (std::size_t i = 0; i < width; ++i)
            map.push_back(cborkit::MapEntry{ cborkit::Value(generate_text(8)), generate_item(t_depth - 1) });
        return cborkit::Value(std::move(map));
    }
    default:
        return generate_scalar();
    }
}

int main(int argc, char** argv) try
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    namespace po = boost::program_options;
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,H",                                                          "Print this message")
        ("count,C",     po::value<std::size_t>()->default_value(1000),      "Number of top-level data items")
        ("depth,D",     po::value<std::size_t>()->default_value(4),         "Maximum nesting depth of a data item")
        ("seed,S",      po::value<std::uint64_t>(),                         "Seed of the random generator")
        ("output,O",    po::value<std::string>()->required(),               "Output file name")
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

    std::uint64_t seed = vm.contains("seed") ? vm["seed"].as<std::uint64_t>() : std::random_device{}();
    g_prng.seed(seed);

    std::size_t count = vm["count"].as<std::size_t>();
    std::size_t depth = vm["depth"].as<std::size_t>();
    cborkit::logger()->info("Generating {} data items of depth up to {} with seed {}", count, depth, seed);

    cborkit::Encoder encoder;
    encoder.write_array_start(static_cast<std::uint64_t>(count));
    for (std::size_t i = 0; i < count; ++i)
        encoder.write_data_item(generate_item(depth));

    std::string out_file_name = vm["output"].as<std::string>();
    std::ofstream out_file(out_file_name, std::ios_base::binary);
    if (!out_file.is_open())
        throw std::runtime_error("Error while opening output file");

    std::span<const cborkit::byte_t> data = encoder.get_encoded_data();
    if (!out_file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size())))
        throw std::runtime_error("Error while writing to file");
    cborkit::logger()->info("Wrote {} bytes to \"{}\"", data.size(), out_file_name);
}
catch (const std::exception& e)
{
    cborkit::logger()->critical("{}", e.what());
    return 1;
}
