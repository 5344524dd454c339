#include <cborkit/decoder.hpp>
#include <cborkit/error.hpp>
#include <cborkit/utils.hpp>
#include <cborkit/value.hpp>

#include <spdlog/fmt/fmt.h>
#include <tclap/CmdLine.h>

#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

struct Params
{
    std::string input;
    std::string hex;
    bool elements;
    std::size_t max_depth;
    bool epoch;
};

static std::optional<Params> parse_cmd_line(int argc, char* argv[])
{
    try
    {
        TCLAP::CmdLine cmd("Print CBOR data items in diagnostic notation", ' ', "0.1");

        TCLAP::ValueArg<std::string> input_arg(
            /* short flag */    "i",
            /* long flag */     "input",
            /* description */   "File with CBOR data",
            /* required */      true,
            /* default */       "",
            /* type info */     "path"
        );
        TCLAP::ValueArg<std::string> hex_arg(
            /* short flag */    "x",
            /* long flag */     "hex",
            /* description */   "CBOR data as a hex string",
            /* required */      true,
            /* default */       "",
            /* type info */     "hex"
        );
        cmd.xorAdd(input_arg, hex_arg);

        TCLAP::SwitchArg elements_arg(
            /* short flag */    "e",
            /* long flag */     "elements",
            /* description */   "Print the raw element stream instead of data items",
            /* default */       false
        );
        cmd.add(elements_arg);

        TCLAP::ValueArg<std::size_t> max_depth_arg(
            /* short flag */    "d",
            /* long flag */     "max-depth",
            /* description */   "Maximum nesting depth of a data item",
            /* required */      false,
            /* default */       cborkit::DEFAULT_MAX_NESTING_DEPTH,
            /* type info */     "int"
        );
        cmd.add(max_depth_arg);

        TCLAP::SwitchArg epoch_arg(
            /* short flag */    "t",
            /* long flag */     "epoch",
            /* description */   "Convert tag 1 epoch times to timestamps",
            /* default */       false
        );
        cmd.add(epoch_arg);

        TCLAP::SwitchArg verbose_arg(
            /* short flag */    "v",
            /* long flag */     "verbose",
            /* description */   "Enable debug logging",
            /* default */       false
        );
        cmd.add(verbose_arg);

        cmd.parse(argc, argv);

        if (verbose_arg.getValue())
            cborkit::logger()->set_level(spdlog::level::debug);

        return Params{ .input = input_arg.getValue(),
                       .hex = hex_arg.getValue(),
                       .elements = elements_arg.getValue(),
                       .max_depth = max_depth_arg.getValue(),
                       .epoch = epoch_arg.getValue() };
    }
    catch (TCLAP::ArgException& e)
    {
        cborkit::logger()->error("Parsing command line arguments failed: '{0}' for arg {1}", e.error(), e.argId());
        return std::nullopt;
    }
}

static cborkit::Bytes read_file(const std::string& file_name)
{
    std::ifstream in_file(file_name, std::ios_base::binary | std::ios_base::ate);
    if (!in_file.is_open())
        throw std::runtime_error("Error while opening input file");
    std::streamsize size = in_file.tellg();
    in_file.seekg(0, std::ios::beg);

    cborkit::Bytes buffer(static_cast<std::size_t>(size));
    if (!in_file.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Error while reading from file");
    return buffer;
}

static cborkit::Bytes parse_hex(const std::string& hex)
{
    std::string digits;
    for (char sym : hex)
    {
        if (std::isspace(static_cast<unsigned char>(sym)))
            continue;
        if (!std::isxdigit(static_cast<unsigned char>(sym)))
            throw std::invalid_argument(std::string("Invalid hex digit '") + sym + "'");
        digits.push_back(sym);
    }
    if (digits.size() % 2 != 0)
        throw std::invalid_argument("Hex string has an odd number of digits");

    cborkit::Bytes bytes;
    bytes.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2)
        bytes.push_back(static_cast<cborkit::byte_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    return bytes;
}

static void dump_elements(cborkit::Decoder& decoder, std::size_t total)
{
    using cborkit::Type;

    while (decoder.get_remaining_bytes_len() != 0)
    {
        const std::size_t offset = total - decoder.get_remaining_bytes_len();
        const Type type = decoder.peek_next_type();
        std::string detail;
        switch (type)
        {
        case Type::UnsignedInt:
            detail = std::to_string(decoder.pop_next_unsigned_int());
            break;
        case Type::NegativeInt:
        {
            cborkit::Integer value = -1 - cborkit::Integer(decoder.pop_next_negative_int());
            detail = value.str();
            break;
        }
        case Type::Float:
            detail = cborkit::to_diagnostic(cborkit::Value(decoder.pop_next_double()));
            break;
        case Type::Bool:
            detail = decoder.pop_next_bool() ? "true" : "false";
            break;
        case Type::Bytes:
            detail = fmt::format("{} bytes", decoder.pop_next_bytes().size());
            break;
        case Type::Text:
            detail = cborkit::to_diagnostic(cborkit::Value(decoder.pop_next_text()));
            break;
        case Type::ArrayStart:
            detail = fmt::format("{} items", *decoder.pop_next_array_start());
            break;
        case Type::MapStart:
            detail = fmt::format("{} pairs", *decoder.pop_next_map_start());
            break;
        case Type::Tag:
            detail = std::to_string(decoder.pop_next_tag_val());
            break;
        default:
            decoder.consume_next_element();
            break;
        }
        std::cout << fmt::format("{:>8}  {:<12} {}\n", offset, cborkit::to_string(type), detail);
    }
}

static void dump_data_items(cborkit::Decoder& decoder)
{
    while (decoder.get_remaining_bytes_len() != 0)
        std::cout << decoder.pop_next_data_item() << '\n';
}

int main(int argc, char* argv[]) try
{
    std::ios::sync_with_stdio(false);

    std::optional<Params> params = parse_cmd_line(argc, argv);
    if (!params.has_value())
        return 1;

    cborkit::Bytes data = params->input.empty() ? parse_hex(params->hex) : read_file(params->input);
    cborkit::logger()->debug("Loaded {} bytes", data.size());

    cborkit::DecoderOptions options;
    options.max_nesting_depth = params->max_depth;
    if (params->epoch)
        options.epoch_time_converter = cborkit::epoch_seconds_to_timestamp;

    cborkit::Decoder decoder(data, std::move(options));
    try
    {
        if (params->elements)
            dump_elements(decoder, data.size());
        else
            dump_data_items(decoder);
    }
    catch (const cborkit::Error& e)
    {
        std::cout.flush();
        cborkit::logger()->error("Decoding failed at offset {}: {} ({})", data.size() - decoder.get_remaining_bytes_len(),
                                 e.what(), cborkit::to_string(e.kind));
        return 1;
    }
    return 0;
}
catch (const std::exception& e)
{
    cborkit::logger()->critical("{}", e.what());
    return 1;
}
