#include "test_utils.hpp"

#include <cborkit/decoder.hpp>
#include <cborkit/encoder.hpp>
#include <cborkit/error.hpp>

#include <catch2/catch.hpp>

#include <chrono>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>

using cborkit::Bytes;
using cborkit::Decoder;
using cborkit::DecoderOptions;
using cborkit::Type;
using cborkit::Value;

TEST_CASE("Peek distinguishes definite and indefinite heads without consuming", "[decoder]")
{
    const Bytes data{ 0x40, 0x5f, 0x60, 0x7f, 0x80, 0x9f, 0xa0, 0xbf, 0xc1, 0xf4, 0xf6, 0xf7, 0xff };
    const Type expected[] = { Type::Bytes, Type::IndefBytes, Type::Text, Type::IndefStr,
                              Type::ArrayStart, Type::IndefArray, Type::MapStart, Type::IndefMap,
                              Type::Tag, Type::Bool, Type::Null, Type::Undefined, Type::Break };

    for (std::size_t i = 0; i < std::size(expected); ++i)
    {
        Decoder decoder(std::span(data).subspan(i));
        REQUIRE(decoder.peek_next_type() == expected[i]);
        REQUIRE(decoder.peek_next_type() == expected[i]);
        REQUIRE(decoder.get_remaining_bytes_len() == data.size() - i);
    }

    const Bytes integers{ 0x18, 0x18, 0x38, 0x63, 0xff };
    Decoder decoder(integers);
    REQUIRE(decoder.peek_next_type() == Type::UnsignedInt);
    decoder.consume_next_element();
    REQUIRE(decoder.peek_next_type() == Type::NegativeInt);
    decoder.consume_next_element();
    REQUIRE(decoder.peek_next_type() == Type::Break);
}

TEST_CASE("Scalar pops return the decoded values", "[decoder]")
{
    cborkit::Encoder encoder;
    encoder.write_int(500);
    encoder.write_int(-100);
    encoder.write_float(2.5);
    encoder.write_bool(true);
    encoder.write_bytes(Bytes{ 0x01, 0x02 });
    encoder.write_text("hello");
    encoder.write_tag(42);
    encoder.write_null();
    Bytes data = cborkit::test::encoded(encoder);

    Decoder decoder(data);
    REQUIRE(decoder.pop_next_unsigned_int() == 500);
    REQUIRE(decoder.pop_next_negative_int() == 99);
    REQUIRE(decoder.pop_next_double() == 2.5);
    REQUIRE(decoder.pop_next_bool());
    std::span<const cborkit::byte_t> bytes = decoder.pop_next_bytes();
    REQUIRE(Bytes(bytes.begin(), bytes.end()) == Bytes{ 0x01, 0x02 });
    REQUIRE(decoder.pop_next_text() == "hello");
    REQUIRE(decoder.pop_next_tag_val() == 42);
    REQUIRE(decoder.peek_next_type() == Type::Null);
    decoder.consume_next_element();
    REQUIRE(decoder.get_remaining_bytes_len() == 0);
}

TEST_CASE("Half and single precision floats are widened", "[decoder]")
{
    const Bytes data{ 0xf9, 0x3c, 0x00, 0xfa, 0x3f, 0xc0, 0x00, 0x00 };
    Decoder decoder(data);
    REQUIRE(decoder.pop_next_double() == 1.0);
    REQUIRE(decoder.pop_next_double() == 1.5);
}

TEST_CASE("A type mismatch on a scalar pop consumes nothing", "[decoder]")
{
    const Bytes data{ 0x20, 0x61, 0x61 };
    Decoder decoder(data);

    REQUIRE_THROWS_AS(decoder.pop_next_unsigned_int(), cborkit::TypeMismatchError);
    REQUIRE_FALSE(decoder.failed());
    REQUIRE(decoder.get_remaining_bytes_len() == 3);
    REQUIRE(decoder.pop_next_negative_int() == 0);

    REQUIRE_THROWS_AS(decoder.pop_next_bytes(), cborkit::TypeMismatchError);
    REQUIRE(decoder.pop_next_text() == "a");
}

TEST_CASE("Container starts report definite counts and flag indefinite ones", "[decoder]")
{
    cborkit::Encoder encoder;
    encoder.write_array_start(2);
    encoder.write_int(1);
    encoder.write_int(2);
    encoder.write_indef_map_start();
    encoder.write_text("k");
    encoder.write_int(3);
    encoder.write_break();
    encoder.write_map_start(0);
    Bytes data = cborkit::test::encoded(encoder);

    Decoder decoder(data);
    REQUIRE(decoder.pop_next_array_start() == 2);
    REQUIRE(decoder.pop_next_unsigned_int() == 1);
    REQUIRE(decoder.pop_next_unsigned_int() == 2);

    std::optional<std::uint64_t> count = decoder.pop_next_map_start();
    REQUIRE_FALSE(count.has_value());
    std::size_t pairs = 0;
    while (decoder.peek_next_type() != Type::Break)
    {
        REQUIRE(decoder.pop_next_text() == "k");
        REQUIRE(decoder.pop_next_unsigned_int() == 3);
        ++pairs;
    }
    decoder.consume_next_element();
    REQUIRE(pairs == 1);

    count = decoder.pop_next_map_start();
    REQUIRE(count.has_value());
    REQUIRE(*count == 0);
}

TEST_CASE("Skipping elements and whole data items", "[decoder]")
{
    // [1, [2, {"a": 3}], 4], "tail"
    const Bytes data{ 0x83, 0x01, 0x82, 0x02, 0xa1, 0x61, 0x61, 0x03, 0x04, 0x64, 0x74, 0x61, 0x69, 0x6c };

    SECTION("one element at a time")
    {
        Decoder decoder(data);
        decoder.consume_next_element();
        REQUIRE(decoder.pop_next_unsigned_int() == 1);
        decoder.consume_next_element();
        REQUIRE(decoder.pop_next_unsigned_int() == 2);
    }
    SECTION("nested item")
    {
        Decoder decoder(data);
        decoder.consume_next_data_item();
        REQUIRE(decoder.pop_next_text() == "tail");
    }
    SECTION("inner item")
    {
        Decoder decoder(data);
        decoder.consume_next_element();
        decoder.consume_next_data_item();
        decoder.consume_next_data_item();
        REQUIRE(decoder.pop_next_unsigned_int() == 4);
    }
    SECTION("indefinite containers and tags")
    {
        const Bytes indefinite{ 0x9f, 0xc1, 0x01, 0x5f, 0x41, 0x00, 0xff, 0xbf, 0x01, 0x02, 0xff, 0xff, 0xf5 };
        Decoder decoder(indefinite);
        decoder.consume_next_data_item();
        REQUIRE(decoder.pop_next_bool());
    }
}

TEST_CASE("Deep nesting is skipped iteratively and capped when materialized", "[decoder]")
{
    const std::size_t depth = 100000;
    Bytes data(depth, 0x81);
    data.push_back(0x00);

    Decoder skipper(data);
    skipper.consume_next_data_item();
    REQUIRE(skipper.get_remaining_bytes_len() == 0);

    Decoder decoder(data);
    REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);

    Bytes nested(1000, 0x81);
    nested.push_back(0x00);
    Decoder limited(nested, DecoderOptions{ .max_nesting_depth = 999 });
    REQUIRE_THROWS_AS(limited.pop_next_data_item(), cborkit::MalformedInputError);
    Decoder allowed(nested, DecoderOptions{ .max_nesting_depth = 1000 });
    REQUIRE(allowed.pop_next_data_item().is<cborkit::Array>());
}

TEST_CASE("Nested sizes bounded only by the remaining input are rejected", "[decoder]")
{
    // Every array declares as many entries as there are bytes after its head.
    const std::size_t depth = 256;
    const std::size_t padding = 4096;
    Bytes data;
    for (std::size_t level = 0; level < depth; ++level)
    {
        const std::uint64_t remaining = (depth - level - 1) * 9 + padding;
        data.push_back(0x9b);
        for (int shift = 56; shift >= 0; shift -= 8)
            data.push_back(static_cast<std::uint8_t>(remaining >> shift));
    }
    data.resize(data.size() + padding, 0x00);

    Decoder decoder(data);
    REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);
    REQUIRE(decoder.failed());

    Decoder skipper(data);
    REQUIRE_THROWS_AS(skipper.consume_next_data_item(), cborkit::MalformedInputError);
}

TEST_CASE("Malformed input fails the decoder for good", "[decoder]")
{
    SECTION("empty input")
    {
        Decoder decoder(std::span<const cborkit::byte_t>{});
        REQUIRE(decoder.get_remaining_bytes_len() == 0);
        REQUIRE_THROWS_AS(decoder.peek_next_type(), cborkit::MalformedInputError);
    }
    SECTION("truncated head")
    {
        const Bytes data{ 0x19, 0x01 };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_unsigned_int(), cborkit::MalformedInputError);
        REQUIRE(decoder.failed());
        REQUIRE_THROWS_AS(decoder.peek_next_type(), cborkit::MalformedInputError);
    }
    SECTION("truncated payload")
    {
        const Bytes data{ 0x82, 0x01, 0x43, 0x00 };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);
        REQUIRE(decoder.failed());
    }
    SECTION("reserved additional information")
    {
        const Bytes data{ 0x1c };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.peek_next_type(), cborkit::MalformedInputError);
    }
    SECTION("unassigned simple value")
    {
        const Bytes data{ 0xf0 };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.consume_next_element(), cborkit::MalformedInputError);
    }
    SECTION("unmatched break")
    {
        const Bytes data{ 0x81, 0xff };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);

        Decoder skipper(data);
        REQUIRE_THROWS_AS(skipper.consume_next_data_item(), cborkit::MalformedInputError);
    }
    SECTION("wrong chunk inside an indefinite string")
    {
        const Bytes data{ 0x5f, 0x61, 0x61, 0xff };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);
    }
    SECTION("declared size beyond the input")
    {
        const Bytes data{ 0x9b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x00 };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);
    }
    SECTION("later calls keep failing")
    {
        const Bytes data{ 0xff, 0x01 };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::MalformedInputError);
        REQUIRE_THROWS_AS(decoder.pop_next_unsigned_int(), cborkit::MalformedInputError);
    }
}

TEST_CASE("Tags are interpreted while materializing data items", "[decoder]")
{
    SECTION("epoch time without a converter is passed through")
    {
        const Bytes data{ 0xc1, 0x18, 0x64 };
        REQUIRE(cborkit::test::decode(data) == Value::tagged(1, Value(100)));
    }
    SECTION("epoch time with a converter")
    {
        cborkit::Encoder encoder;
        encoder.write_tag(1);
        encoder.write_float(1609459200.0);
        Bytes data = cborkit::test::encoded(encoder);
        Value value = cborkit::test::decode(data, DecoderOptions{ .epoch_time_converter = cborkit::epoch_seconds_to_timestamp });
        REQUIRE(value.is<cborkit::Timestamp>());
        REQUIRE(value.get<cborkit::Timestamp>().time_since_epoch().count() == 1609459200.0);
    }
    SECTION("epoch time with a text payload")
    {
        const Bytes data{ 0xc1, 0x61, 0x31 };
        Decoder decoder(data);
        REQUIRE_THROWS_AS(decoder.pop_next_data_item(), cborkit::UnsupportedTagError);
    }
    SECTION("date/time strings are not interpreted")
    {
        // 0("2013-03-21T20:04:00Z")
        const Bytes data{ 0xc0, 0x74, 0x32, 0x30, 0x31, 0x33, 0x2d, 0x30, 0x33, 0x2d, 0x32, 0x31, 0x54,
                          0x32, 0x30, 0x3a, 0x30, 0x34, 0x3a, 0x30, 0x30, 0x5a };
        Decoder decoder(data, DecoderOptions{ .epoch_time_converter = cborkit::epoch_seconds_to_timestamp });
        REQUIRE_THROWS_WITH(decoder.pop_next_data_item(), "Unsupported tag value: 0");
    }
    SECTION("decimal fractions and bigfloats")
    {
        const Bytes fraction{ 0xc4, 0x82, 0x21, 0x19, 0x6a, 0xb3 };
        REQUIRE_THROWS_AS(cborkit::test::decode(fraction), cborkit::UnsupportedTagError);
        const Bytes bigfloat{ 0xc5, 0x82, 0x20, 0x03 };
        REQUIRE_THROWS_AS(cborkit::test::decode(bigfloat), cborkit::UnsupportedTagError);
    }
    SECTION("bignums")
    {
        const Bytes positive{ 0xc2, 0x49, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
        cborkit::Integer expected = cborkit::Integer(1) << 64;
        REQUIRE(cborkit::test::decode(positive) == Value(expected));

        const Bytes negative{ 0xc3, 0x49, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
        expected = -1 - expected;
        REQUIRE(cborkit::test::decode(negative) == Value(expected));

        const Bytes empty{ 0xc2, 0x40 };
        REQUIRE(cborkit::test::decode(empty) == Value(0));
    }
    SECTION("bignum with a text payload")
    {
        const Bytes data{ 0xc2, 0x61, 0x31 };
        REQUIRE_THROWS_AS(cborkit::test::decode(data), cborkit::MalformedInputError);
    }
    SECTION("unknown tags are kept")
    {
        const Bytes data{ 0xd8, 0x20, 0x63, 0x61, 0x62, 0x63 };
        REQUIRE(cborkit::test::decode(data) == Value::tagged(32, Value("abc")));
    }
}

TEST_CASE("Numeric pop accepts integers, floats and bignums", "[decoder]")
{
    const Bytes data{ 0x05, 0x24, 0xfb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                      0xc2, 0x42, 0x01, 0x00, 0x61, 0x61 };
    Decoder decoder(data);
    REQUIRE(decoder.pop_next_numeric() == Value(5));
    REQUIRE(decoder.pop_next_numeric() == Value(-5));
    REQUIRE(decoder.pop_next_numeric() == Value(1.5));
    REQUIRE(decoder.pop_next_numeric() == Value(256));
    REQUIRE_THROWS_AS(decoder.pop_next_numeric(), cborkit::TypeMismatchError);
    REQUIRE(decoder.pop_next_text() == "a");
}

TEST_CASE("List and map pops require the matching container", "[decoder]")
{
    const Bytes data{ 0xa1, 0x01, 0x02, 0x9f, 0x01, 0xff };
    Decoder decoder(data);

    REQUIRE_THROWS_AS(decoder.pop_next_list(), cborkit::TypeMismatchError);
    cborkit::Map map = decoder.pop_next_map();
    REQUIRE(map == cborkit::Map{ cborkit::MapEntry{ 1, 2 } });

    REQUIRE_THROWS_AS(decoder.pop_next_map(), cborkit::TypeMismatchError);
    cborkit::Array array = decoder.pop_next_list();
    REQUIRE(array == cborkit::Array{ Value(1) });
}
