#include "test_utils.hpp"

#include <cborkit/decoder.hpp>
#include <cborkit/encoder.hpp>
#include <cborkit/error.hpp>
#include <cborkit/shape.hpp>
#include <cborkit/shaped_writer.hpp>

#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <string_view>

using cborkit::Array;
using cborkit::BasicShape;
using cborkit::Bytes;
using cborkit::Decoder;
using cborkit::Encoder;
using cborkit::Map;
using cborkit::MapEntry;
using cborkit::Type;
using cborkit::Value;
using cborkit::test::decode;
using cborkit::test::encoded;

namespace
{

BasicShape::Ptr user_shape()
{
    return BasicShape::structure({
        { "id", BasicShape::scalar("integer"), "" },
        { "name", BasicShape::scalar("string"), "" },
        { "active", BasicShape::scalar("boolean"), "" },
    });
}

// Hand-written shape that only provides what a list needs.
class StringList : public cborkit::Shape
{
public:
    std::string_view type_name() const override
    {
        return "list";
    }

    const Shape& member() const override
    {
        return m_member;
    }

private:
    class StringShape : public cborkit::Shape
    {
    public:
        std::string_view type_name() const override
        {
            return "string";
        }
    } m_member;
};

class MemberlessList : public cborkit::Shape
{
public:
    std::string_view type_name() const override
    {
        return "list";
    }
};

}  // namespace

TEST_CASE("Absent structure members are dropped", "[shape]")
{
    Value value(Map{ MapEntry{ "id", 123 }, MapEntry{ "name", "Alice" }, MapEntry{ "active", cborkit::Null{} } });

    Encoder encoder;
    cborkit::write_data_item_shaped(encoder, value, *user_shape());

    Value expected(Map{ MapEntry{ "id", 123 }, MapEntry{ "name", "Alice" } });
    REQUIRE(decode(encoder.get_encoded_data()) == expected);
    REQUIRE(encoded(encoder)[0] == 0xa2);
}

TEST_CASE("Structure members are encoded under their serialization names", "[shape]")
{
    BasicShape::Ptr shape = BasicShape::structure({
        { "user_id", BasicShape::scalar("long"), "UserId" },
        { "tags", BasicShape::list(BasicShape::scalar("string")), "" },
    });
    REQUIRE(shape->get_serialization_name("user_id") == "UserId");
    REQUIRE(shape->get_serialization_name("tags") == "tags");

    Value value(Map{ MapEntry{ "user_id", 5 }, MapEntry{ "tags", Value(Array{ "a", "b" }) } });
    Encoder encoder;
    cborkit::write_data_item_shaped(encoder, value, *shape);

    Value expected(Map{ MapEntry{ "UserId", 5 }, MapEntry{ "tags", Value(Array{ "a", "b" }) } });
    REQUIRE(decode(encoder.get_encoded_data()) == expected);
}

TEST_CASE("Timestamps are written as tag 1 with a double", "[shape]")
{
    BasicShape::Ptr shape = BasicShape::scalar("timestamp");
    cborkit::Timestamp moment(std::chrono::duration<double>(1609459200.0));
    Encoder encoder;

    SECTION("converted by the scalar converter")
    {
        cborkit::ScalarConverter converter = [](const Value& value)
        {
            return Value(value.get<cborkit::Timestamp>().time_since_epoch().count());
        };
        cborkit::write_data_item_shaped(encoder, Value(moment), *shape, converter);
    }
    SECTION("time point without a converter")
    {
        cborkit::write_data_item_shaped(encoder, Value(moment), *shape);
    }
    SECTION("integer seconds")
    {
        cborkit::write_data_item_shaped(encoder, Value(1609459200), *shape);
    }

    Bytes data = encoded(encoder);
    REQUIRE(data.size() == 10);
    Decoder decoder(data);
    REQUIRE(decoder.peek_next_type() == Type::Tag);
    REQUIRE(decoder.pop_next_tag_val() == 1);
    REQUIRE(decoder.peek_next_type() == Type::Float);
    REQUIRE(decoder.pop_next_double() == 1609459200.0);
}

TEST_CASE("Lists and maps recurse into their child shapes", "[shape]")
{
    BasicShape::Ptr shape = BasicShape::map(BasicShape::scalar("string"),
                                            BasicShape::list(BasicShape::scalar("double")));
    Value value(Map{ MapEntry{ "b", Value(Array{ 1.5, 2 }) }, MapEntry{ "a", Value(Array{}) } });

    Encoder encoder;
    cborkit::write_data_item_shaped(encoder, value, *shape);

    Value expected(Map{ MapEntry{ "b", Value(Array{ 1.5, 2.0 }) }, MapEntry{ "a", Value(Array{}) } });
    REQUIRE(decode(encoder.get_encoded_data()) == expected);
}

TEST_CASE("Scalar shapes accept their compatible kinds", "[shape]")
{
    Encoder encoder;
    cborkit::write_data_item_shaped(encoder, Value("hi"), *BasicShape::scalar("blob"));
    cborkit::write_data_item_shaped(encoder, Value(Bytes{ 0x01 }), *BasicShape::scalar("blob"));
    cborkit::write_data_item_shaped(encoder, Value(3), *BasicShape::scalar("float"));
    cborkit::write_data_item_shaped(encoder, Value(true), *BasicShape::scalar("boolean"));
    cborkit::write_data_item_shaped(encoder, Value(cborkit::Null{}), *BasicShape::scalar("integer"));

    Decoder decoder(encoder.get_encoded_data());
    REQUIRE(decoder.pop_next_data_item() == Value(Bytes{ 'h', 'i' }));
    REQUIRE(decoder.pop_next_data_item() == Value(Bytes{ 0x01 }));
    REQUIRE(decoder.pop_next_double() == 3.0);
    REQUIRE(decoder.pop_next_bool());
    REQUIRE(decoder.peek_next_type() == Type::Null);
}

TEST_CASE("Custom shape implementations drive the writer", "[shape]")
{
    Encoder encoder;
    cborkit::write_data_item_shaped(encoder, Value(Array{ "x", "y" }), StringList());
    REQUIRE(decode(encoder.get_encoded_data()) == Value(Array{ "x", "y" }));

    Encoder other;
    REQUIRE_THROWS_AS(cborkit::write_data_item_shaped(other, Value(Array{}), MemberlessList()),
                      cborkit::ShapeConfigError);
    REQUIRE(other.get_encoded_data().empty());
}

TEST_CASE("Value and shape mismatches are reported", "[shape]")
{
    Encoder encoder;

    SECTION("list shape with text")
    {
        BasicShape::Ptr shape = BasicShape::list(BasicShape::scalar("integer"));
        REQUIRE_THROWS_AS(cborkit::write_data_item_shaped(encoder, Value("nope"), *shape), cborkit::ShapeMismatchError);
    }
    SECTION("integer shape with a float")
    {
        REQUIRE_THROWS_AS(cborkit::write_data_item_shaped(encoder, Value(1.5), *BasicShape::scalar("integer")),
                          cborkit::TypeMismatchError);
    }
    SECTION("member the structure does not describe")
    {
        Value value(Map{ MapEntry{ "id", 1 }, MapEntry{ "email", "a@b" } });
        REQUIRE_THROWS_AS(cborkit::write_data_item_shaped(encoder, value, *user_shape()), cborkit::ShapeMismatchError);
    }
    SECTION("non-text structure key")
    {
        Value value(Map{ MapEntry{ 1, 1 } });
        REQUIRE_THROWS_AS(cborkit::write_data_item_shaped(encoder, value, *user_shape()), cborkit::ShapeMismatchError);
    }

    REQUIRE(encoder.get_encoded_data().empty());
}

TEST_CASE("Unknown shape types are configuration errors", "[shape]")
{
    REQUIRE(cborkit::parse_shape_type("structure") == cborkit::ShapeType::Structure);
    REQUIRE_THROWS_AS(cborkit::parse_shape_type("decimal"), cborkit::ShapeConfigError);

    Encoder encoder;
    BasicShape::Ptr shape = BasicShape::list(BasicShape::scalar("decimal"));
    REQUIRE_THROWS_AS(cborkit::write_data_item_shaped(encoder, Value(Array{ 1 }), *shape), cborkit::ShapeConfigError);
    REQUIRE(encoded(encoder) == Bytes{ 0x81 });

    REQUIRE_THROWS_AS(BasicShape::scalar("integer")->key(), cborkit::ShapeConfigError);
    REQUIRE_THROWS_AS(BasicShape::scalar("integer")->get_serialization_name("id"), cborkit::ShapeConfigError);
}
