#include <cborkit/shaped_writer.hpp>
#include <cborkit/error.hpp>
#include <cborkit/utils.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>
#include <vector>

namespace cborkit
{

namespace
{

[[noreturn]] void throw_mismatch(ShapeType type, const Value& value)
{
    std::string message = fmt::format("shape {} does not accept a value of kind {}", to_string(type), to_string(value.kind()));
    logger()->debug("{}", message);
    throw ShapeMismatchError(message);
}

}  // namespace

ShapedWriter::ShapedWriter(Encoder& encoder, ScalarConverter converter)
    : m_encoder(encoder)
    , m_converter(std::move(converter))
{
}

void ShapedWriter::write(const Value& value, const Shape& shape)
{
    const ShapeType type = parse_shape_type(shape.type_name());
    if (value.is_null())
    {
        m_encoder.write_null();
        return;
    }

    switch (type)
    {
    case ShapeType::List:
        write_list(value, shape);
        return;
    case ShapeType::Map:
        write_map(value, shape);
        return;
    case ShapeType::Structure:
        write_structure(value, shape);
        return;
    case ShapeType::Timestamp:
        write_timestamp(value);
        return;
    default:
        write_scalar(type, value);
        return;
    }
}

void ShapedWriter::write_scalar(ShapeType type, const Value& value)
{
    switch (type)
    {
    case ShapeType::Integer:
    case ShapeType::Long:
        if (value.is<Integer>())
            return m_encoder.write_int(value.get<Integer>());
        break;
    case ShapeType::Float:
    case ShapeType::Double:
        if (value.is<double>())
            return m_encoder.write_float(value.get<double>());
        if (value.is<Integer>())
            return m_encoder.write_float(value.get<Integer>().convert_to<double>());
        break;
    case ShapeType::Boolean:
        if (value.is<bool>())
            return m_encoder.write_bool(value.get<bool>());
        break;
    case ShapeType::String:
        if (value.is<Text>())
            return m_encoder.write_text(value.get<Text>());
        break;
    case ShapeType::Blob:
        if (value.is<Bytes>())
            return m_encoder.write_bytes(value.get<Bytes>());
        if (value.is<Text>())
        {
            const Text& text = value.get<Text>();
            return m_encoder.write_bytes({ reinterpret_cast<const byte_t*>(text.data()), text.size() });
        }
        break;
    default:
        break;
    }
    throw_mismatch(type, value);
}

// Always tag 1 with an 8-byte float, whatever numeric kind the seconds have.
void ShapedWriter::write_timestamp(const Value& value)
{
    const Value converted = m_converter ? m_converter(value) : value;

    double seconds = 0.0;
    if (converted.is<Timestamp>())
        seconds = converted.get<Timestamp>().time_since_epoch().count();
    else if (converted.is<double>())
        seconds = converted.get<double>();
    else if (converted.is<Integer>())
        seconds = converted.get<Integer>().convert_to<double>();
    else
        throw_mismatch(ShapeType::Timestamp, converted);

    m_encoder.write_tag(tag::EPOCH_TIME);
    m_encoder.write_float(seconds);
}

void ShapedWriter::write_list(const Value& value, const Shape& shape)
{
    if (!value.is<Array>())
        throw_mismatch(ShapeType::List, value);

    const Shape& member = shape.member();
    const Array& array = value.get<Array>();
    m_encoder.write_array_start(static_cast<std::uint64_t>(array.size()));
    for (const Value& item : array)
        write(item, member);
}

void ShapedWriter::write_map(const Value& value, const Shape& shape)
{
    if (!value.is<Map>())
        throw_mismatch(ShapeType::Map, value);

    const Shape& key_shape = shape.key();
    const Shape& value_shape = shape.value();
    const Map& map = value.get<Map>();
    m_encoder.write_map_start(static_cast<std::uint64_t>(map.size()));
    for (const MapEntry& entry : map)
    {
        write(entry.key, key_shape);
        write(entry.value, value_shape);
    }
}

void ShapedWriter::write_structure(const Value& value, const Shape& shape)
{
    if (!value.is<Map>())
        throw_mismatch(ShapeType::Structure, value);

    // The map head carries the member count, so absent members are
    // filtered out before anything is written.
    struct PresentMember
    {
        const Text* name;
        const Value* value;
        const Shape* shape;
    };
    std::vector<PresentMember> present;

    for (const MapEntry& entry : value.get<Map>())
    {
        if (!entry.key.is<Text>())
            throw_mismatch(ShapeType::Structure, entry.key);
        const Text& name = entry.key.get<Text>();
        const Shape* member_shape = shape.find_member(name);
        if (member_shape == nullptr)
        {
            logger()->debug("structure has no member {}", name);
            throw ShapeMismatchError("structure has no member " + name);
        }
        if (!entry.value.is_null())
            present.push_back({ &name, &entry.value, member_shape });
    }

    m_encoder.write_map_start(static_cast<std::uint64_t>(present.size()));
    for (const PresentMember& member : present)
    {
        m_encoder.write_text(shape.get_serialization_name(*member.name));
        write(*member.value, *member.shape);
    }
}

void write_data_item_shaped(Encoder& encoder, const Value& value, const Shape& shape,
                            const ScalarConverter& converter)
{
    ShapedWriter writer(encoder, converter);
    writer.write(value, shape);
}

}  // namespace cborkit
