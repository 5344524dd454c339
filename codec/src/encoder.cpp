#include <cborkit/encoder.hpp>
#include <cborkit/cbor_wrapper.hpp>
#include <cborkit/error.hpp>
#include <cborkit/utils.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <exception>
#include <iterator>
#include <limits>
#include <string>

namespace cborkit
{

namespace
{

const Integer& uint64_limit()
{
    static const Integer limit(std::numeric_limits<std::uint64_t>::max());
    return limit;
}

std::uint64_t checked_count(const Integer& count, std::string_view what)
{
    if (count < 0 || count > uint64_limit())
        throw ValueOutOfRangeError(std::string(what) + " " + count.str() + " is out of range [0, 2^64 - 1]");
    return count.convert_to<std::uint64_t>();
}

}  // namespace

void Encoder::write_uint(std::uint64_t value)
{
    libcbor::encode_uint(m_buffer, value);
}

void Encoder::write_negint(std::uint64_t value)
{
    libcbor::encode_negint(m_buffer, value);
}

void Encoder::write_int(const Integer& value)
{
    if (value >= 0)
    {
        if (value <= uint64_limit())
        {
            write_uint(value.convert_to<std::uint64_t>());
            return;
        }
        Bytes magnitude;
        boost::multiprecision::export_bits(value, std::back_inserter(magnitude), 8);
        libcbor::encode_tag(m_buffer, tag::UNSIGNED_BIGNUM);
        libcbor::encode_bytestring(m_buffer, magnitude);
        return;
    }

    // CBOR stores a negative integer n as -1 - n.
    const Integer encoded = -1 - value;
    if (encoded <= uint64_limit())
    {
        write_negint(encoded.convert_to<std::uint64_t>());
        return;
    }
    Bytes magnitude;
    boost::multiprecision::export_bits(encoded, std::back_inserter(magnitude), 8);
    libcbor::encode_tag(m_buffer, tag::NEGATIVE_BIGNUM);
    libcbor::encode_bytestring(m_buffer, magnitude);
}

void Encoder::write_float(double value)
{
    libcbor::encode_double(m_buffer, value);
}

void Encoder::write_bytes(std::span<const byte_t> value)
{
    libcbor::encode_bytestring(m_buffer, value);
}

void Encoder::write_text(std::string_view value)
{
    libcbor::encode_string(m_buffer, value);
}

void Encoder::write_array_start(std::uint64_t count)
{
    libcbor::encode_array_start(m_buffer, count);
}

void Encoder::write_array_start(const Integer& count)
{
    write_array_start(checked_count(count, "array size"));
}

void Encoder::write_map_start(std::uint64_t count)
{
    libcbor::encode_map_start(m_buffer, count);
}

void Encoder::write_map_start(const Integer& count)
{
    write_map_start(checked_count(count, "map size"));
}

void Encoder::write_tag(std::uint64_t tag)
{
    libcbor::encode_tag(m_buffer, tag);
}

void Encoder::write_tag(const Integer& tag)
{
    write_tag(checked_count(tag, "tag"));
}

void Encoder::write_null()
{
    libcbor::encode_null(m_buffer);
}

void Encoder::write_undefined()
{
    libcbor::encode_undef(m_buffer);
}

void Encoder::write_bool(bool value)
{
    libcbor::encode_bool(m_buffer, value);
}

void Encoder::write_indef_bytes_start()
{
    libcbor::encode_indef_bytestring_start(m_buffer);
    m_open_indefinite.push_back(Type::IndefBytes);
}

void Encoder::write_indef_text_start()
{
    libcbor::encode_indef_string_start(m_buffer);
    m_open_indefinite.push_back(Type::IndefStr);
}

void Encoder::write_indef_array_start()
{
    libcbor::encode_indef_array_start(m_buffer);
    m_open_indefinite.push_back(Type::IndefArray);
}

void Encoder::write_indef_map_start()
{
    libcbor::encode_indef_map_start(m_buffer);
    m_open_indefinite.push_back(Type::IndefMap);
}

void Encoder::write_break()
{
    if (m_open_indefinite.empty())
        throw MalformedInputError("break written without an open indefinite-length container");
    libcbor::encode_break(m_buffer);
    m_open_indefinite.pop_back();
}

void Encoder::write_data_item(const Value& value)
{
    const std::size_t initial_size = m_buffer.size();
    try
    {
        write_value(value);
    }
    catch (const std::exception& e)
    {
        logger()->debug("write_data_item discarded {} bytes: {}", m_buffer.size() - initial_size, e.what());
        m_buffer.resize(initial_size);
        throw;
    }
}

void Encoder::write_value(const Value& value)
{
    switch (value.kind())
    {
    case Value::Kind::Null:
        write_null();
        return;
    case Value::Kind::Bool:
        write_bool(value.get<bool>());
        return;
    case Value::Kind::Integer:
        write_int(value.get<Integer>());
        return;
    case Value::Kind::Float:
        write_float(value.get<double>());
        return;
    case Value::Kind::Bytes:
        write_bytes(value.get<Bytes>());
        return;
    case Value::Kind::Text:
        write_text(value.get<Text>());
        return;
    case Value::Kind::Array:
    {
        const Array& array = value.get<Array>();
        write_array_start(static_cast<std::uint64_t>(array.size()));
        for (const Value& item : array)
            write_value(item);
        return;
    }
    case Value::Kind::Map:
    {
        const Map& map = value.get<Map>();
        write_map_start(static_cast<std::uint64_t>(map.size()));
        for (const MapEntry& entry : map)
        {
            write_value(entry.key);
            write_value(entry.value);
        }
        return;
    }
    case Value::Kind::Undefined:
    case Value::Kind::Tagged:
    case Value::Kind::Timestamp:
        break;
    }
    throw TypeMismatchError("unsupported type: " + std::string(to_string(value.kind())));
}

std::span<const byte_t> Encoder::get_encoded_data() const noexcept
{
    return m_buffer;
}

std::size_t Encoder::open_indefinite_depth() const noexcept
{
    return m_open_indefinite.size();
}

void Encoder::reset() noexcept
{
    m_buffer.clear();
    m_open_indefinite.clear();
}

}  // namespace cborkit
