#include <cstddef>
#include <new>
#include <stdexcept>
#include <string>

namespace cborkit::libcbor
{

inline Item::Item(cbor_item_t* item) noexcept
    : m_item(item)
{
}

inline Item::Item(std::span<const byte_t> data)
{
    cbor_load_result result;
    m_item = cbor_load(data.data(), data.size(), &result);
    if (result.error.code != CBOR_ERR_NONE)
        throw std::runtime_error("Cbor deserialization error " + std::to_string(result.error.code)
                                 + " at position " + std::to_string(result.error.position));
}

inline Item::Item(const Item& other) noexcept
    : m_item(other.m_item)
{
    if (m_item != nullptr)
        cbor_incref(m_item);
}

inline Item& Item::operator=(const Item& other) noexcept
{
    if (&other == this)
        return *this;

    dtor_impl();

    m_item = other.m_item;
    if (m_item != nullptr)
        cbor_incref(m_item);

    return *this;
}

inline Item::Item(Item&& other) noexcept
    : m_item(other.m_item)
{
    other.m_item = nullptr;
}

inline Item& Item::operator=(Item&& other) noexcept
{
    if (&other == this)
        return *this;

    dtor_impl();

    m_item = other.m_item;
    other.m_item = nullptr;

    return *this;
}

inline Item::~Item()
{
    dtor_impl();
}

inline void Item::dtor_impl()
{
    if (m_item != nullptr)
        cbor_decref(&m_item);
}

inline Item::operator const cbor_item_t*() const noexcept
{
    return m_item;
}

inline Item::operator cbor_item_t*() noexcept
{
    return m_item;
}

namespace detail
{

// Longest head libcbor can produce: initial byte plus 8-byte argument.
inline constexpr std::size_t MAX_HEAD_SIZE = 9;

inline Element& element_from(void* context) noexcept
{
    return *static_cast<Element*>(context);
}

inline void set_head(void* context, Type type, std::uint64_t value = 0) noexcept
{
    Element& element = element_from(context);
    element.type = type;
    element.value = value;
}

// libcbor changed the integer types of the string and collection
// callbacks between releases, so sizes are taken as `auto`.
inline const cbor_callbacks& stream_callbacks()
{
    static const cbor_callbacks callbacks = []()
    {
        cbor_callbacks result = cbor_empty_callbacks;

        result.uint8  = [](void* context, auto value) { set_head(context, Type::UnsignedInt, value); };
        result.uint16 = [](void* context, auto value) { set_head(context, Type::UnsignedInt, value); };
        result.uint32 = [](void* context, auto value) { set_head(context, Type::UnsignedInt, value); };
        result.uint64 = [](void* context, auto value) { set_head(context, Type::UnsignedInt, value); };

        result.negint8  = [](void* context, auto value) { set_head(context, Type::NegativeInt, value); };
        result.negint16 = [](void* context, auto value) { set_head(context, Type::NegativeInt, value); };
        result.negint32 = [](void* context, auto value) { set_head(context, Type::NegativeInt, value); };
        result.negint64 = [](void* context, auto value) { set_head(context, Type::NegativeInt, value); };

        result.byte_string = [](void* context, cbor_data data, auto length)
        {
            set_head(context, Type::Bytes, static_cast<std::uint64_t>(length));
            element_from(context).payload = { data, static_cast<std::size_t>(length) };
        };
        result.string = [](void* context, cbor_data data, auto length)
        {
            set_head(context, Type::Text, static_cast<std::uint64_t>(length));
            element_from(context).payload = { data, static_cast<std::size_t>(length) };
        };
        result.byte_string_start = [](void* context) { set_head(context, Type::IndefBytes); };
        result.string_start      = [](void* context) { set_head(context, Type::IndefStr); };

        result.array_start = [](void* context, auto size)
        {
            set_head(context, Type::ArrayStart, static_cast<std::uint64_t>(size));
        };
        result.map_start = [](void* context, auto size)
        {
            set_head(context, Type::MapStart, static_cast<std::uint64_t>(size));
        };
        result.indef_array_start = [](void* context) { set_head(context, Type::IndefArray); };
        result.indef_map_start   = [](void* context) { set_head(context, Type::IndefMap); };

        result.tag = [](void* context, auto value) { set_head(context, Type::Tag, value); };

        result.float2 = [](void* context, auto value)
        {
            set_head(context, Type::Float);
            element_from(context).float_value = static_cast<double>(value);
        };
        result.float4 = [](void* context, auto value)
        {
            set_head(context, Type::Float);
            element_from(context).float_value = static_cast<double>(value);
        };
        result.float8 = [](void* context, auto value)
        {
            set_head(context, Type::Float);
            element_from(context).float_value = static_cast<double>(value);
        };

        result.boolean = [](void* context, auto value)
        {
            set_head(context, Type::Bool);
            element_from(context).bool_value = value;
        };
        result.null        = [](void* context) { set_head(context, Type::Null); };
        result.undefined   = [](void* context) { set_head(context, Type::Undefined); };
        result.indef_break = [](void* context) { set_head(context, Type::Break); };

        return result;
    }();
    return callbacks;
}

template <typename Encode>
inline void append_head(Bytes& buffer, Encode&& encode)
{
    const std::size_t offset = buffer.size();
    buffer.resize(offset + MAX_HEAD_SIZE);
    const std::size_t written = encode(buffer.data() + offset, MAX_HEAD_SIZE);
    buffer.resize(offset + written);
    if (written == 0)
        throw std::runtime_error("Cbor head encoding error");
}

}  // namespace detail

inline DecodeResult decode_element(std::span<const byte_t> source)
{
    if (source.empty())
        return { DecodeStatus::NEED_MORE_DATA, {} };

    Element element;
    cbor_decoder_result result = cbor_stream_decode(source.data(), source.size(),
                                                    &detail::stream_callbacks(), &element);
    switch (result.status)
    {
    case CBOR_DECODER_FINISHED:
        if (element.type == Type::Unknown)
            return { DecodeStatus::INVALID, {} };
        element.size = result.read;
        return { DecodeStatus::OK, element };
    case CBOR_DECODER_NEDATA:
        return { DecodeStatus::NEED_MORE_DATA, {} };
    default:
        return { DecodeStatus::INVALID, {} };
    }
}

inline void encode_uint(Bytes& buffer, std::uint64_t value)
{
    detail::append_head(buffer, [value](unsigned char* out, std::size_t size)
    {
        return cbor_encode_uint(value, out, size);
    });
}

inline void encode_negint(Bytes& buffer, std::uint64_t value)
{
    detail::append_head(buffer, [value](unsigned char* out, std::size_t size)
    {
        return cbor_encode_negint(value, out, size);
    });
}

inline void encode_double(Bytes& buffer, double value)
{
    detail::append_head(buffer, [value](unsigned char* out, std::size_t size)
    {
        return cbor_encode_double(value, out, size);
    });
}

inline void encode_bool(Bytes& buffer, bool value)
{
    detail::append_head(buffer, [value](unsigned char* out, std::size_t size)
    {
        return cbor_encode_bool(value, out, size);
    });
}

inline void encode_null(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_null);
}

inline void encode_undef(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_undef);
}

inline void encode_tag(Bytes& buffer, std::uint64_t value)
{
    detail::append_head(buffer, [value](unsigned char* out, std::size_t size)
    {
        return cbor_encode_tag(value, out, size);
    });
}

inline void encode_bytestring(Bytes& buffer, std::span<const byte_t> value)
{
    detail::append_head(buffer, [length = value.size()](unsigned char* out, std::size_t size)
    {
        return cbor_encode_bytestring_start(length, out, size);
    });
    buffer.insert(buffer.end(), value.begin(), value.end());
}

inline void encode_string(Bytes& buffer, std::string_view value)
{
    detail::append_head(buffer, [length = value.size()](unsigned char* out, std::size_t size)
    {
        return cbor_encode_string_start(length, out, size);
    });
    const auto* begin = reinterpret_cast<const byte_t*>(value.data());
    buffer.insert(buffer.end(), begin, begin + value.size());
}

inline void encode_array_start(Bytes& buffer, std::uint64_t length)
{
    detail::append_head(buffer, [length](unsigned char* out, std::size_t size)
    {
        return cbor_encode_array_start(static_cast<std::size_t>(length), out, size);
    });
}

inline void encode_map_start(Bytes& buffer, std::uint64_t length)
{
    detail::append_head(buffer, [length](unsigned char* out, std::size_t size)
    {
        return cbor_encode_map_start(static_cast<std::size_t>(length), out, size);
    });
}

inline void encode_indef_bytestring_start(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_indef_bytestring_start);
}

inline void encode_indef_string_start(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_indef_string_start);
}

inline void encode_indef_array_start(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_indef_array_start);
}

inline void encode_indef_map_start(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_indef_map_start);
}

inline void encode_break(Bytes& buffer)
{
    detail::append_head(buffer, cbor_encode_break);
}

}  // namespace cborkit::libcbor
