#include <cborkit/decoder.hpp>
#include <cborkit/error.hpp>
#include <cborkit/utils.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace cborkit
{

namespace
{

// Declared sizes are only bounded by the remaining input, and every open
// frame reserves at once, so preallocation is capped.
constexpr std::uint64_t MAX_RESERVED_ENTRIES = 1024;

// An open container while pop_next_data_item assembles nested values.
struct Frame
{
    Type type = Type::Unknown;                // head that opened the frame
    std::optional<std::uint64_t> remaining;   // entries left, std::nullopt until a break
    Value value;
    std::optional<Value> key;                 // map key waiting for its value
    std::uint64_t tag = 0;
};

bool is_string_frame(Type type) noexcept
{
    return type == Type::IndefBytes || type == Type::IndefStr;
}

Text to_text(std::span<const byte_t> payload)
{
    return Text(reinterpret_cast<const char*>(payload.data()), payload.size());
}

Integer decode_bignum(const Bytes& magnitude)
{
    Integer value = 0;
    if (!magnitude.empty())
        boost::multiprecision::import_bits(value, magnitude.begin(), magnitude.end(), 8);
    return value;
}

}  // namespace

Decoder::Decoder(std::span<const byte_t> source, DecoderOptions options)
    : m_source(source)
    , m_options(std::move(options))
{
}

template <typename Operation>
auto Decoder::guarded(Operation&& operation) -> decltype(operation())
{
    if (CBORKIT_UNLIKELY(m_failed))
        throw MalformedInputError("decoder is in a failed state after an earlier error");

    const std::size_t cursor = m_cursor;
    try
    {
        return operation();
    }
    catch (const Error& e)
    {
        if (e.kind == ErrorKind::MalformedInput || m_cursor != cursor)
        {
            logger()->debug("decoder failed at offset {}: {}", m_cursor, e.what());
            m_failed = true;
        }
        throw;
    }
    catch (...)
    {
        if (m_cursor != cursor)
            m_failed = true;
        throw;
    }
}

const libcbor::Element& Decoder::peek_element()
{
    if (m_peeked)
        return *m_peeked;

    const std::span<const byte_t> rest = m_source.subspan(m_cursor);
    libcbor::DecodeResult result = libcbor::decode_element(rest);
    switch (result.status)
    {
    case libcbor::DecodeStatus::OK:
        break;
    case libcbor::DecodeStatus::NEED_MORE_DATA:
        if (rest.empty())
            throw MalformedInputError(fmt::format("unexpected end of input at offset {}", m_cursor));
        throw MalformedInputError(fmt::format("truncated item at offset {}", m_cursor));
    case libcbor::DecodeStatus::INVALID:
        throw MalformedInputError(fmt::format("malformed head 0x{:02x} at offset {}", rest.front(), m_cursor));
    }

    m_peeked = result.element;
    return *m_peeked;
}

libcbor::Element Decoder::pop_element()
{
    libcbor::Element element = peek_element();
    m_peeked.reset();
    m_cursor += element.size;
    return element;
}

libcbor::Element Decoder::pop_element(Type expected)
{
    const Type actual = peek_element().type;
    if (actual != expected)
        throw TypeMismatchError(fmt::format("expected {}, got {}", to_string(expected), to_string(actual)));
    return pop_element();
}

// Every entry takes at least one byte, so a declared size larger than the
// rest of the input cannot be satisfied.
void Decoder::check_count(std::uint64_t count, std::uint64_t items_per_entry) const
{
    const std::size_t remaining = m_source.size() - m_cursor;
    if (count > remaining / items_per_entry)
        throw MalformedInputError(fmt::format("declared size {} exceeds the {} remaining bytes", count, remaining));
}

Type Decoder::peek_next_type()
{
    return guarded([this]() { return peek_element().type; });
}

std::size_t Decoder::get_remaining_bytes_len() const noexcept
{
    return m_source.size() - m_cursor;
}

bool Decoder::failed() const noexcept
{
    return m_failed;
}

void Decoder::consume_next_element()
{
    guarded([this]() { pop_element(); });
}

void Decoder::consume_next_data_item()
{
    guarded([this]()
    {
        struct Pending
        {
            Type type;
            std::optional<std::uint64_t> remaining;
        };
        std::vector<Pending> pending;

        do
        {
            if (!pending.empty() && is_string_frame(pending.back().type))
            {
                const Type chunk_type = pending.back().type == Type::IndefBytes ? Type::Bytes : Type::Text;
                const Type actual = peek_element().type;
                if (actual != chunk_type && actual != Type::Break)
                    throw MalformedInputError(fmt::format("{} chunk inside an indefinite {} at offset {}",
                                                          to_string(actual), to_string(chunk_type), m_cursor));
            }

            const libcbor::Element element = pop_element();
            bool completed = true;
            switch (element.type)
            {
            case Type::ArrayStart:
                check_count(element.value, 1);
                if (element.value != 0)
                {
                    pending.push_back({ element.type, element.value });
                    completed = false;
                }
                break;
            case Type::MapStart:
                check_count(element.value, 2);
                if (element.value != 0)
                {
                    pending.push_back({ element.type, 2 * element.value });
                    completed = false;
                }
                break;
            case Type::Tag:
                pending.push_back({ element.type, 1 });
                completed = false;
                break;
            case Type::Break:
                if (pending.empty() || pending.back().remaining.has_value())
                    throw MalformedInputError(fmt::format("unexpected break at offset {}", m_cursor - 1));
                pending.pop_back();
                break;
            default:
                if (is_indefinite_start(element.type))
                {
                    pending.push_back({ element.type, std::nullopt });
                    completed = false;
                }
                break;
            }

            if (completed)
            {
                while (!pending.empty() && pending.back().remaining.has_value())
                {
                    if (--*pending.back().remaining != 0)
                        break;
                    pending.pop_back();
                }
            }
        } while (!pending.empty());
    });
}

std::uint64_t Decoder::pop_next_unsigned_int()
{
    return guarded([this]() { return pop_element(Type::UnsignedInt).value; });
}

std::uint64_t Decoder::pop_next_negative_int()
{
    return guarded([this]() { return pop_element(Type::NegativeInt).value; });
}

double Decoder::pop_next_double()
{
    return guarded([this]() { return pop_element(Type::Float).float_value; });
}

bool Decoder::pop_next_bool()
{
    return guarded([this]() { return pop_element(Type::Bool).bool_value; });
}

std::span<const byte_t> Decoder::pop_next_bytes()
{
    return guarded([this]() { return pop_element(Type::Bytes).payload; });
}

std::string_view Decoder::pop_next_text()
{
    return guarded([this]()
    {
        const std::span<const byte_t> payload = pop_element(Type::Text).payload;
        return std::string_view(reinterpret_cast<const char*>(payload.data()), payload.size());
    });
}

std::optional<std::uint64_t> Decoder::pop_next_array_start()
{
    return guarded([this]() -> std::optional<std::uint64_t>
    {
        if (peek_element().type == Type::IndefArray)
        {
            pop_element();
            return std::nullopt;
        }
        const std::uint64_t count = pop_element(Type::ArrayStart).value;
        check_count(count, 1);
        return count;
    });
}

std::optional<std::uint64_t> Decoder::pop_next_map_start()
{
    return guarded([this]() -> std::optional<std::uint64_t>
    {
        if (peek_element().type == Type::IndefMap)
        {
            pop_element();
            return std::nullopt;
        }
        const std::uint64_t count = pop_element(Type::MapStart).value;
        check_count(count, 2);
        return count;
    });
}

std::uint64_t Decoder::pop_next_tag_val()
{
    return guarded([this]() { return pop_element(Type::Tag).value; });
}

Value Decoder::pop_next_numeric()
{
    return guarded([this]() -> Value
    {
        const libcbor::Element& element = peek_element();
        switch (element.type)
        {
        case Type::UnsignedInt:
            return Value(pop_element().value);
        case Type::NegativeInt:
            return Value(Integer(-1 - Integer(pop_element().value)));
        case Type::Float:
            return Value(pop_element().float_value);
        case Type::Tag:
            if (element.value == tag::UNSIGNED_BIGNUM || element.value == tag::NEGATIVE_BIGNUM)
                return decode_data_item();
            break;
        default:
            break;
        }
        throw TypeMismatchError(fmt::format("expected a numeric item, got {}", to_string(element.type)));
    });
}

Value Decoder::pop_next_data_item()
{
    return guarded([this]() { return decode_data_item(); });
}

Array Decoder::pop_next_list()
{
    return guarded([this]()
    {
        const Type type = peek_element().type;
        if (type != Type::ArrayStart && type != Type::IndefArray)
            throw TypeMismatchError(fmt::format("expected an array, got {}", to_string(type)));
        Value item = decode_data_item();
        return std::move(item.get<Array>());
    });
}

Map Decoder::pop_next_map()
{
    return guarded([this]()
    {
        const Type type = peek_element().type;
        if (type != Type::MapStart && type != Type::IndefMap)
            throw TypeMismatchError(fmt::format("expected a map, got {}", to_string(type)));
        Value item = decode_data_item();
        return std::move(item.get<Map>());
    });
}

Value Decoder::decode_data_item()
{
    std::vector<Frame> stack;

    auto open = [this, &stack](Frame frame)
    {
        if (stack.size() >= m_options.max_nesting_depth)
            throw MalformedInputError(fmt::format("nesting depth exceeds {} at offset {}",
                                                  m_options.max_nesting_depth, m_cursor));
        stack.push_back(std::move(frame));
    };

    while (true)
    {
        const libcbor::Element element = pop_element();
        std::optional<Value> item;

        if (!stack.empty() && is_string_frame(stack.back().type) && element.type != Type::Break)
        {
            Frame& top = stack.back();
            if (top.type == Type::IndefBytes && element.type == Type::Bytes)
            {
                Bytes& bytes = top.value.get<Bytes>();
                bytes.insert(bytes.end(), element.payload.begin(), element.payload.end());
            }
            else if (top.type == Type::IndefStr && element.type == Type::Text)
            {
                top.value.get<Text>().append(reinterpret_cast<const char*>(element.payload.data()),
                                             element.payload.size());
            }
            else
            {
                throw MalformedInputError(fmt::format("{} chunk inside {} at offset {}",
                                                      to_string(element.type), to_string(top.type),
                                                      m_cursor - element.size));
            }
            continue;
        }

        switch (element.type)
        {
        case Type::UnsignedInt:
            item = Value(element.value);
            break;
        case Type::NegativeInt:
            item = Value(Integer(-1 - Integer(element.value)));
            break;
        case Type::Float:
            item = Value(element.float_value);
            break;
        case Type::Bool:
            item = Value(element.bool_value);
            break;
        case Type::Null:
            item = Value(Null{});
            break;
        case Type::Undefined:
            item = Value(Undefined{});
            break;
        case Type::Bytes:
            item = Value(Bytes(element.payload.begin(), element.payload.end()));
            break;
        case Type::Text:
            item = Value(to_text(element.payload));
            break;
        case Type::ArrayStart:
        {
            check_count(element.value, 1);
            if (element.value == 0)
            {
                item = Value(Array{});
                break;
            }
            Array array;
            array.reserve(static_cast<std::size_t>(std::min(element.value, MAX_RESERVED_ENTRIES)));
            open(Frame{ .type = element.type, .remaining = element.value, .value = Value(std::move(array)) });
            break;
        }
        case Type::MapStart:
        {
            check_count(element.value, 2);
            if (element.value == 0)
            {
                item = Value(Map{});
                break;
            }
            Map map;
            map.reserve(static_cast<std::size_t>(std::min(element.value, MAX_RESERVED_ENTRIES)));
            open(Frame{ .type = element.type, .remaining = element.value, .value = Value(std::move(map)) });
            break;
        }
        case Type::IndefArray:
            open(Frame{ .type = element.type, .value = Value(Array{}) });
            break;
        case Type::IndefMap:
            open(Frame{ .type = element.type, .value = Value(Map{}) });
            break;
        case Type::IndefBytes:
            open(Frame{ .type = element.type, .value = Value(Bytes{}) });
            break;
        case Type::IndefStr:
            open(Frame{ .type = element.type, .value = Value(Text{}) });
            break;
        case Type::Tag:
            if (element.value == tag::STANDARD_TIME || element.value == tag::DECIMAL_FRACTION
                || element.value == tag::BIGFLOAT)
                throw UnsupportedTagError("Unsupported tag value: " + std::to_string(element.value));
            open(Frame{ .type = element.type, .remaining = 1, .tag = element.value });
            break;
        case Type::Break:
            if (stack.empty() || stack.back().remaining.has_value())
                throw MalformedInputError(fmt::format("unexpected break at offset {}", m_cursor - 1));
            if (stack.back().key)
                throw MalformedInputError(fmt::format("indefinite map closed after a key at offset {}", m_cursor - 1));
            item = std::move(stack.back().value);
            stack.pop_back();
            break;
        case Type::Unknown:
            throw MalformedInputError(fmt::format("unknown element at offset {}", m_cursor - element.size));
        }

        while (item)
        {
            if (stack.empty())
                return std::move(*item);

            Frame& top = stack.back();
            if (top.type == Type::Tag)
            {
                Value interpreted = interpret_tag(top.tag, std::move(*item));
                stack.pop_back();
                item = std::move(interpreted);
                continue;
            }

            if (top.type == Type::MapStart || top.type == Type::IndefMap)
            {
                if (!top.key)
                {
                    top.key = std::move(*item);
                    item.reset();
                    break;
                }
                top.value.get<Map>().push_back(MapEntry{ std::move(*top.key), std::move(*item) });
                top.key.reset();
            }
            else
            {
                top.value.get<Array>().push_back(std::move(*item));
            }
            item.reset();

            if (top.remaining && --*top.remaining == 0)
            {
                item = std::move(top.value);
                stack.pop_back();
            }
        }
    }
}

Value Decoder::interpret_tag(std::uint64_t tag_value, Value item) const
{
    switch (tag_value)
    {
    case tag::EPOCH_TIME:
        if (!item.is<Integer>() && !item.is<double>())
            throw UnsupportedTagError("tag 1 requires a numeric payload, got " + std::string(to_string(item.kind())));
        if (m_options.epoch_time_converter)
            return m_options.epoch_time_converter(item);
        return Value::tagged(tag_value, std::move(item));
    case tag::UNSIGNED_BIGNUM:
    case tag::NEGATIVE_BIGNUM:
    {
        if (!item.is<Bytes>())
            throw MalformedInputError(fmt::format("bignum tag {} requires a byte string, got {}",
                                                  tag_value, to_string(item.kind())));
        Integer magnitude = decode_bignum(item.get<Bytes>());
        if (tag_value == tag::NEGATIVE_BIGNUM)
            magnitude = -1 - magnitude;
        return Value(std::move(magnitude));
    }
    default:
        return Value::tagged(tag_value, std::move(item));
    }
}

Value epoch_seconds_to_timestamp(const Value& seconds)
{
    double count = 0.0;
    if (seconds.is<Integer>())
        count = seconds.get<Integer>().convert_to<double>();
    else if (seconds.is<double>())
        count = seconds.get<double>();
    else
        throw TypeMismatchError("epoch time must be numeric, got " + std::string(to_string(seconds.kind())));
    return Value(Timestamp(std::chrono::duration<double>(count)));
}

}  // namespace cborkit
