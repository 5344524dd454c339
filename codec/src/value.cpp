#include <cborkit/value.hpp>
#include <cborkit/error.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace cborkit
{

bool Tagged::operator==(const Tagged& other) const
{
    if (tag != other.tag)
        return false;
    if (item == nullptr || other.item == nullptr)
        return item == other.item;
    return *item == *other.item;
}

Value Value::tagged(std::uint64_t tag, Value item)
{
    return Value(Tagged{ .tag = tag, .item = std::make_shared<const Value>(std::move(item)) });
}

bool Value::operator==(const Value& other) const
{
    return m_storage == other.m_storage;
}

void Value::throw_kind_mismatch(Kind requested) const
{
    throw TypeMismatchError("expected a value of kind " + std::string(to_string(requested))
                            + ", got " + std::string(to_string(kind())));
}

std::string_view to_string(Value::Kind kind) noexcept
{
    switch (kind)
    {
    case Value::Kind::Null:      return "null";
    case Value::Kind::Undefined: return "undefined";
    case Value::Kind::Bool:      return "bool";
    case Value::Kind::Integer:   return "integer";
    case Value::Kind::Float:     return "float";
    case Value::Kind::Bytes:     return "bytes";
    case Value::Kind::Text:      return "text";
    case Value::Kind::Array:     return "array";
    case Value::Kind::Map:       return "map";
    case Value::Kind::Tagged:    return "tagged";
    case Value::Kind::Timestamp: return "timestamp";
    }
    return "unknown";
}

namespace
{

void write_float(std::ostream& output, double value)
{
    if (std::isnan(value))
    {
        output << "NaN";
        return;
    }
    if (std::isinf(value))
    {
        output << (value < 0 ? "-Infinity" : "Infinity");
        return;
    }

    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".e") == std::string::npos)
        text += ".0";
    output << text;
}

void write_text(std::ostream& output, const Text& text)
{
    output << '"';
    for (char sym : text)
    {
        switch (sym)
        {
        case '"':  output << "\\\""; break;
        case '\\': output << "\\\\"; break;
        case '\n': output << "\\n"; break;
        case '\r': output << "\\r"; break;
        case '\t': output << "\\t"; break;
        default:
            if (static_cast<unsigned char>(sym) < 0x20)
                output << fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(sym)));
            else
                output << sym;
        }
    }
    output << '"';
}

struct DiagnosticWriter
{
    std::ostream& output;

    void operator()(const Null&) const { output << "null"; }
    void operator()(const Undefined&) const { output << "undefined"; }
    void operator()(bool value) const { output << (value ? "true" : "false"); }
    void operator()(const Integer& value) const { output << value; }
    void operator()(double value) const { write_float(output, value); }
    void operator()(const Text& value) const { write_text(output, value); }

    void operator()(const Bytes& value) const
    {
        const char fill = output.fill('0');
        output << "h'" << std::hex;
        for (byte_t byte : value)
            output << std::setw(2) << static_cast<int>(byte);
        output << std::dec << '\'';
        output.fill(fill);
    }

    void operator()(const Array& value) const
    {
        output << '[';
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            if (i != 0)
                output << ", ";
            output << value[i];
        }
        output << ']';
    }

    void operator()(const Map& value) const
    {
        output << '{';
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            if (i != 0)
                output << ", ";
            output << value[i].key << ": " << value[i].value;
        }
        output << '}';
    }

    void operator()(const Tagged& value) const
    {
        output << value.tag << '(';
        if (value.item != nullptr)
            output << *value.item;
        output << ')';
    }

    void operator()(const Timestamp& value) const
    {
        output << tag::EPOCH_TIME << '(';
        write_float(output, value.time_since_epoch().count());
        output << ')';
    }
};

}  // namespace

std::ostream& operator<<(std::ostream& output, const Value& value)
{
    std::visit(DiagnosticWriter{ output }, value.storage());
    return output;
}

std::string to_diagnostic(const Value& value)
{
    std::ostringstream output;
    output << value;
    return output.str();
}

}  // namespace cborkit
