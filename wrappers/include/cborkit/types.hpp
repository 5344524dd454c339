#ifndef CBORKIT_WRAPPERS_TYPES_HPP_
#define CBORKIT_WRAPPERS_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cborkit
{

using byte_t = std::uint8_t;
using Bytes = std::vector<byte_t>;

// Kind of the next element on the wire. Definite and indefinite
// variants of strings and containers are distinct.
enum class Type
{
    Unknown = 0,
    UnsignedInt,
    NegativeInt,
    Float,
    Bytes,
    Text,
    ArrayStart,
    MapStart,
    Tag,
    Bool,
    Null,
    Undefined,
    Break,
    IndefBytes,
    IndefStr,
    IndefArray,
    IndefMap,
};

[[nodiscard]] constexpr std::string_view to_string(Type type) noexcept
{
    switch (type)
    {
    case Type::UnsignedInt: return "UnsignedInt";
    case Type::NegativeInt: return "NegativeInt";
    case Type::Float:       return "Float";
    case Type::Bytes:       return "Bytes";
    case Type::Text:        return "Text";
    case Type::ArrayStart:  return "ArrayStart";
    case Type::MapStart:    return "MapStart";
    case Type::Tag:         return "Tag";
    case Type::Bool:        return "Bool";
    case Type::Null:        return "Null";
    case Type::Undefined:   return "Undefined";
    case Type::Break:       return "Break";
    case Type::IndefBytes:  return "IndefBytes";
    case Type::IndefStr:    return "IndefStr";
    case Type::IndefArray:  return "IndefArray";
    case Type::IndefMap:    return "IndefMap";
    case Type::Unknown:     break;
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_indefinite_start(Type type) noexcept
{
    return type == Type::IndefBytes || type == Type::IndefStr
        || type == Type::IndefArray || type == Type::IndefMap;
}

namespace tag
{

inline constexpr std::uint64_t STANDARD_TIME    = 0;  // RFC 3339 text, not converted
inline constexpr std::uint64_t EPOCH_TIME       = 1;
inline constexpr std::uint64_t UNSIGNED_BIGNUM  = 2;
inline constexpr std::uint64_t NEGATIVE_BIGNUM  = 3;
inline constexpr std::uint64_t DECIMAL_FRACTION = 4;
inline constexpr std::uint64_t BIGFLOAT         = 5;

}  // namespace tag

inline constexpr std::size_t DEFAULT_MAX_NESTING_DEPTH = 512;

}  // namespace cborkit

#endif  // CBORKIT_WRAPPERS_TYPES_HPP_
