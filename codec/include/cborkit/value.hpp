#ifndef CBORKIT_CODEC_VALUE_HPP_
#define CBORKIT_CODEC_VALUE_HPP_

#include <cborkit/codec/export.h>
#include <cborkit/types.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cborkit
{

using Integer = boost::multiprecision::cpp_int;
using Text = std::string;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::duration<double>>;

struct Null
{
    bool operator==(const Null&) const noexcept = default;
};

struct Undefined
{
    bool operator==(const Undefined&) const noexcept = default;
};

class Value;
struct MapEntry;

using Array = std::vector<Value>;
using Map = std::vector<MapEntry>;  // insertion order is preserved

// A tag number with the item it wraps, kept when the decoder has no
// interpretation for the tag.
struct CBORKIT_CODEC_EXPORT Tagged
{
    std::uint64_t tag = 0;
    std::shared_ptr<const Value> item;

    bool operator==(const Tagged& other) const;
};

// Decoded CBOR data item, also the dynamically-typed input of
// Encoder::write_data_item.
class CBORKIT_CODEC_EXPORT Value
{
public:
    // Same order as the alternatives of Storage.
    enum class Kind
    {
        Null = 0,
        Undefined,
        Bool,
        Integer,
        Float,
        Bytes,
        Text,
        Array,
        Map,
        Tagged,
        Timestamp,
    };

    using Storage = std::variant<Null, Undefined, bool, Integer, double, Bytes, Text, Array, Map, Tagged, Timestamp>;

    Value() noexcept = default;
    Value(const Value&) = default;
    Value& operator=(const Value&) = default;
    Value(Value&&) noexcept = default;
    Value& operator=(Value&&) noexcept = default;
    ~Value() = default;

    inline Value(Null) noexcept;
    inline Value(Undefined) noexcept;
    inline Value(bool value) noexcept;
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    inline Value(T value);
    inline Value(Integer value);
    inline Value(double value) noexcept;
    inline Value(Bytes value) noexcept;
    inline Value(Text value) noexcept;
    inline Value(const char* value);
    inline Value(std::string_view value);
    inline Value(Array value) noexcept;
    inline Value(Map value) noexcept;
    inline Value(Tagged value) noexcept;
    inline Value(Timestamp value) noexcept;

    [[nodiscard]] static Value tagged(std::uint64_t tag, Value item);

    [[nodiscard]] inline Kind kind() const noexcept;
    [[nodiscard]] inline bool is_null() const noexcept;

    template <typename T>
    [[nodiscard]] inline bool is() const noexcept;

    // Throw TypeMismatchError when the value holds another kind.
    template <typename T>
    [[nodiscard]] inline const T& get() const;
    template <typename T>
    [[nodiscard]] inline T& get();

    [[nodiscard]] inline const Storage& storage() const noexcept;

    bool operator==(const Value& other) const;

private:
    Storage m_storage;

    [[noreturn]] void throw_kind_mismatch(Kind requested) const;
};

struct MapEntry
{
    Value key;
    Value value;

    bool operator==(const MapEntry&) const = default;
};

[[nodiscard]] CBORKIT_CODEC_EXPORT std::string_view to_string(Value::Kind kind) noexcept;

// RFC 8949 diagnostic notation.
CBORKIT_CODEC_EXPORT std::ostream& operator<<(std::ostream& output, const Value& value);
[[nodiscard]] CBORKIT_CODEC_EXPORT std::string to_diagnostic(const Value& value);

}  // namespace cborkit

#include "value.ipp"

#endif  // CBORKIT_CODEC_VALUE_HPP_
