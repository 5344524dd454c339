#include <cborkit/error.hpp>

#include <cstddef>
#include <type_traits>
#include <utility>

namespace cborkit
{

namespace detail
{

template <typename T, typename... Alternatives>
constexpr Value::Kind kind_of_impl(std::variant<Alternatives...>*) noexcept
{
    std::size_t index = 0;
    ((std::is_same_v<T, Alternatives> ? false : (++index, true)) && ...);
    return static_cast<Value::Kind>(index);
}

template <typename T, typename Variant>
constexpr Value::Kind kind_of() noexcept
{
    return kind_of_impl<T>(static_cast<Variant*>(nullptr));
}

}  // namespace detail

inline Value::Value(Null) noexcept
    : m_storage(std::in_place_type<Null>)
{
}

inline Value::Value(Undefined) noexcept
    : m_storage(std::in_place_type<Undefined>)
{
}

inline Value::Value(bool value) noexcept
    : m_storage(std::in_place_type<bool>, value)
{
}

template <std::integral T>
    requires (!std::same_as<T, bool>)
inline Value::Value(T value)
    : m_storage(std::in_place_type<Integer>, value)
{
}

inline Value::Value(Integer value)
    : m_storage(std::in_place_type<Integer>, std::move(value))
{
}

inline Value::Value(double value) noexcept
    : m_storage(std::in_place_type<double>, value)
{
}

inline Value::Value(Bytes value) noexcept
    : m_storage(std::in_place_type<Bytes>, std::move(value))
{
}

inline Value::Value(Text value) noexcept
    : m_storage(std::in_place_type<Text>, std::move(value))
{
}

inline Value::Value(const char* value)
    : m_storage(std::in_place_type<Text>, value)
{
}

inline Value::Value(std::string_view value)
    : m_storage(std::in_place_type<Text>, value)
{
}

inline Value::Value(Array value) noexcept
    : m_storage(std::in_place_type<Array>, std::move(value))
{
}

inline Value::Value(Map value) noexcept
    : m_storage(std::in_place_type<Map>, std::move(value))
{
}

inline Value::Value(Tagged value) noexcept
    : m_storage(std::in_place_type<Tagged>, std::move(value))
{
}

inline Value::Value(Timestamp value) noexcept
    : m_storage(std::in_place_type<Timestamp>, value)
{
}

inline Value::Kind Value::kind() const noexcept
{
    return static_cast<Kind>(m_storage.index());
}

inline bool Value::is_null() const noexcept
{
    return std::holds_alternative<Null>(m_storage);
}

template <typename T>
inline bool Value::is() const noexcept
{
    return std::holds_alternative<T>(m_storage);
}

template <typename T>
inline const T& Value::get() const
{
    const T* value = std::get_if<T>(&m_storage);
    if (value == nullptr)
        throw_kind_mismatch(detail::kind_of<T, Storage>());
    return *value;
}

template <typename T>
inline T& Value::get()
{
    T* value = std::get_if<T>(&m_storage);
    if (value == nullptr)
        throw_kind_mismatch(detail::kind_of<T, Storage>());
    return *value;
}

inline const Value::Storage& Value::storage() const noexcept
{
    return m_storage;
}

}  // namespace cborkit
