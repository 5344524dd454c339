#ifndef CBORKIT_CODEC_ENCODER_HPP_
#define CBORKIT_CODEC_ENCODER_HPP_

#include <cborkit/codec/export.h>
#include <cborkit/types.hpp>
#include <cborkit/value.hpp>

#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cborkit
{

// Streaming CBOR encoder appending items to an owned, growable buffer.
//
// Integers use the shortest head; integers beyond 64 bits fall back to
// bignum tags 2/3. Floats are always written as 8-byte doubles.
// Indefinite-length starts are tracked only to validate write_break();
// an encoder with open indefinite containers still hands out its bytes.
class CBORKIT_CODEC_EXPORT Encoder
{
public:
    Encoder() = default;
    Encoder(const Encoder&) = default;
    Encoder& operator=(const Encoder&) = default;
    Encoder(Encoder&&) noexcept = default;
    Encoder& operator=(Encoder&&) noexcept = default;
    ~Encoder() = default;

    void write_uint(std::uint64_t value);
    // Writes the negative integer -1 - value.
    void write_negint(std::uint64_t value);

    void write_int(const Integer& value);
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    void write_int(T value);

    void write_float(double value);
    void write_bytes(std::span<const byte_t> value);
    void write_text(std::string_view value);

    // Sizes and tags outside [0, 2^64 - 1] throw ValueOutOfRangeError and
    // write nothing.
    void write_array_start(std::uint64_t count);
    void write_array_start(const Integer& count);
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    void write_array_start(T count);
    void write_map_start(std::uint64_t count);
    void write_map_start(const Integer& count);
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    void write_map_start(T count);

    // The caller must follow with exactly one data item.
    void write_tag(std::uint64_t tag);
    void write_tag(const Integer& tag);
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    void write_tag(T tag);

    void write_null();
    void write_undefined();
    void write_bool(bool value);

    void write_indef_bytes_start();
    void write_indef_text_start();
    void write_indef_array_start();
    void write_indef_map_start();
    void write_break();

    // Writes null, bool, integer, float, bytes, text, array and map
    // values recursively. Any other kind fails with TypeMismatchError and
    // leaves the buffer as it was before the call.
    void write_data_item(const Value& value);

    [[nodiscard]] std::span<const byte_t> get_encoded_data() const noexcept;
    [[nodiscard]] std::size_t open_indefinite_depth() const noexcept;

    void reset() noexcept;

private:
    Bytes m_buffer;
    std::vector<Type> m_open_indefinite;

    void write_value(const Value& value);
};

template <std::integral T>
    requires (!std::same_as<T, bool>)
void Encoder::write_int(T value)
{
    if constexpr (std::is_signed_v<T>)
    {
        if (value < 0)
        {
            write_negint(static_cast<std::uint64_t>(-(value + 1)));
            return;
        }
    }
    write_uint(static_cast<std::uint64_t>(value));
}

// Negative built-in arguments go through the range-checked Integer overloads.
template <std::integral T>
    requires (!std::same_as<T, bool>)
void Encoder::write_array_start(T count)
{
    if constexpr (std::is_signed_v<T>)
    {
        if (count < 0)
            return write_array_start(Integer(count));
    }
    write_array_start(static_cast<std::uint64_t>(count));
}

template <std::integral T>
    requires (!std::same_as<T, bool>)
void Encoder::write_map_start(T count)
{
    if constexpr (std::is_signed_v<T>)
    {
        if (count < 0)
            return write_map_start(Integer(count));
    }
    write_map_start(static_cast<std::uint64_t>(count));
}

template <std::integral T>
    requires (!std::same_as<T, bool>)
void Encoder::write_tag(T tag)
{
    if constexpr (std::is_signed_v<T>)
    {
        if (tag < 0)
            return write_tag(Integer(tag));
    }
    write_tag(static_cast<std::uint64_t>(tag));
}

}  // namespace cborkit

#endif  // CBORKIT_CODEC_ENCODER_HPP_
