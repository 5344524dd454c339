#ifndef CBORKIT_WRAPPERS_CBOR_WRAPPER_HPP_
#define CBORKIT_WRAPPERS_CBOR_WRAPPER_HPP_

#include <cborkit/types.hpp>

#include <cbor.h>

#include <cstdint>
#include <span>
#include <string_view>

namespace cborkit::libcbor
{

// Reference-counted DOM produced by cbor_load. Only used to cross-check
// our streaming codec against libcbor's own decoder.
class Item
{
public:
    explicit inline Item(cbor_item_t* item) noexcept;
    explicit inline Item(std::span<const byte_t> data);
    inline Item(const Item&) noexcept;
    inline Item& operator=(const Item&) noexcept;
    inline Item(Item&&) noexcept;
    inline Item& operator=(Item&&) noexcept;

    inline ~Item();

    inline operator const cbor_item_t*() const noexcept;
    inline operator cbor_item_t*() noexcept;

private:
    cbor_item_t* m_item = nullptr;

    inline void dtor_impl();
};

// One wire element: a head plus, for definite strings, its payload.
struct Element
{
    Type type = Type::Unknown;
    std::uint64_t value = 0;        // uint, raw negint, tag number or container size
    double float_value = 0.0;
    bool bool_value = false;
    std::span<const byte_t> payload;
    std::size_t size = 0;           // bytes occupied on the wire
};

enum class DecodeStatus
{
    OK,
    NEED_MORE_DATA,
    INVALID,
};

struct DecodeResult
{
    DecodeStatus status = DecodeStatus::INVALID;
    Element element;
};

[[nodiscard]] inline DecodeResult decode_element(std::span<const byte_t> source);

inline void encode_uint(Bytes& buffer, std::uint64_t value);
inline void encode_negint(Bytes& buffer, std::uint64_t value);
inline void encode_double(Bytes& buffer, double value);
inline void encode_bool(Bytes& buffer, bool value);
inline void encode_null(Bytes& buffer);
inline void encode_undef(Bytes& buffer);
inline void encode_tag(Bytes& buffer, std::uint64_t value);
inline void encode_bytestring(Bytes& buffer, std::span<const byte_t> value);
inline void encode_string(Bytes& buffer, std::string_view value);
inline void encode_array_start(Bytes& buffer, std::uint64_t size);
inline void encode_map_start(Bytes& buffer, std::uint64_t size);
inline void encode_indef_bytestring_start(Bytes& buffer);
inline void encode_indef_string_start(Bytes& buffer);
inline void encode_indef_array_start(Bytes& buffer);
inline void encode_indef_map_start(Bytes& buffer);
inline void encode_break(Bytes& buffer);

}  // namespace cborkit::libcbor

#include "cbor_wrapper.ipp"

#endif  // CBORKIT_WRAPPERS_CBOR_WRAPPER_HPP_
