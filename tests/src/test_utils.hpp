#ifndef CBORKIT_TESTS_TEST_UTILS_HPP_
#define CBORKIT_TESTS_TEST_UTILS_HPP_

#include <cborkit/decoder.hpp>
#include <cborkit/encoder.hpp>
#include <cborkit/types.hpp>
#include <cborkit/value.hpp>

#include <span>
#include <stdexcept>
#include <utility>

namespace cborkit::test
{

inline Bytes encoded(const Encoder& encoder)
{
    std::span<const byte_t> data = encoder.get_encoded_data();
    return Bytes(data.begin(), data.end());
}

inline Bytes encode(const Value& value)
{
    Encoder encoder;
    encoder.write_data_item(value);
    return encoded(encoder);
}

// Decodes exactly one data item spanning the whole input.
inline Value decode(std::span<const byte_t> data, DecoderOptions options = {})
{
    Decoder decoder(data, std::move(options));
    Value value = decoder.pop_next_data_item();
    if (decoder.get_remaining_bytes_len() != 0)
        throw std::runtime_error("trailing bytes after data item");
    return value;
}

}  // namespace cborkit::test

#endif  // CBORKIT_TESTS_TEST_UTILS_HPP_
