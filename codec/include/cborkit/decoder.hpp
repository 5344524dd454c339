#ifndef CBORKIT_CODEC_DECODER_HPP_
#define CBORKIT_CODEC_DECODER_HPP_

#include <cborkit/codec/export.h>
#include <cborkit/cbor_wrapper.hpp>
#include <cborkit/types.hpp>
#include <cborkit/value.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

namespace cborkit
{

struct DecoderOptions
{
    // Applied to the numeric payload of tag 1 by pop_next_data_item.
    std::function<Value(const Value&)> epoch_time_converter;
    std::size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
};

// Pull decoder over a borrowed byte slice. The slice must outlive the
// decoder and every view returned by pop_next_bytes/pop_next_text.
//
// Malformed input, or any error raised once the cursor has moved, puts
// the decoder into a failed state: every later call throws
// MalformedInputError. A type mismatch on a scalar pop consumes nothing.
class CBORKIT_CODEC_EXPORT Decoder
{
public:
    explicit Decoder(std::span<const byte_t> source, DecoderOptions options = {});

    [[nodiscard]] Type peek_next_type();
    [[nodiscard]] std::size_t get_remaining_bytes_len() const noexcept;
    [[nodiscard]] bool failed() const noexcept;

    // Skips one head together with the payload of a definite string.
    void consume_next_element();
    // Skips one complete data item of any nesting depth.
    void consume_next_data_item();

    std::uint64_t pop_next_unsigned_int();
    // Returns the raw argument n of a negative integer whose value is -1 - n.
    std::uint64_t pop_next_negative_int();
    double pop_next_double();
    bool pop_next_bool();
    std::span<const byte_t> pop_next_bytes();
    std::string_view pop_next_text();

    // std::nullopt for an indefinite-length container: read items until
    // peek_next_type() returns Type::Break, then consume the break.
    std::optional<std::uint64_t> pop_next_array_start();
    std::optional<std::uint64_t> pop_next_map_start();
    std::uint64_t pop_next_tag_val();

    // Unsigned, negative, float or bignum-tagged item as an Integer or Float value.
    Value pop_next_numeric();
    Value pop_next_data_item();
    Array pop_next_list();
    Map pop_next_map();

private:
    std::span<const byte_t> m_source;
    std::size_t m_cursor = 0;
    DecoderOptions m_options;
    std::optional<libcbor::Element> m_peeked;
    bool m_failed = false;

    template <typename Operation>
    auto guarded(Operation&& operation) -> decltype(operation());

    const libcbor::Element& peek_element();
    libcbor::Element pop_element();
    libcbor::Element pop_element(Type expected);
    void check_count(std::uint64_t count, std::uint64_t items_per_entry) const;

    Value decode_data_item();
    Value interpret_tag(std::uint64_t tag_value, Value item) const;
};

// Converts an Integer or Float count of seconds since 1970-01-01T00:00Z.
[[nodiscard]] CBORKIT_CODEC_EXPORT Value epoch_seconds_to_timestamp(const Value& seconds);

}  // namespace cborkit

#endif  // CBORKIT_CODEC_DECODER_HPP_
