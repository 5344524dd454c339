#ifndef CBORKIT_CODEC_SHAPED_WRITER_HPP_
#define CBORKIT_CODEC_SHAPED_WRITER_HPP_

#include <cborkit/codec/export.h>
#include <cborkit/encoder.hpp>
#include <cborkit/shape.hpp>
#include <cborkit/value.hpp>

#include <functional>

namespace cborkit
{

// Maps a timestamp value to its epoch seconds (Integer or Float).
using ScalarConverter = std::function<Value(const Value&)>;

// Encodes values guided by a Shape. Structure members holding Null are
// left out of the encoded map. A mismatch between value and shape throws
// ShapeMismatchError; bytes already written for enclosing containers
// remain in the encoder.
class CBORKIT_CODEC_EXPORT ShapedWriter
{
public:
    explicit ShapedWriter(Encoder& encoder, ScalarConverter converter = {});

    void write(const Value& value, const Shape& shape);

private:
    Encoder& m_encoder;
    ScalarConverter m_converter;

    void write_scalar(ShapeType type, const Value& value);
    void write_timestamp(const Value& value);
    void write_list(const Value& value, const Shape& shape);
    void write_map(const Value& value, const Shape& shape);
    void write_structure(const Value& value, const Shape& shape);
};

CBORKIT_CODEC_EXPORT void write_data_item_shaped(Encoder& encoder, const Value& value, const Shape& shape,
                                                 const ScalarConverter& converter = {});

}  // namespace cborkit

#endif  // CBORKIT_CODEC_SHAPED_WRITER_HPP_
