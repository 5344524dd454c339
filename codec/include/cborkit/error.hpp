#ifndef CBORKIT_CODEC_ERROR_HPP_
#define CBORKIT_CODEC_ERROR_HPP_

#include <cborkit/codec/export.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace cborkit
{

enum class ErrorKind
{
    TypeMismatch,
    ValueOutOfRange,
    MalformedInput,
    UnsupportedTag,
    ShapeMismatch,
    ShapeConfig,
};

[[nodiscard]] CBORKIT_CODEC_EXPORT std::string_view to_string(ErrorKind kind) noexcept;

class CBORKIT_CODEC_EXPORT Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& error_message);
    ~Error() override;

    const ErrorKind kind;
};

// Wrong CBOR type for the requested accessor, or a native value the
// encoder cannot represent.
class CBORKIT_CODEC_EXPORT TypeMismatchError : public Error
{
public:
    explicit TypeMismatchError(const std::string& error_message);
    ~TypeMismatchError() override;

protected:
    TypeMismatchError(ErrorKind kind, const std::string& error_message);
};

class CBORKIT_CODEC_EXPORT ValueOutOfRangeError : public Error
{
public:
    explicit ValueOutOfRangeError(const std::string& error_message);
    ~ValueOutOfRangeError() override;
};

// Truncated buffer, invalid head, unmatched break or nesting too deep.
class CBORKIT_CODEC_EXPORT MalformedInputError : public Error
{
public:
    explicit MalformedInputError(const std::string& error_message);
    ~MalformedInputError() override;
};

class CBORKIT_CODEC_EXPORT UnsupportedTagError : public Error
{
public:
    explicit UnsupportedTagError(const std::string& error_message);
    ~UnsupportedTagError() override;
};

class CBORKIT_CODEC_EXPORT ShapeMismatchError : public TypeMismatchError
{
public:
    explicit ShapeMismatchError(const std::string& error_message);
    ~ShapeMismatchError() override;
};

// The shape itself is unusable: unknown type name or a missing accessor.
class CBORKIT_CODEC_EXPORT ShapeConfigError : public Error
{
public:
    explicit ShapeConfigError(const std::string& error_message);
    ~ShapeConfigError() override;
};

}  // namespace cborkit

#endif  // CBORKIT_CODEC_ERROR_HPP_
