#include <cborkit/error.hpp>

namespace cborkit
{

std::string_view to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::TypeMismatch:      return "type mismatch";
    case ErrorKind::ValueOutOfRange:   return "value out of range";
    case ErrorKind::MalformedInput:    return "malformed input";
    case ErrorKind::UnsupportedTag:    return "unsupported tag";
    case ErrorKind::ShapeMismatch:     return "shape mismatch";
    case ErrorKind::ShapeConfig:       return "shape configuration";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& error_message)
    : std::runtime_error(error_message)
    , kind(kind)
{
}

Error::~Error() = default;

TypeMismatchError::TypeMismatchError(const std::string& error_message)
    : Error(ErrorKind::TypeMismatch, error_message)
{
}

TypeMismatchError::TypeMismatchError(ErrorKind kind, const std::string& error_message)
    : Error(kind, error_message)
{
}

TypeMismatchError::~TypeMismatchError() = default;

ValueOutOfRangeError::ValueOutOfRangeError(const std::string& error_message)
    : Error(ErrorKind::ValueOutOfRange, error_message)
{
}

ValueOutOfRangeError::~ValueOutOfRangeError() = default;

MalformedInputError::MalformedInputError(const std::string& error_message)
    : Error(ErrorKind::MalformedInput, error_message)
{
}

MalformedInputError::~MalformedInputError() = default;

UnsupportedTagError::UnsupportedTagError(const std::string& error_message)
    : Error(ErrorKind::UnsupportedTag, error_message)
{
}

UnsupportedTagError::~UnsupportedTagError() = default;

ShapeMismatchError::ShapeMismatchError(const std::string& error_message)
    : TypeMismatchError(ErrorKind::ShapeMismatch, error_message)
{
}

ShapeMismatchError::~ShapeMismatchError() = default;

ShapeConfigError::ShapeConfigError(const std::string& error_message)
    : Error(ErrorKind::ShapeConfig, error_message)
{
}

ShapeConfigError::~ShapeConfigError() = default;

}  // namespace cborkit
