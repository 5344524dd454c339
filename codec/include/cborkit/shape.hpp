#ifndef CBORKIT_CODEC_SHAPE_HPP_
#define CBORKIT_CODEC_SHAPE_HPP_

#include <cborkit/codec/export.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cborkit
{

enum class ShapeType
{
    Integer,
    Long,
    Float,
    Double,
    Boolean,
    String,
    Blob,
    Timestamp,
    List,
    Map,
    Structure,
};

// Throws ShapeConfigError for a name that is not one of the shape types.
[[nodiscard]] CBORKIT_CODEC_EXPORT ShapeType parse_shape_type(std::string_view type_name);
[[nodiscard]] CBORKIT_CODEC_EXPORT std::string_view to_string(ShapeType type) noexcept;

// Read-only description of a value's structure, implemented by callers.
// Only type_name() is mandatory: the other accessors throw
// ShapeConfigError unless a shape of the matching kind overrides them.
class CBORKIT_CODEC_EXPORT Shape
{
public:
    Shape() = default;
    Shape(const Shape&) = default;
    Shape& operator=(const Shape&) = default;
    virtual ~Shape();

    [[nodiscard]] virtual std::string_view type_name() const = 0;

    // Element shape of a list.
    [[nodiscard]] virtual const Shape& member() const;
    // Key and value shapes of a map.
    [[nodiscard]] virtual const Shape& key() const;
    [[nodiscard]] virtual const Shape& value() const;

    // Shape of a structure member, or nullptr for a name the structure lacks.
    [[nodiscard]] virtual const Shape* find_member(std::string_view name) const;
    // Key under which a structure member is encoded.
    [[nodiscard]] virtual std::string get_serialization_name(std::string_view member_name) const;
};

class CBORKIT_CODEC_EXPORT BasicShape final : public Shape
{
public:
    using Ptr = std::shared_ptr<const BasicShape>;

    struct Member
    {
        std::string name;
        Ptr shape;
        std::string serialization_name;  // empty: encoded under name
    };

    [[nodiscard]] static Ptr scalar(std::string type_name);
    [[nodiscard]] static Ptr list(Ptr member);
    [[nodiscard]] static Ptr map(Ptr key, Ptr value);
    [[nodiscard]] static Ptr structure(std::vector<Member> members);

    [[nodiscard]] std::string_view type_name() const override;
    [[nodiscard]] const Shape& member() const override;
    [[nodiscard]] const Shape& key() const override;
    [[nodiscard]] const Shape& value() const override;
    [[nodiscard]] const Shape* find_member(std::string_view name) const override;
    [[nodiscard]] std::string get_serialization_name(std::string_view member_name) const override;

    [[nodiscard]] const std::vector<Member>& members() const noexcept;

private:
    explicit BasicShape(std::string type_name);

    std::string m_type_name;
    Ptr m_member;
    Ptr m_key;
    Ptr m_value;
    std::vector<Member> m_members;

    const Member* lookup(std::string_view name) const noexcept;
};

}  // namespace cborkit

#endif  // CBORKIT_CODEC_SHAPE_HPP_
