#include <cborkit/shape.hpp>
#include <cborkit/error.hpp>

#include <array>
#include <utility>

namespace cborkit
{

namespace
{

struct ShapeTypeName
{
    ShapeType type;
    std::string_view name;
};

constexpr std::array<ShapeTypeName, 11> SHAPE_TYPE_NAMES = {{
    { ShapeType::Integer,   "integer" },
    { ShapeType::Long,      "long" },
    { ShapeType::Float,     "float" },
    { ShapeType::Double,    "double" },
    { ShapeType::Boolean,   "boolean" },
    { ShapeType::String,    "string" },
    { ShapeType::Blob,      "blob" },
    { ShapeType::Timestamp, "timestamp" },
    { ShapeType::List,      "list" },
    { ShapeType::Map,       "map" },
    { ShapeType::Structure, "structure" },
}};

[[noreturn]] void throw_no_accessor(const Shape& shape, std::string_view accessor)
{
    throw ShapeConfigError("shape type " + std::string(shape.type_name()) + " has no " + std::string(accessor));
}

}  // namespace

ShapeType parse_shape_type(std::string_view type_name)
{
    for (const ShapeTypeName& entry : SHAPE_TYPE_NAMES)
        if (entry.name == type_name)
            return entry.type;
    throw ShapeConfigError("unsupported shape type: " + std::string(type_name));
}

std::string_view to_string(ShapeType type) noexcept
{
    for (const ShapeTypeName& entry : SHAPE_TYPE_NAMES)
        if (entry.type == type)
            return entry.name;
    return "unknown";
}

Shape::~Shape() = default;

const Shape& Shape::member() const
{
    throw_no_accessor(*this, "member");
}

const Shape& Shape::key() const
{
    throw_no_accessor(*this, "key");
}

const Shape& Shape::value() const
{
    throw_no_accessor(*this, "value");
}

const Shape* Shape::find_member(std::string_view) const
{
    throw_no_accessor(*this, "members");
}

std::string Shape::get_serialization_name(std::string_view) const
{
    throw_no_accessor(*this, "serialization name");
}

BasicShape::BasicShape(std::string type_name)
    : m_type_name(std::move(type_name))
{
}

BasicShape::Ptr BasicShape::scalar(std::string type_name)
{
    return Ptr(new BasicShape(std::move(type_name)));
}

BasicShape::Ptr BasicShape::list(Ptr member)
{
    if (member == nullptr)
        throw ShapeConfigError("list shape requires a member shape");
    auto shape = new BasicShape("list");
    shape->m_member = std::move(member);
    return Ptr(shape);
}

BasicShape::Ptr BasicShape::map(Ptr key, Ptr value)
{
    if (key == nullptr || value == nullptr)
        throw ShapeConfigError("map shape requires key and value shapes");
    auto shape = new BasicShape("map");
    shape->m_key = std::move(key);
    shape->m_value = std::move(value);
    return Ptr(shape);
}

BasicShape::Ptr BasicShape::structure(std::vector<Member> members)
{
    for (const Member& member : members)
        if (member.shape == nullptr)
            throw ShapeConfigError("structure member " + member.name + " has no shape");
    auto shape = new BasicShape("structure");
    shape->m_members = std::move(members);
    return Ptr(shape);
}

std::string_view BasicShape::type_name() const
{
    return m_type_name;
}

const Shape& BasicShape::member() const
{
    if (m_member == nullptr)
        return Shape::member();
    return *m_member;
}

const Shape& BasicShape::key() const
{
    if (m_key == nullptr)
        return Shape::key();
    return *m_key;
}

const Shape& BasicShape::value() const
{
    if (m_value == nullptr)
        return Shape::value();
    return *m_value;
}

const Shape* BasicShape::find_member(std::string_view name) const
{
    if (m_type_name != "structure")
        return Shape::find_member(name);
    const Member* member = lookup(name);
    return member != nullptr ? member->shape.get() : nullptr;
}

std::string BasicShape::get_serialization_name(std::string_view member_name) const
{
    if (m_type_name != "structure")
        return Shape::get_serialization_name(member_name);
    const Member* member = lookup(member_name);
    if (member == nullptr)
        throw ShapeConfigError("structure has no member " + std::string(member_name));
    return member->serialization_name.empty() ? member->name : member->serialization_name;
}

const std::vector<BasicShape::Member>& BasicShape::members() const noexcept
{
    return m_members;
}

const BasicShape::Member* BasicShape::lookup(std::string_view name) const noexcept
{
    for (const Member& member : m_members)
        if (member.name == name)
            return &member;
    return nullptr;
}

}  // namespace cborkit
