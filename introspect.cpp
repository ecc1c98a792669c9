#include "introspect.hpp"

#include <algorithm>
#include <cassert>
#include <mutex>
#include <ostream>
#include <boost/core/demangle.hpp>
#include "logging.hpp"

namespace introspect
{
//=============================================================================
// Error implementations
//=============================================================================
namespace detail
{
std::unexpected<Error> makeError(ErrorCode code, std::string message, std::error_code ioError)
{
    return std::unexpected(Error { code, std::move(message), ioError });
}

std::string demangle(std::type_info const& type)
{
    return boost::core::demangle(type.name());
}
} // namespace detail

std::string_view toString(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::kindResolution:  return "kind resolution";
    case ErrorCode::typeMismatch:    return "type mismatch";
    case ErrorCode::unsupportedType: return "unsupported type";
    case ErrorCode::io:              return "io";
    }

    return "unknown";
}

std::ostream& operator<<(std::ostream& o, ErrorCode code)
{
    return o << toString(code);
}

std::ostream& operator<<(std::ostream& o, Error const& error)
{
    o << toString(error.code) << ": " << error.message;

    if (error.ioError)
        o << " (" << error.ioError.message() << ")";

    return o;
}

std::string_view toString(Kind kind)
{
    switch (kind)
    {
    case Kind::scalar:      return "scalar";
    case Kind::structure:   return "struct";
    case Kind::enumeration: return "enum";
    case Kind::list:        return "list";
    case Kind::map:         return "map";
    case Kind::option:      return "option";
    case Kind::opaque:      return "opaque";
    }

    return "unknown";
}

std::ostream& operator<<(std::ostream& o, Kind kind)
{
    return o << toString(kind);
}

//=============================================================================
// FieldDescriptor implementations
//=============================================================================
std::optional<std::string_view> FieldDescriptor::renameOverride() const
{
    if (auto const* rename = attribute<attribute::Rename>())
        return rename->name;

    return {};
}

bool FieldDescriptor::shouldSkip(void const* fieldData) const
{
    for (auto const& attr : attributes)
    {
        if (std::holds_alternative<attribute::SkipSerializing>(attr))
            return true;

        if (auto const* skipIf = std::get_if<attribute::SkipSerializingIf>(&attr))
            if (skipIf->predicate && skipIf->predicate(fieldData))
                return true;
    }

    return false;
}

//=============================================================================
// Shape implementations
//=============================================================================
FieldDescriptor const* Shape::field(std::string_view wireName) const
{
    auto it = std::find_if(fields.begin(), fields.end(), [wireName] (FieldDescriptor const& f) { return f.wireName == wireName; });
    return it != fields.end() ? &(*it) : nullptr;
}

//=============================================================================
// Registry implementations
//=============================================================================
Registry& Registry::instance()
{
    static Registry registry;
    return registry;
}

Shape const& Registry::add(std::unique_ptr<Shape> shape)
{
    assert(shape != nullptr);

    std::unique_lock lock(mutex);
    auto [it, inserted] = shapes.try_emplace(std::type_index(shape->typeInfo()), nullptr);

    if (inserted)
    {
        getLogger("introspect")->debug("registered {} shape {} with {} field(s)", toString(shape->kind), shape->typeName, shape->fields.size());
        it->second = std::move(shape);
    }

    return *it->second;
}

Shape const* Registry::find(std::type_info const& type) const
{
    std::shared_lock lock(mutex);
    auto it = shapes.find(std::type_index(type));
    return it != shapes.end() ? it->second.get() : nullptr;
}

Result<std::reference_wrapper<Shape const>> Registry::lookup(std::type_info const& type) const
{
    if (auto const* shape = find(type))
        return std::cref(*shape);

    return detail::makeError(ErrorCode::kindResolution, "no shape registered for " + detail::demangle(type));
}

std::size_t Registry::size() const
{
    std::shared_lock lock(mutex);
    return shapes.size();
}

//=============================================================================
// Peek implementations
//=============================================================================
namespace
{
template <typename View, typename Def>
Result<View> refine(Peek const& peek, Kind wanted)
{
    if (peek.kind() != wanted)
        return detail::makeError(ErrorCode::typeMismatch,
                                 std::string(peek.shape().typeName).append(" is a ").append(toString(peek.kind()))
                                     .append(", not a ").append(toString(wanted)));

    auto const* def = peek.shape().definition<Def>();

    if (def == nullptr)
        return detail::makeError(ErrorCode::unsupportedType, peek.shape().typeName + " has no " + std::string(toString(wanted)) + " definition");

    return View(peek, *def);
}
} // namespace

Result<PeekStruct> Peek::intoStruct() const
{
    if (kind() != Kind::structure)
        return detail::makeError(ErrorCode::typeMismatch, descriptor->typeName + " is a " + std::string(toString(kind())) + ", not a struct");

    return PeekStruct(*this);
}

Result<PeekScalar> Peek::intoScalar() const
{
    if (kind() != Kind::scalar)
        return detail::makeError(ErrorCode::typeMismatch, descriptor->typeName + " is a " + std::string(toString(kind())) + ", not a scalar");

    return PeekScalar(*this);
}

Result<PeekList>   Peek::intoList() const   { return refine<PeekList, ListDef>(*this, Kind::list); }
Result<PeekMap>    Peek::intoMap() const    { return refine<PeekMap, MapDef>(*this, Kind::map); }
Result<PeekOption> Peek::intoOption() const { return refine<PeekOption, OptionDef>(*this, Kind::option); }
Result<PeekEnum>   Peek::intoEnum() const   { return refine<PeekEnum, EnumDef>(*this, Kind::enumeration); }

//=============================================================================
// Refined view implementations
//=============================================================================
FieldPeek PeekStruct::at(std::size_t idx) const
{
    auto const& field = peek.shape().fields[idx];
    auto const* base = static_cast<std::byte const*>(peek.data());
    return FieldPeek { field, Peek(base + field.offset, field.shape()) };
}

std::optional<FieldPeek> PeekStruct::field(std::size_t idx) const
{
    if (idx >= fieldCount())
        return {};

    return at(idx);
}

std::optional<Peek> PeekStruct::fieldByName(std::string_view wireName) const
{
    auto const& fields = peek.shape().fields;
    auto it = std::find_if(fields.begin(), fields.end(), [wireName] (FieldDescriptor const& f) { return f.wireName == wireName; });

    if (it == fields.end())
        return {};

    return at(static_cast<std::size_t>(std::distance(fields.begin(), it))).value;
}

std::optional<Peek> PeekList::item(std::size_t idx) const
{
    if (idx >= size())
        return {};

    return at(idx);
}

std::vector<std::pair<Peek, Peek>> PeekMap::entries() const
{
    std::vector<std::pair<Peek, Peek>> result;
    result.reserve(size());

    auto const& keyShape = def->keyShape();
    auto const& valueShape = def->valueShape();

    def->forEach(peek.data(), [&] (void const* key, void const* value)
    {
        result.emplace_back(Peek(key, keyShape), Peek(value, valueShape));
    });

    return result;
}

std::optional<Peek> PeekOption::value() const
{
    if (! isSome())
        return {};

    return Peek(def->value(peek.data()), def->innerShape());
}

std::optional<std::string_view> PeekEnum::variantName() const
{
    auto const d = discriminant();
    auto it = std::find_if(def->variants.begin(), def->variants.end(), [d] (EnumVariant const& v) { return v.discriminant == d; });

    if (it == def->variants.end())
        return {};

    return it->name;
}

//=============================================================================
// Debug output
//=============================================================================
namespace detail
{
bool debugStructure(std::ostream& o, Peek const& peek)
{
    auto const& shape = peek.shape();

    switch (shape.kind)
    {
    case Kind::structure:
    {
        auto const view = PeekStruct(peek);
        o << shape.typeName << " {";

        auto first = true;
        for (auto const& [field, value] : view.fields())
        {
            o << (std::exchange(first, false) ? " ." : ", .") << field.wireName << " = ";

            if (field.isSensitive())
                o << "[REDACTED]";
            else
                o << value;
        }

        o << (first ? "}" : " }");
        return true;
    }
    case Kind::list:
        if (auto list = peek.intoList())
        {
            o << "[";
            auto first = true;
            for (auto const& item : list->items())
                o << (std::exchange(first, false) ? "" : ", ") << item;

            o << "]";
            return true;
        }
        break;
    case Kind::map:
        if (auto map = peek.intoMap())
        {
            o << "{";
            auto first = true;
            for (auto const& [key, value] : map->entries())
                o << (std::exchange(first, false) ? "" : ", ") << key << ": " << value;

            o << "}";
            return true;
        }
        break;
    case Kind::option:
        if (auto option = peek.intoOption())
        {
            if (auto value = option->value())
                o << *value;
            else
                o << "None";

            return true;
        }
        break;
    case Kind::enumeration:
        if (auto enumeration = peek.intoEnum())
        {
            if (auto name = enumeration->variantName())
                o << *name;
            else
                o << shape.typeName << "(" << enumeration->discriminant() << ")";

            return true;
        }
        break;
    case Kind::scalar:
    case Kind::opaque:
        break;
    }

    return false;
}

void debugPlaceholder(std::ostream& o, Shape const& shape)
{
    if (shape.kind == Kind::opaque)
        o << "Opaque";
    else
        o << "<" << shape.typeName << ">";
}
} // namespace detail

std::ostream& operator<<(std::ostream& o, Peek const& peek)
{
    if (detail::debugStructure(o, peek))
        return o;

    if (auto const debug = peek.shape().vtable.debug)
        debug(peek.data(), o);
    else
        detail::debugPlaceholder(o, peek.shape());

    return o;
}
} // namespace introspect
