#pragma once

namespace introspect
{

namespace detail
{
/// Creates an error for the given code
std::unexpected<Error> makeError(ErrorCode code, std::string message, std::error_code ioError = {});

/// Human readable name for a std::type_info
std::string demangle(std::type_info const& type);

/**
 * @brief Debug output of structs and of composites carrying their definition
 *
 * @return false, with nothing written, for scalars, opaque values and composites
 *         without a definition
 */
bool debugStructure(std::ostream& o, Peek const& peek);

/// "Opaque" for opaque shapes, "<typeName>" otherwise
void debugPlaceholder(std::ostream& o, Shape const& shape);
} // namespace detail

//=============================================================================
// FieldDescriptor implementations
//=============================================================================
template <typename A>
A const* FieldDescriptor::attribute() const
{
    for (auto const& attr : attributes)
        if (auto const* found = std::get_if<A>(&attr))
            return found;

    return nullptr;
}

//=============================================================================
// Peek implementations
//=============================================================================
template <typename T>
Result<Peek> Peek::of(T const& value)
{
    return Registry::instance().lookup(typeid(T)).transform([&value] (Shape const& shape)
    {
        return Peek(std::addressof(value), shape);
    });
}

template <typename T>
Result<std::reference_wrapper<T const>> Peek::get() const
{
    if (! descriptor->is<T>())
        return detail::makeError(ErrorCode::typeMismatch,
                                 "cannot access a value of type " + descriptor->typeName + " as " + detail::demangle(typeid(T)));

    return std::cref(*static_cast<T const*>(location));
}
} // namespace introspect
