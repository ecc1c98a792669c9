/**
 * @file describe.hpp
 * @brief Compile-time production of Shapes
 *
 * A type becomes introspectable by specializing Describe<T> with a static build()
 * function returning its Shape. Shapes for standard types (strings, fixed-width
 * integers, floating point, bool, vectors, optionals and string keyed maps) are
 * provided here. Aggregates are described with describeStruct(), which derives
 * field names, offsets and types with Boost.PFR.
 *
 * Usage example:
 *   struct Person { std::string name; std::uint8_t age; std::string password; };
 *
 *   template <>
 *   struct introspect::Describe<Person>
 *   {
 *       static Shape build()
 *       {
 *           return describeStruct<Person>()
 *               .renameAll(RenameRule::camelCase)
 *               .sensitive("password"_fld)
 *               .build();
 *       }
 *   };
 *
 *   registerShape<Person>();   // Peek::of(person) now succeeds
 */

#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>
#include "introspect.hpp"

namespace introspect
{

/**
 * @brief Customization point producing the Shape of T
 *
 * Specializations provide
 *   static Shape build();
 *
 * build() must not call shapeOf() for other types directly. Field and element
 * shapes are referenced through function pointers and resolved lazily.
 */
template <typename T>
struct Describe;

/// T has a Describe specialization
template <typename T>
concept Describable = requires { { Describe<T>::build() } -> std::same_as<Shape>; };

/**
 * @brief Returns the registered Shape of T
 *
 * The first call builds the shape with Describe<T>::build() and adds it to the
 * Registry. Later calls return the same shape.
 */
template <Describable T>
Shape const& shapeOf();

/// Registers the shape of T so that Peek::of() can resolve it
template <Describable T>
Shape const& registerShape() { return shapeOf<T>(); }

/**
 * @brief Wrapper for values that must stay opaque
 *
 * The shape of Opaque<T> has Kind::opaque and prints as "Opaque". It is
 * rejected by the serializer.
 */
template <typename T>
struct Opaque
{
    T value;
};

//=============================================================================
// Compile-time field names
//=============================================================================

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * Names a field of an aggregate when configuring a StructBuilder. Unknown names
 * are rejected at compile time.
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

/**
 * @brief User-defined literal for naming fields at compile time
 *
 * describeStruct<Person>().sensitive("password"_fld);
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

//=============================================================================
// Shape building blocks
//=============================================================================

/**
 * @brief construct, drop and equals for T
 *
 * construct is only set for default constructible types, equals only for types
 * (and element types) that are equality comparable.
 */
template <typename T>
ValueVTable lifecycleVTable();

/**
 * @brief The default operation table for T
 *
 * Like lifecycleVTable(), plus a debug operation using operator<< if T has one.
 * Otherwise structs and composites print through the generic Peek output and
 * anything else prints its type name.
 */
template <typename T>
ValueVTable defaultVTable();

/// A shape of the given kind carrying T's identity, size, alignment and operations
template <typename T>
Shape basicShape(Kind kind, ValueVTable vtable = defaultVTable<T>());

/**
 * @brief Builds the Shape of an aggregate
 *
 * Field names, declaration order, offsets and field types are derived with
 * Boost.PFR. Every field type must be Describable. T must be default
 * constructible as offsets are measured on a value-initialized instance.
 *
 * All methods naming a field take the field's declared name as a "_fld"
 * literal. Wire names are computed once, in build().
 */
template <typename T>
class StructBuilder
{
public:
    static constexpr auto kFieldCount = boost::pfr::tuple_size_v<T>;
    static constexpr auto kFieldNames = boost::pfr::names_as_array<T>();

    StructBuilder();

    /// Overrides the type name shown in debug output
    StructBuilder& name(std::string typeName);

    /// Case convention applied to every field without an explicit rename
    StructBuilder& renameAll(RenameRule rule);

    template <fixstr::fixed_string Name>
    StructBuilder& rename(CompileTimeString<Name>, std::string wireName);

    template <fixstr::fixed_string Name>
    StructBuilder& sensitive(CompileTimeString<Name>);

    template <fixstr::fixed_string Name>
    StructBuilder& skipSerializing(CompileTimeString<Name>);

    /// Skips the field when predicate(fieldValue) is true
    template <fixstr::fixed_string Name, typename Predicate>
    StructBuilder& skipSerializingIf(CompileTimeString<Name>, Predicate && predicate);

    /// provider() returns the field's default value
    template <fixstr::fixed_string Name, typename Provider>
    StructBuilder& defaultValue(CompileTimeString<Name>, Provider && provider);

    template <fixstr::fixed_string Name>
    StructBuilder& arbitrary(CompileTimeString<Name>, std::string content);

    template <fixstr::fixed_string Name>
    StructBuilder& doc(CompileTimeString<Name>, std::string text);

    /// Replaces the debug operation of the struct
    StructBuilder& debug(void (*fn)(void const*, std::ostream&));

    /// Adds a container attribute
    StructBuilder& attribute(std::string content);

    Shape build() const;

private:
    struct PendingField
    {
        FieldFlags flags = FieldFlags::none;
        std::vector<FieldAttribute> attributes = {};
        std::string doc = {};
    };

    template <fixstr::fixed_string Name>
    static consteval std::size_t indexOf();

    template <fixstr::fixed_string Name>
    PendingField& pendingField();

    static std::array<std::size_t, kFieldCount> offsets();

    template <std::size_t I>
    FieldDescriptor makeField(std::size_t offset) const;

    Shape shape;
    std::array<PendingField, kFieldCount> pending;
};

/// Starts describing the aggregate T
template <typename T>
StructBuilder<T> describeStruct() { return StructBuilder<T>(); }

/**
 * @brief Describes an enum by its named variants
 *
 * describeEnum<Color>({ { "red", Color::red }, { "green", Color::green } });
 */
template <typename E> requires std::is_enum_v<E>
Shape describeEnum(std::initializer_list<std::pair<std::string_view, E>> variants);

/// Describes T as opaque. Debug output prints "Opaque".
template <typename T>
Shape describeOpaque(std::string typeName = {});

//=============================================================================
// Built-in descriptions
//=============================================================================
namespace detail
{
template <typename T>
concept BuiltinScalar = std::same_as<T, std::string>
    || std::same_as<T, std::uint8_t> || std::same_as<T, std::uint16_t> || std::same_as<T, std::uint32_t> || std::same_as<T, std::uint64_t>
    || std::same_as<T, std::int8_t>  || std::same_as<T, std::int16_t>  || std::same_as<T, std::int32_t>  || std::same_as<T, std::int64_t>
    || std::same_as<T, bool> || std::same_as<T, float> || std::same_as<T, double> || std::same_as<T, std::monostate>;
} // namespace detail

template <detail::BuiltinScalar T>
struct Describe<T> { static Shape build(); };

template <typename T> requires (! std::same_as<T, bool>)
struct Describe<std::vector<T>> { static Shape build(); };

template <typename T>
struct Describe<std::optional<T>> { static Shape build(); };

template <typename V>
struct Describe<std::map<std::string, V>> { static Shape build(); };

template <typename T>
struct Describe<Opaque<T>> { static Shape build() { return describeOpaque<Opaque<T>>(); } };
} // namespace introspect

#include "describe.tpp"
