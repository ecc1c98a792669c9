/**
 * @file introspect.hpp
 * @brief Type descriptors and type-erased views over live values
 *
 * Every introspectable type is described once by a Shape: its kind, its fields
 * (name, wire name, byte offset, flags, attributes) and a small table of
 * operations. Shapes are produced elsewhere (see describe.hpp), registered in the
 * process-wide Registry and never modified afterwards.
 *
 * A Peek pairs the address of a live value with its Shape. Generic code uses it to
 * inspect a value without knowing its concrete type:
 *   - Kind inspection via shape()
 *   - Checked typed access via get<T>()
 *   - Ordered field traversal via intoStruct().fields()
 *   - Element traversal for lists, maps and options
 *
 * Usage example:
 *   Person ada { "Ada", 36 };
 *   auto peek = Peek::of(ada);
 *   if (peek)
 *       for (auto const& [field, value] : peek->intoStruct()->fields())
 *           std::cout << field.wireName << " = " << value << std::endl;
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include "naming.hpp"

namespace introspect
{

//=============================================================================
// Errors
//=============================================================================

/**
 * @brief Classification of every failure surfaced by this library
 */
enum class ErrorCode
{
    kindResolution,    ///< No shape is registered for the type
    typeMismatch,      ///< A typed access did not match the shape of the value
    unsupportedType,   ///< The serializer has no encoding for this kind or scalar type
    io                 ///< The output stream rejected a write
};

/**
 * @brief A classified error with a human readable description
 *
 * ioError is only set for ErrorCode::io.
 */
struct Error
{
    ErrorCode code;
    std::string message;
    std::error_code ioError = {};
};

/// Result of a fallible operation
template <typename T>
using Result = std::expected<T, Error>;

std::string_view toString(ErrorCode code);
std::ostream& operator<<(std::ostream& o, ErrorCode code);
std::ostream& operator<<(std::ostream& o, Error const& error);

//=============================================================================
// Descriptor model
//=============================================================================

class Shape;
class Peek;

/**
 * @brief The broad category of a described type
 */
enum class Kind
{
    scalar,        ///< Strings, integers, floating point numbers, booleans
    structure,     ///< A struct with named fields
    enumeration,   ///< A C++ enum with named variants
    list,          ///< A sequence of elements of one type
    map,           ///< Ordered key/value pairs
    option,        ///< A value that may be absent
    opaque         ///< Cannot be introspected any further
};

std::string_view toString(Kind kind);
std::ostream& operator<<(std::ostream& o, Kind kind);

/// Bit flags on a field. Flags never influence serialization.
enum class FieldFlags : std::uint32_t
{
    none      = 0,
    sensitive = 1u << 0   ///< The value is replaced by [REDACTED] in debug output
};

constexpr FieldFlags operator|(FieldFlags a, FieldFlags b) noexcept
{
    return static_cast<FieldFlags>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

constexpr bool hasFlag(FieldFlags flags, FieldFlags flag) noexcept
{
    return (static_cast<std::uint32_t>(flags) & static_cast<std::uint32_t>(flag)) != 0;
}

/**
 * @brief Per-field metadata attached by the producer
 */
namespace attribute
{
/// The field holds secret data
struct Sensitive {};

/// Explicit wire name for the field, wins over the container's rename rule
struct Rename { std::string name; };

/// Constructs the field's default value into uninitialized storage of the field's type
struct Default { std::function<void(void*)> provider; };

/// The field is never serialized
struct SkipSerializing {};

/// The field is not serialized if the predicate returns true for the field's value
struct SkipSerializingIf { std::function<bool(void const*)> predicate; };

/// Anything else, passed through verbatim
struct Arbitrary { std::string content; };
} // namespace attribute

using FieldAttribute = std::variant<attribute::Sensitive,
                                    attribute::Rename,
                                    attribute::Default,
                                    attribute::SkipSerializing,
                                    attribute::SkipSerializingIf,
                                    attribute::Arbitrary>;

/**
 * @brief Describes a single field within a structure Shape
 *
 * The shape of the field's type is obtained lazily through a function pointer,
 * avoiding static initialization order issues with recursive/nested types.
 *
 * wireName is final: it is computed once when the descriptor is built.
 */
struct FieldDescriptor
{
    std::string rawName;
    std::string wireName;
    std::size_t offset = 0;
    Shape const& (*shape)() = nullptr;
    FieldFlags flags = FieldFlags::none;
    std::vector<FieldAttribute> attributes = {};
    std::string doc = {};

    bool isSensitive() const { return hasFlag(flags, FieldFlags::sensitive); }

    /// Returns the first attribute of type A, or nullptr
    template <typename A>
    A const* attribute() const;

    /// Returns the explicit rename override, if any
    std::optional<std::string_view> renameOverride() const;

    /**
     * @brief Consults the skip attributes of this field
     *
     * @param fieldData Address of this field's value inside its parent
     * @return true if SkipSerializing is present or a SkipSerializingIf predicate holds
     */
    bool shouldSkip(void const* fieldData) const;
};

/**
 * @brief Operation table of a Shape
 *
 * All operations take the address of a value of the described type. Only debug
 * is mandatory, the rest may be null.
 */
struct ValueVTable
{
    void (*debug)(void const*, std::ostream&) = nullptr;
    void (*construct)(void*) = nullptr;   ///< default-construct into uninitialized storage
    void (*drop)(void*) = nullptr;        ///< destroy in place
    bool (*equals)(void const*, void const*) = nullptr;
};

/// Element access for Kind::list
struct ListDef
{
    std::size_t (*size)(void const*) = nullptr;
    void const* (*item)(void const*, std::size_t) = nullptr;
    Shape const& (*itemShape)() = nullptr;
};

/// Entry access for Kind::map. forEach must visit the entries in a stable order.
struct MapDef
{
    std::size_t (*size)(void const*) = nullptr;
    void (*forEach)(void const*, std::function<void(void const* key, void const* value)> const&) = nullptr;
    Shape const& (*keyShape)() = nullptr;
    Shape const& (*valueShape)() = nullptr;
};

/// Access to the wrapped value of Kind::option
struct OptionDef
{
    bool (*isSome)(void const*) = nullptr;
    void const* (*value)(void const*) = nullptr;
    Shape const& (*innerShape)() = nullptr;
};

struct EnumVariant
{
    std::string name;
    std::int64_t discriminant;
};

/// Variant table for Kind::enumeration
struct EnumDef
{
    std::vector<EnumVariant> variants;
    std::int64_t (*discriminant)(void const*) = nullptr;
};

using ShapeDef = std::variant<std::monostate, ListDef, MapDef, OptionDef, EnumDef>;

/**
 * @brief Immutable description of one type
 *
 * Exactly one Shape exists per described type. It is built by a producer, handed
 * to the Registry and only ever accessed through const references afterwards.
 */
class Shape
{
public:
    std::type_info const* type = &typeid(void);
    std::string typeName;
    std::size_t size = 0;
    std::size_t alignment = 1;
    Kind kind = Kind::opaque;
    std::vector<FieldDescriptor> fields = {};
    RenameRule renameRule = RenameRule::passthrough;
    std::vector<std::string> attributes = {};   ///< container attributes, passed through verbatim
    ValueVTable vtable = {};
    ShapeDef def = {};

    /// Returns the std::type_info identifying the described type
    std::type_info const& typeInfo() const { return *type; }

    /// Returns true if this shape describes T
    template <typename T>
    bool is() const { return *type == typeid(T); }

    /// Finds a field by its wire name
    FieldDescriptor const* field(std::string_view wireName) const;

    /// Returns the kind-specific definition, or nullptr if this shape carries none of type D
    template <typename D>
    D const* definition() const { return std::get_if<D>(&def); }
};

/**
 * @brief Process-wide table of registered shapes keyed by type identity
 *
 * Shapes are added once and never removed or modified, so references handed out
 * stay valid until the process exits.
 */
class Registry
{
public:
    /// Returns the lazily created process-wide registry
    static Registry& instance();

    /**
     * @brief Registers a shape
     *
     * If a shape for the same type is already registered, that shape is kept and
     * returned and the new one is discarded.
     */
    Shape const& add(std::unique_ptr<Shape> shape);

    /// Returns the registered shape for the type, or nullptr
    Shape const* find(std::type_info const& type) const;

    template <typename T>
    Shape const* find() const { return find(typeid(T)); }

    /// Like find() but reports a kind-resolution error if the type is not registered
    Result<std::reference_wrapper<Shape const>> lookup(std::type_info const& type) const;

    std::size_t size() const;

    Registry(Registry const&) = delete;
    Registry& operator=(Registry const&) = delete;

private:
    Registry() = default;

    mutable std::shared_mutex mutex;
    std::unordered_map<std::type_index, std::unique_ptr<Shape const>> shapes;
};

//=============================================================================
// Type-erased views
//=============================================================================

class PeekStruct;
class PeekScalar;
class PeekList;
class PeekMap;
class PeekOption;
class PeekEnum;

/**
 * @brief Borrowed, type-erased view of a value
 *
 * A Peek never owns the value it points at and is only valid as long as that
 * value is alive and not mutated. Peeks are cheap to copy.
 */
class Peek
{
public:
    /// Pairs a raw location with the shape of the value stored there
    Peek(void const* data, Shape const& shape) noexcept : location(data), descriptor(&shape) {}

    /**
     * @brief Creates a view of value using the registered shape of T
     *
     * @return The view, or a kind-resolution error if no shape is registered for T
     */
    template <typename T>
    static Result<Peek> of(T const& value);

    /// Returns the shape of the viewed value
    Shape const& shape() const noexcept { return *descriptor; }

    Kind kind() const noexcept { return descriptor->kind; }

    /// Returns the raw address of the viewed value
    void const* data() const noexcept { return location; }

    /**
     * @brief Checked typed access
     *
     * @return A reference to the value if the shape describes T, a type-mismatch error otherwise
     */
    template <typename T>
    Result<std::reference_wrapper<T const>> get() const;

    Result<PeekStruct> intoStruct() const;
    Result<PeekScalar> intoScalar() const;
    Result<PeekList>   intoList() const;
    Result<PeekMap>    intoMap() const;
    Result<PeekOption> intoOption() const;
    Result<PeekEnum>   intoEnum() const;

private:
    void const* location;
    Shape const* descriptor;
};

/// A field descriptor paired with a view of the field's value
struct FieldPeek
{
    FieldDescriptor const& field;
    Peek value;
};

namespace detail
{
/**
 * @brief Random access by index exposed as an input iterator
 *
 * Owner is a view (a Peek plus a definition pointer) and is held by value, so
 * iterators stay valid after the view they were obtained from is gone. Owner
 * must provide at(std::size_t) returning Value by value.
 */
template <typename Owner, typename Value>
class IndexIterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Value;

    IndexIterator(Owner owner_, std::size_t idx_) : owner(owner_), idx(idx_) {}

    Value operator*() const { return owner.at(idx); }

    IndexIterator& operator++() { ++idx; return *this; }
    IndexIterator operator++(int) { auto tmp = *this; ++idx; return tmp; }

    /// Only iterators of the same range may be compared
    bool operator==(IndexIterator const& o) const { return idx == o.idx; }
    bool operator!=(IndexIterator const& o) const { return ! (*this == o); }

private:
    Owner owner;
    std::size_t idx;
};

/// A begin/end pair over an Owner's indexed elements, holding a copy of the Owner
template <typename Owner, typename Value>
class IndexRange
{
public:
    using iterator = IndexIterator<Owner, Value>;

    IndexRange(Owner owner_, std::size_t count_) : owner(owner_), count(count_) {}

    iterator begin() const { return iterator(owner, 0); }
    iterator end() const { return iterator(owner, count); }
    std::size_t size() const { return count; }
    bool empty() const { return count == 0; }

private:
    Owner owner;
    std::size_t count;
};
} // namespace detail

/**
 * @brief View of a value of Kind::structure
 *
 * Fields are always produced in descriptor order, which is the declaration
 * order of the described struct.
 */
class PeekStruct
{
public:
    using FieldRange = detail::IndexRange<PeekStruct, FieldPeek>;

    explicit PeekStruct(Peek peek_) : peek(peek_) {}

    Shape const& shape() const noexcept { return peek.shape(); }
    Peek const& asPeek() const noexcept { return peek; }

    std::size_t fieldCount() const noexcept { return peek.shape().fields.size(); }

    /**
     * @brief Lazy sequence of (field descriptor, field view) pairs
     *
     * Each call returns a fresh sequence. The range may outlive this PeekStruct,
     * but the views borrow from the same value and are only valid while it is.
     */
    FieldRange fields() const { return FieldRange(*this, fieldCount()); }

    /// Returns the field at idx, or an empty optional if idx is out of range
    std::optional<FieldPeek> field(std::size_t idx) const;

    /// Returns a view of the field with the given wire name
    std::optional<Peek> fieldByName(std::string_view wireName) const;

    /// Unchecked access used by the iterators; idx must be less than fieldCount()
    FieldPeek at(std::size_t idx) const;

private:
    Peek peek;
};

/**
 * @brief View of a value of Kind::scalar
 */
class PeekScalar
{
public:
    explicit PeekScalar(Peek peek_) : peek(peek_) {}

    Shape const& shape() const noexcept { return peek.shape(); }

    template <typename T>
    bool is() const { return peek.shape().is<T>(); }

    template <typename T>
    Result<std::reference_wrapper<T const>> get() const { return peek.get<T>(); }

private:
    Peek peek;
};

/**
 * @brief View of a value of Kind::list
 */
class PeekList
{
public:
    using ItemRange = detail::IndexRange<PeekList, Peek>;

    PeekList(Peek peek_, ListDef const& def_) : peek(peek_), def(&def_) {}

    Shape const& shape() const noexcept { return peek.shape(); }
    Shape const& itemShape() const { return def->itemShape(); }

    std::size_t size() const { return def->size(peek.data()); }
    bool empty() const { return size() == 0; }

    /// Returns the element at idx, or an empty optional if idx is out of range
    std::optional<Peek> item(std::size_t idx) const;

    ItemRange items() const { return ItemRange(*this, size()); }

    /// Unchecked access used by the iterators
    Peek at(std::size_t idx) const { return Peek(def->item(peek.data(), idx), def->itemShape()); }

private:
    Peek peek;
    ListDef const* def;
};

/**
 * @brief View of a value of Kind::map
 */
class PeekMap
{
public:
    PeekMap(Peek peek_, MapDef const& def_) : peek(peek_), def(&def_) {}

    Shape const& shape() const noexcept { return peek.shape(); }

    std::size_t size() const { return def->size(peek.data()); }
    bool empty() const { return size() == 0; }

    /// Returns views of all entries in the order the map definition visits them
    std::vector<std::pair<Peek, Peek>> entries() const;

private:
    Peek peek;
    MapDef const* def;
};

/**
 * @brief View of a value of Kind::option
 */
class PeekOption
{
public:
    PeekOption(Peek peek_, OptionDef const& def_) : peek(peek_), def(&def_) {}

    Shape const& shape() const noexcept { return peek.shape(); }

    bool isSome() const { return def->isSome(peek.data()); }
    bool isNone() const { return ! isSome(); }

    /// Returns a view of the wrapped value, or an empty optional if there is none
    std::optional<Peek> value() const;

private:
    Peek peek;
    OptionDef const* def;
};

/**
 * @brief View of a value of Kind::enumeration
 */
class PeekEnum
{
public:
    PeekEnum(Peek peek_, EnumDef const& def_) : peek(peek_), def(&def_) {}

    Shape const& shape() const noexcept { return peek.shape(); }

    std::int64_t discriminant() const { return def->discriminant(peek.data()); }

    /// Returns the name of the active variant, or an empty optional for undeclared values
    std::optional<std::string_view> variantName() const;

private:
    Peek peek;
    EnumDef const* def;
};

/**
 * @brief Debug output of any viewed value
 *
 * Structs print as "Type { .field = value, ... }" and sensitive fields as
 * [REDACTED].
 */
std::ostream& operator<<(std::ostream& o, Peek const& peek);
} // namespace introspect

#include "introspect.tpp"
