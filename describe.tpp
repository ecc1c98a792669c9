#pragma once

namespace introspect
{

namespace detail
{
/// Equality comparable, looking through the standard containers
template <typename T> struct DeepEquality : std::bool_constant<std::equality_comparable<T>> {};
template <typename T> struct DeepEquality<std::vector<T>> : DeepEquality<T> {};
template <typename T> struct DeepEquality<std::optional<T>> : DeepEquality<T> {};
template <typename K, typename V> struct DeepEquality<std::map<K, V>> : std::bool_constant<DeepEquality<K>::value && DeepEquality<V>::value> {};

template <typename T>
concept Streamable = requires (std::ostream& o, T const& v) { o << v; };

template <BuiltinScalar T>
constexpr std::string_view scalarTypeName()
{
    if constexpr (std::same_as<T, std::string>)             return "std::string";
    else if constexpr (std::same_as<T, std::uint8_t>)       return "std::uint8_t";
    else if constexpr (std::same_as<T, std::uint16_t>)      return "std::uint16_t";
    else if constexpr (std::same_as<T, std::uint32_t>)      return "std::uint32_t";
    else if constexpr (std::same_as<T, std::uint64_t>)      return "std::uint64_t";
    else if constexpr (std::same_as<T, std::int8_t>)        return "std::int8_t";
    else if constexpr (std::same_as<T, std::int16_t>)       return "std::int16_t";
    else if constexpr (std::same_as<T, std::int32_t>)       return "std::int32_t";
    else if constexpr (std::same_as<T, std::int64_t>)       return "std::int64_t";
    else if constexpr (std::same_as<T, bool>)               return "bool";
    else if constexpr (std::same_as<T, float>)              return "float";
    else if constexpr (std::same_as<T, double>)             return "double";
    else
        return "std::monostate";
}
} // namespace detail

//=============================================================================
// Registration
//=============================================================================
template <Describable T>
Shape const& shapeOf()
{
    static Shape const& shape = Registry::instance().add(std::make_unique<Shape>(Describe<T>::build()));
    return shape;
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Shape building blocks
//=============================================================================
template <typename T>
ValueVTable lifecycleVTable()
{
    ValueVTable vtable;

    if constexpr (std::is_default_constructible_v<T>)
        vtable.construct = [] (void* p) { std::construct_at(static_cast<T*>(p)); };

    if constexpr (std::is_destructible_v<T>)
        vtable.drop = [] (void* p) { std::destroy_at(static_cast<T*>(p)); };

    if constexpr (detail::DeepEquality<T>::value)
        vtable.equals = [] (void const* a, void const* b) { return static_cast<bool>(*static_cast<T const*>(a) == *static_cast<T const*>(b)); };

    return vtable;
}

template <typename T>
ValueVTable defaultVTable()
{
    auto vtable = lifecycleVTable<T>();

    vtable.debug = [] (void const* p, std::ostream& o)
    {
        [[maybe_unused]] auto const& v = *static_cast<T const*>(p);

        if constexpr (std::same_as<T, std::string>)
            o << std::quoted(v);
        else if constexpr (std::same_as<T, bool>)
            o << (v ? "true" : "false");
        else if constexpr (std::same_as<T, std::monostate>)
            o << "()";
        else if constexpr (std::integral<T> && sizeof(T) == 1)
            o << static_cast<int>(v);
        else if constexpr (detail::Streamable<T>)
            o << v;
        else
        {
            Peek const peek(p, shapeOf<T>());

            if (! detail::debugStructure(o, peek))
                detail::debugPlaceholder(o, peek.shape());
        }
    };

    return vtable;
}

template <typename T>
Shape basicShape(Kind kind, ValueVTable vtable)
{
    Shape shape;
    shape.type = &typeid(T);
    shape.typeName = detail::demangle(typeid(T));
    shape.size = sizeof(T);
    shape.alignment = alignof(T);
    shape.kind = kind;
    shape.vtable = vtable;
    return shape;
}

//=============================================================================
// StructBuilder implementations
//=============================================================================
template <typename T>
StructBuilder<T>::StructBuilder() : shape(basicShape<T>(Kind::structure))
{
    static_assert(std::is_aggregate_v<T>, "describeStruct() requires an aggregate");
    static_assert(std::is_default_constructible_v<T>, "describeStruct() requires a default constructible type");
}

template <typename T>
StructBuilder<T>& StructBuilder<T>::name(std::string typeName)
{
    shape.typeName = std::move(typeName);
    return *this;
}

template <typename T>
StructBuilder<T>& StructBuilder<T>::renameAll(RenameRule rule)
{
    shape.renameRule = rule;
    return *this;
}

template <typename T>
template <fixstr::fixed_string Name>
StructBuilder<T>& StructBuilder<T>::rename(CompileTimeString<Name>, std::string wireName)
{
    auto& field = pendingField<Name>();
    std::erase_if(field.attributes, [] (FieldAttribute const& a) { return std::holds_alternative<attribute::Rename>(a); });
    field.attributes.emplace_back(attribute::Rename { std::move(wireName) });
    return *this;
}

template <typename T>
template <fixstr::fixed_string Name>
StructBuilder<T>& StructBuilder<T>::sensitive(CompileTimeString<Name>)
{
    auto& field = pendingField<Name>();
    field.flags = field.flags | FieldFlags::sensitive;
    field.attributes.emplace_back(attribute::Sensitive {});
    return *this;
}

template <typename T>
template <fixstr::fixed_string Name>
StructBuilder<T>& StructBuilder<T>::skipSerializing(CompileTimeString<Name>)
{
    pendingField<Name>().attributes.emplace_back(attribute::SkipSerializing {});
    return *this;
}

template <typename T>
template <fixstr::fixed_string Name, typename Predicate>
StructBuilder<T>& StructBuilder<T>::skipSerializingIf(CompileTimeString<Name>, Predicate && predicate)
{
    auto& field = pendingField<Name>();

    using FieldType = boost::pfr::tuple_element_t<indexOf<Name>(), T>;
    static_assert(std::predicate<std::decay_t<Predicate> const&, FieldType const&>, "predicate must be callable with the field's type");

    field.attributes.emplace_back(attribute::SkipSerializingIf {
        [pred = std::forward<Predicate>(predicate)] (void const* data)
        {
            return static_cast<bool>(std::invoke(pred, *static_cast<FieldType const*>(data)));
        }
    });

    return *this;
}

template <typename T>
template <fixstr::fixed_string Name, typename Provider>
StructBuilder<T>& StructBuilder<T>::defaultValue(CompileTimeString<Name>, Provider && provider)
{
    auto& field = pendingField<Name>();

    using FieldType = boost::pfr::tuple_element_t<indexOf<Name>(), T>;
    static_assert(std::is_convertible_v<std::invoke_result_t<std::decay_t<Provider> const&>, FieldType>, "provider must return the field's type");

    field.attributes.emplace_back(attribute::Default {
        [fn = std::forward<Provider>(provider)] (void* storage)
        {
            std::construct_at(static_cast<FieldType*>(storage), std::invoke(fn));
        }
    });

    return *this;
}

template <typename T>
template <fixstr::fixed_string Name>
StructBuilder<T>& StructBuilder<T>::arbitrary(CompileTimeString<Name>, std::string content)
{
    pendingField<Name>().attributes.emplace_back(attribute::Arbitrary { std::move(content) });
    return *this;
}

template <typename T>
template <fixstr::fixed_string Name>
StructBuilder<T>& StructBuilder<T>::doc(CompileTimeString<Name>, std::string text)
{
    pendingField<Name>().doc = std::move(text);
    return *this;
}

template <typename T>
StructBuilder<T>& StructBuilder<T>::debug(void (*fn)(void const*, std::ostream&))
{
    shape.vtable.debug = fn;
    return *this;
}

template <typename T>
StructBuilder<T>& StructBuilder<T>::attribute(std::string content)
{
    shape.attributes.emplace_back(std::move(content));
    return *this;
}

template <typename T>
Shape StructBuilder<T>::build() const
{
    auto result = shape;
    auto const fieldOffsets = offsets();

    result.fields.reserve(kFieldCount);
    [this, &result, &fieldOffsets] <std::size_t... I> (std::index_sequence<I...>)
    {
        (result.fields.push_back(makeField<I>(fieldOffsets[I])), ...);
    }(std::make_index_sequence<kFieldCount>());

    return result;
}

template <typename T>
template <fixstr::fixed_string Name>
consteval std::size_t StructBuilder<T>::indexOf()
{
    std::string_view const wanted(Name.data(), Name.size());

    for (std::size_t i = 0; i < kFieldCount; ++i)
        if (kFieldNames[i] == wanted)
            return i;

    return kFieldCount;
}

template <typename T>
template <fixstr::fixed_string Name>
typename StructBuilder<T>::PendingField& StructBuilder<T>::pendingField()
{
    static constexpr auto kIndex = indexOf<Name>();
    static_assert(kIndex < kFieldCount, "the struct has no field with this name");

    return pending[kIndex];
}

template <typename T>
std::array<std::size_t, StructBuilder<T>::kFieldCount> StructBuilder<T>::offsets()
{
    std::array<std::size_t, kFieldCount> result {};
    T const sample {};
    auto const* base = reinterpret_cast<std::byte const*>(std::addressof(sample));

    [&result, &sample, base] <std::size_t... I> (std::index_sequence<I...>)
    {
        ((result[I] = static_cast<std::size_t>(reinterpret_cast<std::byte const*>(std::addressof(boost::pfr::get<I>(sample))) - base)), ...);
    }(std::make_index_sequence<kFieldCount>());

    return result;
}

template <typename T>
template <std::size_t I>
FieldDescriptor StructBuilder<T>::makeField(std::size_t offset) const
{
    FieldDescriptor field;
    field.rawName = std::string(kFieldNames[I]);
    field.offset = offset;
    field.shape = &shapeOf<boost::pfr::tuple_element_t<I, T>>;
    field.flags = pending[I].flags;
    field.attributes = pending[I].attributes;
    field.doc = pending[I].doc;
    field.wireName = computeWireName(normalizeIdentifier(field.rawName), field.renameOverride(), shape.renameRule);
    return field;
}

//=============================================================================
// Enumerations and opaque types
//=============================================================================
template <typename E> requires std::is_enum_v<E>
Shape describeEnum(std::initializer_list<std::pair<std::string_view, E>> variants)
{
    auto shape = basicShape<E>(Kind::enumeration);

    EnumDef def;
    for (auto const& [variantName, value] : variants)
        def.variants.push_back(EnumVariant { std::string(variantName), static_cast<std::int64_t>(value) });

    def.discriminant = [] (void const* p) { return static_cast<std::int64_t>(*static_cast<E const*>(p)); };
    shape.def = std::move(def);
    return shape;
}

template <typename T>
Shape describeOpaque(std::string typeName)
{
    auto vtable = lifecycleVTable<T>();
    vtable.debug = [] (void const*, std::ostream& o) { o << "Opaque"; };

    auto shape = basicShape<T>(Kind::opaque, vtable);

    if (! typeName.empty())
        shape.typeName = std::move(typeName);

    return shape;
}

//=============================================================================
// Built-in descriptions
//=============================================================================
template <detail::BuiltinScalar T>
Shape Describe<T>::build()
{
    auto shape = basicShape<T>(Kind::scalar);
    shape.typeName = std::string(detail::scalarTypeName<T>());
    return shape;
}

template <typename T> requires (! std::same_as<T, bool>)
Shape Describe<std::vector<T>>::build()
{
    using Vector = std::vector<T>;

    auto shape = basicShape<Vector>(Kind::list);
    shape.def = ListDef {
        .size      = [] (void const* p) { return static_cast<Vector const*>(p)->size(); },
        .item      = [] (void const* p, std::size_t idx) -> void const* { return std::addressof((*static_cast<Vector const*>(p))[idx]); },
        .itemShape = &shapeOf<T>
    };

    return shape;
}

template <typename T>
Shape Describe<std::optional<T>>::build()
{
    using Optional = std::optional<T>;

    auto shape = basicShape<Optional>(Kind::option);
    shape.def = OptionDef {
        .isSome     = [] (void const* p) { return static_cast<Optional const*>(p)->has_value(); },
        .value      = [] (void const* p) -> void const* { return std::addressof(**static_cast<Optional const*>(p)); },
        .innerShape = &shapeOf<T>
    };

    return shape;
}

template <typename V>
Shape Describe<std::map<std::string, V>>::build()
{
    using Map = std::map<std::string, V>;

    auto shape = basicShape<Map>(Kind::map);
    shape.def = MapDef {
        .size    = [] (void const* p) { return static_cast<Map const*>(p)->size(); },
        .forEach = [] (void const* p, std::function<void(void const*, void const*)> const& visit)
        {
            for (auto const& [key, value] : *static_cast<Map const*>(p))
                visit(std::addressof(key), std::addressof(value));
        },
        .keyShape   = &shapeOf<std::string>,
        .valueShape = &shapeOf<V>
    };

    return shape;
}
} // namespace introspect
