#include "msgpack_serializer.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <msgpack.hpp>
#include <CxxUtilities.hpp>
#include "logging.hpp"

namespace introspect::msgpack
{
namespace
{
using Packer = ::msgpack::packer<std::ostream>;

LoggerPtr const& logger()
{
    static auto const log = getLogger("introspect.msgpack");
    return log;
}

/// Scalar types with a MessagePack representation
using SupportedScalarTypes = std::tuple<std::string,
                                        std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t,
                                        std::int8_t,  std::int16_t,  std::int32_t,  std::int64_t,
                                        bool, float, double, std::monostate>;

Result<void> checkLength(std::size_t length, std::string_view what)
{
    if (length <= kMaxLength)
        return {};

    return detail::makeError(ErrorCode::unsupportedType,
                             std::string(what) + " of " + std::to_string(length) + " exceeds the MessagePack limit");
}

Result<void> checkStream(std::ostream& os)
{
    if (os)
        return {};

    return detail::makeError(ErrorCode::io, "output stream rejected the write", std::make_error_code(std::io_errc::stream));
}

Result<void> unsupported(Peek const& peek, std::string_view reason)
{
    logger()->debug("rejecting {} ({}): {}", peek.shape().typeName, toString(peek.kind()), reason);
    return detail::makeError(ErrorCode::unsupportedType, peek.shape().typeName + ": " + std::string(reason));
}

class Serializer
{
public:
    Serializer(std::ostream& os_, SerializeOptions const& options_) : os(os_), options(options_) {}

    Result<void> value(Peek const& peek)
    {
        logger()->trace("serializing {} ({})", peek.shape().typeName, toString(peek.kind()));

        switch (peek.kind())
        {
        case Kind::scalar:      return scalar(peek);
        case Kind::structure:   return structure(PeekStruct(peek));
        case Kind::list:        return peek.intoList().and_then([this] (PeekList const& l) { return list(l); });
        case Kind::map:         return peek.intoMap().and_then([this] (PeekMap const& m) { return map(m); });
        case Kind::option:      return peek.intoOption().and_then([this] (PeekOption const& o) { return option(o); });
        case Kind::enumeration: return unsupported(peek, "enums have no MessagePack representation");
        case Kind::opaque:      return unsupported(peek, "opaque values cannot be serialized");
        }

        return unsupported(peek, "unknown kind");
    }

private:
    Result<void> scalar(Peek const& peek)
    {
        auto const write = cxxutils::multilambda(
            [this] (std::string const& str) -> Result<void> { return writeString(os, str); },
            [this] (bool b)                 -> Result<void> { writeBool(os, b); return {}; },
            [this] (float f)                -> Result<void> { writeFloat(os, f); return {}; },
            [this] (double d)               -> Result<void> { writeDouble(os, d); return {}; },
            [this] (std::monostate)         -> Result<void> { writeNil(os); return {}; },
            [this] <typename I> (I n) -> Result<void> requires (std::is_integral_v<I> && (! std::is_same_v<I, bool>))
            {
                if constexpr (std::is_signed_v<I>)
                    writeSigned(os, n);
                else
                    writeUnsigned(os, n);

                return {};
            });

        std::optional<Result<void>> written;

        std::invoke([&peek, &write, &written] <typename... Types> (std::type_identity<std::tuple<Types...>>)
        {
            return ([&peek, &write, &written] <typename T> (std::type_identity<T>)
            {
                auto value = peek.get<T>();

                if (! value)
                    return false;

                written = write(value->get());
                return true;
            }(std::type_identity<Types>()) || ...);
        }, std::type_identity<SupportedScalarTypes>());

        if (! written.has_value())
            return unsupported(peek, "scalar type has no MessagePack representation");

        return written->and_then([this] { return checkStream(os); });
    }

    Result<void> structure(PeekStruct const& view)
    {
        auto const& fields = view.shape().fields;
        std::vector<bool> skipped(fields.size(), false);

        if (options.honourSkipAttributes)
            for (std::size_t i = 0; i < fields.size(); ++i)
                skipped[i] = fields[i].shouldSkip(view.at(i).value.data());

        if (auto header = writeMapHeader(os, static_cast<std::size_t>(std::count(skipped.begin(), skipped.end(), false))); ! header)
            return header;

        for (std::size_t i = 0; i < fields.size(); ++i)
        {
            if (skipped[i])
                continue;

            auto const [field, child] = view.at(i);

            if (auto key = writeString(os, field.wireName); ! key)
                return key;

            if (auto result = value(child); ! result)
                return result;
        }

        return checkStream(os);
    }

    Result<void> list(PeekList const& view)
    {
        if (auto header = writeArrayHeader(os, view.size()); ! header)
            return header;

        for (auto const& item : view.items())
            if (auto result = value(item); ! result)
                return result;

        return checkStream(os);
    }

    Result<void> map(PeekMap const& view)
    {
        auto const entries = view.entries();

        if (auto header = writeMapHeader(os, entries.size()); ! header)
            return header;

        for (auto const& [key, val] : entries)
        {
            if (auto result = value(key); ! result)
                return result;

            if (auto result = value(val); ! result)
                return result;
        }

        return checkStream(os);
    }

    Result<void> option(PeekOption const& view)
    {
        if (auto inner = view.value())
            return value(*inner);

        writeNil(os);
        return checkStream(os);
    }

    std::ostream& os;
    SerializeOptions const& options;
};
} // namespace

//=============================================================================
// Entry points
//=============================================================================
Result<void> serialize(Peek const& peek, std::ostream& os, SerializeOptions const& options)
{
    if (auto stream = checkStream(os); ! stream)
        return stream;

    return Serializer(os, options).value(peek);
}

Result<std::vector<std::uint8_t>> toBytes(Peek const& peek, SerializeOptions const& options)
{
    std::ostringstream buffer;

    return serialize(peek, buffer, options).transform([&buffer] ()
    {
        auto const str = buffer.str();
        return std::vector<std::uint8_t>(str.begin(), str.end());
    });
}

//=============================================================================
// Primitive writers
//=============================================================================
void writeNil(std::ostream& os)
{
    Packer(os).pack_nil();
}

void writeBool(std::ostream& os, bool value)
{
    Packer packer(os);

    if (value)
        packer.pack_true();
    else
        packer.pack_false();
}

Result<void> writeString(std::ostream& os, std::string_view str)
{
    return checkLength(str.size(), "string length").transform([&os, str]
    {
        auto const length = static_cast<std::uint32_t>(str.size());
        Packer(os).pack_str(length).pack_str_body(str.data(), length);
    });
}

void writeUnsigned(std::ostream& os, std::uint64_t value)
{
    Packer(os).pack_uint64(value);
}

void writeSigned(std::ostream& os, std::int64_t value)
{
    Packer(os).pack_int64(value);
}

void writeFloat(std::ostream& os, float value)
{
    Packer(os).pack_float(value);
}

void writeDouble(std::ostream& os, double value)
{
    Packer(os).pack_double(value);
}

Result<void> writeMapHeader(std::ostream& os, std::size_t count)
{
    return checkLength(count, "map size").transform([&os, count]
    {
        Packer(os).pack_map(static_cast<std::uint32_t>(count));
    });
}

Result<void> writeArrayHeader(std::ostream& os, std::size_t count)
{
    return checkLength(count, "array size").transform([&os, count]
    {
        Packer(os).pack_array(static_cast<std::uint32_t>(count));
    });
}
} // namespace introspect::msgpack
