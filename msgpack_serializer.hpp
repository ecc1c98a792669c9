/**
 * @file msgpack_serializer.hpp
 * @brief MessagePack encoding of any viewed value
 *
 * Structs become maps keyed by wire name (in field order), lists become arrays,
 * string keyed maps become maps and options become nil or their value. Integers
 * always use the smallest encoding that holds the value.
 *
 * Usage example:
 *   registerShape<Person>();
 *   auto bytes = msgpack::toBytes(Person { "Ada", 36 });
 *   // 82 a4 'name' a3 'Ada' a3 'age' 24
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>
#include "introspect.hpp"

namespace introspect::msgpack
{

/**
 * @brief Serializer configuration
 */
struct SerializeOptions
{
    /// If false every declared field is emitted regardless of skip attributes
    bool honourSkipAttributes = true;
};

/**
 * @brief Writes the MessagePack encoding of the viewed value to os
 *
 * Enumerations, opaque values and scalars without a MessagePack representation
 * are rejected with ErrorCode::unsupportedType. Nothing is written for the
 * rejected value itself, but on any error the bytes already written to os must
 * be treated as invalid.
 */
Result<void> serialize(Peek const& peek, std::ostream& os, SerializeOptions const& options = {});

/// Encodes the viewed value into a byte buffer
Result<std::vector<std::uint8_t>> toBytes(Peek const& peek, SerializeOptions const& options = {});

/// Encodes value using the registered shape of T
template <typename T>
Result<std::vector<std::uint8_t>> toBytes(T const& value, SerializeOptions const& options = {})
{
    return Peek::of(value).and_then([&options] (Peek const& peek) { return toBytes(peek, options); });
}

//=============================================================================
// Primitive writers
//=============================================================================

/// The largest string length or container count MessagePack can represent
inline constexpr std::size_t kMaxLength = 0xffffffffu;

void writeNil(std::ostream& os);
void writeBool(std::ostream& os, bool value);

/**
 * @brief fixstr, str8, str16 or str32 depending on the length
 *
 * @return An unsupported-type error, with nothing written, if str is longer than kMaxLength
 */
Result<void> writeString(std::ostream& os, std::string_view str);

/// positive fixint, uint8, uint16, uint32 or uint64 depending on the value
void writeUnsigned(std::ostream& os, std::uint64_t value);

/// Non-negative values as writeUnsigned(), otherwise negative fixint, int8, int16, int32 or int64
void writeSigned(std::ostream& os, std::int64_t value);

void writeFloat(std::ostream& os, float value);
void writeDouble(std::ostream& os, double value);

/// fixmap, map16 or map32 depending on the entry count. Fails like writeString() above kMaxLength.
Result<void> writeMapHeader(std::ostream& os, std::size_t count);

/// fixarray, array16 or array32 depending on the element count. Fails like writeString() above kMaxLength.
Result<void> writeArrayHeader(std::ostream& os, std::size_t count);
} // namespace introspect::msgpack
