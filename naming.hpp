/**
 * @file naming.hpp
 * @brief Case-convention rules used to compute the wire name of a field
 *
 * A field's wire name is part of the encoded output, so it is computed once when
 * the field's descriptor is built and never again. The rules mirror the usual
 * serialization conventions (snake_case, camelCase, kebab-case, ...).
 *
 * Usage example:
 *   applyRenameRule(RenameRule::snakeCase, "HTTPRequest");   // "http_request"
 *   applyRenameRule(RenameRule::pascalCase, "user_id");      // "UserId"
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace introspect
{

/**
 * @brief Case conversion applied to a field name
 *
 * pascalCase, camelCase and the snake/kebab rules split the input into words
 * (see splitIntoWords()) and rejoin the case-folded words. lowercase and
 * uppercase fold the whole identifier, separators included.
 */
enum class RenameRule
{
    lowercase,            ///< "FooBar" -> "foobar"
    uppercase,            ///< "FooBar" -> "FOOBAR"
    pascalCase,           ///< "foo_bar" -> "FooBar"
    camelCase,            ///< "foo_bar" -> "fooBar"
    snakeCase,            ///< "FooBar" -> "foo_bar"
    screamingSnakeCase,   ///< "FooBar" -> "FOO_BAR"
    kebabCase,            ///< "FooBar" -> "foo-bar"
    screamingKebabCase,   ///< "FooBar" -> "FOO-BAR"
    passthrough           ///< no renaming
};

/**
 * @brief Splits an identifier into words
 *
 * Word boundaries are explicit separators ('_', '-', whitespace), a
 * lowercase (or digit) to uppercase transition ("fooBar" -> "foo", "Bar") and an
 * acronym boundary ("HTTPRequest" -> "HTTP", "Request"). Separators never end up
 * in a word and no word is empty.
 */
std::vector<std::string> splitIntoWords(std::string_view input);

/// "user_id" -> "user_id", "fooBar" -> "foobar". Separator-only input gives an empty string.
std::string toLowercase(std::string_view input);
std::string toUppercase(std::string_view input);

/// Capitalizes every word. Words without lowercase letters (acronyms) are kept as they are.
std::string toPascalCase(std::string_view input);

/// Like toPascalCase() but the first word is all lowercase
std::string toCamelCase(std::string_view input);

std::string toSnakeCase(std::string_view input);
std::string toScreamingSnakeCase(std::string_view input);
std::string toKebabCase(std::string_view input);
std::string toScreamingKebabCase(std::string_view input);

/**
 * @brief Apply a rename rule to an identifier
 *
 * Pure and deterministic. Passthrough returns the input unchanged.
 */
std::string applyRenameRule(RenameRule rule, std::string_view input);

/**
 * @brief Parse the conventional spelling of a rule
 *
 * Accepts "lowercase", "UPPERCASE", "PascalCase", "camelCase", "snake_case",
 * "SCREAMING_SNAKE_CASE", "kebab-case" and "SCREAMING-KEBAB-CASE".
 *
 * @return The rule, or an empty optional for unknown spellings
 */
std::optional<RenameRule> renameRuleFromString(std::string_view str);

/// Returns the conventional spelling of a rule ("passthrough" for RenameRule::passthrough)
std::string_view toString(RenameRule rule);

/// Strips a single trailing '_' used to escape a C++ keyword ("class_" -> "class")
std::string_view normalizeIdentifier(std::string_view identifier);

/// Returns true if the name is a tuple index ("0", "1", ...). Such names are never renamed.
bool isNumericName(std::string_view name);

/**
 * @brief Compute the name a field is written under
 *
 * @param rawName        The declared name of the field
 * @param explicitRename A per-field override; wins over everything else
 * @param containerRule  The rename rule configured on the containing struct
 */
std::string computeWireName(std::string_view rawName,
                            std::optional<std::string_view> explicitRename,
                            RenameRule containerRule);

std::ostream& operator<<(std::ostream& o, RenameRule rule);
} // namespace introspect
