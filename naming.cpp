#include "naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ostream>
#include <utility>

namespace introspect
{
namespace
{
bool isSeparator(char c)        { return c == '_' || c == '-' || std::isspace(static_cast<unsigned char>(c)) != 0; }
bool isUpper(char c)            { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool isLower(char c)            { return std::islower(static_cast<unsigned char>(c)) != 0; }
char upper(char c)              { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
char lower(char c)              { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

std::string lowered(std::string word)
{
    std::transform(word.begin(), word.end(), word.begin(), lower);
    return word;
}

std::string uppered(std::string word)
{
    std::transform(word.begin(), word.end(), word.begin(), upper);
    return word;
}

std::string capitalized(std::string word)
{
    // acronyms like "HTTP" stay as they are
    if (std::none_of(word.begin(), word.end(), isLower))
        return word;

    word = lowered(std::move(word));
    word.front() = upper(word.front());
    return word;
}

template <typename Transform>
std::string joinWords(std::string_view input, std::string_view separator, Transform && transform)
{
    std::string result;

    for (auto& word : splitIntoWords(input))
    {
        if (! result.empty())
            result += separator;

        result += transform(std::move(word));
    }

    return result;
}

constexpr std::array<std::pair<std::string_view, RenameRule>, 8> kRuleSpellings = {{
    { "lowercase",            RenameRule::lowercase          },
    { "UPPERCASE",            RenameRule::uppercase          },
    { "PascalCase",           RenameRule::pascalCase         },
    { "camelCase",            RenameRule::camelCase          },
    { "snake_case",           RenameRule::snakeCase          },
    { "SCREAMING_SNAKE_CASE", RenameRule::screamingSnakeCase },
    { "kebab-case",           RenameRule::kebabCase          },
    { "SCREAMING-KEBAB-CASE", RenameRule::screamingKebabCase }
}};
} // namespace

std::vector<std::string> splitIntoWords(std::string_view input)
{
    std::vector<std::string> words;
    std::string current;
    auto prevIsLower = false;
    auto prevIsUpper = false;

    auto flush = [&words, &current] ()
    {
        if (! current.empty())
            words.emplace_back(std::exchange(current, {}));
    };

    for (std::size_t i = 0; i < input.size(); ++i)
    {
        auto const c = input[i];

        if (isSeparator(c))
        {
            flush();
            prevIsLower = prevIsUpper = false;
        }
        else if (isUpper(c))
        {
            auto const nextIsLower = (i + 1 < input.size()) && isLower(input[i + 1]);

            // "fooBar" splits before 'B', "HTTPRequest" splits before 'R'
            if (prevIsLower || (prevIsUpper && nextIsLower))
                flush();

            current.push_back(c);
            prevIsUpper = true;
            prevIsLower = false;
        }
        else
        {
            current.push_back(c);
            prevIsLower = true;
            prevIsUpper = false;
        }
    }

    flush();
    return words;
}

// lowercase and UPPERCASE fold the whole identifier and keep its separators
std::string toLowercase(std::string_view input)
{
    if (splitIntoWords(input).empty())
        return {};

    return lowered(std::string(input));
}

std::string toUppercase(std::string_view input)
{
    if (splitIntoWords(input).empty())
        return {};

    return uppered(std::string(input));
}

std::string toPascalCase(std::string_view input)         { return joinWords(input, "", capitalized); }
std::string toSnakeCase(std::string_view input)          { return joinWords(input, "_", lowered); }
std::string toScreamingSnakeCase(std::string_view input) { return joinWords(input, "_", uppered); }
std::string toKebabCase(std::string_view input)          { return joinWords(input, "-", lowered); }
std::string toScreamingKebabCase(std::string_view input) { return joinWords(input, "-", uppered); }

std::string toCamelCase(std::string_view input)
{
    auto first = true;
    return joinWords(input, "", [&first] (std::string word)
    {
        return std::exchange(first, false) ? lowered(std::move(word)) : capitalized(std::move(word));
    });
}

std::string applyRenameRule(RenameRule rule, std::string_view input)
{
    switch (rule)
    {
    case RenameRule::lowercase:          return toLowercase(input);
    case RenameRule::uppercase:          return toUppercase(input);
    case RenameRule::pascalCase:         return toPascalCase(input);
    case RenameRule::camelCase:          return toCamelCase(input);
    case RenameRule::snakeCase:          return toSnakeCase(input);
    case RenameRule::screamingSnakeCase: return toScreamingSnakeCase(input);
    case RenameRule::kebabCase:          return toKebabCase(input);
    case RenameRule::screamingKebabCase: return toScreamingKebabCase(input);
    case RenameRule::passthrough:        break;
    }

    return std::string(input);
}

std::optional<RenameRule> renameRuleFromString(std::string_view str)
{
    auto it = std::find_if(kRuleSpellings.begin(), kRuleSpellings.end(), [str] (auto const& entry) { return entry.first == str; });

    if (it == kRuleSpellings.end())
        return {};

    return it->second;
}

std::string_view toString(RenameRule rule)
{
    auto it = std::find_if(kRuleSpellings.begin(), kRuleSpellings.end(), [rule] (auto const& entry) { return entry.second == rule; });
    return it != kRuleSpellings.end() ? it->first : std::string_view("passthrough");
}

std::string_view normalizeIdentifier(std::string_view identifier)
{
    if (identifier.size() > 1 && identifier.back() == '_' && identifier[identifier.size() - 2] != '_')
        identifier.remove_suffix(1);

    return identifier;
}

bool isNumericName(std::string_view name)
{
    return (! name.empty()) && std::all_of(name.begin(), name.end(), [] (char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::string computeWireName(std::string_view rawName,
                            std::optional<std::string_view> explicitRename,
                            RenameRule containerRule)
{
    if (explicitRename.has_value())
        return std::string(*explicitRename);

    if (isNumericName(rawName))
        return std::string(rawName);

    return applyRenameRule(containerRule, rawName);
}

std::ostream& operator<<(std::ostream& o, RenameRule rule)
{
    return o << toString(rule);
}
} // namespace introspect
