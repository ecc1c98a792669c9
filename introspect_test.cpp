#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "describe.hpp"
#include <cstring>
#include <sstream>
#include <thread>

using namespace introspect;

//=============================================================================
// Test struct definitions
//=============================================================================

namespace fixtures {

struct Person {
    std::string name;
    std::uint8_t age;
};

struct Account {
    std::string user;
    std::string password;
    std::optional<std::string> nickname;
};

struct Tree {
    std::string label;
    std::vector<Tree> children;
};

enum class Color { red, green, blue = 7 };

struct Palette {
    Color primary;
    std::map<std::string, std::int32_t> weights;
    std::vector<std::uint16_t> values;
};

struct Settings {
    std::string user_name;
    std::uint32_t max_retries;
    bool class_;
};

struct Handle { int fd; };

struct Unregistered { int x; };

// claims to be a list but carries no list definition
struct Headless { int x; };

// opaque without a dedicated debug operation
struct Socket { int fd; };

} // namespace fixtures

namespace introspect {

template <>
struct Describe<fixtures::Person> {
    static Shape build() { return describeStruct<fixtures::Person>().name("Person").build(); }
};

template <>
struct Describe<fixtures::Account> {
    static Shape build()
    {
        return describeStruct<fixtures::Account>()
            .name("Account")
            .sensitive("password"_fld)
            .doc("user"_fld, "login name")
            .build();
    }
};

template <>
struct Describe<fixtures::Tree> {
    static Shape build() { return describeStruct<fixtures::Tree>().name("Tree").build(); }
};

template <>
struct Describe<fixtures::Color> {
    static Shape build()
    {
        return describeEnum<fixtures::Color>({ { "red", fixtures::Color::red },
                                               { "green", fixtures::Color::green },
                                               { "blue", fixtures::Color::blue } });
    }
};

template <>
struct Describe<fixtures::Palette> {
    static Shape build() { return describeStruct<fixtures::Palette>().name("Palette").build(); }
};

template <>
struct Describe<fixtures::Settings> {
    static Shape build()
    {
        return describeStruct<fixtures::Settings>()
            .renameAll(RenameRule::kebabCase)
            .rename("max_retries"_fld, "retries")
            .defaultValue("max_retries"_fld, [] { return std::uint32_t(3); })
            .arbitrary("class_"_fld, "reserved")
            .attribute("version = 2")
            .build();
    }
};

template <>
struct Describe<fixtures::Handle> {
    static Shape build() { return describeOpaque<fixtures::Handle>("Handle"); }
};

template <>
struct Describe<fixtures::Headless> {
    static Shape build() { return basicShape<fixtures::Headless>(Kind::list); }
};

template <>
struct Describe<fixtures::Socket> {
    static Shape build() { return basicShape<fixtures::Socket>(Kind::opaque); }
};

} // namespace introspect

namespace {

template <typename T>
std::string debugString(T const& value)
{
    auto peek = Peek::of(value);
    REQUIRE(peek.has_value());

    std::ostringstream ss;
    ss << *peek;
    return ss.str();
}

} // namespace

//=============================================================================
// Shape tests
//=============================================================================

TEST_SUITE("Shape") {

TEST_CASE("struct shape") {
    auto const& shape = shapeOf<fixtures::Person>();

    CHECK(shape.kind == Kind::structure);
    CHECK(shape.is<fixtures::Person>());
    CHECK_FALSE(shape.is<fixtures::Account>());
    CHECK(shape.typeName == "Person");
    CHECK(shape.size == sizeof(fixtures::Person));
    CHECK(shape.alignment == alignof(fixtures::Person));
    CHECK(shape.renameRule == RenameRule::passthrough);

    REQUIRE(shape.fields.size() == 2);
    CHECK(shape.fields[0].rawName == "name");
    CHECK(shape.fields[0].wireName == "name");
    CHECK(shape.fields[1].rawName == "age");
    CHECK(shape.fields[1].wireName == "age");
}

TEST_CASE("field offsets and shapes") {
    fixtures::Person person;
    auto const& shape = shapeOf<fixtures::Person>();
    auto const* base = reinterpret_cast<char const*>(&person);

    CHECK(shape.fields[0].offset == static_cast<std::size_t>(reinterpret_cast<char const*>(&person.name) - base));
    CHECK(shape.fields[1].offset == static_cast<std::size_t>(reinterpret_cast<char const*>(&person.age) - base));
    CHECK(shape.fields[0].shape().is<std::string>());
    CHECK(shape.fields[1].shape().is<std::uint8_t>());
    CHECK(shape.fields[1].shape().kind == Kind::scalar);
    CHECK(shape.fields[1].shape().typeName == "std::uint8_t");
}

TEST_CASE("wire names follow the rename rule") {
    auto const& shape = shapeOf<fixtures::Settings>();

    REQUIRE(shape.fields.size() == 3);
    CHECK(shape.renameRule == RenameRule::kebabCase);
    CHECK(shape.fields[0].wireName == "user-name");
    CHECK(shape.fields[1].wireName == "retries");
    CHECK(shape.fields[1].renameOverride() == std::optional<std::string_view>("retries"));
    CHECK(shape.fields[2].rawName == "class_");
    CHECK(shape.fields[2].wireName == "class");

    CHECK(shape.field("retries") == &shape.fields[1]);
    CHECK(shape.field("max_retries") == nullptr);
}

TEST_CASE("field and container attributes") {
    auto const& settings = shapeOf<fixtures::Settings>();

    REQUIRE(settings.attributes.size() == 1);
    CHECK(settings.attributes[0] == "version = 2");
    CHECK(shapeOf<fixtures::Person>().attributes.empty());

    auto const* arbitrary = settings.fields[2].attribute<attribute::Arbitrary>();
    REQUIRE(arbitrary != nullptr);
    CHECK(arbitrary->content == "reserved");
    CHECK(settings.fields[0].attribute<attribute::Arbitrary>() == nullptr);

    auto const* defaultValue = settings.fields[1].attribute<attribute::Default>();
    REQUIRE(defaultValue != nullptr);
    std::uint32_t retries = 0;
    defaultValue->provider(&retries);
    CHECK(retries == 3);

    auto const& account = shapeOf<fixtures::Account>();
    CHECK(account.fields[1].isSensitive());
    CHECK(account.fields[1].attribute<attribute::Sensitive>() != nullptr);
    CHECK_FALSE(account.fields[0].isSensitive());
    CHECK(account.fields[0].doc == "login name");
}

TEST_CASE("scalar operations") {
    auto const& shape = shapeOf<std::string>();
    REQUIRE(shape.vtable.construct != nullptr);
    REQUIRE(shape.vtable.drop != nullptr);
    REQUIRE(shape.vtable.equals != nullptr);
    REQUIRE(shape.vtable.debug != nullptr);

    alignas(std::string) std::byte storage[sizeof(std::string)];
    shape.vtable.construct(storage);

    std::string const empty;
    CHECK(shape.vtable.equals(storage, &empty));

    std::ostringstream ss;
    shape.vtable.debug(storage, ss);
    CHECK(ss.str() == "\"\"");

    shape.vtable.drop(storage);
}

TEST_CASE("struct without equality has no equals operation") {
    CHECK(shapeOf<fixtures::Person>().vtable.equals == nullptr);
    CHECK(shapeOf<std::vector<fixtures::Tree>>().vtable.equals == nullptr);
    CHECK(shapeOf<std::vector<std::int32_t>>().vtable.equals != nullptr);
}

TEST_CASE("container shapes") {
    auto const& list = shapeOf<std::vector<std::uint16_t>>();
    CHECK(list.kind == Kind::list);
    REQUIRE(list.definition<ListDef>() != nullptr);
    CHECK(list.definition<ListDef>()->itemShape().is<std::uint16_t>());
    CHECK(list.definition<MapDef>() == nullptr);

    auto const& map = shapeOf<std::map<std::string, std::int32_t>>();
    CHECK(map.kind == Kind::map);
    REQUIRE(map.definition<MapDef>() != nullptr);
    CHECK(map.definition<MapDef>()->keyShape().is<std::string>());
    CHECK(map.definition<MapDef>()->valueShape().is<std::int32_t>());

    auto const& option = shapeOf<std::optional<std::string>>();
    CHECK(option.kind == Kind::option);
    REQUIRE(option.definition<OptionDef>() != nullptr);
    CHECK(option.definition<OptionDef>()->innerShape().is<std::string>());

    CHECK(shapeOf<fixtures::Color>().kind == Kind::enumeration);
    CHECK(shapeOf<fixtures::Handle>().kind == Kind::opaque);
    CHECK(shapeOf<Opaque<int>>().kind == Kind::opaque);
}

TEST_CASE("recursive shapes") {
    auto const& tree = shapeOf<fixtures::Tree>();
    REQUIRE(tree.fields.size() == 2);

    auto const& children = tree.fields[1].shape();
    CHECK(children.kind == Kind::list);
    CHECK(&children.definition<ListDef>()->itemShape() == &tree);
}

} // TEST_SUITE("Shape")

//=============================================================================
// Registry tests
//=============================================================================

TEST_SUITE("Registry") {

TEST_CASE("a shape is registered once") {
    auto const& first = registerShape<fixtures::Person>();
    auto const& second = registerShape<fixtures::Person>();
    CHECK(&first == &second);
    CHECK(Registry::instance().find<fixtures::Person>() == &first);
}

TEST_CASE("adding a duplicate keeps the existing shape") {
    auto const& existing = registerShape<fixtures::Person>();
    auto const sizeBefore = Registry::instance().size();

    auto duplicate = std::make_unique<Shape>(basicShape<fixtures::Person>(Kind::opaque));
    auto const& result = Registry::instance().add(std::move(duplicate));

    CHECK(&result == &existing);
    CHECK(result.kind == Kind::structure);
    CHECK(Registry::instance().size() == sizeBefore);
}

TEST_CASE("lookup of an unregistered type") {
    CHECK(Registry::instance().find<fixtures::Unregistered>() == nullptr);

    auto result = Registry::instance().lookup(typeid(fixtures::Unregistered));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::kindResolution);
    CHECK(result.error().message.find("Unregistered") != std::string::npos);
}

TEST_CASE("concurrent registration") {
    std::vector<Shape const*> seen(8, nullptr);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < seen.size(); ++i)
        threads.emplace_back([&seen, i] { seen[i] = &registerShape<fixtures::Palette>(); });

    for (auto& t : threads)
        t.join();

    for (auto const* shape : seen)
        CHECK(shape == seen.front());
}

} // TEST_SUITE("Registry")

//=============================================================================
// Peek tests
//=============================================================================

TEST_SUITE("Peek") {

TEST_CASE("unregistered type") {
    fixtures::Unregistered value { 1 };
    auto peek = Peek::of(value);
    REQUIRE_FALSE(peek.has_value());
    CHECK(peek.error().code == ErrorCode::kindResolution);
}

TEST_CASE("typed access") {
    registerShape<fixtures::Person>();
    fixtures::Person ada { "Ada", 36 };

    auto peek = Peek::of(ada);
    REQUIRE(peek.has_value());
    CHECK(peek->kind() == Kind::structure);
    CHECK(peek->data() == &ada);

    auto typed = peek->get<fixtures::Person>();
    REQUIRE(typed.has_value());
    CHECK(&typed->get() == &ada);

    auto wrong = peek->get<std::int32_t>();
    REQUIRE_FALSE(wrong.has_value());
    CHECK(wrong.error().code == ErrorCode::typeMismatch);
}

TEST_CASE("fields in declaration order") {
    registerShape<fixtures::Person>();
    fixtures::Person ada { "Ada", 36 };

    auto view = Peek::of(ada)->intoStruct();
    REQUIRE(view.has_value());
    CHECK(view->fieldCount() == 2);

    std::vector<std::string> names;
    for (auto const& [field, value] : view->fields())
        names.push_back(field.wireName);

    REQUIRE(names.size() == 2);
    CHECK(names[0] == "name");
    CHECK(names[1] == "age");

    auto name = view->field(0);
    REQUIRE(name.has_value());
    CHECK(name->value.get<std::string>()->get() == "Ada");
    CHECK_FALSE(view->field(2).has_value());

    auto age = view->fieldByName("age");
    REQUIRE(age.has_value());
    CHECK(age->get<std::uint8_t>()->get() == 36);
    CHECK_FALSE(view->fieldByName("missing").has_value());
}

TEST_CASE("fields of a temporary view") {
    registerShape<fixtures::Person>();
    fixtures::Person ada { "Ada", 36 };

    std::vector<std::string> names;
    for (auto const& [field, value] : Peek::of(ada)->intoStruct()->fields())
        names.push_back(field.wireName);

    CHECK(names == std::vector<std::string> { "name", "age" });

    auto const fields = Peek::of(ada)->intoStruct()->fields();
    REQUIRE(fields.size() == 2);

    auto it = fields.begin();
    CHECK((*it).value.get<std::string>()->get() == "Ada");
    ++it;
    CHECK((*it).value.get<std::uint8_t>()->get() == 36);
    CHECK(++it == fields.end());

    registerShape<std::vector<std::uint16_t>>();
    std::vector<std::uint16_t> const values { 4, 5 };
    auto const items = Peek::of(values)->intoList()->items();

    std::vector<std::uint16_t> collected;
    for (auto const& item : items)
        collected.push_back(item.get<std::uint16_t>()->get());

    CHECK(collected == values);
}

TEST_CASE("fields restart on every call") {
    registerShape<fixtures::Person>();
    fixtures::Person ada { "Ada", 36 };

    auto view = Peek::of(ada)->intoStruct();
    REQUIRE(view.has_value());

    auto collect = [&view] {
        std::vector<std::string> names;
        for (auto const& [field, value] : view->fields())
            names.push_back(field.wireName);
        return names;
    };

    auto const first = collect();
    auto const second = collect();
    CHECK(first == std::vector<std::string> { "name", "age" });
    CHECK(second == first);

    auto const range = view->fields();
    auto a = range.begin();
    ++a;
    CHECK((*view->fields().begin()).field.wireName == "name");
    CHECK((*a).field.wireName == "age");
}

TEST_CASE("field views alias the value") {
    registerShape<fixtures::Person>();
    fixtures::Person ada { "Ada", 36 };

    auto age = Peek::of(ada)->intoStruct()->fieldByName("age");
    REQUIRE(age.has_value());
    CHECK(age->data() == &ada.age);

    ada.age = 37;
    CHECK(age->get<std::uint8_t>()->get() == 37);
}

TEST_CASE("refinement to the wrong kind") {
    registerShape<fixtures::Person>();
    fixtures::Person ada { "Ada", 36 };
    auto peek = *Peek::of(ada);

    CHECK(peek.intoList().error().code == ErrorCode::typeMismatch);
    CHECK(peek.intoMap().error().code == ErrorCode::typeMismatch);
    CHECK(peek.intoOption().error().code == ErrorCode::typeMismatch);
    CHECK(peek.intoEnum().error().code == ErrorCode::typeMismatch);
    CHECK(peek.intoScalar().error().code == ErrorCode::typeMismatch);

    auto name = peek.intoStruct()->fieldByName("name");
    REQUIRE(name.has_value());
    CHECK(name->intoStruct().error().code == ErrorCode::typeMismatch);

    auto scalar = name->intoScalar();
    REQUIRE(scalar.has_value());
    CHECK(scalar->is<std::string>());
    CHECK_FALSE(scalar->is<std::int32_t>());
    CHECK(scalar->get<std::string>()->get() == "Ada");
}

TEST_CASE("lists maps and enums") {
    registerShape<fixtures::Palette>();
    fixtures::Palette palette { fixtures::Color::blue, { { "b", 2 }, { "a", 1 } }, { 10, 20, 30 } };
    auto view = Peek::of(palette)->intoStruct();
    REQUIRE(view.has_value());

    auto values = view->fieldByName("values")->intoList();
    REQUIRE(values.has_value());
    CHECK(values->size() == 3);
    CHECK(values->item(1)->get<std::uint16_t>()->get() == 20);
    CHECK_FALSE(values->item(3).has_value());

    std::vector<std::uint16_t> collected;
    for (auto const& item : values->items())
        collected.push_back(item.get<std::uint16_t>()->get());
    CHECK(collected == palette.values);

    auto weights = view->fieldByName("weights")->intoMap();
    REQUIRE(weights.has_value());
    auto entries = weights->entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].first.get<std::string>()->get() == "a");
    CHECK(entries[0].second.get<std::int32_t>()->get() == 1);
    CHECK(entries[1].first.get<std::string>()->get() == "b");

    auto primary = view->fieldByName("primary")->intoEnum();
    REQUIRE(primary.has_value());
    CHECK(primary->discriminant() == 7);
    CHECK(primary->variantName() == std::optional<std::string_view>("blue"));

    auto const undeclared = static_cast<fixtures::Color>(3);
    registerShape<fixtures::Color>();
    auto unnamed = Peek::of(undeclared)->intoEnum();
    REQUIRE(unnamed.has_value());
    CHECK_FALSE(unnamed->variantName().has_value());
}

TEST_CASE("composite kind without its definition") {
    registerShape<fixtures::Headless>();
    fixtures::Headless value { 1 };

    auto list = Peek::of(value)->intoList();
    REQUIRE_FALSE(list.has_value());
    CHECK(list.error().code == ErrorCode::unsupportedType);
    CHECK(Peek::of(value)->intoMap().error().code == ErrorCode::typeMismatch);
}

TEST_CASE("options") {
    registerShape<fixtures::Account>();
    fixtures::Account account { "ada", "secret", std::nullopt };

    auto nickname = Peek::of(account)->intoStruct()->fieldByName("nickname")->intoOption();
    REQUIRE(nickname.has_value());
    CHECK(nickname->isNone());
    CHECK_FALSE(nickname->value().has_value());

    account.nickname = "countess";
    CHECK(nickname->isSome());
    REQUIRE(nickname->value().has_value());
    CHECK(nickname->value()->get<std::string>()->get() == "countess");
}

} // TEST_SUITE("Peek")

//=============================================================================
// Debug output tests
//=============================================================================

TEST_SUITE("Debug output") {

TEST_CASE("struct") {
    registerShape<fixtures::Person>();
    CHECK(debugString(fixtures::Person { "Ada", 36 }) == "Person { .name = \"Ada\", .age = 36 }");
}

TEST_CASE("sensitive fields are redacted") {
    registerShape<fixtures::Account>();
    auto const output = debugString(fixtures::Account { "ada", "hunter2", "countess" });

    CHECK(output == "Account { .user = \"ada\", .password = [REDACTED], .nickname = \"countess\" }");
    CHECK(output.find("hunter2") == std::string::npos);
}

TEST_CASE("containers and enums") {
    registerShape<fixtures::Palette>();
    fixtures::Palette palette { fixtures::Color::green, { { "a", 1 }, { "b", -2 } }, { 1, 2 } };

    CHECK(debugString(palette) == "Palette { .primary = green, .weights = {\"a\": 1, \"b\": -2}, .values = [1, 2] }");
}

TEST_CASE("nested and recursive values") {
    registerShape<fixtures::Tree>();
    fixtures::Tree tree { "root", { fixtures::Tree { "leaf", {} } } };

    CHECK(debugString(tree) == "Tree { .label = \"root\", .children = [Tree { .label = \"leaf\", .children = [] }] }");
}

TEST_CASE("options print None or the value") {
    registerShape<fixtures::Account>();
    CHECK(debugString(fixtures::Account { "ada", "x", std::nullopt }).ends_with(".nickname = None }"));
}

TEST_CASE("opaque values") {
    registerShape<fixtures::Handle>();
    CHECK(debugString(fixtures::Handle { 3 }) == "Opaque");

    registerShape<Opaque<int>>();
    CHECK(debugString(Opaque<int> { 42 }) == "Opaque");
}

TEST_CASE("types without an output operator") {
    registerShape<fixtures::Socket>();
    CHECK(debugString(fixtures::Socket { 4 }) == "Opaque");

    registerShape<fixtures::Headless>();
    auto const headless = debugString(fixtures::Headless { 1 });
    CHECK(headless.starts_with("<"));
    CHECK(headless.ends_with("Headless>"));

    struct Raw { int x; };
    Shape const raw { .type = &typeid(Raw), .typeName = "Raw", .kind = Kind::scalar };
    Raw value { 1 };

    std::ostringstream ss;
    ss << Peek(&value, raw);
    CHECK(ss.str() == "<Raw>");
}

TEST_CASE("struct debug operation") {
    std::ostringstream ss;
    fixtures::Person ada { "Ada", 36 };
    shapeOf<fixtures::Person>().vtable.debug(&ada, ss);
    CHECK(ss.str() == "Person { .name = \"Ada\", .age = 36 }");
}

TEST_CASE("errors") {
    std::ostringstream ss;
    ss << Error { ErrorCode::unsupportedType, "Handle: opaque values cannot be serialized" };
    CHECK(ss.str() == "unsupported type: Handle: opaque values cannot be serialized");
    CHECK(toString(ErrorCode::kindResolution) == "kind resolution");
    CHECK(toString(Kind::structure) == "struct");
}

} // TEST_SUITE("Debug output")
