#include <iomanip>
#include <iostream>
#include <sstream>
#include <spdlog/cfg/env.h>
#include "describe.hpp"
#include "logging.hpp"
#include "msgpack_serializer.hpp"

// Example usage
using namespace introspect;

struct Point
{
    float x;
    float y;
};

struct Line
{
    Point start;
    Point finish;
};

enum class Style { solid, dashed };

struct Drawing
{
    std::string title;
    std::vector<Line> lines;
    std::map<std::string, Point> anchors;
    std::optional<std::uint32_t> revision;
    std::string apiToken;
    Style style;
};

namespace introspect
{
template <>
struct Describe<Point> { static Shape build() { return describeStruct<Point>().name("Point").build(); } };

template <>
struct Describe<Line> { static Shape build() { return describeStruct<Line>().name("Line").build(); } };

template <>
struct Describe<Style>
{
    static Shape build() { return describeEnum<Style>({ { "solid", Style::solid }, { "dashed", Style::dashed } }); }
};

template <>
struct Describe<Drawing>
{
    static Shape build()
    {
        return describeStruct<Drawing>()
            .name("Drawing")
            .renameAll(RenameRule::snakeCase)
            .sensitive("apiToken"_fld)
            .skipSerializing("apiToken"_fld)
            .skipSerializingIf("revision"_fld, [] (std::optional<std::uint32_t> const& r) { return ! r.has_value(); })
            .doc("anchors"_fld, "named points of interest")
            .build();
    }
};
} // namespace introspect

namespace
{
std::string hexDump(std::vector<std::uint8_t> const& bytes)
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < bytes.size(); ++i)
        ss << (i == 0 ? "" : (i % 16 == 0 ? "\n" : " ")) << std::setw(2) << static_cast<int>(bytes[i]);

    return ss.str();
}

void printFields(Shape const& shape, int depth = 1)
{
    for (auto const& field : shape.fields)
    {
        auto const& fieldShape = field.shape();

        std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ')
                  << field.rawName << " -> \"" << field.wireName << "\" [" << fieldShape.kind << ", offset " << field.offset << "]";

        if (field.isSensitive())
            std::cout << " (sensitive)";

        if (! field.doc.empty())
            std::cout << " // " << field.doc;

        std::cout << "\n";

        if (fieldShape.kind == Kind::structure)
            printFields(fieldShape, depth + 1);
    }
}

template <typename T>
void encodeAndPrint(T const& value)
{
    auto peek = Peek::of(value);

    if (! peek)
    {
        std::cout << "  error: " << peek.error() << "\n";
        return;
    }

    std::cout << "  value: " << *peek << "\n";

    auto bytes = msgpack::toBytes(*peek);

    if (bytes)
        std::cout << "  msgpack (" << bytes->size() << " bytes):\n" << hexDump(*bytes) << "\n";
    else
        std::cout << "  error: " << bytes.error() << "\n";
}
} // namespace

struct Application
{
    void run()
    {
        registerShape<Point>();
        registerShape<Line>();
        registerShape<Drawing>();

        getLogger("example")->info("{} shapes registered", Registry::instance().size());

        std::cout << "=== Drawing fields ===\n";
        printFields(shapeOf<Drawing>());

        Drawing drawing {
            "sketch",
            { Line { { 0.0f, 0.0f }, { 1.0f, 1.0f } }, Line { { 1.0f, 1.0f }, { 2.0f, 0.5f } } },
            { { "origin", Point { 0.0f, 0.0f } } },
            std::nullopt,
            "s3cr3t",
            Style::dashed
        };

        std::cout << "\n=== Point ===\n";
        encodeAndPrint(Point { 1.5f, -2.0f });

        // style is an enum which has no MessagePack representation
        std::cout << "\n=== Drawing ===\n";
        encodeAndPrint(drawing);

        std::cout << "\n=== Drawing lines ===\n";
        encodeAndPrint(drawing.lines.front());

        auto view = Peek::of(drawing)->intoStruct();
        if (view)
        {
            std::cout << "\n=== Walking Drawing ===\n";
            for (auto const& [field, value] : view->fields())
                std::cout << "  ." << field.wireName << " : " << value.shape().typeName << "\n";
        }
    }
};

int main()
{
    spdlog::cfg::load_env_levels();

    Application app;
    app.run();

    return 0;
}
