#include "test_helpers.hpp"
#include <JsonScribe/struct_introspection.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;

// Field names come from pfr, so the structs live at namespace scope.
namespace aggregate_models {

struct Point {
    int x;
    int y;
};

struct Label {
    std::string text;
    std::optional<int> priority;
    bool visible;
};

struct Shape {
    std::string_view name;
    Point origin;
    std::vector<Point> vertices;
    std::vector<int> weights;
    Label label;
};

} // namespace aggregate_models

using namespace aggregate_models;

static_assert(JsonScribe::InscribableStruct<Point>);
static_assert(!JsonScribe::InscribableStruct<std::string>);
static_assert(!JsonScribe::InscribableStruct<std::vector<int>>);
static_assert(JsonScribe::introspection::structureElementsCount<Shape> == 5);
static_assert(JsonScribe::introspection::structureElementNameByIndex<2, Shape> == "vertices");

// ============================================================================
// Flat aggregates
// ============================================================================

static_assert(TestWrite([](auto& doc) {
    JsonScribe::inscribe(doc, Point{3, -4});
}, R"({"x":3,"y":-4})"));

static_assert(TestWrite([](auto& doc) {
    JsonScribe::inscribe(doc, Label{"hi", std::nullopt, true});
}, R"({"text":"hi","priority":null,"visible":true})"));

// Fields mixed with hand-written members
static_assert(TestWrite([](auto& doc) {
    auto obj = doc.object();
    obj.with("kind", "point");
    JsonScribe::inscribe_fields(obj, Point{1, 2});
    obj.with("extra", false).then();
}, R"({"kind":"point","x":1,"y":2,"extra":false})"));

// ============================================================================
// Nesting
// ============================================================================

static_assert(TestWrite([](auto& doc) {
    Shape shape{
        "tri",
        Point{0, 0},
        {Point{1, 0}, Point{0, 1}},
        {5, 6},
        Label{"t", 2, false},
    };
    JsonScribe::inscribe(doc, shape);
}, R"({"name":"tri","origin":{"x":0,"y":0},"vertices":[{"x":1,"y":0},{"x":0,"y":1}],)"
   R"("weights":[5,6],"label":{"text":"t","priority":2,"visible":false}})"));

// Aggregates as array elements
static_assert(TestWrite([](auto& doc) {
    auto arr = doc.array();
    JsonScribe::inscribe(arr, Point{1, 1});
    JsonScribe::inscribe(arr, Point{2, 2});
    arr.then();
}, R"([{"x":1,"y":1},{"x":2,"y":2}])"));

static_assert(TestWrite([](auto& doc) {
    Shape empty{"none", Point{}, {}, {}, Label{}};
    JsonScribe::inscribe(doc, empty);
}, R"({"name":"none","origin":{"x":0,"y":0},"vertices":[],"weights":[],"label":{"text":"","priority":null,"visible":false}})"));
