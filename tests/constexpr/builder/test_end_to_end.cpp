#include "test_helpers.hpp"
#include <array>
#include <vector>

using namespace TestHelpers;
using JsonScribe::ScribeError;

// ============================================================================
// One document, several ways
// ============================================================================

constexpr std::string_view Expected = R"({"a":[1,true,"x"]})";

static_assert(TestWrite([](auto& doc) {
    doc.object().array("a").with(1).withTrue().with("x").then().then();
}, Expected));

static_assert(TestWrite([](auto& doc) {
    doc.object().array("a").withAll(1, true, "x").then().then();
}, Expected));

static_assert(TestWrite([](auto& doc) {
    auto obj = doc.object();
    auto arr = obj.array("a");
    arr.with(1);
    arr.withTrue();
    arr.element().append('x').then();
    obj.then();
}, Expected));

static_assert(TestScribe([](auto& s) {
    return s.begin_object() && s.write_key("a") && s.begin_array()
        && s.write_number(JsonScribe::to_numeric_literal(1)) && s.write_bool(true)
        && s.write_string("x") && s.end_current() && s.end_current();
}, Expected));

static_assert(TestScribe([](auto& s) {
    return s.begin_object() && s.write_key("a") && s.begin_array()
        && s.write_literal("1") && s.write_literal("true")
        && s.begin_string_value("x") && s.end_through(1);
}, Expected));

// A larger document
static_assert(TestWrite([](auto& doc) {
    std::vector<int> scores{90, 85};
    doc.object()
        .with("name", "Ada")
        .with("age", 36)
        .withNull("email")
        .array("scores").withRange(scores).then()
        .object("address")
            .with("city", "London")
            .withEmptyArray("lines")
        .then()
        .array("tags").then()
    .then();
}, R"({"name":"Ada","age":36,"email":null,"scores":[90,85],"address":{"city":"London","lines":[]},"tags":[]})"));

// ============================================================================
// finish()
// ============================================================================

static_assert(TestWriteFails([](auto& doc) {
    doc.array().with(1);
}, ScribeError::UNCLOSED_CONTEXT, "[1"));

static_assert(TestWriteFails([](auto& doc) {
    doc.object().array("open").object();
}, ScribeError::UNCLOSED_CONTEXT, R"({"open":[{)"));

// Unclosed constructs are reported, not recorded: the session can still be completed
static_assert([]() constexpr {
    std::string out;
    JsonScribe::Document doc(out);
    auto arr = doc.array();
    auto early = doc.finish();
    arr.then();
    auto done = doc.finish();
    return !early && early.error() == ScribeError::UNCLOSED_CONTEXT && early.cursor() == 1
        && done && out == "[]";
}());

// Misuse wins over unclosed
static_assert(TestWriteFails([](auto& doc) {
    auto arr = doc.array();
    arr.object().then().then();
    doc.scribe().end_current();
    doc.array();
}, ScribeError::NO_OPEN_CONTEXT, "[{}]"));

// Nothing written is a successful, empty session
static_assert(TestWrite([](auto&) {}, ""));

// ============================================================================
// A document has one root value
// ============================================================================

static_assert(TestWriteFails([](auto& doc) {
    doc.withTrue().withTrue();
}, ScribeError::MULTIPLE_ROOTS, "true"));

static_assert(TestWriteFails([](auto& doc) {
    doc.array().with(1).then();
    doc.object().with("k", 2).then();
}, ScribeError::MULTIPLE_ROOTS, "[1]"));

static_assert(TestWriteFails([](auto& doc) {
    doc.element().append("x").then();
    doc.withNull();
}, ScribeError::MULTIPLE_ROOTS, R"("x")"));
