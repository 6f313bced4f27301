#include "test_helpers.hpp"
using namespace TestHelpers;
using JsonScribe::ScribeError;
using JsonScribe::to_numeric_literal;

// ============================================================================
// Closing with nothing open
// ============================================================================

static_assert(TestScribeFails([](auto& s) {
    s.end_current();
}, ScribeError::NO_OPEN_CONTEXT, ""));

// One close more than opens: the extra close writes nothing
static_assert(TestScribeFails([](auto& s) {
    s.begin_array();
    s.write_number(to_numeric_literal(1));
    s.end_current();
    s.end_current();
}, ScribeError::NO_OPEN_CONTEXT, "[1]"));

static_assert([]() constexpr {
    std::string out;
    StringScribe s{JsonScribe::StringSink(out)};
    bool ok = s.begin_object() && s.end_current();
    bool extra = s.end_current();
    return ok && !extra && s.cursor() == 0 && JsonScribe::is_misuse(s.getError());
}());

// Keys and string content need an open context
static_assert(TestScribeFails([](auto& s) {
    s.write_key("k");
}, ScribeError::NO_OPEN_CONTEXT, ""));

static_assert(TestScribeFails([](auto& s) {
    s.append_to_string_value("text");
}, ScribeError::NO_OPEN_CONTEXT, ""));

// ============================================================================
// Closing a context that is already gone
// ============================================================================

static_assert(TestScribeFails([](auto& s) {
    s.begin_array();
    s.begin_array();
    const std::size_t inner = s.cursor();
    s.end_current();
    s.end_through(inner);   // already closed
}, ScribeError::CONTEXT_ALREADY_CLOSED, "[[]"));

static_assert(TestScribeFails([](auto& s) {
    s.end_through(0);
}, ScribeError::NO_OPEN_CONTEXT, ""));

// ============================================================================
// The first error sticks
// ============================================================================

static_assert(TestScribeFails([](auto& s) {
    s.begin_array();
    s.end_current();
    s.end_current();            // misuse
    s.begin_array();            // refused
    s.write_null();             // refused
    s.write_string("ignored");  // refused
}, ScribeError::NO_OPEN_CONTEXT, "[]"));

static_assert([]() constexpr {
    std::string out;
    StringScribe s{JsonScribe::StringSink(out)};
    s.end_current();
    return !s.begin_object()
        && !s.write_key("k")
        && !s.write_bool(true)
        && !s.write_number(to_numeric_literal(1))
        && !s.begin_string_value()
        && !s.append_to_string_value('c')
        && !s.end_current()
        && !s.end_through(1)
        && out.empty()
        && s.getError() == ScribeError::NO_OPEN_CONTEXT;
}());

static_assert(JsonScribe::error_to_string(ScribeError::CONTEXT_ALREADY_CLOSED) == "CONTEXT_ALREADY_CLOSED");
static_assert(!JsonScribe::is_misuse(ScribeError::SINK_FAILURE));

// ============================================================================
// Frames are numbered in open order
// ============================================================================

static_assert([]() constexpr {
    std::string out;
    StringScribe s{JsonScribe::StringSink(out)};
    if (s.current_id() != 0) return false;
    s.begin_array();
    const std::size_t outer = s.current_id();
    s.begin_object();
    const std::size_t first = s.current_id();
    s.end_current();
    if (s.current_id() != outer) return false;
    s.begin_object();
    const std::size_t second = s.current_id();
    return outer != first && first != second && second != outer
        && s.end_through(2, second) && s.end_through(1, outer) && out == "[{},{}]";
}());

// Right depth, wrong frame: refused, nothing closed
static_assert(TestScribeFails([](auto& s) {
    s.begin_array();
    s.begin_array();
    const std::size_t stale = s.current_id();
    s.end_current();
    s.begin_object();
    s.end_through(2, stale);
}, ScribeError::CONTEXT_ALREADY_CLOSED, "[[],{"));

// ============================================================================
// One root value per scribe
// ============================================================================

static_assert(TestScribeFails([](auto& s) {
    s.write_bool(true);
    s.write_bool(true);
}, ScribeError::MULTIPLE_ROOTS, "true"));

static_assert(TestScribeFails([](auto& s) {
    s.begin_array();
    s.end_current();
    s.begin_object();
}, ScribeError::MULTIPLE_ROOTS, "[]"));

static_assert(TestScribeFails([](auto& s) {
    s.begin_string_value("a");
    s.end_current();
    s.write_string("b");
}, ScribeError::MULTIPLE_ROOTS, R"("a")"));

// A refused Decimal does not complete the root
static_assert(TestScribeFails([](auto& s) {
    s.write_number(JsonScribe::NumericLiteral(JsonScribe::Decimal("1.")));
}, ScribeError::ILLFORMED_NUMBER, ""));

static_assert(JsonScribe::is_misuse(ScribeError::MULTIPLE_ROOTS));
