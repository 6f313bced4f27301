#include "test_helpers.hpp"
#include <cstdint>
#include <limits>

using namespace TestHelpers;

// ============================================================================
// Integer rendering
// ============================================================================

static_assert(TestWrite([](auto& doc) { doc.with(0); }, "0"));
static_assert(TestWrite([](auto& doc) { doc.with(-1); }, "-1"));
static_assert(TestWrite([](auto& doc) { doc.with(1234567890); }, "1234567890"));

static_assert(TestWrite([](auto& doc) {
    doc.with(std::numeric_limits<std::int64_t>::min());
}, "-9223372036854775808"));

static_assert(TestWrite([](auto& doc) {
    doc.with(std::numeric_limits<std::int64_t>::max());
}, "9223372036854775807"));

static_assert(TestWrite([](auto& doc) {
    doc.with(std::numeric_limits<std::uint64_t>::max());
}, "18446744073709551615"));

// Every integer width maps onto the same rendering
static_assert(TestWrite([](auto& doc) {
    doc.array()
        .with(static_cast<signed char>(-128))
        .with(static_cast<unsigned char>(255))
        .with(static_cast<short>(-32768))
        .with(static_cast<unsigned short>(65535))
        .with(std::numeric_limits<std::int32_t>::min())
        .with(std::numeric_limits<std::uint32_t>::max())
        .with(42L)
        .with(42ULL)
    .then();
}, "[-128,255,-32768,65535,-2147483648,4294967295,42,42]"));

// char is a one-character string, not a number
static_assert(TestWrite([](auto& doc) {
    doc.array().with('7').with(static_cast<signed char>('7')).then();
}, R"(["7",55])"));

// ============================================================================
// NumericLiteral directly
// ============================================================================

static_assert(TestScribe([](auto& s) {
    return s.write_number(JsonScribe::NumericLiteral(std::in_place_type<std::uint64_t>, 7u));
}, "7"));

static_assert([]() constexpr {
    auto lit = JsonScribe::to_numeric_literal(static_cast<unsigned short>(3));
    return std::holds_alternative<std::uint64_t>(lit) && std::get<std::uint64_t>(lit) == 3;
}());

static_assert([]() constexpr {
    auto lit = JsonScribe::to_numeric_literal(-3);
    return std::holds_alternative<std::int64_t>(lit) && std::get<std::int64_t>(lit) == -3;
}());

static_assert([]() constexpr {
    char buf[JsonScribe::NumberBufSize]{};
    char* end = JsonScribe::format_decimal_integer<std::int64_t>(-905, buf, buf + sizeof(buf));
    return std::string_view(buf, static_cast<std::size_t>(end - buf)) == "-905";
}());

// Floating types keep their own alternative
static_assert([]() constexpr {
    return std::holds_alternative<float>(JsonScribe::to_numeric_literal(1.0f))
        && std::holds_alternative<double>(JsonScribe::to_numeric_literal(1.0))
        && std::holds_alternative<long double>(JsonScribe::to_numeric_literal(1.0L));
}());

static_assert(JsonScribe::NumericValue<int>);
static_assert(JsonScribe::NumericValue<unsigned char>);
static_assert(JsonScribe::NumericValue<double>);
static_assert(JsonScribe::NumericValue<JsonScribe::Decimal>);
static_assert(!JsonScribe::NumericValue<bool>);
static_assert(!JsonScribe::NumericValue<char>);
static_assert(!JsonScribe::NumericValue<char32_t>);
