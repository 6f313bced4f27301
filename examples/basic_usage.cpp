// Basic JsonScribe usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <JsonScribe/builder.hpp>
#include <JsonScribe/error_formatting.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace JsonScribe;

int main() {
    std::vector<int> ports{8080, 8443};

    std::string json;
    Document doc(json);
    doc.object()
        .with("app_name", "MyApp")
        .with("version", 1)
        .withTrue("debug_mode")
        .object("server")
            .with("host", "localhost")
            .array("ports").withRange(ports).then()
        .then()
        .value("banner", "Welcome to ").append("MyApp").append('!').then()
    .then();

    auto result = doc.finish();
    if (!result) {
        std::cout << ScribeResultToString(result) << std::endl;
        return 1;
    }

    std::cout << json << std::endl;

    // Writing straight to a stream, one primitive at a time
    Scribe scribe{StreamSink(std::cout)};
    bool ok = scribe.begin_array()
        && scribe.write_string("line\nbreak")
        && scribe.write_number(to_numeric_literal(0.25))
        && scribe.write_number(Decimal("12345678901234567890.5"))
        && scribe.end_current();
    std::cout << std::endl;
    if (!ok) {
        std::cout << ScribeResultToString(scribe.result()) << std::endl;
        return 1;
    }

    return 0;
}
