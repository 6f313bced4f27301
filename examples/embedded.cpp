// Embedded Systems Example: telemetry into a fixed buffer
//
// Demonstrates:
// - Fixed-capacity context stack (no allocation for nesting state)
// - Output into a caller-owned char buffer; overflow is reported, never overrun
// - Aggregates written field by field without allocation
//
// Notes:
// - Output buffers are fixed-size and explicitly NUL-terminated for convenience.
//

#include <JsonScribe/builder.hpp>
#include <JsonScribe/error_formatting.hpp>

#include <array>
#include <cstdint>
#include <cstdio>
#include <optional>

using namespace JsonScribe;

// ============================================================================
// Models
// ============================================================================

struct Sample {
    std::uint32_t timestamp_ms;
    float temperature_c;
    std::optional<std::int16_t> rssi_dbm;
};

using TelemetryDocument = Document<IteratorSink<char*, char*>, ContextStack<4>>;

// ============================================================================
// Writer
// ============================================================================

template<std::size_t N>
ScribeResult write_telemetry(char* first, char* last, const char* device, const std::array<Sample, N>& samples) {
    TelemetryDocument doc(first, last);
    auto root = doc.object();
    root.with("device", device);
    auto list = root.array("samples");
    for (const Sample& s : samples) {
        list.object()
            .with("t", s.timestamp_ms)
            .with("temp", s.temperature_c)
            .with("rssi", s.rssi_dbm)
        .then();
    }
    list.then();
    root.then();
    return doc.finish();
}

int main() {
    std::array<Sample, 3> samples{{
        {1000, 21.5f, std::int16_t{-61}},
        {2000, 21.75f, std::nullopt},
        {3000, 22.0f, std::int16_t{-58}},
    }};

    std::array<char, 256> buf{};
    auto r = write_telemetry(buf.data(), buf.data() + buf.size() - 1, "sensor-7", samples);
    if (!r) {
        std::printf("%s\n", ScribeResultToString(r).c_str());
        return 1;
    }
    std::printf("%s\n", buf.data());

    // Same data into a buffer that is too small
    std::array<char, 32> small{};
    auto overflow = write_telemetry(small.data(), small.data() + small.size() - 1, "sensor-7", samples);
    std::printf("small buffer: %s\n", ScribeResultToString(overflow).c_str());
    return overflow.error() == ScribeError::SINK_FAILURE ? 0 : 1;
}
