#pragma once

#include <cstddef>
#include <concepts>
#include <ostream>
#include <string>

#include "io.hpp"

namespace JsonScribe {

// ============================================================================
// SinkLike Concept
// ============================================================================

/// Concept for append-only character targets the scribe writes into.
/// Both operations return false when the target refused the characters
/// (overflow, bad stream state). A sink refers to storage owned by the caller.
template<typename T>
concept SinkLike = requires(T& sink, char c, const char* data, std::size_t size) {
    { sink.put(c) } -> std::same_as<bool>;
    { sink.write(data, size) } -> std::same_as<bool>;
};

// ============================================================================
// IteratorSink - any char output iterator bounded by a sentinel
// ============================================================================

/// Writes through an output iterator until it reaches the sentinel.
/// Reaching the sentinel is a sink failure, so a fixed buffer
/// IteratorSink<char*, char*> reports overflow instead of writing past its end.
template<CharOutputIterator It, CharSentinelForOut<It> Sent>
class IteratorSink {
    It m_current;
    Sent m_end;
    std::size_t m_bytesWritten = 0;

public:
    using iterator_type = It;

    constexpr IteratorSink(It first, Sent last): m_current(first), m_end(last) {}

    constexpr bool put(char c) {
        if(m_current == m_end) {
            return false;
        }
        *m_current++ = c; m_bytesWritten ++;
        return true;
    }

    constexpr bool write(const char* data, std::size_t size) {
        for(std::size_t i = 0; i < size; i ++) {
            if(m_current == m_end) {
                return false;
            }
            *m_current++ = data[i]; m_bytesWritten ++;
        }
        return true;
    }

    constexpr It current() const {
        return m_current;
    }

    constexpr std::size_t bytes_written() const {
        return m_bytesWritten;
    }
};

template<class It, class Sent>
IteratorSink(It, Sent) -> IteratorSink<It, Sent>;

// ============================================================================
// StringSink - appends to a caller-owned std::string
// ============================================================================

class StringSink {
    std::string* m_out;

public:
    constexpr explicit StringSink(std::string& out): m_out(&out) {}

    constexpr bool put(char c) {
        m_out->push_back(c);
        return true;
    }

    constexpr bool write(const char* data, std::size_t size) {
        m_out->append(data, size);
        return true;
    }

    constexpr const std::string& str() const {
        return *m_out;
    }
};

// ============================================================================
// StreamSink - writes to a caller-owned std::ostream
// ============================================================================

/// Fails as soon as the stream state is no longer good. If the stream was set up
/// to throw (exceptions mask), its exception leaves the scribe untouched.
/// Never flushes: flushing stays with whoever owns the stream.
class StreamSink {
    std::ostream* m_os;

public:
    explicit StreamSink(std::ostream& os): m_os(&os) {}

    bool put(char c) {
        m_os->put(c);
        return m_os->good();
    }

    bool write(const char* data, std::size_t size) {
        m_os->write(data, static_cast<std::streamsize>(size));
        return m_os->good();
    }
};

static_assert(SinkLike<IteratorSink<char*, char*>>, "IteratorSink<char*, char*> should satisfy SinkLike");
static_assert(SinkLike<IteratorSink<std::back_insert_iterator<std::string>, io_details::limitless_sentinel>>,
              "IteratorSink over a back inserter should satisfy SinkLike");
static_assert(SinkLike<StringSink>, "StringSink should satisfy SinkLike");
static_assert(SinkLike<StreamSink>, "StreamSink should satisfy SinkLike");

} // namespace JsonScribe
