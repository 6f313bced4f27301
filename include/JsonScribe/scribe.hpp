#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "config.hpp"
#include "context_stack.hpp"
#include "errors.hpp"
#include "escape.hpp"
#include "numeric_literal.hpp"
#include "scribe_concept.hpp"
#include "sink.hpp"

namespace JsonScribe {

/// Streaming JSON writer. Keeps one ContextFrame per open array, object or
/// string value and emits separators and delimiters as constructs are opened
/// and closed; nothing is buffered beyond what the sink does itself.
///
/// Every primitive returns false on failure. The first failure is recorded in
/// getError() and makes every later primitive a no-op returning false, so
/// misuse is never followed by more output.
///
/// Detected misuse: closing with nothing open (NO_OPEN_CONTEXT), closing a
/// context that is already gone (CONTEXT_ALREADY_CLOSED), and a second
/// top-level value after the root is complete (MULTIPLE_ROOTS). Writing a key where a
/// value belongs, or a value where a key belongs, is the caller's contract:
/// the builder handles make those calls unrepresentable.
template<SinkLike Sink, ContextStackLike Stack = DefaultContextStack>
class Scribe {
public:
    using sink_type = Sink;
    using stack_type = Stack;
    using error_type = ScribeError;

    constexpr explicit Scribe(Sink sink): m_sink(std::move(sink)) {}

    constexpr ScribeError getError() const {
        return m_error;
    }

    constexpr ScribeResult result() const {
        return ScribeResult(m_error, cursor());
    }

    /// Nesting depth; equals the number of frames on the context stack.
    constexpr std::size_t cursor() const {
        return m_stack.size();
    }

    /// Open sequence number of the innermost frame; 0 when nothing is open.
    constexpr std::size_t current_id() const {
        return m_stack.empty() ? 0 : m_stack.at(m_stack.size() - 1).id;
    }

    constexpr Sink& sink() {
        return m_sink;
    }

    constexpr const Sink& sink() const {
        return m_sink;
    }

    constexpr bool begin_array() {
        return open(ContextFrame{ContextKind::ARRAY, false, false}, '[');
    }

    constexpr bool begin_object() {
        return open(ContextFrame{ContextKind::OBJECT, false, true}, '{');
    }

    constexpr bool begin_string_value() {
        return open(ContextFrame{ContextKind::STRING_VALUE, false, false}, '"');
    }

    constexpr bool begin_string_value(std::string_view prefix) {
        if (!begin_string_value()) return false;
        return escaped(prefix);
    }

    constexpr bool end_current() {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (m_stack.empty()) {
            return fail(ScribeError::NO_OPEN_CONTEXT);
        }
        ContextFrame frame = m_stack.pop();
        if (!put(closing_delimiter(frame.kind))) return false;
        if (!m_stack.empty()) {
            m_stack.top().hasEmittedFirstChild = true;
        } else {
            m_rootComplete = true;
        }
        return true;
    }

    /// Closes frames until the one opened at `depth` (cursor right after its
    /// begin_*) is closed, children first.
    constexpr bool end_through(std::size_t depth) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (depth == 0) {
            return fail(ScribeError::NO_OPEN_CONTEXT);
        }
        if (m_stack.size() < depth) {
            return fail(ScribeError::CONTEXT_ALREADY_CLOSED);
        }
        while (m_stack.size() >= depth) {
            if (!end_current()) return false;
        }
        return true;
    }

    /// Same, but only if the frame at `depth` is still the one numbered `id`
    /// (see current_id()). A frame opened later at the same depth is not closed.
    constexpr bool end_through(std::size_t depth, std::size_t id) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (depth == 0) {
            return fail(ScribeError::NO_OPEN_CONTEXT);
        }
        if (m_stack.size() < depth || m_stack.at(depth - 1).id != id) {
            return fail(ScribeError::CONTEXT_ALREADY_CLOSED);
        }
        return end_through(depth);
    }

    constexpr bool write_key(std::string_view key) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (m_stack.empty()) {
            return fail(ScribeError::NO_OPEN_CONTEXT);
        }
        ContextFrame& frame = m_stack.top();
        if (frame.hasEmittedFirstChild) {
            if (!put(',')) return false;
        }
        frame.hasEmittedFirstChild = true;
        frame.awaitingKey = false;
        if (!put('"')) return false;
        if (!escaped(key)) return false;
        if (!put('"')) return false;
        return put(':');
    }

    /// Writes a pre-rendered token (null, true, false, a number) verbatim.
    constexpr bool write_literal(std::string_view token) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (!separate()) return false;
        if (!raw(token)) return false;
        mark_root();
        return true;
    }

    constexpr bool write_null() {
        return write_literal("null");
    }

    constexpr bool write_bool(bool value) {
        return write_literal(value ? "true" : "false");
    }

    constexpr bool write_number(const NumericLiteral& number) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (const Decimal* d = std::get_if<Decimal>(&number)) {
            if (!is_json_number(d->text)) {
                return fail(ScribeError::ILLFORMED_NUMBER);
            }
            return write_literal(d->text);
        }
        if (!has_json_number_form(number)) {
            return write_null();
        }
        char buf[NumberBufSize]{};
        char* end = format_number(number, buf, buf + sizeof(buf));
        if (end == nullptr) {
            return fail(ScribeError::ILLFORMED_NUMBER);
        }
        return write_literal(std::string_view(buf, static_cast<std::size_t>(end - buf)));
    }

    /// A complete string literal in one call; no frame is pushed.
    constexpr bool write_string(std::string_view value) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (!separate()) return false;
        if (!put('"')) return false;
        if (!escaped(value)) return false;
        if (!put('"')) return false;
        mark_root();
        return true;
    }

    constexpr bool append_to_string_value(std::string_view content) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (m_stack.empty()) {
            return fail(ScribeError::NO_OPEN_CONTEXT);
        }
        return escaped(content);
    }

    constexpr bool append_to_string_value(char c) {
        return append_to_string_value(std::string_view(&c, 1));
    }

private:
    constexpr bool fail(ScribeError e) {
        m_error = e;
        return false;
    }

    constexpr bool put(char c) {
        if (!m_sink.put(c)) {
            return fail(ScribeError::SINK_FAILURE);
        }
        return true;
    }

    constexpr bool raw(std::string_view s) {
        if (!m_sink.write(s.data(), s.size())) {
            return fail(ScribeError::SINK_FAILURE);
        }
        return true;
    }

    constexpr bool escaped(std::string_view s) {
        if (!write_escaped(m_sink, s)) {
            return fail(ScribeError::SINK_FAILURE);
        }
        return true;
    }

    constexpr void mark_root() {
        if (m_stack.empty()) {
            m_rootComplete = true;
        }
    }

    // Whatever has to precede a value in the current context.
    constexpr bool separate() {
        if (m_stack.empty()) {
            if (m_rootComplete) {
                return fail(ScribeError::MULTIPLE_ROOTS);
            }
            return true;
        }
        ContextFrame& frame = m_stack.top();
        switch (frame.kind) {
        case ContextKind::ARRAY:
            if (frame.hasEmittedFirstChild) {
                if (!put(',')) return false;
            }
            frame.hasEmittedFirstChild = true;
            break;
        case ContextKind::OBJECT:
            // the key already wrote ':'
            frame.awaitingKey = true;
            break;
        case ContextKind::STRING_VALUE:
            break;
        }
        return true;
    }

    constexpr bool open(const ContextFrame& frame, char delimiter) {
        if (m_error != ScribeError::NO_ERROR) return false;
        if (m_stack.full()) {
            return fail(ScribeError::NESTING_DEPTH_EXCEEDED);
        }
        if (!separate()) return false;
        if (!put(delimiter)) return false;
        ContextFrame stamped = frame;
        stamped.id = ++m_opened;
        if (!m_stack.push(stamped)) {
            return fail(ScribeError::NESTING_DEPTH_EXCEEDED);
        }
        return true;
    }

    Sink m_sink;
    Stack m_stack;
    ScribeError m_error = ScribeError::NO_ERROR;
    std::size_t m_opened = 0;
    bool m_rootComplete = false;
};

template<SinkLike Sink>
Scribe(Sink) -> Scribe<Sink>;

static_assert(ScribeLike<Scribe<StringSink>>);
static_assert(ScribeLike<Scribe<IteratorSink<char*, char*>, ContextStack<16>>>);
static_assert(ScribeLike<Scribe<StreamSink>>);

} // namespace JsonScribe
