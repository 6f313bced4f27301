#pragma once

#include <cstddef>
#include <string_view>

namespace JsonScribe {

enum class ScribeError {
    NO_ERROR,
    SINK_FAILURE,
    NO_OPEN_CONTEXT,
    CONTEXT_ALREADY_CLOSED,
    NESTING_DEPTH_EXCEEDED,
    ILLFORMED_NUMBER,
    UNCLOSED_CONTEXT,
    MULTIPLE_ROOTS
};

constexpr std::string_view error_to_string(ScribeError e) {
    switch(e) {
    case ScribeError::NO_ERROR: return "NO_ERROR"; break;
    case ScribeError::SINK_FAILURE: return "SINK_FAILURE"; break;
    case ScribeError::NO_OPEN_CONTEXT: return "NO_OPEN_CONTEXT"; break;
    case ScribeError::CONTEXT_ALREADY_CLOSED: return "CONTEXT_ALREADY_CLOSED"; break;
    case ScribeError::NESTING_DEPTH_EXCEEDED: return "NESTING_DEPTH_EXCEEDED"; break;
    case ScribeError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER"; break;
    case ScribeError::UNCLOSED_CONTEXT: return "UNCLOSED_CONTEXT"; break;
    case ScribeError::MULTIPLE_ROOTS: return "MULTIPLE_ROOTS"; break;
    }
    return "N/A";
}

// Structural misuse, as opposed to a failing sink or bad input data.
constexpr bool is_misuse(ScribeError e) {
    return e == ScribeError::NO_OPEN_CONTEXT
        || e == ScribeError::CONTEXT_ALREADY_CLOSED
        || e == ScribeError::UNCLOSED_CONTEXT
        || e == ScribeError::MULTIPLE_ROOTS;
}

class ScribeResult {
    ScribeError m_error = ScribeError::NO_ERROR;
    std::size_t m_cursor = 0;
public:
    constexpr ScribeResult(ScribeError err, std::size_t cursor):
        m_error(err), m_cursor(cursor)
    {}
    constexpr operator bool() const {
        return m_error == ScribeError::NO_ERROR;
    }
    constexpr ScribeError error() const {
        return m_error;
    }
    // Nesting depth at the moment the result was taken (or the error occurred).
    constexpr std::size_t cursor() const {
        return m_cursor;
    }
};

} // namespace JsonScribe
