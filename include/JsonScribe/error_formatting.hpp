#pragma once

#include <format>
#include <string>

#include "errors.hpp"

namespace JsonScribe {

/// One-line description of a finished or failed writing session, e.g.
/// "JSON writing error 'NO_OPEN_CONTEXT' at depth 0: close requested with no open array, object or string value"
inline std::string ScribeResultToString(const ScribeResult& res) {
    if (res) {
        return "JSON written successfully";
    }
    std::string detail;
    switch (res.error()) {
    case ScribeError::SINK_FAILURE:
        detail = "the output refused further characters";
        break;
    case ScribeError::NO_OPEN_CONTEXT:
        detail = "close requested with no open array, object or string value";
        break;
    case ScribeError::CONTEXT_ALREADY_CLOSED:
        detail = "handle closed after its construct was already closed";
        break;
    case ScribeError::NESTING_DEPTH_EXCEEDED:
        detail = "context stack capacity reached";
        break;
    case ScribeError::ILLFORMED_NUMBER:
        detail = "decimal text is not a JSON number";
        break;
    case ScribeError::UNCLOSED_CONTEXT:
        detail = "document finished with open constructs";
        break;
    case ScribeError::MULTIPLE_ROOTS:
        detail = "top-level value written after the root value was complete";
        break;
    case ScribeError::NO_ERROR:
        break;
    }
    return std::format("JSON writing error '{}' at depth {}: {}", error_to_string(res.error()), res.cursor(), detail);
}

} // namespace JsonScribe
