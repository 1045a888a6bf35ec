// result.cpp
// Names for finding severities and kinds

#include <vast/result.hpp>

namespace vast {

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

const char* to_string(FindingKind kind) {
    switch (kind) {
        case FindingKind::Missing: return "missing";
        case FindingKind::Invalid: return "invalid";
    }
    return "unknown";
}

} // namespace vast
