//! # Build Diagnostics Implementation

#include "build/diagnostics.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace stylebook::build {

void DiagnosticSink::report(DiagnosticLevel level, std::string_view module, std::string message) {
    if (forward_) {
        switch (level) {
        case DiagnosticLevel::Info:
        case DiagnosticLevel::Success:
            STYLEBOOK_LOG_INFO(module, message);
            break;
        case DiagnosticLevel::Warning:
            STYLEBOOK_LOG_WARN(module, message);
            break;
        case DiagnosticLevel::Error:
            STYLEBOOK_LOG_ERROR(module, message);
            break;
        }
    }
    entries_.push_back(Diagnostic{level, std::move(message)});
}

auto DiagnosticSink::messages(DiagnosticLevel level) const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry.level == level) {
            result.push_back(entry.message);
        }
    }
    return result;
}

auto DiagnosticSink::count(DiagnosticLevel level) const -> size_t {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [level](const Diagnostic& d) { return d.level == level; }));
}

} // namespace stylebook::build
