//! # Build Diagnostics
//!
//! Ordered collector of the messages a build reports to its operator.
//!
//! Every component that can warn receives a `DiagnosticSink&` instead of
//! consulting process-wide state. Entries are kept in report order and are
//! also forwarded to the logger under the reporting component's module tag,
//! so the CLI prints them while tests assert on `entries()`.
//!
//! ```cpp
//! DiagnosticSink diagnostics;
//! diagnostics.warning("copy", "Could not copy dependency: " + dir);
//! size_t warnings = diagnostics.count(DiagnosticLevel::Warning);
//! ```

#ifndef STYLEBOOK_BUILD_DIAGNOSTICS_HPP
#define STYLEBOOK_BUILD_DIAGNOSTICS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stylebook::build {

/// Severity of a diagnostic entry.
enum class DiagnosticLevel {
    Info,
    Warning,
    Error,
    Success,
};

/// One reported message.
struct Diagnostic {
    DiagnosticLevel level;
    std::string message;
};

/// Collector of build diagnostics, owned by the caller.
class DiagnosticSink {
public:
    DiagnosticSink() = default;

    /// When `forward` is false, entries are only collected and never logged.
    explicit DiagnosticSink(bool forward) : forward_(forward) {}

    void report(DiagnosticLevel level, std::string_view module, std::string message);

    void info(std::string_view module, std::string message) {
        report(DiagnosticLevel::Info, module, std::move(message));
    }

    void warning(std::string_view module, std::string message) {
        report(DiagnosticLevel::Warning, module, std::move(message));
    }

    void error(std::string_view module, std::string message) {
        report(DiagnosticLevel::Error, module, std::move(message));
    }

    void success(std::string_view module, std::string message) {
        report(DiagnosticLevel::Success, module, std::move(message));
    }

    [[nodiscard]] auto entries() const -> const std::vector<Diagnostic>& {
        return entries_;
    }

    /// Messages of every entry at `level`, in report order.
    [[nodiscard]] auto messages(DiagnosticLevel level) const -> std::vector<std::string>;

    [[nodiscard]] auto count(DiagnosticLevel level) const -> size_t;

private:
    std::vector<Diagnostic> entries_;
    bool forward_ = true;
};

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_DIAGNOSTICS_HPP
