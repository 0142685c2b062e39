#include "minipg/common/diagnostics.hpp"

#include <algorithm>
#include <utility>

namespace minipg {

std::string_view severity_to_string(Severity severity) noexcept
{
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
    default:
        return "error";
    }
}

DiagnosticLog::DiagnosticLog(DiagnosticSink sink)
    : sink_{std::move(sink)}
{
}

void DiagnosticLog::record(Severity severity, std::string component, std::string message, std::string statement)
{
    Diagnostic diagnostic{};
    diagnostic.severity = severity;
    diagnostic.component = std::move(component);
    diagnostic.message = std::move(message);
    diagnostic.statement = std::move(statement);
    if (sink_) {
        sink_(diagnostic);
    }
    entries_.push_back(std::move(diagnostic));
}

void DiagnosticLog::append(const std::vector<Diagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        if (sink_) {
            sink_(diagnostic);
        }
        entries_.push_back(diagnostic);
    }
}

const std::vector<Diagnostic>& DiagnosticLog::entries() const noexcept
{
    return entries_;
}

std::vector<Diagnostic> DiagnosticLog::take() noexcept
{
    return std::exchange(entries_, {});
}

bool DiagnosticLog::has_errors() const noexcept
{
    return std::any_of(entries_.begin(), entries_.end(), [](const Diagnostic& diagnostic) {
        return diagnostic.severity == Severity::Error;
    });
}

}  // namespace minipg
