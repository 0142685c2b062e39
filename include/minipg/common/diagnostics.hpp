#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace minipg {

enum class Severity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct Diagnostic final {
    Severity severity = Severity::Info;
    std::string component{};
    std::string message{};
    std::string statement{};
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

[[nodiscard]] std::string_view severity_to_string(Severity severity) noexcept;

// Collects diagnostics for one operation and forwards each one to an optional sink.
class DiagnosticLog final {
public:
    DiagnosticLog() = default;
    explicit DiagnosticLog(DiagnosticSink sink);

    void record(Severity severity, std::string component, std::string message, std::string statement = {});
    void append(const std::vector<Diagnostic>& diagnostics);

    [[nodiscard]] const std::vector<Diagnostic>& entries() const noexcept;
    [[nodiscard]] std::vector<Diagnostic> take() noexcept;
    [[nodiscard]] bool has_errors() const noexcept;

private:
    DiagnosticSink sink_{};
    std::vector<Diagnostic> entries_{};
};

}  // namespace minipg
