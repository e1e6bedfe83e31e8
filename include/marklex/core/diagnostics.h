#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace marklex::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct SourceRange {
    std::size_t start = 0;
    std::size_t end = 0;

    bool operator==(const SourceRange& other) const {
        return start == other.start && end == other.end;
    }
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint32_t code = 0;
    SourceRange range;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    // Same as emit(), with a numeric code and the source range it refers to.
    void emit_at(Severity severity, const std::string& module,
                 const std::string& stage, std::uint32_t code,
                 SourceRange range, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_code(std::uint32_t code) const;

    void clear();
    std::size_t size() const;

private:
    void record(DiagnosticEvent event);

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace marklex::core
