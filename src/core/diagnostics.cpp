#include <marklex/core/diagnostics.h>

#include <sstream>
#include <utility>

namespace marklex::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.range.end > event.range.start) {
        oss << " @" << event.range.start << "-" << event.range.end;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    record(std::move(event));
}

void DiagnosticEmitter::emit_at(Severity severity, const std::string& module,
                                const std::string& stage, std::uint32_t code,
                                SourceRange range, const std::string& message) {
    DiagnosticEvent event;
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.code = code;
    event.range = range;
    record(std::move(event));
}

void DiagnosticEmitter::record(DiagnosticEvent event) {
    if (event.severity < min_severity_) {
        return;
    }

    event.timestamp = std::chrono::steady_clock::now();
    event.correlation_id = correlation_id_;

    events_.push_back(std::move(event));

    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_code(std::uint32_t code) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.code == code) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace marklex::core
