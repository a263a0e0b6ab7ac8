#include "mocksynth/Diagnostics.hpp"

#include <algorithm>

namespace mocksynth {

std::string severity_name(Severity severity) {
    switch (severity) {
        case Severity::Error:   return "Error";
        case Severity::Warning: return "Warning";
    }
    return "Error";
}

std::string Diagnostic::to_string() const {
    return severity_name(severity) + ": " + summary + ": " + detail;
}

bool Diagnostics::has_errors() const {
    return std::any_of(items_.begin(), items_.end(), [](const Diagnostic& d) {
        return d.severity == Severity::Error;
    });
}

std::vector<std::string> Diagnostics::details() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& d : items_) out.push_back(d.detail);
    return out;
}

} // namespace mocksynth
