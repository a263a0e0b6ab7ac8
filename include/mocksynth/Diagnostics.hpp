/**
 * @file Diagnostics.hpp
 * @brief Diagnostics returned by synthesis
 *
 * Diagnostics are plain data: they describe a problem, where it was
 * found, and which source range it is attributed to. Rendering and exit
 * code mapping are up to the caller.
 */

#ifndef MOCKSYNTH_DIAGNOSTICS_HPP
#define MOCKSYNTH_DIAGNOSTICS_HPP

#include "mocksynth/Path.hpp"

#include <string>
#include <vector>

namespace mocksynth {

enum class Severity {
    Error,
    Warning
};

/// "Error" or "Warning"
std::string severity_name(Severity severity);

struct Diagnostic {
    Severity severity = Severity::Error;
    std::string summary;
    std::string detail;
    Path path;              // where in the value tree the problem was found
    SourceRange subject;    // source the offending input came from

    /// "<Severity>: <summary>: <detail>"
    std::string to_string() const;
};

/**
 * @brief Ordered list of diagnostics
 */
class Diagnostics {
public:
    using const_iterator = std::vector<Diagnostic>::const_iterator;

    void append(Diagnostic diag) { items_.push_back(std::move(diag)); }
    void extend(const Diagnostics& other) {
        items_.insert(items_.end(), other.items_.begin(), other.items_.end());
    }

    bool empty() const noexcept { return items_.empty(); }
    size_t size() const noexcept { return items_.size(); }
    const Diagnostic& operator[](size_t i) const { return items_[i]; }

    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }

    bool has_errors() const;

    /// Detail strings in order.
    std::vector<std::string> details() const;

private:
    std::vector<Diagnostic> items_;
};

} // namespace mocksynth

#endif // MOCKSYNTH_DIAGNOSTICS_HPP
