/**
 * @file Path.cpp
 * @brief Implementation of traversal paths and source ranges
 */

#include "mocksynth/Path.hpp"

#include <sstream>

namespace mocksynth {

Path Path::attribute(const std::string& name) const {
    Path next = *this;
    next.steps_.push_back(PathStep::attribute(name));
    return next;
}

Path Path::element(size_t index) const {
    Path next = *this;
    next.steps_.push_back(PathStep::element(index));
    return next;
}

Path Path::key(const std::string& key) const {
    Path next = *this;
    next.steps_.push_back(PathStep::key(key));
    return next;
}

std::string Path::to_string() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& step : steps_) {
        switch (step.kind) {
            case PathStep::Kind::Attribute:
                if (!first) oss << '.';
                oss << step.name;
                break;
            case PathStep::Kind::Index:
                oss << '[' << step.index << ']';
                break;
            case PathStep::Kind::Key:
                oss << "[\"" << step.name << "\"]";
                break;
        }
        first = false;
    }
    return oss.str();
}

std::string Path::attribute_string() const {
    std::vector<std::string> names;
    for (const auto& step : steps_) {
        if (step.kind == PathStep::Kind::Attribute) {
            names.push_back(step.name);
        }
    }
    return join_dot_path(names);
}

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

Path path_from_dots(const std::string& dotted) {
    Path path;
    for (const auto& seg : split_dot_path(dotted)) {
        path = path.attribute(seg);
    }
    return path;
}

std::string SourceRange::to_string() const {
    std::ostringstream oss;
    oss << filename << ':' << start.line << ',' << start.column << '-';
    if (start.line == end.line) {
        oss << end.column;
    } else {
        oss << end.line << ',' << end.column;
    }
    return oss.str();
}

} // namespace mocksynth
