#include "mocksynth/Util.hpp"
#include "mocksynth/Path.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#if !defined(_WIN32)
  extern char **environ;
#endif

namespace mocksynth {

void deep_merge(Json& base, const Json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        base = overlay;
        return;
    }
    for (const auto& item : overlay.items()) {
        auto existing = base.find(item.key());
        if (existing != base.end() && existing->is_object() && item.value().is_object()) {
            deep_merge(*existing, item.value());
        } else {
            base[item.key()] = item.value();
        }
    }
}

const Json& get_by_dot(const Json& root, const std::string& path) {
    const Json* node = &root;
    for (const auto& segment : split_dot_path(path)) {
        if (!node->is_object()) {
            throw std::out_of_range("'" + path + "': '" + segment + "' is below a non-object");
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            throw std::out_of_range("'" + path + "': missing key '" + segment + "'");
        }
        node = &*it;
    }
    return *node;
}

bool exists_by_dot(const Json& root, const std::string& path) {
    try {
        (void)get_by_dot(root, path);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void set_by_dot(Json& root, const std::string& path, const Json& value) {
    const std::vector<std::string> segments = split_dot_path(path);
    if (segments.empty()) {
        root = value;
        return;
    }

    Json* node = &root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!node->is_object()) *node = Json::object();
        Json& child = (*node)[segments[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    if (!node->is_object()) *node = Json::object();
    (*node)[segments.back()] = value;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

/// Split on top-level commas (outside quotes and brackets).
std::vector<std::string> split_entries(const std::string& s) {
    std::vector<std::string> entries;
    std::string current;
    int depth = 0;
    char quote = '\0';

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (quote != '\0') {
            if (c == quote && s[i - 1] != '\\') quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            entries.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) entries.push_back(current);
    return entries;
}

} // namespace

std::map<std::string, Json> parse_overrides(const std::string& s) {
    std::map<std::string, Json> out;
    for (const auto& entry : split_entries(s)) {
        const auto colon = entry.find(':');
        if (colon == std::string::npos) continue;

        const std::string key = trim(entry.substr(0, colon));
        if (key.empty()) continue;
        out[key] = parse_json_or_string(trim(entry.substr(colon + 1)));
    }
    return out;
}

Json parse_json_or_string(const std::string& raw) {
    try {
        return Json::parse(raw);
    } catch (const Json::parse_error&) {
        return Json(raw);
    }
}

std::string transform_env_name(const std::string& name) {
    const std::string lower = to_lower(name);
    std::string out;
    out.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] != '_') {
            out += lower[i];
        } else if (i + 1 < lower.size() && lower[i + 1] == '_') {
            out += '_';
            ++i;
        } else {
            out += '.';
        }
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> prefixed_environment(const std::string& prefix) {
    std::string head = prefix;
    while (!head.empty() && head.back() == '_') head.pop_back();
    head += '_';

    std::vector<std::pair<std::string, std::string>> vars;
#if defined(_WIN32)
    char** const vars_begin = _environ;
#else
    char** const vars_begin = environ;
#endif
    if (vars_begin == nullptr) return vars;

    for (char** env = vars_begin; *env != nullptr; ++env) {
        const std::string entry(*env);
        const auto eq = entry.find('=');
        if (eq == std::string::npos || entry.compare(0, head.size(), head) != 0) continue;

        const std::string key = transform_env_name(entry.substr(head.size(), eq - head.size()));
        if (key.empty()) continue;
        vars.emplace_back(key, entry.substr(eq + 1));
    }
    return vars;
}

} // namespace mocksynth
