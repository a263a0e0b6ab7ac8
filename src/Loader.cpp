/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "mocksynth/Loader.hpp"
#include "mocksynth/Errors.hpp"
#include "mocksynth/Util.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mocksynth {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// ----------------------------------------------------------------------------
// JSON -> TOML for output. TOML has no null: null members are left out and
// null array elements are written as "".
// ----------------------------------------------------------------------------

void push_json(toml::array& out, const Json& v);

void insert_json(toml::table& out, const std::string& key, const Json& v) {
    if (v.is_object()) {
        toml::table child;
        for (const auto& item : v.items()) insert_json(child, item.key(), item.value());
        out.insert(key, std::move(child));
    } else if (v.is_array()) {
        toml::array child;
        for (const auto& elem : v) push_json(child, elem);
        out.insert(key, std::move(child));
    } else if (v.is_string()) {
        out.insert(key, v.get<std::string>());
    } else if (v.is_boolean()) {
        out.insert(key, v.get<bool>());
    } else if (v.is_number_integer()) {
        out.insert(key, v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        out.insert(key, v.get<double>());
    }
}

void push_json(toml::array& out, const Json& v) {
    if (v.is_object()) {
        toml::table child;
        for (const auto& item : v.items()) insert_json(child, item.key(), item.value());
        out.push_back(std::move(child));
    } else if (v.is_array()) {
        toml::array child;
        for (const auto& elem : v) push_json(child, elem);
        out.push_back(std::move(child));
    } else if (v.is_string()) {
        out.push_back(v.get<std::string>());
    } else if (v.is_boolean()) {
        out.push_back(v.get<bool>());
    } else if (v.is_number_integer()) {
        out.push_back(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        out.push_back(v.get<double>());
    } else {
        out.push_back(std::string{});
    }
}

} // anonymous namespace

// ============================================================================
// Documents
// ============================================================================

Json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return Json::parse(content);
    } catch (const Json::parse_error& e) {
        throw DocumentParseError(path, e.what());
    }
}

Json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line
                << ", column " << e.source().begin.column
                << ": " << e.description();
        throw DocumentParseError(path, details.str());
    }

    // toml++ renders dates and times as JSON strings.
    std::ostringstream rendered;
    rendered << toml::json_formatter{table};
    try {
        return Json::parse(rendered.str());
    } catch (const Json::parse_error& e) {
        // nan and inf have no JSON form
        throw DocumentParseError(path, e.what());
    }
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Json load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw DocumentParseError(path, "unsupported file type '" + ext +
                                   "' (expected .json or .toml)");
}

SourceRange whole_file_range(const std::string& path) {
    const std::string content = read_file(path);

    SourceRange range;
    range.filename = path;
    range.start = SourcePos{1, 1, 0};

    SourcePos end{1, 1, 0};
    for (char c : content) {
        ++end.byte;
        if (c == '\n') {
            ++end.line;
            end.column = 1;
        } else {
            ++end.column;
        }
    }
    range.end = end;
    return range;
}

std::string to_toml_string(const Json& j) {
    toml::table root;
    if (j.is_object()) {
        for (const auto& item : j.items()) insert_json(root, item.key(), item.value());
    } else {
        insert_json(root, "value", j);
    }
    std::ostringstream oss;
    oss << root;
    return oss.str();
}

// ============================================================================
// Synthesis inputs
// ============================================================================

Block load_schema_file(const std::string& path) {
    return schema_from_json(load_document(path));
}

Value load_target_file(const std::string& path, const Block& schema) {
    return value_from_json(load_document(path), schema.implied_type());
}

ReplacementValue load_replacement_file(const std::string& path) {
    ReplacementValue replacement;
    replacement.value = infer_value_from_json(load_document(path));
    replacement.range = whole_file_range(path);
    return replacement;
}

ReplacementValue replacement_from_string(const std::string& raw, const std::string& label) {
    Json parsed;
    try {
        parsed = Json::parse(raw);
    } catch (const Json::parse_error& e) {
        throw DocumentParseError("--with", e.what());
    }

    const int length = static_cast<int>(raw.size());
    ReplacementValue replacement;
    replacement.value = infer_value_from_json(parsed);
    replacement.range.filename = label.empty() ? std::string("<inline>") : label;
    replacement.range.start = SourcePos{1, 1, 0};
    replacement.range.end = SourcePos{1, length + 1, length};
    return replacement;
}

} // namespace mocksynth
