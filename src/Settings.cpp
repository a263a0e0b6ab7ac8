#include "mocksynth/Settings.hpp"
#include "mocksynth/Errors.hpp"
#include "mocksynth/Loader.hpp"
#include "mocksynth/Util.hpp"

namespace mocksynth {

Json default_settings() {
    return Json{
        {"output", {{"indent", 2}, {"format", "json"}}},
        {"fail_on_diagnostics", true},
    };
}

Settings Settings::load(const SettingsOptions& opts) {
    Json merged = Json::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, load_document(*opts.file_path));
    }

    Settings settings(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        settings.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    settings.apply_overrides(opts.overrides);

    // 5) mandatory
    settings.enforce_mandatory(opts.mandatory);

    return settings;
}

const Json& Settings::at(const std::string& path) const {
    return get_by_dot(data_, path);
}

bool Settings::contains(const std::string& path) const {
    return exists_by_dot(data_, path);
}

void Settings::set(const std::string& path, const Json& v) {
    set_by_dot(data_, path, v);
}

void Settings::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

void Settings::apply_env_prefix(const std::string& prefix) {
    for (const auto& [key, raw] : prefixed_environment(prefix)) {
        set_by_dot(data_, key, parse_json_or_string(raw));
    }
}

void Settings::apply_overrides(const std::map<std::string, Json>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

std::optional<std::uint64_t> Settings::seed() const {
    if (!contains("seed")) return std::nullopt;
    const Json& v = at("seed");
    if (v.is_number_unsigned()) return v.get<std::uint64_t>();
    if (v.is_number_integer()) return static_cast<std::uint64_t>(v.get<std::int64_t>());
    if (v.is_null()) return std::nullopt;
    throw MocksynthError("Setting 'seed' must be an integer, got " + json_type_name(v));
}

int Settings::output_indent() const {
    return get<int>("output.indent", 2);
}

std::string Settings::output_format() const {
    return to_lower(get<std::string>("output.format", "json"));
}

bool Settings::fail_on_diagnostics() const {
    return get<bool>("fail_on_diagnostics", true);
}

std::optional<std::string> Settings::replacement_label() const {
    if (!contains("replacement.label")) return std::nullopt;
    const Json& v = at("replacement.label");
    if (!v.is_string()) return std::nullopt;
    return v.get<std::string>();
}

int Settings::exit_status(const Diagnostics& diagnostics) const {
    return diagnostics.has_errors() && fail_on_diagnostics() ? 1 : 0;
}

std::string Settings::to_json_string(int indent) const {
    return data_.dump(indent);
}

} // namespace mocksynth
