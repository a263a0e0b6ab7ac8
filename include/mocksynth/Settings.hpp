#ifndef MOCKSYNTH_SETTINGS_HPP
#define MOCKSYNTH_SETTINGS_HPP

#include "mocksynth/Diagnostics.hpp"
#include "mocksynth/Json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mocksynth {

/**
 * @brief Built-in settings
 *
 * ```json
 * {"output": {"indent": 2, "format": "json"}, "fail_on_diagnostics": true}
 * ```
 */
Json default_settings();

/**
 * @brief Options for constructing Settings from multiple sources.
 */
struct SettingsOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix = std::string("MOCKSYNTH"); // env var prefix
    std::map<std::string, Json> overrides; // final precedence
    Json defaults = default_settings();
    std::vector<std::string> mandatory;
};

/**
 * @brief Tool settings with dot-notation helpers.
 *
 * Recognised keys: seed, output.indent, output.format,
 * fail_on_diagnostics, replacement.label.
 */
class Settings {
public:
    Settings() = default;
    explicit Settings(Json data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Settings load(const SettingsOptions& opts);

    const Json& data() const noexcept { return data_; }

    // Dot helpers
    const Json& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Json& v);

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const Json::exception&) {
            return fallback;
        }
    }

    // Enforcement
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Json>& kv);

    // Typed accessors
    std::optional<std::uint64_t> seed() const;
    int output_indent() const;
    std::string output_format() const;
    bool fail_on_diagnostics() const;
    std::optional<std::string> replacement_label() const;

    // 1 when `diagnostics` holds an error and fail_on_diagnostics is set, else 0.
    int exit_status(const Diagnostics& diagnostics) const;

    std::string to_json_string(int indent = 2) const;

private:
    Json data_ = Json::object();
};

} // namespace mocksynth

#endif // MOCKSYNTH_SETTINGS_HPP
