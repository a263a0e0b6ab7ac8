#ifndef MOCKSYNTH_UTIL_HPP
#define MOCKSYNTH_UTIL_HPP

#include "mocksynth/Json.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mocksynth {

// Merge `overlay` into `base`. Objects merge key by key; anything else in
// `overlay` replaces what `base` holds.
void deep_merge(Json& base, const Json& overlay);

// Dot-path access into nested JSON objects ("output.indent").
// An empty path addresses the root.
void set_by_dot(Json& root, const std::string& path, const Json& value);
// Throws std::out_of_range if a segment is missing or not an object.
const Json& get_by_dot(const Json& root, const std::string& path);
bool exists_by_dot(const Json& root, const std::string& path);

std::string to_lower(std::string s);

// Parse an --overrides string: "seed:42, output.format:toml".
// Commas inside quotes, [] or {} do not split entries. Entries without
// a ':' are skipped.
std::map<std::string, Json> parse_overrides(const std::string& s);

// JSON if `raw` parses, otherwise `raw` as a JSON string.
Json parse_json_or_string(const std::string& raw);

// Environment name (prefix already stripped) to dot-path:
// lower-case, "__" -> "_", "_" -> ".". OUTPUT_INDENT -> output.indent,
// FAIL__ON__DIAGNOSTICS -> fail_on_diagnostics
std::string transform_env_name(const std::string& name);

// Variables named PREFIX_*, as (dot-path, raw value) pairs.
// Trailing underscores on `prefix` are ignored.
std::vector<std::pair<std::string, std::string>> prefixed_environment(const std::string& prefix);

} // namespace mocksynth

#endif // MOCKSYNTH_UTIL_HPP
