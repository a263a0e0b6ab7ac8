/**
 * @file Loader.hpp
 * @brief Loading schemas, targets and replacements from files
 *
 * Documents are JSON (nlohmann::json) or TOML (toml++), chosen by file
 * extension. TOML tables become JSON objects; dates and times become
 * strings.
 */

#ifndef MOCKSYNTH_LOADER_HPP
#define MOCKSYNTH_LOADER_HPP

#include "mocksynth/Json.hpp"
#include "mocksynth/Schema.hpp"
#include "mocksynth/Synthesize.hpp"
#include "mocksynth/Value.hpp"

#include <string>

namespace mocksynth {

// ============================================================================
// Documents
// ============================================================================

/**
 * @brief Load a JSON file, keeping key order
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Json load_json_file(const std::string& path);

/**
 * @brief Load a TOML file as JSON
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Json load_toml_file(const std::string& path);

/**
 * @brief Load a JSON or TOML file, detected by extension
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError on syntax errors or an extension other than
 *         .json / .toml
 */
Json load_document(const std::string& path);

/**
 * @brief Lower-cased extension including the dot (".json"), or ""
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Range covering a whole file, from 1,1 to its last character
 *
 * @throws FileNotFoundError if the file doesn't exist
 */
SourceRange whole_file_range(const std::string& path);

/**
 * @brief Render a JSON document as TOML
 *
 * TOML needs a table at the root, so a non-object document is wrapped
 * under "value". Null object members are omitted; null array elements
 * become empty strings.
 */
std::string to_toml_string(const Json& j);

// ============================================================================
// Synthesis inputs
// ============================================================================

/**
 * @brief Load a schema document
 * @throws SchemaError if the document is not a valid schema
 */
Block load_schema_file(const std::string& path);

/**
 * @brief Load a target value, decoded against the schema's implied type
 * @throws DecodeError if the document does not fit the schema
 */
Value load_target_file(const std::string& path, const Block& schema);

/**
 * @brief Load a replacement value
 *
 * The document is decoded without a wanted type; mismatches against the
 * schema are reported later by synthesis as diagnostics. The range covers
 * the whole file.
 */
ReplacementValue load_replacement_file(const std::string& path);

/**
 * @brief Parse an inline JSON replacement (the CLI's --with)
 *
 * The range is labelled `label`, or "<inline>" when it is empty, and runs
 * from 1,1 to one column past the last character of `raw`.
 *
 * @throws DocumentParseError (file "--with") if `raw` is not valid JSON
 */
ReplacementValue replacement_from_string(const std::string& raw, const std::string& label);

} // namespace mocksynth

#endif // MOCKSYNTH_LOADER_HPP
