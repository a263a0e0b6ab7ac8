/**
 * @file Json.hpp
 * @brief JSON encoding of types, values and schemas
 *
 * Uses nlohmann::ordered_json so that documents keep their key order;
 * schema declaration order is the order synthesis visits fields.
 *
 * Type encoding:
 * - "string", "number", "bool", "dynamic"
 * - ["list", T], ["set", T], ["map", T]
 * - ["object", {"name": T, ...}]
 *
 * Schema encoding (provider schema layout):
 * ```json
 * {
 *   "attributes": {
 *     "id":     {"type": "string", "computed": true},
 *     "nested": {"nested_type": {"attributes": {...}, "nesting_mode": "list"}}
 *   },
 *   "block_types": {
 *     "block": {"nesting_mode": "set", "block": {"attributes": {...}}}
 *   }
 * }
 * ```
 * A document of the form {"version": N, "block": {...}} is unwrapped.
 */

#ifndef MOCKSYNTH_JSON_HPP
#define MOCKSYNTH_JSON_HPP

#include "mocksynth/Path.hpp"
#include "mocksynth/Schema.hpp"
#include "mocksynth/Type.hpp"
#include "mocksynth/Value.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mocksynth {

using Json = nlohmann::ordered_json;

/**
 * @brief Human-readable kind of a JSON value
 * @return "null", "boolean", "integer", "float", "string", "array" or "object"
 */
std::string json_type_name(const Json& j);

/**
 * @brief Decode a type from its JSON encoding
 * @throws SchemaError if the encoding is not recognised
 */
Type type_from_json(const Json& j);

Json type_to_json(const Type& type);

/**
 * @brief Decode a value against the type it must have
 *
 * Primitives are converted where possible ("42" decodes as number 42
 * when a number is wanted). Object keys the type does not declare are
 * ignored; declared attributes missing from the document decode as null.
 *
 * @param j JSON document
 * @param type Wanted type
 * @param path Location of `j`, used in error messages
 * @throws DecodeError if `j` cannot represent `type`
 */
Value value_from_json(const Json& j, const Type& type, const Path& path = Path());

/**
 * @brief Decode a value without a wanted type
 *
 * Objects decode as objects, arrays as lists. An empty array is a list of
 * dynamic; null array elements take the type of their siblings.
 *
 * @throws DecodeError if an array mixes element types
 */
Value infer_value_from_json(const Json& j, const Path& path = Path());

/**
 * @brief Encode a value as JSON
 *
 * Sets become arrays in iteration order; maps become objects. Integral
 * numbers are written as integers.
 */
Json value_to_json(const Value& value);

/**
 * @brief Decode a schema block
 * @throws SchemaError on unknown nesting modes, bad types, or wrong shapes
 */
Block schema_from_json(const Json& j);

/**
 * @brief Parse a nesting mode name ("single", "list", "set", "map")
 * @throws SchemaError for any other name
 */
NestingMode nesting_mode_from_string(const std::string& name);

} // namespace mocksynth

#endif // MOCKSYNTH_JSON_HPP
