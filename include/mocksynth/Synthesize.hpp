/**
 * @file Synthesize.hpp
 * @brief Computed-value synthesis for mocked data sources
 *
 * Walks a schema alongside a target value and an optional replacement
 * value and produces the fully-populated result a simulated read would
 * return.
 *
 * Merging rules, per schema attribute:
 * - Nested attribute or nested block: recurse per nesting mode
 * - Computed, target value known: keep the target value
 * - Computed, target value null, replacement present: use the replacement
 *   converted to the attribute type; on failure report it and generate
 * - Computed, target value null, no replacement: generate
 * - Not computed: copy the target value; replacements are ignored
 *
 * Collections (list, set, map) receive the same replacement object for
 * every element. Replacements are never indexed by position or key.
 *
 * The result holds exactly the schema's fields; target fields unknown to
 * the schema are dropped.
 */

#ifndef MOCKSYNTH_SYNTHESIZE_HPP
#define MOCKSYNTH_SYNTHESIZE_HPP

#include "mocksynth/Diagnostics.hpp"
#include "mocksynth/Path.hpp"
#include "mocksynth/Random.hpp"
#include "mocksynth/Schema.hpp"
#include "mocksynth/Value.hpp"

#include <optional>

namespace mocksynth {

/**
 * @brief User-supplied overrides for computed attributes
 *
 * `range` is only used to attribute diagnostics.
 */
struct ReplacementValue {
    std::optional<Value> value;
    SourceRange range;
};

struct SynthesisResult {
    Value value;
    Diagnostics diagnostics;
};

/**
 * @brief Synthesize the computed values of a data source
 *
 * Never throws for malformed values: a replacement that is not an object,
 * or that holds values of the wrong shape or type, is reported in the
 * returned diagnostics and the affected subtree falls back to generated
 * values.
 *
 * @param target Known values (conventionally an object; null is treated
 *               as an object whose fields are all null)
 * @param replacement Optional overrides
 * @param schema Block describing the result shape
 * @param random Generator for unset computed leaves
 * @return Merged value and diagnostics in visiting order
 *
 * Example:
 * ```cpp
 * Block schema;
 * schema.add_attribute("id", make_attribute(Type::string(), true))
 *       .add_attribute("value", make_attribute(Type::string()));
 *
 * Value target = Value::object({
 *     {"id", Value::null(Type::string())},
 *     {"value", Value::string("Hello, world!")},
 * });
 * ReplacementValue with{Value::object({{"id", Value::string("myvalue")}}), {}};
 *
 * auto result = synthesize(target, with, schema);
 * // result.value: {id = "myvalue", value = "Hello, world!"}
 * ```
 */
SynthesisResult synthesize(const Value& target, const ReplacementValue& replacement,
                           const Block& schema, RandomSource& random);

/**
 * @brief Same as above, drawing from RandomSource::process_default()
 */
SynthesisResult synthesize(const Value& target, const ReplacementValue& replacement,
                           const Block& schema);

} // namespace mocksynth

#endif // MOCKSYNTH_SYNTHESIZE_HPP
