/**
 * @file Convert.hpp
 * @brief Type-directed value conversion
 *
 * Conversion rules:
 * - Anything converts to dynamic unchanged
 * - Null converts to a null of the wanted type
 * - string <- string, number, bool
 * - number <- number, or a string holding a decimal number
 * - bool   <- bool, or the strings "true" / "false"
 * - list/set of T <- list or set, element by element
 * - map of T      <- map or object, entry by entry
 * - object        <- object or map with exactly the wanted attributes
 *
 * Conversion is all-or-nothing: the first failing element aborts it.
 */

#ifndef MOCKSYNTH_CONVERT_HPP
#define MOCKSYNTH_CONVERT_HPP

#include "mocksynth/Type.hpp"
#include "mocksynth/Value.hpp"

namespace mocksynth {

/**
 * @brief Convert a value to the wanted type
 *
 * @param value Value to convert
 * @param want Type the result must have
 * @return Converted value of type `want`
 * @throws ConversionError when the value cannot be represented as `want`.
 *         what() is the bare reason, e.g. "string required" or
 *         "element 0: a number is required".
 *
 * Examples:
 * ```cpp
 * convert(Value::number(42), Type::string());        // "42"
 * convert(Value::string("true"), Type::boolean());   // true
 * convert(Value::empty_list(Type::string()), Type::string());
 * // throws ConversionError("string", "string required")
 * ```
 */
Value convert(const Value& value, const Type& want);

} // namespace mocksynth

#endif // MOCKSYNTH_CONVERT_HPP
