/**
 * @file Value.hpp
 * @brief Structured value model
 *
 * A Value is a closed sum over:
 * - Null (typed: a null string is not a null number)
 * - String, Number (double), Bool
 * - List (ordered sequence)
 * - Set (unordered, no duplicates)
 * - Map (string-keyed, homogeneous)
 * - Object (named attributes, heterogeneous)
 *
 * Values are immutable. Containers share their children, so copying a
 * Value never deep-copies a tree.
 */

#ifndef MOCKSYNTH_VALUE_HPP
#define MOCKSYNTH_VALUE_HPP

#include "mocksynth/Type.hpp"

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace mocksynth {

class Value {
public:
    using Elements = std::vector<Value>;
    using Entries = std::map<std::string, Value>;

    /// Default-constructed value is a dynamic null.
    Value() = default;

    static Value null(const Type& type);
    static Value string(std::string s);
    static Value number(double n);
    static Value boolean(bool b);

    /**
     * @brief Object value; the type is derived from the attribute values
     */
    static Value object(Entries attributes);
    static Value empty_object();

    static Value list(const Type& element_type, Elements elements);
    static Value empty_list(const Type& element_type);

    /**
     * @brief Set value
     *
     * Structurally equal elements are collapsed; the first occurrence
     * keeps its position in iteration order.
     */
    static Value set(const Type& element_type, Elements elements);
    static Value empty_set(const Type& element_type);

    static Value map(const Type& element_type, Entries entries);
    static Value empty_map(const Type& element_type);

    const Type& type() const noexcept { return type_; }
    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }

    bool is_object() const noexcept { return !is_null() && type_.is_object(); }
    bool is_list() const noexcept { return !is_null() && type_.is_list(); }
    bool is_set() const noexcept { return !is_null() && type_.is_set(); }
    bool is_map() const noexcept { return !is_null() && type_.is_map(); }

    /// @throws std::logic_error on kind mismatch or null
    const std::string& as_string() const;
    double as_number() const;
    bool as_bool() const;

    /// Elements of a list or set
    const Elements& elements() const;
    /// Entries of a map
    const Entries& entries() const;
    /// Attributes of an object
    const Entries& attributes() const;

    bool has_attr(const std::string& name) const;

    /**
     * @brief Attribute of an object value
     * @throws std::out_of_range if the attribute does not exist
     */
    const Value& get_attr(const std::string& name) const;

    /// Number of elements, entries or attributes; 0 for primitives and null.
    size_t size() const;

    /**
     * @brief Short human-readable rendering, e.g. {id = "a", tags = ["x"]}
     */
    std::string to_string() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Value(Type type, std::shared_ptr<const Elements> elements);
    Value(Type type, std::shared_ptr<const Entries> entries);

    Type type_;
    std::variant<std::monostate,
                 bool,
                 double,
                 std::string,
                 std::shared_ptr<const Elements>,
                 std::shared_ptr<const Entries>> data_;
};

/**
 * @brief Shortest decimal text that reads back as the same double
 *
 * Integral values print without a fractional part ("42", "-3").
 */
std::string format_number(double n);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace mocksynth

#endif // MOCKSYNTH_VALUE_HPP
