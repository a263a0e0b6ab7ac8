/**
 * @file Type.hpp
 * @brief Static type descriptors for structured values
 *
 * Every Value carries a Type. Types are immutable and cheap to copy;
 * nested element and attribute types are shared.
 *
 * Kinds:
 * - Dynamic (any type; used where nothing more precise is known)
 * - String, Number, Bool
 * - List, Set, Map (one element type each)
 * - Object (named attribute types)
 */

#ifndef MOCKSYNTH_TYPE_HPP
#define MOCKSYNTH_TYPE_HPP

#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace mocksynth {

enum class TypeKind {
    Dynamic,
    String,
    Number,
    Bool,
    List,
    Set,
    Map,
    Object
};

class Type {
public:
    using AttributeTypes = std::map<std::string, Type>;

    /// Default-constructed type is Dynamic.
    Type() = default;

    static Type dynamic() { return Type(TypeKind::Dynamic); }
    static Type string() { return Type(TypeKind::String); }
    static Type number() { return Type(TypeKind::Number); }
    static Type boolean() { return Type(TypeKind::Bool); }
    static Type list(const Type& element);
    static Type set(const Type& element);
    static Type map(const Type& element);
    static Type object(AttributeTypes attributes);
    static Type empty_object() { return object({}); }

    TypeKind kind() const noexcept { return kind_; }

    bool is_dynamic() const noexcept { return kind_ == TypeKind::Dynamic; }
    bool is_primitive() const noexcept {
        return kind_ == TypeKind::String || kind_ == TypeKind::Number ||
               kind_ == TypeKind::Bool;
    }
    bool is_list() const noexcept { return kind_ == TypeKind::List; }
    bool is_set() const noexcept { return kind_ == TypeKind::Set; }
    bool is_map() const noexcept { return kind_ == TypeKind::Map; }
    bool is_collection() const noexcept { return is_list() || is_set() || is_map(); }
    bool is_object() const noexcept { return kind_ == TypeKind::Object; }

    /**
     * @brief Element type of a list, set or map
     * @throws std::logic_error if this is not a collection type
     */
    const Type& element_type() const;

    /**
     * @brief Attribute types of an object type
     * @throws std::logic_error if this is not an object type
     */
    const AttributeTypes& attribute_types() const;

    bool has_attribute(const std::string& name) const;

    /**
     * @brief Type of a single object attribute
     * @throws std::out_of_range if the attribute does not exist
     */
    const Type& attribute_type(const std::string& name) const;

    /**
     * @brief Human-readable type name
     *
     * "string", "number", "bool", "dynamic", "list of string",
     * "map of object", "object", ...
     */
    std::string friendly_name() const;

    bool operator==(const Type& other) const;
    bool operator!=(const Type& other) const { return !(*this == other); }

private:
    explicit Type(TypeKind kind) : kind_(kind) {}

    TypeKind kind_ = TypeKind::Dynamic;
    std::shared_ptr<const Type> element_;
    std::shared_ptr<const AttributeTypes> attributes_;
};

std::ostream& operator<<(std::ostream& os, const Type& type);

} // namespace mocksynth

#endif // MOCKSYNTH_TYPE_HPP
