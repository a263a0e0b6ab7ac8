/**
 * @file Type.cpp
 * @brief Implementation of type descriptors
 */

#include "mocksynth/Type.hpp"

#include <ostream>
#include <stdexcept>

namespace mocksynth {

Type Type::list(const Type& element) {
    Type t(TypeKind::List);
    t.element_ = std::make_shared<const Type>(element);
    return t;
}

Type Type::set(const Type& element) {
    Type t(TypeKind::Set);
    t.element_ = std::make_shared<const Type>(element);
    return t;
}

Type Type::map(const Type& element) {
    Type t(TypeKind::Map);
    t.element_ = std::make_shared<const Type>(element);
    return t;
}

Type Type::object(AttributeTypes attributes) {
    Type t(TypeKind::Object);
    t.attributes_ = std::make_shared<const AttributeTypes>(std::move(attributes));
    return t;
}

const Type& Type::element_type() const {
    if (!is_collection()) {
        throw std::logic_error("element_type() called on " + friendly_name());
    }
    return *element_;
}

const Type::AttributeTypes& Type::attribute_types() const {
    if (!is_object()) {
        throw std::logic_error("attribute_types() called on " + friendly_name());
    }
    return *attributes_;
}

bool Type::has_attribute(const std::string& name) const {
    return is_object() && attributes_->count(name) > 0;
}

const Type& Type::attribute_type(const std::string& name) const {
    const auto& attrs = attribute_types();
    auto it = attrs.find(name);
    if (it == attrs.end()) {
        throw std::out_of_range("object has no attribute \"" + name + "\"");
    }
    return it->second;
}

std::string Type::friendly_name() const {
    switch (kind_) {
        case TypeKind::Dynamic: return "dynamic";
        case TypeKind::String:  return "string";
        case TypeKind::Number:  return "number";
        case TypeKind::Bool:    return "bool";
        case TypeKind::List:    return "list of " + element_->friendly_name();
        case TypeKind::Set:     return "set of " + element_->friendly_name();
        case TypeKind::Map:     return "map of " + element_->friendly_name();
        case TypeKind::Object:  return "object";
    }
    return "unknown";
}

bool Type::operator==(const Type& other) const {
    if (kind_ != other.kind_) return false;

    if (is_collection()) {
        return *element_ == *other.element_;
    }
    if (is_object()) {
        return *attributes_ == *other.attributes_;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Type& type) {
    return os << type.friendly_name();
}

} // namespace mocksynth
