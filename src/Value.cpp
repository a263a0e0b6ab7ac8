/**
 * @file Value.cpp
 * @brief Implementation of the structured value model
 */

#include "mocksynth/Value.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace mocksynth {

namespace {

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

bool contains_equal(const Value::Elements& elems, const Value& v) {
    return std::find(elems.begin(), elems.end(), v) != elems.end();
}

} // namespace

std::string format_number(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n > 0 ? "Infinity" : "-Infinity";

    if (std::floor(n) == n &&
        n >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
        n < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::to_string(static_cast<std::int64_t>(n));
    }

    for (int precision = 1; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << n;
        if (std::strtod(oss.str().c_str(), nullptr) == n) {
            return oss.str();
        }
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << n;
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

Value::Value(Type type, std::shared_ptr<const Elements> elements)
    : type_(std::move(type)), data_(std::move(elements)) {}

Value::Value(Type type, std::shared_ptr<const Entries> entries)
    : type_(std::move(type)), data_(std::move(entries)) {}

Value Value::null(const Type& type) {
    Value v;
    v.type_ = type;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.type_ = Type::string();
    v.data_ = std::move(s);
    return v;
}

Value Value::number(double n) {
    Value v;
    v.type_ = Type::number();
    v.data_ = n;
    return v;
}

Value Value::boolean(bool b) {
    Value v;
    v.type_ = Type::boolean();
    v.data_ = b;
    return v;
}

Value Value::object(Entries attributes) {
    Type::AttributeTypes types;
    for (const auto& [name, attr] : attributes) {
        types.emplace(name, attr.type());
    }
    return Value(Type::object(std::move(types)),
                 std::make_shared<const Entries>(std::move(attributes)));
}

Value Value::empty_object() {
    return object({});
}

Value Value::list(const Type& element_type, Elements elements) {
    return Value(Type::list(element_type),
                 std::make_shared<const Elements>(std::move(elements)));
}

Value Value::empty_list(const Type& element_type) {
    return list(element_type, {});
}

Value Value::set(const Type& element_type, Elements elements) {
    Elements unique;
    unique.reserve(elements.size());
    for (auto& elem : elements) {
        if (!contains_equal(unique, elem)) {
            unique.push_back(std::move(elem));
        }
    }
    return Value(Type::set(element_type),
                 std::make_shared<const Elements>(std::move(unique)));
}

Value Value::empty_set(const Type& element_type) {
    return set(element_type, {});
}

Value Value::map(const Type& element_type, Entries entries) {
    return Value(Type::map(element_type),
                 std::make_shared<const Entries>(std::move(entries)));
}

Value Value::empty_map(const Type& element_type) {
    return map(element_type, {});
}

// ============================================================================
// Inspection
// ============================================================================

const std::string& Value::as_string() const {
    if (auto p = std::get_if<std::string>(&data_)) return *p;
    throw std::logic_error("as_string() called on " +
                           (is_null() ? std::string("null ") : std::string()) +
                           type_.friendly_name());
}

double Value::as_number() const {
    if (auto p = std::get_if<double>(&data_)) return *p;
    throw std::logic_error("as_number() called on " +
                           (is_null() ? std::string("null ") : std::string()) +
                           type_.friendly_name());
}

bool Value::as_bool() const {
    if (auto p = std::get_if<bool>(&data_)) return *p;
    throw std::logic_error("as_bool() called on " +
                           (is_null() ? std::string("null ") : std::string()) +
                           type_.friendly_name());
}

const Value::Elements& Value::elements() const {
    if (type_.is_list() || type_.is_set()) {
        if (auto p = std::get_if<std::shared_ptr<const Elements>>(&data_)) return **p;
    }
    throw std::logic_error("elements() called on " + type_.friendly_name());
}

const Value::Entries& Value::entries() const {
    if (type_.is_map()) {
        if (auto p = std::get_if<std::shared_ptr<const Entries>>(&data_)) return **p;
    }
    throw std::logic_error("entries() called on " + type_.friendly_name());
}

const Value::Entries& Value::attributes() const {
    if (type_.is_object()) {
        if (auto p = std::get_if<std::shared_ptr<const Entries>>(&data_)) return **p;
    }
    throw std::logic_error("attributes() called on " + type_.friendly_name());
}

bool Value::has_attr(const std::string& name) const {
    return is_object() && attributes().count(name) > 0;
}

const Value& Value::get_attr(const std::string& name) const {
    const auto& attrs = attributes();
    auto it = attrs.find(name);
    if (it == attrs.end()) {
        throw std::out_of_range("object has no attribute \"" + name + "\"");
    }
    return it->second;
}

size_t Value::size() const {
    if (auto p = std::get_if<std::shared_ptr<const Elements>>(&data_)) return (*p)->size();
    if (auto p = std::get_if<std::shared_ptr<const Entries>>(&data_)) return (*p)->size();
    return 0;
}

std::string Value::to_string() const {
    if (is_null()) return "null";

    switch (type_.kind()) {
        case TypeKind::String: return quote(as_string());
        case TypeKind::Number: return format_number(as_number());
        case TypeKind::Bool:   return as_bool() ? "true" : "false";
        case TypeKind::List:
        case TypeKind::Set: {
            std::ostringstream oss;
            oss << (type_.is_set() ? "toset([" : "[");
            const auto& elems = elements();
            for (size_t i = 0; i < elems.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << elems[i].to_string();
            }
            oss << (type_.is_set() ? "])" : "]");
            return oss.str();
        }
        case TypeKind::Map:
        case TypeKind::Object: {
            std::ostringstream oss;
            oss << (type_.is_map() ? "tomap({" : "{");
            const auto& items = type_.is_map() ? entries() : attributes();
            bool first = true;
            for (const auto& [key, val] : items) {
                if (!first) oss << ", ";
                first = false;
                oss << (type_.is_map() ? quote(key) : key) << " = " << val.to_string();
            }
            oss << (type_.is_map() ? "})" : "}");
            return oss.str();
        }
        case TypeKind::Dynamic:
            break;
    }
    return "null";
}

// ============================================================================
// Equality
// ============================================================================

bool Value::operator==(const Value& other) const {
    if (type_ != other.type_) return false;
    if (is_null() || other.is_null()) return is_null() && other.is_null();

    switch (type_.kind()) {
        case TypeKind::String: return as_string() == other.as_string();
        case TypeKind::Number: return as_number() == other.as_number();
        case TypeKind::Bool:   return as_bool() == other.as_bool();
        case TypeKind::List:   return elements() == other.elements();
        case TypeKind::Set: {
            const auto& a = elements();
            const auto& b = other.elements();
            if (a.size() != b.size()) return false;
            return std::all_of(a.begin(), a.end(),
                               [&b](const Value& v) { return contains_equal(b, v); });
        }
        case TypeKind::Map:    return entries() == other.entries();
        case TypeKind::Object: return attributes() == other.attributes();
        case TypeKind::Dynamic:
            break;
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.to_string();
}

} // namespace mocksynth
