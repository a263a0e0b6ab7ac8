/**
 * @file Convert.cpp
 * @brief Implementation of type-directed conversion
 */

#include "mocksynth/Convert.hpp"
#include "mocksynth/Errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <string>

namespace mocksynth {

namespace {

[[noreturn]] void fail(const Type& want, const std::string& message) {
    throw ConversionError(want.friendly_name(), message);
}

[[noreturn]] void required(const Type& want) {
    fail(want, want.friendly_name() + " required");
}

/**
 * @brief Run a nested conversion, prefixing any failure with `where`
 */
Value convert_nested(const Value& value, const Type& want_elem,
                     const Type& want_outer, const std::string& where) {
    try {
        return convert(value, want_elem);
    } catch (const ConversionError& err) {
        fail(want_outer, where + ": " + err.what());
    }
}

bool is_decimal_number(const std::string& s) {
    static const std::regex pattern("^-?[0-9]+(\\.[0-9]+)?([eE][+-]?[0-9]+)?$");
    return std::regex_match(s, pattern);
}

Value to_string_value(const Value& value, const Type& want) {
    switch (value.type().kind()) {
        case TypeKind::String: return value;
        case TypeKind::Number: return Value::string(format_number(value.as_number()));
        case TypeKind::Bool:   return Value::string(value.as_bool() ? "true" : "false");
        default:               required(want);
    }
}

Value to_number_value(const Value& value, const Type& want) {
    switch (value.type().kind()) {
        case TypeKind::Number:
            return value;
        case TypeKind::String: {
            const auto& s = value.as_string();
            if (!is_decimal_number(s)) {
                fail(want, "a number is required");
            }
            errno = 0;
            const double n = std::strtod(s.c_str(), nullptr);
            // Underflow rounds toward zero; only overflow is rejected.
            if (errno == ERANGE && (n == HUGE_VAL || n == -HUGE_VAL)) {
                fail(want, "a number is required");
            }
            return Value::number(n);
        }
        default:
            required(want);
    }
}

Value to_bool_value(const Value& value, const Type& want) {
    switch (value.type().kind()) {
        case TypeKind::Bool:
            return value;
        case TypeKind::String: {
            const auto& s = value.as_string();
            if (s == "true") return Value::boolean(true);
            if (s == "false") return Value::boolean(false);
            fail(want, "a bool is required");
        }
        default:
            required(want);
    }
}

Value to_sequence_value(const Value& value, const Type& want) {
    if (!value.is_list() && !value.is_set()) {
        required(want);
    }
    const Type& elem_type = want.element_type();

    Value::Elements out;
    out.reserve(value.size());
    size_t index = 0;
    for (const auto& elem : value.elements()) {
        out.push_back(convert_nested(elem, elem_type, want,
                                     "element " + std::to_string(index)));
        ++index;
    }
    return want.is_set() ? Value::set(elem_type, std::move(out))
                         : Value::list(elem_type, std::move(out));
}

Value to_map_value(const Value& value, const Type& want) {
    if (!value.is_map() && !value.is_object()) {
        required(want);
    }
    const Type& elem_type = want.element_type();
    const auto& source = value.is_map() ? value.entries() : value.attributes();

    Value::Entries out;
    for (const auto& [key, elem] : source) {
        out.emplace(key, convert_nested(elem, elem_type, want,
                                        "key \"" + key + "\""));
    }
    return Value::map(elem_type, std::move(out));
}

Value to_object_value(const Value& value, const Type& want) {
    if (!value.is_object() && !value.is_map()) {
        required(want);
    }
    const auto& wanted = want.attribute_types();
    const auto& source = value.is_object() ? value.attributes() : value.entries();

    for (const auto& [name, type] : wanted) {
        (void)type;
        if (source.count(name) == 0) {
            fail(want, "attribute \"" + name + "\" is required");
        }
    }

    Value::Entries out;
    for (const auto& [name, attr] : source) {
        auto it = wanted.find(name);
        if (it == wanted.end()) {
            fail(want, "unsupported attribute \"" + name + "\"");
        }
        out.emplace(name, convert_nested(attr, it->second, want,
                                         "attribute \"" + name + "\""));
    }
    return Value::object(std::move(out));
}

} // namespace

Value convert(const Value& value, const Type& want) {
    if (want.is_dynamic()) {
        return value;
    }
    if (value.is_null()) {
        return Value::null(want);
    }
    if (value.type() == want) {
        return value;
    }

    switch (want.kind()) {
        case TypeKind::String: return to_string_value(value, want);
        case TypeKind::Number: return to_number_value(value, want);
        case TypeKind::Bool:   return to_bool_value(value, want);
        case TypeKind::List:
        case TypeKind::Set:    return to_sequence_value(value, want);
        case TypeKind::Map:    return to_map_value(value, want);
        case TypeKind::Object: return to_object_value(value, want);
        case TypeKind::Dynamic:
            break;
    }
    return value;
}

} // namespace mocksynth
