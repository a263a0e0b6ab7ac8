/**
 * @file Json.cpp
 * @brief Implementation of the JSON codec
 */

#include "mocksynth/Json.hpp"
#include "mocksynth/Convert.hpp"
#include "mocksynth/Errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace mocksynth {

std::string json_type_name(const Json& j) {
    if (j.is_null()) return "null";
    if (j.is_boolean()) return "boolean";
    if (j.is_number_integer()) return "integer";
    if (j.is_number_float()) return "float";
    if (j.is_string()) return "string";
    if (j.is_array()) return "array";
    if (j.is_object()) return "object";
    return "unknown";
}

// ============================================================================
// Types
// ============================================================================

Type type_from_json(const Json& j) {
    if (j.is_string()) {
        const auto name = j.get<std::string>();
        if (name == "string") return Type::string();
        if (name == "number") return Type::number();
        if (name == "bool") return Type::boolean();
        if (name == "dynamic") return Type::dynamic();
        throw SchemaError("", "unknown primitive type \"" + name + "\"");
    }

    if (!j.is_array() || j.size() != 2 || !j[0].is_string()) {
        throw SchemaError("", "invalid type encoding " + j.dump());
    }

    const auto kind = j[0].get<std::string>();
    if (kind == "list") return Type::list(type_from_json(j[1]));
    if (kind == "set") return Type::set(type_from_json(j[1]));
    if (kind == "map") return Type::map(type_from_json(j[1]));
    if (kind == "object") {
        if (!j[1].is_object()) {
            throw SchemaError("", "object type needs an attribute map, got " +
                                  json_type_name(j[1]));
        }
        Type::AttributeTypes attrs;
        for (auto it = j[1].begin(); it != j[1].end(); ++it) {
            attrs.emplace(it.key(), type_from_json(it.value()));
        }
        return Type::object(std::move(attrs));
    }
    throw SchemaError("", "unknown type kind \"" + kind + "\"");
}

Json type_to_json(const Type& type) {
    switch (type.kind()) {
        case TypeKind::Dynamic: return "dynamic";
        case TypeKind::String:  return "string";
        case TypeKind::Number:  return "number";
        case TypeKind::Bool:    return "bool";
        case TypeKind::List:    return Json::array({"list", type_to_json(type.element_type())});
        case TypeKind::Set:     return Json::array({"set", type_to_json(type.element_type())});
        case TypeKind::Map:     return Json::array({"map", type_to_json(type.element_type())});
        case TypeKind::Object: {
            Json attrs = Json::object();
            for (const auto& [name, attr] : type.attribute_types()) {
                attrs[name] = type_to_json(attr);
            }
            return Json::array({"object", attrs});
        }
    }
    return "dynamic";
}

// ============================================================================
// Values
// ============================================================================

Value infer_value_from_json(const Json& j, const Path& path) {
    if (j.is_null()) return Value();
    if (j.is_boolean()) return Value::boolean(j.get<bool>());
    if (j.is_number()) return Value::number(j.get<double>());
    if (j.is_string()) return Value::string(j.get<std::string>());

    if (j.is_array()) {
        Value::Elements elems;
        elems.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i) {
            elems.push_back(infer_value_from_json(j[i], path.element(i)));
        }

        Type elem_type = Type::dynamic();
        for (size_t i = 0; i < elems.size(); ++i) {
            if (elems[i].is_null()) continue;
            if (elem_type.is_dynamic()) {
                elem_type = elems[i].type();
            } else if (elems[i].type() != elem_type) {
                throw DecodeError(path.element(i).to_string(),
                                  elem_type.friendly_name(),
                                  elems[i].type().friendly_name());
            }
        }
        for (auto& elem : elems) {
            if (elem.is_null()) elem = Value::null(elem_type);
        }
        return Value::list(elem_type, std::move(elems));
    }

    Value::Entries attrs;
    for (auto it = j.begin(); it != j.end(); ++it) {
        attrs.emplace(it.key(), infer_value_from_json(it.value(), path.attribute(it.key())));
    }
    return Value::object(std::move(attrs));
}

Value value_from_json(const Json& j, const Type& type, const Path& path) {
    if (j.is_null()) {
        return Value::null(type);
    }

    switch (type.kind()) {
        case TypeKind::Dynamic:
            return infer_value_from_json(j, path);

        case TypeKind::String:
        case TypeKind::Number:
        case TypeKind::Bool: {
            if (j.is_array() || j.is_object()) {
                throw DecodeError(path.to_string(), type.friendly_name(), json_type_name(j));
            }
            try {
                return convert(infer_value_from_json(j, path), type);
            } catch (const ConversionError&) {
                throw DecodeError(path.to_string(), type.friendly_name(), json_type_name(j));
            }
        }

        case TypeKind::List:
        case TypeKind::Set: {
            if (!j.is_array()) {
                throw DecodeError(path.to_string(), type.friendly_name(), json_type_name(j));
            }
            const Type& elem_type = type.element_type();
            Value::Elements elems;
            elems.reserve(j.size());
            for (size_t i = 0; i < j.size(); ++i) {
                elems.push_back(value_from_json(j[i], elem_type, path.element(i)));
            }
            return type.is_set() ? Value::set(elem_type, std::move(elems))
                                 : Value::list(elem_type, std::move(elems));
        }

        case TypeKind::Map: {
            if (!j.is_object()) {
                throw DecodeError(path.to_string(), type.friendly_name(), json_type_name(j));
            }
            const Type& elem_type = type.element_type();
            Value::Entries entries;
            for (auto it = j.begin(); it != j.end(); ++it) {
                entries.emplace(it.key(),
                                value_from_json(it.value(), elem_type, path.key(it.key())));
            }
            return Value::map(elem_type, std::move(entries));
        }

        case TypeKind::Object: {
            if (!j.is_object()) {
                throw DecodeError(path.to_string(), type.friendly_name(), json_type_name(j));
            }
            Value::Entries attrs;
            for (const auto& [name, attr_type] : type.attribute_types()) {
                auto it = j.find(name);
                if (it == j.end()) {
                    attrs.emplace(name, Value::null(attr_type));
                } else {
                    attrs.emplace(name, value_from_json(*it, attr_type, path.attribute(name)));
                }
            }
            return Value::object(std::move(attrs));
        }
    }
    return infer_value_from_json(j, path);
}

Json value_to_json(const Value& value) {
    if (value.is_null()) return nullptr;

    switch (value.type().kind()) {
        case TypeKind::String:
            return value.as_string();
        case TypeKind::Number: {
            const double n = value.as_number();
            if (std::floor(n) == n &&
                n >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
                n < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(n);
            }
            return n;
        }
        case TypeKind::Bool:
            return value.as_bool();
        case TypeKind::List:
        case TypeKind::Set: {
            Json arr = Json::array();
            for (const auto& elem : value.elements()) arr.push_back(value_to_json(elem));
            return arr;
        }
        case TypeKind::Map:
        case TypeKind::Object: {
            Json obj = Json::object();
            const auto& items = value.is_map() ? value.entries() : value.attributes();
            for (const auto& [key, elem] : items) obj[key] = value_to_json(elem);
            return obj;
        }
        case TypeKind::Dynamic:
            break;
    }
    return nullptr;
}

// ============================================================================
// Schema
// ============================================================================

NestingMode nesting_mode_from_string(const std::string& name) {
    if (name == "single") return NestingMode::Single;
    if (name == "list") return NestingMode::List;
    if (name == "set") return NestingMode::Set;
    if (name == "map") return NestingMode::Map;
    throw SchemaError("", "unknown nesting mode \"" + name + "\"");
}

namespace {

bool flag(const Json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

NestingMode nesting_of(const Json& j, const std::string& where) {
    auto it = j.find("nesting_mode");
    if (it == j.end() || !it->is_string()) {
        throw SchemaError(where, "missing \"nesting_mode\"");
    }
    try {
        return nesting_mode_from_string(it->get<std::string>());
    } catch (const SchemaError& err) {
        throw SchemaError(where, err.reason());
    }
}

Block block_from_json(const Json& j, const std::string& where);

Block attributes_from_json(const Json& j, const std::string& where) {
    Block block;
    if (!j.is_object()) {
        throw SchemaError(where, "\"attributes\" must be an object, got " + json_type_name(j));
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string name = it.key();
        const std::string attr_where = where.empty() ? name : where + "." + name;
        const Json& spec = it.value();
        if (!spec.is_object()) {
            throw SchemaError(attr_where, "attribute must be an object, got " +
                                          json_type_name(spec));
        }

        Attribute attr;
        auto nested = spec.find("nested_type");
        if (nested != spec.end()) {
            if (!nested->is_object()) {
                throw SchemaError(attr_where, "\"nested_type\" must be an object");
            }
            Block inner = nested->contains("attributes")
                              ? attributes_from_json(nested->at("attributes"), attr_where)
                              : Block();
            attr = make_nested_attribute(std::move(inner), nesting_of(*nested, attr_where));
        } else {
            auto type = spec.find("type");
            if (type == spec.end()) {
                throw SchemaError(attr_where, "attribute needs \"type\" or \"nested_type\"");
            }
            try {
                attr.type = type_from_json(*type);
            } catch (const SchemaError& err) {
                throw SchemaError(attr_where, err.reason());
            }
        }

        attr.computed = flag(spec, "computed");
        attr.optional = flag(spec, "optional");
        attr.required = flag(spec, "required");
        attr.sensitive = flag(spec, "sensitive");
        if (spec.contains("description") && spec["description"].is_string()) {
            attr.description = spec["description"].get<std::string>();
        }

        block.add_attribute(name, std::move(attr));
    }
    return block;
}

Block block_from_json(const Json& j, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(where, "block must be an object, got " + json_type_name(j));
    }

    Block block;
    auto attrs = j.find("attributes");
    if (attrs != j.end()) {
        block = attributes_from_json(*attrs, where);
    }

    auto types = j.find("block_types");
    if (types == j.end()) {
        return block;
    }
    if (!types->is_object()) {
        throw SchemaError(where, "\"block_types\" must be an object, got " +
                                 json_type_name(*types));
    }

    for (auto it = types->begin(); it != types->end(); ++it) {
        const std::string name = it.key();
        const std::string block_where = where.empty() ? name : where + "." + name;
        const Json& spec = it.value();
        if (!spec.is_object()) {
            throw SchemaError(block_where, "block type must be an object");
        }

        Block inner = spec.contains("block") ? block_from_json(spec.at("block"), block_where)
                                             : Block();
        NestedBlock nested = make_nested_block(std::move(inner), nesting_of(spec, block_where));
        if (spec.contains("min_items") && spec["min_items"].is_number_integer()) {
            nested.min_items = spec["min_items"].get<int>();
        }
        if (spec.contains("max_items") && spec["max_items"].is_number_integer()) {
            nested.max_items = spec["max_items"].get<int>();
        }
        block.add_block(name, std::move(nested));
    }
    return block;
}

} // namespace

Block schema_from_json(const Json& j) {
    if (j.is_object() && !j.contains("attributes") && !j.contains("block_types") &&
        j.contains("block") && j["block"].is_object()) {
        return block_from_json(j["block"], "");
    }
    return block_from_json(j, "");
}

} // namespace mocksynth
