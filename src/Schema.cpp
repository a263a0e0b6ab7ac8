/**
 * @file Schema.cpp
 * @brief Implementation of the schema model
 */

#include "mocksynth/Schema.hpp"

#include <algorithm>

namespace mocksynth {

std::string nesting_mode_name(NestingMode mode) {
    switch (mode) {
        case NestingMode::Single: return "single";
        case NestingMode::List:   return "list";
        case NestingMode::Set:    return "set";
        case NestingMode::Map:    return "map";
    }
    return "single";
}

Type nest_type(const Type& object_type, NestingMode mode) {
    switch (mode) {
        case NestingMode::Single: return object_type;
        case NestingMode::List:   return Type::list(object_type);
        case NestingMode::Set:    return Type::set(object_type);
        case NestingMode::Map:    return Type::map(object_type);
    }
    return object_type;
}

Type Attribute::implied_type() const {
    if (nested_type) {
        return nest_type(nested_type->attributes.implied_type(), nested_type->nesting);
    }
    return type;
}

Type NestedBlock::implied_type() const {
    Type inner = block ? block->implied_type() : Type::empty_object();
    return nest_type(inner, nesting);
}

Block& Block::add_attribute(const std::string& name, Attribute attribute) {
    attributes_.emplace_back(name, std::move(attribute));
    return *this;
}

Block& Block::add_block(const std::string& name, NestedBlock block) {
    block_types_.emplace_back(name, std::move(block));
    return *this;
}

const Attribute* Block::find_attribute(const std::string& name) const {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [&name](const NamedAttribute& a) { return a.first == name; });
    return it == attributes_.end() ? nullptr : &it->second;
}

const NestedBlock* Block::find_block(const std::string& name) const {
    auto it = std::find_if(block_types_.begin(), block_types_.end(),
                           [&name](const NamedBlock& b) { return b.first == name; });
    return it == block_types_.end() ? nullptr : &it->second;
}

Type Block::implied_type() const {
    Type::AttributeTypes types;
    for (const auto& [name, attr] : attributes_) {
        types.emplace(name, attr.implied_type());
    }
    for (const auto& [name, nested] : block_types_) {
        types.emplace(name, nested.implied_type());
    }
    return Type::object(std::move(types));
}

Attribute make_attribute(const Type& type, bool computed) {
    Attribute attr;
    attr.type = type;
    attr.computed = computed;
    attr.optional = !computed;
    return attr;
}

Attribute make_nested_attribute(Block attributes, NestingMode nesting) {
    auto nested = std::make_shared<NestedObject>();
    nested->attributes = std::move(attributes);
    nested->nesting = nesting;

    Attribute attr;
    attr.optional = true;
    attr.nested_type = std::move(nested);
    attr.type = attr.implied_type();
    return attr;
}

NestedBlock make_nested_block(Block block, NestingMode nesting) {
    NestedBlock nb;
    nb.block = std::make_shared<const Block>(std::move(block));
    nb.nesting = nesting;
    return nb;
}

} // namespace mocksynth
